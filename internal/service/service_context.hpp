#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace datalens::catalog {
class MemoryRecordSource;
}
namespace datalens::query {
class FieldAccessor;
class QueryEngine;
} // namespace datalens::query
namespace datalens::graph {
class GraphCache;
}

namespace datalens::service {

struct ServiceOptions {
  std::string              catalog_path;
  std::vector<std::string> orphan_excluded_types;
  uint32_t                 default_top_n = 10;
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<datalens::catalog::MemoryRecordSource> records;
  std::shared_ptr<datalens::query::FieldAccessor>        accessor;
  std::shared_ptr<datalens::query::QueryEngine>          query_engine;
  std::shared_ptr<datalens::graph::GraphCache>           graph_cache;
  ServiceOptions                                         options;
};

} // namespace datalens::service
