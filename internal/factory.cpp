#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/field_reference_extractor.hpp"
#include "internal/catalog/memory_record_source.hpp"
#include "internal/catalog/yaml_catalog_loader.hpp"
#include "internal/graph/graph_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/field_accessor.hpp"
#include "internal/query/query_engine.hpp"

namespace datalens::factory {

using observability::IntField;
using observability::SizeField;
using observability::StringField;

namespace {

std::chrono::seconds CacheValidity(const datalens::runtime::config::GraphConfig& graph) {
  if (!graph.has_cache_validity_seconds()) {
    return graph::GraphCache::kDefaultValidity;
  }
  return std::chrono::seconds(graph.cache_validity_seconds());
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const datalens::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Records
  // ------------------------------------------------------------------
  auto records = std::make_shared<catalog::MemoryRecordSource>(std::make_shared<schema::TypeRegistry>());
  if (!config.catalog().path().empty()) {
    auto loaded = catalog::YamlCatalogLoader::LoadFromFile(config.catalog().path());
    records->Reset(std::move(loaded.types), std::move(loaded.records));
  } else {
    DATALENS_LOG_WARN("no catalog.path configured, starting with an empty record set");
  }

  // ------------------------------------------------------------------
  // Query and graph
  // ------------------------------------------------------------------
  const auto& reserved = config.query().reserved_field_names();
  auto accessor        = std::make_shared<query::FieldAccessor>(std::vector<std::string>(reserved.begin(), reserved.end()));
  auto query_engine    = std::make_shared<query::QueryEngine>(accessor);
  auto extractor       = std::make_shared<catalog::FieldReferenceExtractor>(records, accessor);
  auto graph_cache     = std::make_shared<graph::GraphCache>(records, extractor, CacheValidity(config.graph()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.records      = records;
  ctx.accessor     = accessor;
  ctx.query_engine = query_engine;
  ctx.graph_cache  = graph_cache;

  ctx.options.catalog_path = config.catalog().path();
  ctx.options.orphan_excluded_types.assign(config.graph().orphan_excluded_types().begin(), config.graph().orphan_excluded_types().end());
  if (config.graph().default_top_n() > 0) {
    ctx.options.default_top_n = config.graph().default_top_n();
  }

  app.context            = ctx;
  app.query_service      = std::make_shared<service::QueryService>(ctx);
  app.dependency_service = std::make_shared<service::DependencyService>(ctx);
  app.catalog_service    = std::make_shared<service::CatalogService>(ctx);

  DATALENS_LOG_INFO("datalens initialized", {StringField("catalog", ctx.options.catalog_path), SizeField("records", records->Size()),
                                             IntField("cache_validity_s", static_cast<int64_t>(graph_cache->validity().count()))});
  return app;
}

} // namespace datalens::factory
