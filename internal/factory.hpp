#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/service/catalog_service.hpp"
#include "internal/service/dependency_service.hpp"
#include "internal/service/query_service.hpp"
#include "internal/service/service_context.hpp"

namespace datalens::factory {

/*
  Application

  Owns all long-lived objects of one process.
*/
struct Application {
  service::ServiceContext context;

  std::shared_ptr<service::QueryService>      query_service;
  std::shared_ptr<service::DependencyService> dependency_service;
  std::shared_ptr<service::CatalogService>    catalog_service;
};

/*
  Build

  Constructs the whole core from the runtime config and loads the catalog
  when a path is configured. This is the composition root: the only place
  that knows the concrete record source and reference extractor.
*/
Application Build(const datalens::runtime::config::RuntimeConfig& config);

} // namespace datalens::factory
