#pragma once

#include "datalens/v1.hpp"
#include "service_context.hpp"

namespace datalens::service {

class CatalogService {
 public:
  explicit CatalogService(ServiceContext ctx);

  datalens::v1::ScanResponse Scan(const datalens::v1::ScanRequest& req);

  // Re-reads the catalog file, swaps the record set, then drops every cache
  // derived from the old set. Throws InvalidState when no catalog path is
  // configured; a failed load keeps the current set.
  datalens::v1::ReloadResponse Reload(const datalens::v1::ReloadRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace datalens::service
