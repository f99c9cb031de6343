#pragma once

#include "datalens/v1.hpp"
#include "service_context.hpp"

namespace datalens::service {

class QueryService {
 public:
  explicit QueryService(ServiceContext ctx);

  // Throws NotFound for an unknown type_name and InvalidArgument for a
  // malformed condition.
  datalens::v1::QueryResponse Query(const datalens::v1::QueryRequest& req);

  datalens::v1::SearchByNameResponse SearchByName(const datalens::v1::SearchByNameRequest& req);

  // Throws NotFound for an unknown type.
  datalens::v1::ListQueryableFieldsResponse ListQueryableFields(const datalens::v1::ListQueryableFieldsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace datalens::service
