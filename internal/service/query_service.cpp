#include "query_service.hpp"

#include <algorithm>
#include <utility>

#include "internal/catalog/memory_record_source.hpp"
#include "internal/query/field_accessor.hpp"
#include "internal/query/query_engine.hpp"
#include "internal/util/errors.hpp"
#include "observe_call.hpp"
#include "proto_convert.hpp"

namespace datalens::service {

using namespace datalens::v1;

namespace {

// The registry is returned with the type so the pointer stays valid
// across a concurrent reload.
std::pair<std::shared_ptr<const schema::TypeRegistry>, const schema::RecordType*> RequireType(const catalog::MemoryRecordSource& records,
                                                                                                const std::string&                type_name) {
  auto        types = records.Types();
  const auto* type  = types ? types->Find(type_name) : nullptr;
  if (!type) {
    throw util::NotFound("record type not found: " + type_name);
  }
  return {std::move(types), type};
}

} // namespace

QueryService::QueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

QueryResponse QueryService::Query(const QueryRequest& req) {
  return ObserveCall("QueryService.Query", [&] {
    const auto group = FromProto(req.group());

    auto candidates = ctx_.records->ListAllRecords();
    if (!req.type_name().empty()) {
      RequireType(*ctx_.records, req.type_name());
      std::erase_if(candidates, [&](const model::RecordPtr& r) { return !r || r->Type().name() != req.type_name(); });
    }

    QueryResponse resp;
    for (const auto& condition : group.conditions()) {
      if (condition.enabled()) resp.add_condition_text(condition.DisplayText());
    }
    resp.set_scanned(candidates.size());
    for (const auto& record : ctx_.query_engine->Query(group, candidates)) {
      *resp.add_records() = ToRecordRef(*record);
    }
    return resp;
  });
}

SearchByNameResponse QueryService::SearchByName(const SearchByNameRequest& req) {
  return ObserveCall("QueryService.SearchByName", [&] {
    SearchByNameResponse resp;
    for (const auto& record : ctx_.query_engine->SearchByName(req.term(), req.case_sensitive(), ctx_.records->ListAllRecords())) {
      *resp.add_records() = ToRecordRef(*record);
    }
    return resp;
  });
}

ListQueryableFieldsResponse QueryService::ListQueryableFields(const ListQueryableFieldsRequest& req) {
  return ObserveCall("QueryService.ListQueryableFields", [&] {
    const auto [types, type] = RequireType(*ctx_.records, req.type_name());

    ListQueryableFieldsResponse resp;
    for (const auto& field : ctx_.accessor->QueryableFields(*type)) {
      auto* out = resp.add_fields();
      out->set_name(field.name);
      out->set_kind(std::string(schema::ToString(field.kind)));
      out->set_owner_type(field.owner ? field.owner->name() : std::string());
    }
    return resp;
  });
}

} // namespace datalens::service
