#include "catalog_service.hpp"

#include "internal/catalog/memory_record_source.hpp"
#include "internal/catalog/scan_result.hpp"
#include "internal/catalog/yaml_catalog_loader.hpp"
#include "internal/graph/graph_builder.hpp"
#include "internal/query/field_accessor.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_call.hpp"

namespace datalens::service {

using namespace datalens::v1;

namespace {

void ToProto(const catalog::TypeNode& node, datalens::v1::TypeNode* out) {
  out->set_display_name(node.display_name);
  if (node.type) out->set_type_name(node.type->name());
  out->set_record_count(node.record_count);
  for (const auto& child : node.children) {
    ToProto(child, out->add_children());
  }
}

} // namespace

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ScanResponse CatalogService::Scan(const ScanRequest&) {
  return ObserveCall("CatalogService.Scan", [&] {
    const auto scan = catalog::ScanResult::Scan(*ctx_.records);

    ScanResponse resp;
    for (const auto& category : scan.Categories()) {
      ToProto(category, resp.add_categories());
    }
    resp.set_total_records(scan.TotalRecordCount());
    resp.set_total_types(scan.TotalTypeCount());
    *resp.mutable_scanned_at() = util::ToProto(scan.scanned_at());
    return resp;
  });
}

ReloadResponse CatalogService::Reload(const ReloadRequest&) {
  return ObserveCall("CatalogService.Reload", [&] {
    if (ctx_.options.catalog_path.empty()) {
      throw util::InvalidState("reload requires catalog.path to be configured");
    }

    auto loaded = catalog::YamlCatalogLoader::LoadFromFile(ctx_.options.catalog_path);
    ctx_.records->Reset(loaded.types, std::move(loaded.records));
    ctx_.accessor->ClearCache();
    ctx_.graph_cache->InvalidateCache();

    ReloadResponse resp;
    resp.set_total_records(ctx_.records->Size());
    resp.set_total_types(loaded.types->Size());
    return resp;
  });
}

} // namespace datalens::service
