#include "field_reference_extractor.hpp"

#include <unordered_set>

#include "internal/catalog/record_source.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/field_accessor.hpp"
#include "internal/util/errors.hpp"

namespace datalens::catalog {

using observability::StringField;

FieldReferenceExtractor::FieldReferenceExtractor(std::shared_ptr<const RecordSource> source, std::shared_ptr<const query::FieldAccessor> accessor)
    : source_(std::move(source)), accessor_(std::move(accessor)) {
  if (!source_) {
    throw util::InvalidArgument("reference extractor requires a record source");
  }
  if (!accessor_) {
    throw util::InvalidArgument("reference extractor requires a field accessor");
  }
}

model::RecordSet FieldReferenceExtractor::ReferencesOf(const model::Record& record) const {
  model::RecordSet                out;
  std::unordered_set<std::string> seen;

  for (const auto& field : accessor_->QueryableFields(record.Type())) {
    if (field.kind != schema::FieldKind::kRecordRef) continue;

    const auto  value = accessor_->GetValue(record, field);
    const auto* ref   = value.As<model::RecordRef>();
    if (!ref || ref->identity.empty() || !seen.insert(ref->identity).second) continue;

    const auto& identity = ref->identity;

    auto target = source_->LoadByIdentity(identity);
    if (!target) {
      DATALENS_LOG_DEBUG("dangling record reference", {StringField("record", record.Identity()), StringField("field", field.name), StringField("target", identity)});
      continue;
    }
    out.push_back(std::move(target));
  }
  return out;
}

} // namespace datalens::catalog
