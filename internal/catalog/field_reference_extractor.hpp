#pragma once

#include <memory>

#include "internal/graph/reference_extractor.hpp"

namespace datalens::query {
class FieldAccessor;
}

namespace datalens::catalog {

class RecordSource;

/*
  Extracts references from record-typed fields.

  Every queryable field of kind record along the type chain is read; the
  identities are resolved through the record source. Identities that do not
  resolve are dropped with a debug log. Each target appears once, in field
  order.
*/
class FieldReferenceExtractor final : public graph::ReferenceExtractor {
 public:
  // Throws InvalidArgument when source or accessor is null.
  FieldReferenceExtractor(std::shared_ptr<const RecordSource> source, std::shared_ptr<const query::FieldAccessor> accessor);

  model::RecordSet ReferencesOf(const model::Record& record) const override;

 private:
  std::shared_ptr<const RecordSource>         source_;
  std::shared_ptr<const query::FieldAccessor> accessor_;
};

} // namespace datalens::catalog
