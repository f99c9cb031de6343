#pragma once

#include "internal/model/record.hpp"

namespace datalens::graph {

/*
  Yields the records a record points to. Implementations may throw; the
  builder contains failures to the record being processed.
*/
class ReferenceExtractor {
 public:
  virtual ~ReferenceExtractor() = default;

  virtual model::RecordSet ReferencesOf(const model::Record& record) const = 0;
};

} // namespace datalens::graph
