#pragma once

#include <string>

#include "internal/model/record.hpp"

namespace datalens::catalog {

/*
  Provider of the record set.

  The core never persists or mutates records. Whoever changes the set owns
  the graph cache too and must call GraphCache::InvalidateCache().
*/
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  virtual model::RecordSet ListAllRecords() const = 0;

  // nullptr when no record has this identity.
  virtual model::RecordPtr LoadByIdentity(const std::string& identity) const = 0;
};

} // namespace datalens::catalog
