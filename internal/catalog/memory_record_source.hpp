#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/catalog/record_source.hpp"
#include "internal/schema/type_registry.hpp"

namespace datalens::catalog {

/*
  Record source backed by an in-process list.

  Records keep insertion order. The registry the records were declared
  against travels with them so callers can list queryable fields by type
  name. Reset() swaps both atomically; readers holding records from the
  previous set stay valid because records share ownership of their types.
*/
class MemoryRecordSource final : public RecordSource {
 public:
  MemoryRecordSource() = default;
  explicit MemoryRecordSource(std::shared_ptr<const schema::TypeRegistry> types);

  model::RecordSet ListAllRecords() const override;
  model::RecordPtr LoadByIdentity(const std::string& identity) const override;

  // Throws InvalidArgument for a null record or empty identity and
  // AlreadyExists for a duplicate identity.
  void Add(model::RecordPtr record);

  // Replaces the whole set. Same validation as Add(); on failure the
  // previous set is kept.
  void Reset(std::shared_ptr<const schema::TypeRegistry> types, model::RecordSet records);

  void Clear();

  size_t Size() const;

  std::shared_ptr<const schema::TypeRegistry> Types() const;

 private:
  struct State {
    std::shared_ptr<const schema::TypeRegistry>       types;
    model::RecordSet                                  records;
    std::unordered_map<std::string, model::RecordPtr> by_identity;
  };

  static void Insert(State& s, model::RecordPtr record);

  mutable std::shared_mutex mutex_;
  State                     state_;
};

} // namespace datalens::catalog
