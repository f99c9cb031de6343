#include "memory_record_source.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace datalens::catalog {

MemoryRecordSource::MemoryRecordSource(std::shared_ptr<const schema::TypeRegistry> types) {
  state_.types = std::move(types);
}

model::RecordSet MemoryRecordSource::ListAllRecords() const {
  std::shared_lock lock(mutex_);
  return state_.records;
}

model::RecordPtr MemoryRecordSource::LoadByIdentity(const std::string& identity) const {
  std::shared_lock lock(mutex_);
  auto             it = state_.by_identity.find(identity);
  if (it == state_.by_identity.end()) return nullptr;
  return it->second;
}

void MemoryRecordSource::Insert(State& s, model::RecordPtr record) {
  if (!record) {
    throw util::InvalidArgument("record is null");
  }
  const auto& identity = record->Identity();
  if (identity.empty()) {
    throw util::InvalidArgument("record '" + record->Name() + "' has an empty identity");
  }
  if (s.by_identity.contains(identity)) {
    throw util::AlreadyExists("duplicate record identity: " + identity);
  }
  s.by_identity.emplace(identity, record);
  s.records.push_back(std::move(record));
}

void MemoryRecordSource::Add(model::RecordPtr record) {
  std::unique_lock lock(mutex_);
  Insert(state_, std::move(record));
}

void MemoryRecordSource::Reset(std::shared_ptr<const schema::TypeRegistry> types, model::RecordSet records) {
  State next;
  next.types = std::move(types);
  next.records.reserve(records.size());
  for (auto& record : records) {
    Insert(next, std::move(record));
  }

  std::unique_lock lock(mutex_);
  state_ = std::move(next);
}

void MemoryRecordSource::Clear() {
  std::unique_lock lock(mutex_);
  state_.records.clear();
  state_.by_identity.clear();
}

size_t MemoryRecordSource::Size() const {
  std::shared_lock lock(mutex_);
  return state_.records.size();
}

std::shared_ptr<const schema::TypeRegistry> MemoryRecordSource::Types() const {
  std::shared_lock lock(mutex_);
  return state_.types;
}

} // namespace datalens::catalog
