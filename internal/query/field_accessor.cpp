#include "field_accessor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>

#include "internal/observability/logging.hpp"

namespace datalens::query {

namespace {

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
  return it != haystack.end();
}

} // namespace

FieldAccessor::FieldAccessor(std::vector<std::string> extra_reserved_names)
    : extra_reserved_(std::make_move_iterator(extra_reserved_names.begin()), std::make_move_iterator(extra_reserved_names.end())) {
}

bool FieldAccessor::IsBuiltinReservedName(std::string_view field_name) {
  if (field_name == "m_Script") return true;
  if (!field_name.starts_with("m_")) return false;

  static constexpr std::array<std::string_view, 3> kHostMarkers = {"hideFlags", "icon", "gameObject"};
  return std::any_of(kHostMarkers.begin(), kHostMarkers.end(), [&](std::string_view marker) { return ContainsIgnoreCase(field_name, marker); });
}

bool FieldAccessor::IsHidden(std::string_view field_name) const {
  return IsBuiltinReservedName(field_name) || extra_reserved_.contains(std::string(field_name));
}

std::optional<schema::FieldDescriptor> FieldAccessor::Resolve(const schema::RecordType& type, std::string_view field_name) const {
  CacheKey key{&type, std::string(field_name)};
  {
    std::shared_lock lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;
  }

  std::optional<schema::FieldDescriptor> resolved;
  if (!field_name.empty() && !IsHidden(field_name)) {
    for (const schema::RecordType* t = &type; t; t = t->base()) {
      const auto* field = t->FindOwnField(field_name);
      if (!field) continue;
      if (field->kind != schema::FieldKind::kDelegate) {
        resolved = schema::FieldDescriptor{field->name, field->kind, t};
      }
      break;
    }
  }

  std::unique_lock lock(mutex_);
  cache_.emplace(std::move(key), resolved);
  return resolved;
}

model::Value FieldAccessor::GetValue(const model::Record& record, const schema::FieldDescriptor& descriptor) const {
  try {
    return record.Get(descriptor);
  } catch (const std::exception& e) {
    DATALENS_LOG_DEBUG("field read failed", {observability::StringField("record", record.Identity()), observability::StringField("field", descriptor.name),
                                             observability::StringField("error", e.what())});
    return model::Value::Null();
  }
}

std::vector<schema::FieldDescriptor> FieldAccessor::QueryableFields(const schema::RecordType& type) const {
  std::vector<schema::FieldDescriptor> fields;
  std::unordered_set<std::string>      seen;

  for (const schema::RecordType* t = &type; t; t = t->base()) {
    for (const auto& field : t->fields()) {
      if (!seen.insert(field.name).second) continue;
      if (field.kind == schema::FieldKind::kDelegate || IsHidden(field.name)) continue;
      fields.push_back(schema::FieldDescriptor{field.name, field.kind, t});
    }
  }
  return fields;
}

void FieldAccessor::ClearCache() {
  std::unique_lock lock(mutex_);
  cache_.clear();
}

size_t FieldAccessor::CacheSize() const {
  std::shared_lock lock(mutex_);
  return cache_.size();
}

} // namespace datalens::query
