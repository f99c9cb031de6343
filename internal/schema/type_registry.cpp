#include "type_registry.hpp"

#include "internal/util/errors.hpp"

namespace datalens::schema {

RecordType& TypeRegistry::Register(const std::string& name, const std::string& base_name, const std::string& category) {
  if (name.empty()) {
    throw util::InvalidArgument("record type name must not be empty");
  }
  if (by_name_.contains(name)) {
    throw util::AlreadyExists("record type '" + name + "' already registered");
  }

  const RecordType* base = nullptr;
  if (!base_name.empty()) {
    base = Find(base_name);
    if (!base) {
      throw util::NotFound("base type '" + base_name + "' of '" + name + "' is not registered");
    }
  }

  types_.push_back(std::make_unique<RecordType>(name, base, category));
  auto* type     = types_.back().get();
  by_name_[name] = type;
  return *type;
}

const RecordType* TypeRegistry::Find(std::string_view name) const {
  auto it = by_name_.find(std::string(name));
  return it == by_name_.end() ? nullptr : it->second;
}

RecordType* TypeRegistry::FindMutable(std::string_view name) {
  auto it = by_name_.find(std::string(name));
  return it == by_name_.end() ? nullptr : it->second;
}

std::vector<const RecordType*> TypeRegistry::Types() const {
  std::vector<const RecordType*> out;
  out.reserve(types_.size());
  for (const auto& type : types_) {
    out.push_back(type.get());
  }
  return out;
}

std::shared_ptr<const RecordType> TypeRegistry::Share(const std::shared_ptr<const TypeRegistry>& registry, const RecordType& type) {
  if (!registry || registry->Find(type.name()) != &type) {
    throw util::InvalidArgument("record type '" + type.name() + "' does not belong to this registry");
  }
  return std::shared_ptr<const RecordType>(registry, &type);
}

} // namespace datalens::schema
