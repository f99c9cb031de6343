#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace datalens::model {

/*
  Value kinds a record field can hold. The order matches the alternatives
  of Value::Storage.
*/
enum class ValueKind : std::uint8_t {
  kNull = 0,
  kInteger,
  kFloat,
  kBoolean,
  kString,
  kVector2,
  kVector3,
  kColor,
  kEnum,
  kObject,
  kRecordRef,
};

std::string_view ToString(ValueKind kind);

struct Vector2 {
  double x = 0;
  double y = 0;

  bool operator==(const Vector2&) const = default;
};

struct Vector3 {
  double x = 0;
  double y = 0;
  double z = 0;

  bool operator==(const Vector3&) const = default;
};

struct Color {
  double r = 0;
  double g = 0;
  double b = 0;
  double a = 1;

  bool operator==(const Color&) const = default;
};

struct EnumValue {
  std::string  name;
  std::int64_t ordinal = 0;

  bool operator==(const EnumValue&) const = default;
};

// Opaque handle to a non-record object (texture, prefab, nested asset).
struct ObjectRef {
  std::string type_name;
  std::string label;

  bool operator==(const ObjectRef&) const = default;
};

// Reference to another record by identity.
struct RecordRef {
  std::string identity;

  bool operator==(const RecordRef&) const = default;
};

class Value {
 public:
  using Storage = std::variant<std::monostate, std::int64_t, double, bool, std::string, Vector2, Vector3, Color, EnumValue, ObjectRef, RecordRef>;

  Value() = default;
  Value(std::int64_t v) : storage_(v) {
  }
  Value(int v) : storage_(static_cast<std::int64_t>(v)) {
  }
  Value(double v) : storage_(v) {
  }
  Value(bool v) : storage_(v) {
  }
  Value(std::string v) : storage_(std::move(v)) {
  }
  Value(const char* v) : storage_(std::string(v)) {
  }
  Value(Vector2 v) : storage_(v) {
  }
  Value(Vector3 v) : storage_(v) {
  }
  Value(Color v) : storage_(v) {
  }
  Value(EnumValue v) : storage_(std::move(v)) {
  }
  Value(ObjectRef v) : storage_(std::move(v)) {
  }
  Value(RecordRef v) : storage_(std::move(v)) {
  }

  static Value Null() {
    return {};
  }

  ValueKind Kind() const {
    return static_cast<ValueKind>(storage_.index());
  }

  bool IsNull() const {
    return std::holds_alternative<std::monostate>(storage_);
  }

  bool IsString() const {
    return std::holds_alternative<std::string>(storage_);
  }

  template <typename T>
  const T* As() const {
    return std::get_if<T>(&storage_);
  }

  const Storage& storage() const {
    return storage_;
  }

  // Textual form used by the text operators and the comparator fallback.
  // Null renders as an empty string.
  std::string ToString() const;

  bool operator==(const Value&) const = default;

 private:
  Storage storage_;
};

} // namespace datalens::model
