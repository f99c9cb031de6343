#include "value.hpp"

#include <iomanip>
#include <sstream>

namespace datalens::model {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string FormatNumber(double v) {
  std::ostringstream out;
  out << v;
  return out.str();
}

std::string FormatComponents(std::initializer_list<double> components) {
  std::ostringstream out;
  out << '(';
  bool first = true;
  for (double c : components) {
    if (!first) out << ", ";
    first = false;
    out << std::fixed << std::setprecision(2) << c;
  }
  out << ')';
  return out.str();
}

} // namespace

std::string_view ToString(ValueKind kind) {
  switch (kind) {
    case ValueKind::kNull:
      return "null";
    case ValueKind::kInteger:
      return "int";
    case ValueKind::kFloat:
      return "float";
    case ValueKind::kBoolean:
      return "bool";
    case ValueKind::kString:
      return "string";
    case ValueKind::kVector2:
      return "vector2";
    case ValueKind::kVector3:
      return "vector3";
    case ValueKind::kColor:
      return "color";
    case ValueKind::kEnum:
      return "enum";
    case ValueKind::kObject:
      return "object";
    case ValueKind::kRecordRef:
      return "record";
  }
  return "unknown";
}

std::string Value::ToString() const {
  return std::visit(Overloaded{
                        [](std::monostate) { return std::string(); },
                        [](std::int64_t v) { return std::to_string(v); },
                        [](double v) { return FormatNumber(v); },
                        [](bool v) { return std::string(v ? "True" : "False"); },
                        [](const std::string& v) { return v; },
                        [](const Vector2& v) { return FormatComponents({v.x, v.y}); },
                        [](const Vector3& v) { return FormatComponents({v.x, v.y, v.z}); },
                        [](const Color& v) {
                          std::ostringstream out;
                          out << "RGBA" << std::fixed << std::setprecision(3) << '(' << v.r << ", " << v.g << ", " << v.b << ", " << v.a << ')';
                          return out.str();
                        },
                        [](const EnumValue& v) { return v.name; },
                        [](const ObjectRef& v) { return v.label + " (" + v.type_name + ")"; },
                        [](const RecordRef& v) { return v.identity; },
                    },
                    storage_);
}

} // namespace datalens::model
