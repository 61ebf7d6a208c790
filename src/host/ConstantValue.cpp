/***
 * Name: pyinfer::host::ConstantValue (impl)
 * Purpose: Hashing, type mapping and formatting for primitive constants.
 */
#include "host/ConstantValue.h"

#include <functional>
#include <sstream>
#include <type_traits>

namespace pyinfer::host {

std::size_t ConstantValueHash::operator()(const ConstantValue& value) const {
  const std::size_t seed = value.index() * 0x9e3779b97f4a7c15ULL;
  const std::size_t payload = std::visit([](const auto& v) -> std::size_t {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, Ellipsis>) {
      return 0;
    } else if constexpr (std::is_same_v<T, BigInt>) {
      return std::hash<std::string>{}(v.digits);
    } else if constexpr (std::is_same_v<T, Bytes>) {
      return std::hash<std::string>{}(v.data);
    } else if constexpr (std::is_same_v<T, std::complex<double>>) {
      return std::hash<double>{}(v.real()) ^ (std::hash<double>{}(v.imag()) << 1U);
    } else {
      return std::hash<T>{}(v);
    }
  }, value);
  return seed ^ (payload + 0x9e3779b9U + (seed << 6U) + (seed >> 2U));
}

BuiltinTypeId typeIdOf(const ConstantValue& value, bool unicodeStrings) {
  switch (value.index()) {
    case 0: return BuiltinTypeId::NoneType;
    case 1: return BuiltinTypeId::Bool;
    case 2: return BuiltinTypeId::Int;
    case 3: return BuiltinTypeId::Long;
    case 4: return BuiltinTypeId::Float;
    case 5: return BuiltinTypeId::Complex;
    case 6: return unicodeStrings ? BuiltinTypeId::Unicode : BuiltinTypeId::Str;
    case 7: return BuiltinTypeId::Bytes;
    case 8: return BuiltinTypeId::Ellipsis;
    default: return BuiltinTypeId::Unknown;
  }
}

std::optional<std::string> constantAsString(const ConstantValue& value) {
  if (const auto* s = std::get_if<std::string>(&value)) {
    return *s;
  }
  if (const auto* b = std::get_if<Bytes>(&value)) {
    return b->data;
  }
  return std::nullopt;
}

std::string describeConstant(const ConstantValue& value) {
  std::ostringstream oss;
  std::visit([&oss](const auto& v) {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      oss << "None";
    } else if constexpr (std::is_same_v<T, bool>) {
      oss << (v ? "True" : "False");
    } else if constexpr (std::is_same_v<T, BigInt>) {
      oss << v.digits << "L";
    } else if constexpr (std::is_same_v<T, std::complex<double>>) {
      oss << "(" << v.real() << "+" << v.imag() << "j)";
    } else if constexpr (std::is_same_v<T, std::string>) {
      oss << "'" << v << "'";
    } else if constexpr (std::is_same_v<T, Bytes>) {
      oss << "b'" << v.data << "'";
    } else if constexpr (std::is_same_v<T, Ellipsis>) {
      oss << "Ellipsis";
    } else {
      oss << v;
    }
  }, value);
  return oss.str();
}

}  // namespace pyinfer::host
