/***
 * Name: pyinfer::host::ConstantValue
 * Purpose: Carry a primitive constant produced by the host (or by a source literal).
 * Theory of Operation:
 *   A closed variant over the primitive kinds the engine classifies without asking the
 *   host: None (monostate), bool, int, long (arbitrary precision, kept as decimal text),
 *   float, complex, str, bytes and Ellipsis. Values are hashable so that one abstract
 *   constant exists per distinct value.
 */
#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "host/BuiltinTypeId.h"

namespace pyinfer::host {

struct Bytes {
  std::string data;
  bool operator==(const Bytes& other) const { return data == other.data; }
};

struct BigInt {
  std::string digits;
  bool operator==(const BigInt& other) const { return digits == other.digits; }
};

struct Ellipsis {
  bool operator==(const Ellipsis&) const { return true; }
};

using ConstantValue =
    std::variant<std::monostate, bool, int64_t, BigInt, double, std::complex<double>, std::string, Bytes, Ellipsis>;

struct ConstantValueHash {
  std::size_t operator()(const ConstantValue& value) const;
};

// Builtin type of a primitive; str maps to Unicode when `unicodeStrings` (3.x semantics).
BuiltinTypeId typeIdOf(const ConstantValue& value, bool unicodeStrings);

// Text of a str constant or the payload of a bytes constant; nullopt for everything else.
std::optional<std::string> constantAsString(const ConstantValue& value);

std::string describeConstant(const ConstantValue& value);

}  // namespace pyinfer::host
