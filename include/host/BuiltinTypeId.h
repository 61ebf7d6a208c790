/***
 * Name: pyinfer::host::BuiltinTypeId
 * Purpose: Identify the builtin types the engine models specially or needs by name.
 */
#pragma once

namespace pyinfer::host {

enum class BuiltinTypeId {
  Unknown,
  Object,
  Type,
  NoneType,
  Bool,
  Int,
  Long,
  Float,
  Complex,
  Str,
  Unicode,
  Bytes,
  List,
  Tuple,
  Dict,
  Set,
  Function,
  BuiltinFunction,
  Module,
  Ellipsis,
  ListIterator,
  CallableIterator
};

inline const char* to_string(const BuiltinTypeId id) {
  switch (id) {
    case BuiltinTypeId::Object: return "object";
    case BuiltinTypeId::Type: return "type";
    case BuiltinTypeId::NoneType: return "NoneType";
    case BuiltinTypeId::Bool: return "bool";
    case BuiltinTypeId::Int: return "int";
    case BuiltinTypeId::Long: return "long";
    case BuiltinTypeId::Float: return "float";
    case BuiltinTypeId::Complex: return "complex";
    case BuiltinTypeId::Str: return "str";
    case BuiltinTypeId::Unicode: return "unicode";
    case BuiltinTypeId::Bytes: return "bytes";
    case BuiltinTypeId::List: return "list";
    case BuiltinTypeId::Tuple: return "tuple";
    case BuiltinTypeId::Dict: return "dict";
    case BuiltinTypeId::Set: return "set";
    case BuiltinTypeId::Function: return "function";
    case BuiltinTypeId::BuiltinFunction: return "builtin_function";
    case BuiltinTypeId::Module: return "module";
    case BuiltinTypeId::Ellipsis: return "ellipsis";
    case BuiltinTypeId::ListIterator: return "list_iterator";
    case BuiltinTypeId::CallableIterator: return "callable_iterator";
    default: return "unknown";
  }
}

}  // namespace pyinfer::host
