/***
 * Name: pyinfer::host (host objects)
 * Purpose: Capability interfaces through which the engine sees the host type system.
 * Inputs: Objects owned by the host interpreter; the engine only holds non-owning pointers.
 * Outputs: Member lookup, naming and typing of builtin modules, types, functions and constants.
 * Theory of Operation:
 *   Every host object declares one HostObjectKind. `classify` confirms the declared kind
 *   against the object's actual capability interface once, so the engine can match on a
 *   closed enumeration instead of probing types at every use site. Object identity (the
 *   pointer) is the memoization key used by the engine.
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "host/BuiltinTypeId.h"
#include "host/ConstantValue.h"

namespace pyinfer::host {

enum class HostObjectKind {
  Type,
  Function,
  MethodDescriptor,
  Property,
  Module,
  Constant,
  Primitive,
  MemberContainer,
  MultipleMembers,
  Unknown
};

const char* to_string(HostObjectKind kind);

// Opaque per-module lookup context (import state, language flags) created by the host.
class ModuleContext {
 public:
  virtual ~ModuleContext() = default;
};

class HostObject {
 public:
  virtual ~HostObject() = default;
  virtual HostObjectKind kind() const = 0;
};

class HostType;

// A generic reflectable container: anything with named members.
class HostMemberContainer : public HostObject {
 public:
  HostObjectKind kind() const override { return HostObjectKind::MemberContainer; }
  // nullptr when the member does not exist.
  virtual const HostObject* member(const ModuleContext* ctx, std::string_view name) const = 0;
  virtual std::vector<std::string> memberNames(const ModuleContext* ctx) const = 0;
};

class HostType : public HostMemberContainer {
 public:
  HostObjectKind kind() const override { return HostObjectKind::Type; }
  virtual std::string name() const = 0;
  virtual BuiltinTypeId typeId() const { return BuiltinTypeId::Unknown; }
  // Dotted name of the module that declares the type (e.g. "decimal").
  virtual std::string declaringModule() const = 0;
};

class HostModule : public HostMemberContainer {
 public:
  HostObjectKind kind() const override { return HostObjectKind::Module; }
  virtual std::string name() const = 0;
};

class HostFunction : public HostObject {
 public:
  HostObjectKind kind() const override { return HostObjectKind::Function; }
  virtual std::string name() const = 0;
  virtual std::string declaringModule() const = 0;
  virtual std::vector<const HostType*> returnTypes() const = 0;
};

class HostMethodDescriptor : public HostObject {
 public:
  HostObjectKind kind() const override { return HostObjectKind::MethodDescriptor; }
  virtual const HostFunction* function() const = 0;
};

class HostProperty : public HostObject {
 public:
  HostObjectKind kind() const override { return HostObjectKind::Property; }
  virtual const HostType* type() const = 0;
};

// A named constant whose value is not known, only its type (e.g. `sys.maxsize`).
class HostConstant : public HostObject {
 public:
  HostObjectKind kind() const override { return HostObjectKind::Constant; }
  virtual const HostType* type() const = 0;
};

// A raw primitive value exposed by the host.
class HostPrimitive final : public HostObject {
 public:
  explicit HostPrimitive(ConstantValue value) : value_(std::move(value)) {}
  HostObjectKind kind() const override { return HostObjectKind::Primitive; }
  const ConstantValue& value() const { return value_; }

 private:
  ConstantValue value_;
};

// A name that may be bound to one of several host objects (e.g. platform-conditional modules).
class HostMultipleMembers : public HostObject {
 public:
  HostObjectKind kind() const override { return HostObjectKind::MultipleMembers; }
  virtual std::vector<const HostObject*> members() const = 0;
};

/***
 * classify: Confirm the declared kind of `obj` against its capability interface.
 * Returns Unknown when the declared kind is not backed by the matching interface.
 * `obj` must not be null.
 */
HostObjectKind classify(const HostObject* obj);

}  // namespace pyinfer::host
