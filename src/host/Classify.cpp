/***
 * Name: pyinfer::host::classify
 * Purpose: Capability classification mapping a host object to its HostObjectKind exactly once.
 * Inputs:
 *   - obj: non-null host object
 * Outputs: Confirmed kind, or Unknown on a declared/actual capability mismatch
 */
#include "host/HostObject.h"

namespace pyinfer::host {

namespace {
template <typename T>
HostObjectKind confirm(const HostObject* obj, HostObjectKind declared) {
  return dynamic_cast<const T*>(obj) != nullptr ? declared : HostObjectKind::Unknown;
}
}  // namespace

HostObjectKind classify(const HostObject* obj) {
  const HostObjectKind declared = obj->kind();
  switch (declared) {
    case HostObjectKind::Type: return confirm<HostType>(obj, declared);
    case HostObjectKind::Function: return confirm<HostFunction>(obj, declared);
    case HostObjectKind::MethodDescriptor: return confirm<HostMethodDescriptor>(obj, declared);
    case HostObjectKind::Property: return confirm<HostProperty>(obj, declared);
    case HostObjectKind::Module: return confirm<HostModule>(obj, declared);
    case HostObjectKind::Constant: return confirm<HostConstant>(obj, declared);
    case HostObjectKind::Primitive: return confirm<HostPrimitive>(obj, declared);
    case HostObjectKind::MemberContainer: return confirm<HostMemberContainer>(obj, declared);
    case HostObjectKind::MultipleMembers: return confirm<HostMultipleMembers>(obj, declared);
    default: return HostObjectKind::Unknown;
  }
}

const char* to_string(const HostObjectKind kind) {
  switch (kind) {
    case HostObjectKind::Type: return "type";
    case HostObjectKind::Function: return "function";
    case HostObjectKind::MethodDescriptor: return "method_descriptor";
    case HostObjectKind::Property: return "property";
    case HostObjectKind::Module: return "module";
    case HostObjectKind::Constant: return "constant";
    case HostObjectKind::Primitive: return "primitive";
    case HostObjectKind::MemberContainer: return "member_container";
    case HostObjectKind::MultipleMembers: return "multiple_members";
    default: return "unknown";
  }
}

}  // namespace pyinfer::host
