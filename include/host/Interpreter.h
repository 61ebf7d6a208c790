/***
 * Name: pyinfer::host::Interpreter
 * Purpose: Capability interface for the host interpreter whose builtin modules the engine models.
 * Inputs: Module names, builtin type ids, host objects
 * Outputs: Host modules, types and contexts; all queries are synchronous and in-memory
 * Theory of Operation:
 *   The interpreter owns every host object it returns and must keep them alive for as long
 *   as the session that uses it. `initialize` is called once per (re)load so the host can
 *   register its own specializations on the session.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "host/BuiltinTypeId.h"
#include "host/HostObject.h"

namespace pyinfer::analysis {
class AnalysisSession;
}

namespace pyinfer::host {

class Interpreter {
 public:
  virtual ~Interpreter() = default;

  virtual void initialize(analysis::AnalysisSession& session) { (void)session; }

  // Names of every module the host can import, dotted names included.
  virtual std::vector<std::string> moduleNames() const = 0;

  // nullptr when the host has no such module.
  virtual const HostModule* importModule(std::string_view name) = 0;

  // nullptr when the host does not model the type.
  virtual const HostType* builtinType(BuiltinTypeId id) const = 0;

  virtual std::unique_ptr<ModuleContext> createModuleContext() = 0;

  // Declared type of an object the engine could not classify; nullptr when unknown.
  virtual const HostType* declaredTypeOf(const HostObject* obj) const {
    (void)obj;
    return nullptr;
  }

  // Construct a generic type instantiation; nullptr when unsupported.
  virtual const HostType* makeGenericType(const HostType* generic, const std::vector<const HostType*>& indexTypes) {
    (void)generic;
    (void)indexTypes;
    return nullptr;
  }
};

}  // namespace pyinfer::host
