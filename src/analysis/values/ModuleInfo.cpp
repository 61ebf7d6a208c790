/***
 * Name: ModuleInfo (definitions)
 * Purpose: A project module: its top-level scope doubles as its member table.
 * Theory of Operation:
 *   Reading a member records the reader as a dependent of the member's variable, so a
 *   later assignment in this module re-runs readers in other modules. Names with no
 *   assignment fall back to child packages registered under "<module>.<name>".
 */
#include "analysis/values/ModuleInfo.h"

#include <utility>

#include "analysis/AnalysisSession.h"
#include "analysis/AnalysisUnit.h"
#include "analysis/ProjectEntry.h"

namespace pyinfer::analysis {

    ModuleInfo::ModuleInfo(AnalysisSession& session, ProjectEntry& entry, std::string name)
        : Namespace(NamespaceKind::Module), session_(session), entry_(entry), name_(std::move(name)),
          scope_(ScopeKind::Module, nullptr, this, session.limits().maxVariableTypes) {}

    /*** Name: ModuleInfo::getMember */
    NamespaceSet ModuleInfo::getMember(const ast::Node&, AnalysisUnit& unit, const std::string& name) {
        VariableDef& variable = scope_.createVariable(name);
        variable.addDependency(unit);
        if (variable.types().empty() && variable.assignments().empty()) {
            return NamespaceSet(childPackage(nullptr, name));
        }
        return variable.types();
    }

    /*** Name: ModuleInfo::setMember */
    void ModuleInfo::setMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name,
                               const NamespaceSet& value) {
        VariableDef& variable = scope_.createVariable(name);
        variable.addAssignment(unit.locationOf(node));
        variable.addTypes(value);
    }

    std::map<std::string, NamespaceSet> ModuleInfo::allMembers() {
        std::map<std::string, NamespaceSet> out;
        for (const auto& [name, variable] : scope_.variables()) {
            if (!variable->assignments().empty() || !variable->types().empty()) { out[name] = variable->types(); }
        }
        return out;
    }

    /*** Name: ModuleInfo::childPackage */
    Namespace* ModuleInfo::childPackage(const host::ModuleContext*, const std::string& name) {
        auto ref = session_.modules().tryGetValue(name_ + "." + name);
        return ref && ref->hasModule() ? ref->module() : nullptr;
    }

    std::map<std::string, Namespace*> ModuleInfo::childPackages(const host::ModuleContext* ctx) {
        std::map<std::string, Namespace*> out;
        const std::string prefix = name_ + ".";
        for (const auto& [qualified, ref] : session_.modules().snapshot()) {
            if (qualified.compare(0, prefix.size(), prefix) != 0) { continue; }
            const std::string child = qualified.substr(prefix.size());
            if (child.empty() || child.find('.') != std::string::npos) { continue; }
            if (Namespace* module = childPackage(ctx, child)) { out[child] = module; }
        }
        return out;
    }

    /*** Name: ModuleInfo::memberPresence */
    MemberPresence ModuleInfo::memberPresence(const host::ModuleContext*, const std::string& name) {
        if (const VariableDef* variable = scope_.findVariable(name)) {
            if (!variable->types().empty()) { return MemberPresence::Resolved; }
            if (!variable->assignments().empty()) { return MemberPresence::Speculative; }
        }
        auto ref = session_.modules().peek(name_ + "." + name);
        return ref && ref->hasModule() ? MemberPresence::Resolved : MemberPresence::Absent;
    }

    /*** Name: ModuleInfo::clear */
    void ModuleInfo::clear() {
        for (const auto& [name, variable] : scope_.variables()) { variable->notifyDependents(); }
        scope_.clear();
    }

    void ModuleInfo::specializationsChanged() {
        if (entry_.tree() != nullptr) { entry_.enqueueForAnalysis(); }
    }

} // namespace pyinfer::analysis
