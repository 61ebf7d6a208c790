/***
 * Name: ClassInfo, InstanceInfo (definitions)
 * Purpose: User classes and their instances.
 * Theory of Operation:
 *   Class members live in the class scope; lookups that miss there continue through the
 *   values bound to the base-class expressions. A class reachable from its own bases
 *   (through re-assignment in flow-insensitive analysis) would recurse forever, so a lookup
 *   already in progress on the class yields nothing for the bases. Instances keep their own
 *   attribute records and bind class-level functions to themselves.
 */
#include "analysis/values/ClassInfo.h"

#include "analysis/AnalysisSession.h"
#include "analysis/AnalysisUnit.h"
#include "analysis/ProjectEntry.h"
#include "analysis/values/BuiltinValues.h"
#include "analysis/values/FunctionInfo.h"
#include "ast/FunctionDef.h"

namespace pyinfer::analysis {

    namespace {
        class ResolvingGuard {
        public:
            explicit ResolvingGuard(bool& flag) : flag_(flag) { flag_ = true; }
            ~ResolvingGuard() { flag_ = false; }
            ResolvingGuard(const ResolvingGuard&) = delete;
            ResolvingGuard& operator=(const ResolvingGuard&) = delete;

        private:
            bool& flag_;
        };
    } // namespace

    ClassInfo::ClassInfo(AnalysisSession& session, ProjectEntry* entry, const ast::ClassDef& def, Scope& outer)
        : Namespace(NamespaceKind::Class), session_(session), entry_(entry), def_(&def), name_(def.name),
          scope_(ScopeKind::Class, &outer, this, session.limits().maxVariableTypes), bases_(0) {
        if (entry_ != nullptr) { entry_->trackDefinition(*this); }
    }

    std::string ClassInfo::name() const { return name_; }

    InstanceInfo& ClassInfo::instance() {
        if (instance_ == nullptr) { instance_ = session_.make<InstanceInfo>(session_, *this); }
        return *instance_;
    }

    AnalysisUnit* ClassInfo::unit() {
        if (def_ == nullptr) { return nullptr; }
        if (!unit_) { unit_ = session_.makeUnit(entry_, scope_, *def_).shared_from_this(); }
        return unit_.get();
    }

    void ClassInfo::detach() {
        def_ = nullptr;
        unit_.reset();
    }

    /*** Name: ClassInfo::getMember */
    NamespaceSet ClassInfo::getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) {
        VariableDef& variable = scope_.createVariable(name);
        variable.addDependency(unit);
        if (!variable.types().empty()) { return variable.types(); }

        bases_.addDependency(unit);
        if (resolving_) { return {}; }
        const ResolvingGuard guard(resolving_);
        NamespaceSet out;
        for (Namespace* base : bases_.types()) { out = out.unionWith(base->getMember(node, unit, name)); }
        return out;
    }

    /*** Name: ClassInfo::setMember */
    void ClassInfo::setMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name,
                              const NamespaceSet& value) {
        VariableDef& variable = scope_.createVariable(name);
        variable.addAssignment(unit.locationOf(node));
        variable.addTypes(value);
    }

    /*** Name: ClassInfo::call */
    NamespaceSet ClassInfo::call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                                 const std::vector<std::string>& argNames) {
        InstanceInfo& self = instance();
        analysis::call(self.getMember(node, unit, "__init__"), node, unit, args, argNames);
        return self.selfSet();
    }

    NamespaceSet ClassInfo::instanceSet() { return instance().selfSet(); }

    std::map<std::string, NamespaceSet> ClassInfo::allMembers() {
        std::map<std::string, NamespaceSet> out;
        if (!resolving_) {
            const ResolvingGuard guard(resolving_);
            for (Namespace* base : bases_.types()) {
                for (const auto& [name, values] : base->allMembers()) { out[name] = out[name].unionWith(values); }
            }
        }
        for (const auto& [name, variable] : scope_.variables()) {
            if (!variable->types().empty()) { out[name] = variable->types(); }
        }
        return out;
    }

    InstanceInfo::InstanceInfo(AnalysisSession& session, ClassInfo& cls)
        : Namespace(NamespaceKind::Instance), session_(session), class_(cls),
          cap_(session.limits().maxInstanceMemberTypes) {}

    VariableDef& InstanceInfo::attribute(const std::string& name) {
        return attributes_.try_emplace(name, cap_).first->second;
    }

    /*** Name: InstanceInfo::getMember */
    NamespaceSet InstanceInfo::getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) {
        VariableDef& attr = attribute(name);
        attr.addDependency(unit);
        NamespaceSet out = attr.types();
        for (Namespace* value : class_.getMember(node, unit, name)) {
            if (bindsToInstance(*value)) {
                out = out.add(session_.boundMethod(*value, *this));
            } else if (value->kind() == NamespaceKind::BuiltinProperty) {
                out = out.unionWith(static_cast<BuiltinPropertyInfo*>(value)->propertyValue());
            } else {
                out = out.add(value);
            }
        }
        return out;
    }

    /*** Name: InstanceInfo::setMember */
    void InstanceInfo::setMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name,
                                 const NamespaceSet& value) {
        VariableDef& attr = attribute(name);
        attr.addAssignment(unit.locationOf(node));
        attr.addTypes(value);
    }

    NamespaceSet InstanceInfo::call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                                    const std::vector<std::string>& argNames) {
        return analysis::call(getMember(node, unit, "__call__"), node, unit, args, argNames);
    }

    std::map<std::string, NamespaceSet> InstanceInfo::allMembers() {
        std::map<std::string, NamespaceSet> out = class_.allMembers();
        for (const auto& [name, attr] : attributes_) {
            if (!attr.types().empty()) { out[name] = out[name].unionWith(attr.types()); }
        }
        return out;
    }

} // namespace pyinfer::analysis
