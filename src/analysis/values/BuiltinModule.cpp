/***
 * Name: BuiltinModule, ReflectedNamespace (definitions)
 * Purpose: Host modules and generic member containers seen through the value universe.
 */
#include "analysis/values/BuiltinValues.h"

#include "analysis/AnalysisSession.h"
#include "analysis/values/SpecializedCallable.h"

namespace pyinfer::analysis {

    const host::ModuleContext* BuiltinModule::context(const host::ModuleContext* ctx) const {
        return ctx != nullptr ? ctx : session_.defaultContext();
    }

    /*** Name: BuiltinModule::memberValue */
    NamespaceSet BuiltinModule::memberValue(const std::string& name) {
        const host::HostObject* member = module_.member(session_.defaultContext(), name);
        if (member == nullptr) { return {}; }
        Namespace* value = session_.valueOf(member);
        if (specialization(name)) {
            const std::lock_guard<std::mutex> lock(mutex_);
            Namespace*& slot = specialized_[name];
            if (slot == nullptr) { slot = session_.make<SpecializedCallable>(session_, value, *this, name); }
            return slot->selfSet();
        }
        return NamespaceSet(value);
    }

    /*** Name: BuiltinModule::getMember */
    NamespaceSet BuiltinModule::getMember(const ast::Node&, AnalysisUnit&, const std::string& name) {
        NamespaceSet value = memberValue(name);
        if (!value.empty()) { return value; }
        return NamespaceSet(childPackage(nullptr, name));
    }

    std::map<std::string, NamespaceSet> BuiltinModule::allMembers() {
        std::map<std::string, NamespaceSet> out;
        for (const std::string& name : module_.memberNames(session_.defaultContext())) { out[name] = memberValue(name); }
        return out;
    }

    /*** Name: BuiltinModule::childPackage */
    Namespace* BuiltinModule::childPackage(const host::ModuleContext*, const std::string& name) {
        auto ref = session_.modules().tryGetValue(module_.name() + "." + name);
        return ref && ref->hasModule() ? ref->module() : nullptr;
    }

    std::map<std::string, Namespace*> BuiltinModule::childPackages(const host::ModuleContext* ctx) {
        std::map<std::string, Namespace*> out;
        const std::string prefix = module_.name() + ".";
        for (const auto& [qualified, ref] : session_.modules().snapshot()) {
            if (qualified.compare(0, prefix.size(), prefix) != 0) { continue; }
            const std::string child = qualified.substr(prefix.size());
            if (child.empty() || child.find('.') != std::string::npos) { continue; }
            if (Namespace* module = childPackage(ctx, child)) { out[child] = module; }
        }
        return out;
    }

    MemberPresence BuiltinModule::memberPresence(const host::ModuleContext* ctx, const std::string& name) {
        if (module_.member(context(ctx), name) != nullptr) { return MemberPresence::Resolved; }
        auto ref = session_.modules().peek(module_.name() + "." + name);
        return ref ? MemberPresence::Resolved : MemberPresence::Absent;
    }

    /*** Name: ReflectedNamespace::getMember */
    NamespaceSet ReflectedNamespace::getMember(const ast::Node&, AnalysisUnit&, const std::string& name) {
        const host::HostObject* member = container_.member(session_.defaultContext(), name);
        if (member == nullptr) { return {}; }
        return NamespaceSet(session_.valueOf(member));
    }

    std::map<std::string, NamespaceSet> ReflectedNamespace::allMembers() {
        return session_.allMembers(container_, session_.defaultContext());
    }

} // namespace pyinfer::analysis
