/***
 * Name: AnalysisSession (queries)
 * Purpose: Completion-style queries over the module table.
 * Theory of Operation:
 *   Queries read snapshots of the module table and never import modules that are still
 *   unloaded, except getModuleMembers, which resolves the requested path on demand.
 */
#include "analysis/AnalysisSession.h"

#include "pyinfer/support/parse.h"

namespace pyinfer::analysis {

    namespace {

        // "pkg.name" matches the bare name "name".
        bool packageNameMatches(const std::string& name, const std::string& moduleName) {
            const auto dot = moduleName.rfind('.');
            return dot != std::string::npos && moduleName.size() == dot + 1 + name.size() &&
                   moduleName.compare(dot + 1, name.size(), name) == 0;
        }

        bool holdsModule(const NamespaceSet& values) {
            for (Namespace* value : values) {
                if (value->asModule() != nullptr) { return true; }
            }
            return false;
        }

    } // namespace

    /*** Name: AnalysisSession::getModules */
    std::vector<MemberResult> AnalysisSession::getModules(bool topLevelOnly) {
        std::vector<MemberResult> out;
        for (const auto& [name, ref] : modules_.snapshot()) {
            if (name.empty() || !ref->isValid()) { continue; }
            if (topLevelOnly && name.find('.') != std::string::npos) { continue; }
            out.push_back(MemberResult{name, name, NamespaceSet(ref->module()), ref->memberType()});
        }
        return out;
    }

    std::vector<MemberResult> AnalysisSession::getModule(const std::string& name) {
        return getModuleMembers(defaultContext(), support::SplitList(name, '.'), true);
    }

    /*** Name: AnalysisSession::getModuleMembers */
    std::vector<MemberResult> AnalysisSession::getModuleMembers(const host::ModuleContext* ctx,
                                                                const std::vector<std::string>& names,
                                                                bool includeMembers) {
        std::vector<MemberResult> out;
        if (names.empty()) { return out; }

        std::string qualified = names[0];
        for (std::size_t i = 1; i < names.size(); ++i) { qualified += "." + names[i]; }

        ModuleLike* module = nullptr;
        if (auto ref = modules_.tryGetValue(names[0]); ref && ref->isValid()) { module = ref->moduleLike(); }
        for (std::size_t i = 1; i < names.size() && module != nullptr; ++i) {
            Namespace* child = module->childPackage(ctx, names[i]);
            module = child != nullptr ? child->asModule() : nullptr;
        }

        std::map<std::string, MemberResult> byName;
        if (module != nullptr) {
            for (const auto& [child, value] : module->childPackages(ctx)) {
                byName[child] = MemberResult{child, child, NamespaceSet(value), MemberType::Module};
            }
        }
        // Registered children of a package that has no module of its own.
        const std::string prefix = qualified + ".";
        for (const auto& [name, ref] : modules_.snapshot()) {
            if (!ref->isValid() || name.compare(0, prefix.size(), prefix) != 0) { continue; }
            const std::string child = name.substr(prefix.size());
            if (child.empty() || child.find('.') != std::string::npos || byName.count(child) != 0) { continue; }
            byName[child] = MemberResult{child, child, NamespaceSet(ref->module()), MemberType::Module};
        }

        if (module != nullptr) {
            auto* value = dynamic_cast<Namespace*>(module);
            const std::map<std::string, NamespaceSet> members =
                value != nullptr ? value->allMembers() : std::map<std::string, NamespaceSet>{};
            for (const auto& [member, values] : members) {
                if (!includeMembers && !holdsModule(values)) { continue; }
                byName[member] = MemberResult{member, member, values, memberTypeOf(values)};
            }
        }

        out.reserve(byName.size());
        for (auto& [name, result] : byName) { out.push_back(std::move(result)); }
        return out;
    }

    /*** Name: AnalysisSession::findNameInAllModules */
    std::vector<ExportedMemberInfo> AnalysisSession::findNameInAllModules(const std::string& name) {
        const auto modules = modules_.snapshot();
        std::vector<ExportedMemberInfo> out;
        for (const auto& [moduleName, ref] : modules) {
            if (!ref->isValid()) { continue; }
            if (moduleName == name || packageNameMatches(name, moduleName)) {
                out.push_back(ExportedMemberInfo{moduleName, true});
            }
        }
        for (const auto& [moduleName, ref] : modules) {
            if (!ref->isValid()) { continue; }
            switch (ref->containsMember(defaultContext(), name)) {
                case MemberPresence::Resolved:
                    out.push_back(ExportedMemberInfo{moduleName + "." + name, true});
                    break;
                case MemberPresence::Speculative:
                    out.push_back(ExportedMemberInfo{moduleName + "." + name, false});
                    break;
                case MemberPresence::Absent:
                    break;
            }
        }
        return out;
    }

} // namespace pyinfer::analysis
