/***
 * Name: ImportResolver (definitions)
 * Purpose: Resolve dotted import paths across project modules, host modules and ambiguous bindings.
 * Theory of Operation:
 *   Each step looks at the shape of the value reached so far. Module values descend through
 *   child packages; host modules (and other host containers) descend through their members
 *   until the segments run out and the last object is classified. An ambiguous host
 *   binding resolves every alternative separately and re-aggregates what resolved.
 */
#include "analysis/ImportResolver.h"

#include <algorithm>

#include "analysis/AnalysisSession.h"
#include "analysis/values/BuiltinValues.h"

namespace pyinfer::analysis {

    namespace {
        std::vector<std::string> splitDotted(const std::string& name) {
            std::vector<std::string> out;
            std::size_t start = 0;
            while (true) {
                const std::size_t dot = name.find('.', start);
                out.push_back(name.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
                if (dot == std::string::npos) { break; }
                start = dot + 1;
            }
            return out;
        }
    } // namespace

    /*** Name: ImportResolver::importBuiltinModule */
    Namespace* ImportResolver::importBuiltinModule(const std::string& name, bool bottom) const {
        const std::vector<std::string> names = splitDotted(name);
        // A leading dot is a relative import; builtins cannot satisfy it.
        if (names.front().empty()) { return nullptr; }

        auto ref = session_.modules().tryGetValue(names.front());
        Namespace* top = ref && ref->hasModule() ? ref->module() : nullptr;
        if (top == nullptr) {
            const host::HostModule* module = session_.interpreter().importModule(names.front());
            if (module != nullptr) { top = session_.builtinModule(*module); }
        }
        if (top == nullptr || names.size() == 1) { return top; }

        // An unresolvable tail yields nothing in both modes, never the top-level module.
        Namespace* last = importFromModule(top, names, 1);
        if (bottom) { return last; }
        return last != nullptr ? top : nullptr;
    }

    /*** Name: ImportResolver::importFromModule */
    Namespace* ImportResolver::importFromModule(Namespace* module, const std::vector<std::string>& names,
                                                std::size_t index) const {
        Namespace* current = module;
        for (std::size_t i = index; i < names.size() && current != nullptr; ++i) {
            ModuleLike* container = current->asModule();
            if (container == nullptr) { return nullptr; }
            Namespace* child = container->childPackage(session_.defaultContext(), names[i]);
            if (child == nullptr && current->kind() == NamespaceKind::BuiltinModule) {
                return importFromHostModule(&static_cast<BuiltinModule*>(current)->hostModule(), names, i);
            }
            current = child;
        }
        return current;
    }

    /*** Name: ImportResolver::importFromHostModule */
    Namespace* ImportResolver::importFromHostModule(const host::HostModule* module,
                                                    const std::vector<std::string>& names, std::size_t index) const {
        if (module == nullptr) { return nullptr; }
        if (index >= names.size()) { return session_.builtinModule(*module); }
        return importFromMember(module->member(session_.defaultContext(), names[index]), names, index + 1);
    }

    /*** Name: ImportResolver::importFromMember */
    Namespace* ImportResolver::importFromMember(const host::HostObject* member, const std::vector<std::string>& names,
                                                std::size_t index) const {
        if (member == nullptr) { return nullptr; }
        if (index >= names.size()) { return session_.valueOf(member); }
        switch (host::classify(member)) {
            case host::HostObjectKind::Module:
                return importFromHostModule(static_cast<const host::HostModule*>(member), names, index);
            case host::HostObjectKind::MultipleMembers:
                return importFromMultipleMembers(static_cast<const host::HostMultipleMembers*>(member), names, index);
            case host::HostObjectKind::Type:
            case host::HostObjectKind::MemberContainer: {
                const auto* container = static_cast<const host::HostMemberContainer*>(member);
                return importFromMember(container->member(session_.defaultContext(), names[index]), names, index + 1);
            }
            default:
                return nullptr;
        }
    }

    /*** Name: ImportResolver::importFromMultipleMembers */
    Namespace* ImportResolver::importFromMultipleMembers(const host::HostMultipleMembers* members,
                                                         const std::vector<std::string>& names,
                                                         std::size_t index) const {
        if (members == nullptr) { return nullptr; }
        std::vector<Namespace*> resolved;
        for (const host::HostObject* alternative : members->members()) {
            Namespace* value = importFromMember(alternative, names, index);
            if (value != nullptr && std::find(resolved.begin(), resolved.end(), value) == resolved.end()) {
                resolved.push_back(value);
            }
        }
        return session_.aggregate(std::move(resolved));
    }

} // namespace pyinfer::analysis
