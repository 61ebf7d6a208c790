/***
 * Name: MultipleMemberInfo (definitions)
 * Purpose: Aggregate of alternatives; every operation is the union over the alternatives.
 */
#include "analysis/values/MultipleMemberInfo.h"

#include <algorithm>

#include "analysis/AnalysisSession.h"

namespace pyinfer::analysis {

    std::string MultipleMemberInfo::name() const { return members_.empty() ? "<multiple>" : members_.front()->name(); }

    std::string MultipleMemberInfo::description() const {
        std::string out = "one of: ";
        for (std::size_t i = 0; i < members_.size(); ++i) {
            if (i != 0) { out += ", "; }
            out += members_[i]->description();
        }
        return out;
    }

    /*** Name: MultipleMemberInfo::getMember */
    NamespaceSet MultipleMemberInfo::getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) {
        NamespaceSet out;
        for (Namespace* member : members_) { out = out.unionWith(member->getMember(node, unit, name)); }
        return out;
    }

    /*** Name: MultipleMemberInfo::call */
    NamespaceSet MultipleMemberInfo::call(const ast::Node& node, AnalysisUnit& unit,
                                          const std::vector<NamespaceSet>& args,
                                          const std::vector<std::string>& argNames) {
        NamespaceSet out;
        for (Namespace* member : members_) { out = out.unionWith(member->call(node, unit, args, argNames)); }
        return out;
    }

    std::map<std::string, NamespaceSet> MultipleMemberInfo::allMembers() {
        std::map<std::string, NamespaceSet> out;
        for (Namespace* member : members_) {
            for (const auto& [name, values] : member->allMembers()) { out[name] = out[name].unionWith(values); }
        }
        return out;
    }

    /*** Name: MultipleMemberInfo::childPackage */
    Namespace* MultipleMemberInfo::childPackage(const host::ModuleContext* ctx, const std::string& name) {
        std::vector<Namespace*> found;
        for (Namespace* member : members_) {
            ModuleLike* module = member->asModule();
            if (module == nullptr) { continue; }
            Namespace* child = module->childPackage(ctx, name);
            if (child != nullptr && std::find(found.begin(), found.end(), child) == found.end()) {
                found.push_back(child);
            }
        }
        return session_.aggregate(std::move(found));
    }

    std::map<std::string, Namespace*> MultipleMemberInfo::childPackages(const host::ModuleContext* ctx) {
        std::map<std::string, Namespace*> out;
        for (Namespace* member : members_) {
            ModuleLike* module = member->asModule();
            if (module == nullptr) { continue; }
            for (const auto& [name, child] : module->childPackages(ctx)) { out.emplace(name, child); }
        }
        return out;
    }

    MemberPresence MultipleMemberInfo::memberPresence(const host::ModuleContext* ctx, const std::string& name) {
        MemberPresence best = MemberPresence::Absent;
        for (Namespace* member : members_) {
            ModuleLike* module = member->asModule();
            if (module == nullptr) { continue; }
            const MemberPresence presence = module->memberPresence(ctx, name);
            if (static_cast<int>(presence) > static_cast<int>(best)) { best = presence; }
        }
        return best;
    }

} // namespace pyinfer::analysis
