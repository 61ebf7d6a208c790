/***
 * Name: pyinfer::analysis::MultipleMemberInfo
 * Purpose: Aggregate standing for "one of several possible values" (e.g. platform-specific modules).
 * Theory of Operation:
 *   Behaves as the union of its members: member lookups, calls and child-package
 *   navigation are applied to every alternative and the results joined. Aggregates are
 *   canonical per member set (AnalysisSession::aggregate), never built directly.
 */
#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "analysis/ModuleLike.h"
#include "analysis/Namespace.h"

namespace pyinfer::analysis {

    class MultipleMemberInfo final : public Namespace, public ModuleLike {
    public:
        MultipleMemberInfo(AnalysisSession& session, std::vector<Namespace*> members)
            : Namespace(NamespaceKind::MultipleMembers), session_(session), members_(std::move(members)) {}

        const std::vector<Namespace*>& members() const { return members_; }

        std::string name() const override;
        std::string description() const override;
        MemberType memberType() const override { return MemberType::Multiple; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;
        std::map<std::string, NamespaceSet> allMembers() override;
        ModuleLike* asModule() override { return this; }

        std::string moduleName() const override { return name(); }
        Namespace* childPackage(const host::ModuleContext* ctx, const std::string& name) override;
        std::map<std::string, Namespace*> childPackages(const host::ModuleContext* ctx) override;
        MemberPresence memberPresence(const host::ModuleContext* ctx, const std::string& name) override;

    private:
        AnalysisSession& session_;
        std::vector<Namespace*> members_;
    };

} // namespace pyinfer::analysis
