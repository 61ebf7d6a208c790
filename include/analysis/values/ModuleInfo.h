/***
 * Name: pyinfer::analysis::ModuleInfo
 * Purpose: Abstract value of a project module; owns the module scope.
 * Theory of Operation:
 *   Reading a member from another module records the reader as a dependent of the
 *   variable (created on demand), so a later assignment re-enqueues it. A missing member
 *   falls back to the child module "<name>.<member>" from the module registry.
 */
#pragma once

#include <map>
#include <string>

#include "analysis/ModuleLike.h"
#include "analysis/Namespace.h"
#include "analysis/Scope.h"

namespace pyinfer::analysis {

    class ProjectEntry;

    class ModuleInfo final : public Namespace, public ModuleLike {
    public:
        ModuleInfo(AnalysisSession& session, ProjectEntry& entry, std::string name);

        ProjectEntry& entry() const { return entry_; }
        Scope& scope() { return scope_; }

        std::string name() const override { return name_; }
        std::string description() const override { return "module " + name_; }
        MemberType memberType() const override { return MemberType::Module; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        void setMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name,
                       const NamespaceSet& value) override;
        std::map<std::string, NamespaceSet> allMembers() override;
        ModuleLike* asModule() override { return this; }

        std::string moduleName() const override { return name_; }
        Namespace* childPackage(const host::ModuleContext* ctx, const std::string& name) override;
        std::map<std::string, Namespace*> childPackages(const host::ModuleContext* ctx) override;
        MemberPresence memberPresence(const host::ModuleContext* ctx, const std::string& name) override;

        // Re-enqueue every reader of this module's variables, then drop the variables.
        void clear();

    protected:
        void specializationsChanged() override;

    private:
        AnalysisSession& session_;
        ProjectEntry& entry_;
        std::string name_;
        Scope scope_;
    };

} // namespace pyinfer::analysis
