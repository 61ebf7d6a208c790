/***
 * Name: pyinfer::analysis::ClassInfo / InstanceInfo
 * Purpose: Abstract values of a user-defined class and of its instances.
 * Theory of Operation:
 *   One ClassInfo per class statement and one InstanceInfo per class (instances are not
 *   distinguished by creation site). Member lookup searches the class scope, then the
 *   values recorded as bases. Calling the class calls `__init__` on the instance and
 *   yields the instance. Functions found through an instance are bound to it. A class
 *   detached from a replaced tree keeps its name and members but never re-walks its body.
 */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "analysis/Namespace.h"
#include "analysis/Scope.h"
#include "analysis/VariableDef.h"

namespace pyinfer::ast {
    struct ClassDef;
}

namespace pyinfer::analysis {

    class InstanceInfo;
    class ProjectEntry;

    class ClassInfo final : public Namespace {
    public:
        ClassInfo(AnalysisSession& session, ProjectEntry* entry, const ast::ClassDef& def, Scope& outer);

        // nullptr once detached.
        const ast::ClassDef* definition() const { return def_; }
        Scope& scope() { return scope_; }
        VariableDef& bases() { return bases_; }
        InstanceInfo& instance();
        // nullptr once detached.
        AnalysisUnit* unit();
        void detach();

        std::string name() const override;
        std::string description() const override { return "class " + name(); }
        MemberType memberType() const override { return MemberType::Class; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        void setMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name,
                       const NamespaceSet& value) override;
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;
        NamespaceSet instanceSet() override;
        std::map<std::string, NamespaceSet> allMembers() override;

    private:
        AnalysisSession& session_;
        ProjectEntry* entry_;
        const ast::ClassDef* def_;
        std::string name_;
        Scope scope_;
        VariableDef bases_;
        InstanceInfo* instance_{nullptr};
        std::shared_ptr<AnalysisUnit> unit_{};
        bool resolving_{false};
    };

    class InstanceInfo final : public Namespace {
    public:
        InstanceInfo(AnalysisSession& session, ClassInfo& cls);

        ClassInfo& classInfo() const { return class_; }
        const std::map<std::string, VariableDef>& attributes() const { return attributes_; }

        std::string name() const override { return class_.name(); }
        std::string description() const override { return class_.name() + " instance"; }
        MemberType memberType() const override { return MemberType::Instance; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        void setMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name,
                       const NamespaceSet& value) override;
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;
        std::map<std::string, NamespaceSet> allMembers() override;

    private:
        VariableDef& attribute(const std::string& name);

        AnalysisSession& session_;
        ClassInfo& class_;
        std::size_t cap_;
        std::map<std::string, VariableDef> attributes_{};
    };

} // namespace pyinfer::analysis
