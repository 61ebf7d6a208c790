/***
 * Name: pyinfer::analysis::FunctionInfo / BoundMethodInfo
 * Purpose: Abstract value of a user-defined function and of a function bound to an instance.
 *   A function under a specialization is bound through its wrapper, so the override sees
 *   the instance as its first argument just as the body does.
 * Theory of Operation:
 *   Parameters are variables of the function scope. A call adds the argument values to
 *   the parameters (positional first, then by keyword; extra positional arguments go to
 *   the *args tuple, extra keywords to the **kwargs dict) and, if any parameter changed,
 *   enqueues the function body. The call yields the accumulated return values and makes
 *   the caller a dependent of them. The name and parameter list are copied from the
 *   definition, so a function detached from a replaced tree still binds calls and reports
 *   its accumulated returns; its body is never queued again.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "analysis/Namespace.h"
#include "analysis/Scope.h"
#include "analysis/VariableDef.h"

namespace pyinfer::ast {
    struct FunctionDef;
}

namespace pyinfer::analysis {

    class ModuleLike;
    class ProjectEntry;
    class SequenceInfo;

    class FunctionInfo final : public Namespace {
    public:
        FunctionInfo(AnalysisSession& session, ProjectEntry* entry, const ast::FunctionDef& def, Scope& outer);

        // nullptr once detached.
        const ast::FunctionDef* definition() const { return def_; }
        ProjectEntry* entry() const { return entry_; }
        Scope& scope() { return scope_; }
        VariableDef& returnValue() { return returnValue_; }
        std::size_t parameterCount() const;
        VariableDef* parameter(std::size_t index);
        // The unit that walks the body; nullptr once detached.
        AnalysisUnit* unit();
        bool isMethod() const;
        // Forget the definition node and the body unit before their tree is released.
        void detach();

        // Wrapper used while `table` holds a specialization under `qualifiedName`.
        Namespace& specialized(const ModuleLike& table, const std::string& qualifiedName);

        std::string name() const override;
        std::string description() const override;
        MemberType memberType() const override { return isMethod() ? MemberType::Method : MemberType::Function; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;

    private:
        struct Parameter {
            std::string name;
            bool isVarArg;
            bool isKwVarArg;
        };

        bool bindArguments(const std::vector<NamespaceSet>& args, const std::vector<std::string>& argNames);
        SequenceInfo& varArgs();

        AnalysisSession& session_;
        ProjectEntry* entry_;
        const ast::FunctionDef* def_;
        std::string name_;
        std::vector<Parameter> params_{};
        Scope scope_;
        VariableDef returnValue_;
        std::shared_ptr<AnalysisUnit> unit_{};
        SequenceInfo* varArgs_{nullptr};
        Namespace* specialized_{nullptr};
    };

    class BoundMethodInfo final : public Namespace {
    public:
        BoundMethodInfo(AnalysisSession& session, Namespace& function, Namespace& self)
            : Namespace(NamespaceKind::BoundMethod), session_(session), function_(function), self_(self) {}

        // The FunctionInfo, or the SpecializedCallable wrapping it.
        Namespace& function() const { return function_; }
        Namespace& self() const { return self_; }

        std::string name() const override { return function_.name(); }
        std::string description() const override { return "method " + function_.name() + " of " + self_.name(); }
        MemberType memberType() const override { return MemberType::Method; }
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;

    private:
        AnalysisSession& session_;
        Namespace& function_;
        Namespace& self_;
    };

    // True for user functions read through a class, whether plain or specialized.
    bool bindsToInstance(const Namespace& value);

} // namespace pyinfer::analysis
