/***
 * Name: pyinfer::analysis::StatementWalker
 * Purpose: Evaluate the statements of one unit's body against its scope.
 * Theory of Operation:
 *   Flow-insensitive: both branches of if/while/for are walked and every assignment joins
 *   into the target variable. Nested function and class definitions get one value per
 *   node and their own units, queued at the front. A definition whose qualified name has
 *   a specialization in the enclosing module is bound through the override wrapper, and
 *   its body is only queued when the override asks for generic analysis too. Imports
 *   consult the project module table first, then the host; an unresolved module name is
 *   watched so the importing unit re-runs when a module of that name is added.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "analysis/ExpressionEvaluator.h"
#include "analysis/NamespaceSet.h"
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

namespace pyinfer::analysis {

    class AnalysisUnit;
    class ModuleLike;
    class Namespace;

    class StatementWalker final : public ast::VisitorBase {
    public:
        explicit StatementWalker(AnalysisUnit& unit) : unit_(unit), eval_(unit) {}

        // Walk the body of the unit's module, class or function node.
        void walkUnitBody();

        void visit(const ast::FunctionDef& node) override;
        void visit(const ast::ClassDef& node) override;
        void visit(const ast::ReturnStmt& node) override;
        void visit(const ast::AssignStmt& node) override;
        void visit(const ast::ExprStmt& node) override;
        void visit(const ast::IfStmt& node) override;
        void visit(const ast::WhileStmt& node) override;
        void visit(const ast::ForStmt& node) override;
        void visit(const ast::Import& node) override;
        void visit(const ast::ImportFrom& node) override;

        // Join `values` into the variable, attribute, item or unpacked targets named by `target`.
        void assign(const ast::Node& statement, const ast::Expr* target, const NamespaceSet& values);

    private:
        void walk(const std::vector<std::unique_ptr<ast::Stmt>>& body);
        void bind(const ast::Node& node, const std::string& name, const NamespaceSet& values);
        Namespace* resolveModule(const std::string& name);
        std::string relativeBase(const ast::ImportFrom& node) const;
        ModuleLike* enclosingModule() const;
        std::string qualifiedName(const std::string& name) const;

        AnalysisUnit& unit_;
        ExpressionEvaluator eval_;
    };

} // namespace pyinfer::analysis
