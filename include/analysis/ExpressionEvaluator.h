/***
 * Name: pyinfer::analysis::ExpressionEvaluator
 * Purpose: Compute the abstract value set of an expression within an analysis unit.
 * Theory of Operation:
 *   Names resolve through the scope chain (class scopes are only visible to their own
 *   body), then the module scope, then the builtin module; every variable read makes the
 *   unit a dependent of it. Attribute, call and subscript expressions apply the matching
 *   Namespace operation to every member of the operand set. Literals map to constants,
 *   list and tuple displays to one element-tracking sequence per node. A null operand
 *   evaluates to the empty set.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "analysis/NamespaceSet.h"
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"
#include "host/BuiltinTypeId.h"

namespace pyinfer::analysis {

    class AnalysisUnit;

    class ExpressionEvaluator final : public ast::VisitorBase {
    public:
        explicit ExpressionEvaluator(AnalysisUnit& unit) : unit_(unit) {}

        NamespaceSet evaluate(const ast::Expr* expr);
        NamespaceSet lookupName(const ast::Node& node, const std::string& name);

        void visit(const ast::Name& node) override;
        void visit(const ast::Attribute& node) override;
        void visit(const ast::Subscript& node) override;
        void visit(const ast::Call& node) override;
        void visit(const ast::TupleLiteral& node) override;
        void visit(const ast::ListLiteral& node) override;
        void visit(const ast::IntLiteral& node) override;
        void visit(const ast::BoolLiteral& node) override;
        void visit(const ast::FloatLiteral& node) override;
        void visit(const ast::StringLiteral& node) override;
        void visit(const ast::BytesLiteral& node) override;
        void visit(const ast::NoneLiteral& node) override;
        void visit(const ast::EllipsisLiteral& node) override;

    private:
        NamespaceSet sequence(const ast::Node& node, const std::vector<std::unique_ptr<ast::Expr>>& elements,
                              host::BuiltinTypeId typeId);

        AnalysisUnit& unit_;
        NamespaceSet result_{};
    };

} // namespace pyinfer::analysis
