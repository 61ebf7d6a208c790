/***
 * Name: ExpressionEvaluator (definitions)
 * Purpose: Compute the value set of an expression in the context of one analysis unit.
 * Theory of Operation:
 *   Every read of a variable, attribute, element or return value records the unit as a
 *   dependent of what it read, so the unit re-runs when that value grows. A null child
 *   evaluates to the empty set.
 */
#include "analysis/ExpressionEvaluator.h"

#include "analysis/AnalysisSession.h"
#include "analysis/AnalysisUnit.h"
#include "analysis/Scope.h"
#include "analysis/values/BuiltinValues.h"
#include "analysis/values/SequenceInfo.h"

namespace pyinfer::analysis {

    NamespaceSet ExpressionEvaluator::evaluate(const ast::Expr* expr) {
        if (expr == nullptr) { return {}; }
        result_ = {};
        expr->accept(*this);
        NamespaceSet out = std::move(result_);
        result_ = {};
        return out;
    }

    /*** Name: ExpressionEvaluator::lookupName */
    NamespaceSet ExpressionEvaluator::lookupName(const ast::Node& node, const std::string& name) {
        Scope* const start = &unit_.scope();
        for (Scope* scope = start; scope != nullptr; scope = scope->outer()) {
            // Class bodies are not visible from the functions nested in them.
            if (scope->kind() == ScopeKind::Class && scope != start) { continue; }
            VariableDef* variable = scope->findVariable(name);
            if (variable == nullptr || (variable->assignments().empty() && variable->types().empty())) { continue; }
            variable->addDependency(unit_);
            variable->addReference(unit_.locationOf(node));
            return variable->types();
        }

        // Not bound yet: a later module-level assignment must re-run this unit.
        start->moduleScope().createVariable(name).addDependency(unit_);
        Namespace* builtins = unit_.session().builtinsModule();
        return builtins != nullptr ? builtins->getMember(node, unit_, name) : NamespaceSet{};
    }

    void ExpressionEvaluator::visit(const ast::Name& node) { result_ = lookupName(node, node.id); }

    void ExpressionEvaluator::visit(const ast::Attribute& node) {
        const NamespaceSet target = evaluate(node.value.get());
        result_ = analysis::getMember(target, node, unit_, node.attr);
    }

    /*** Name: ExpressionEvaluator::visit(Subscript) */
    void ExpressionEvaluator::visit(const ast::Subscript& node) {
        const NamespaceSet target = evaluate(node.value.get());
        const NamespaceSet index = evaluate(node.slice.get());
        AnalysisSession& session = unit_.session();
        NamespaceSet out;
        for (Namespace* value : target) {
            if (value->kind() == NamespaceKind::BuiltinClass) {
                // list[int] and friends: ask the host for the generic instantiation.
                std::vector<const host::HostType*> indexTypes;
                for (BuiltinClassInfo* cls : index.ofType<BuiltinClassInfo>()) { indexTypes.push_back(&cls->type()); }
                const auto* generic = static_cast<BuiltinClassInfo*>(value);
                if (!indexTypes.empty()) {
                    if (BuiltinClassInfo* made = session.makeGenericType(&generic->type(), indexTypes)) {
                        out = out.add(made);
                        continue;
                    }
                }
            }
            out = out.unionWith(value->getIndex(node, unit_, index));
        }
        result_ = out;
    }

    /*** Name: ExpressionEvaluator::visit(Call) */
    void ExpressionEvaluator::visit(const ast::Call& node) {
        const NamespaceSet callee = evaluate(node.callee.get());
        std::vector<NamespaceSet> args;
        std::vector<std::string> argNames;
        args.reserve(node.args.size() + node.keywords.size());
        argNames.reserve(node.args.size() + node.keywords.size());
        for (const auto& arg : node.args) {
            args.push_back(evaluate(arg.get()));
            argNames.emplace_back();
        }
        for (const ast::KeywordArg& keyword : node.keywords) {
            args.push_back(evaluate(keyword.value.get()));
            argNames.push_back(keyword.name);
        }
        result_ = analysis::call(callee, node, unit_, args, argNames);
    }

    void ExpressionEvaluator::visit(const ast::TupleLiteral& node) {
        result_ = sequence(node, node.elements, host::BuiltinTypeId::Tuple);
    }

    void ExpressionEvaluator::visit(const ast::ListLiteral& node) {
        result_ = sequence(node, node.elements, host::BuiltinTypeId::List);
    }

    void ExpressionEvaluator::visit(const ast::IntLiteral& node) {
        result_ = unit_.session().constant(host::ConstantValue{node.value});
    }

    void ExpressionEvaluator::visit(const ast::BoolLiteral& node) {
        result_ = unit_.session().constant(host::ConstantValue{node.value});
    }

    void ExpressionEvaluator::visit(const ast::FloatLiteral& node) {
        result_ = unit_.session().constant(host::ConstantValue{node.value});
    }

    void ExpressionEvaluator::visit(const ast::StringLiteral& node) {
        result_ = unit_.session().constant(host::ConstantValue{node.value});
    }

    void ExpressionEvaluator::visit(const ast::BytesLiteral& node) {
        result_ = unit_.session().constant(host::ConstantValue{host::Bytes{node.value}});
    }

    void ExpressionEvaluator::visit(const ast::NoneLiteral&) { result_ = unit_.session().noneConstant()->selfSet(); }

    void ExpressionEvaluator::visit(const ast::EllipsisLiteral&) {
        result_ = unit_.session().constant(host::ConstantValue{host::Ellipsis{}});
    }

    /*** Name: ExpressionEvaluator::sequence */
    NamespaceSet ExpressionEvaluator::sequence(const ast::Node& node,
                                               const std::vector<std::unique_ptr<ast::Expr>>& elements,
                                               host::BuiltinTypeId typeId) {
        AnalysisSession& session = unit_.session();
        const NamespaceSet result = unit_.scope().getOrMakeNodeValue(node, [&] {
            return session.make<SequenceInfo>(session, session.knownType(typeId), session.limits().maxVariableTypes)
                ->selfSet();
        });
        NamespaceSet values;
        for (const auto& element : elements) { values = values.unionWith(evaluate(element.get())); }
        for (SequenceInfo* created : result.ofType<SequenceInfo>()) { created->addElementTypes(values); }
        return result;
    }

} // namespace pyinfer::analysis
