/**
 * @file
 * @brief AST base Node accept implementation.
 */
/***
 * Name: pyinfer::ast::Node::accept
 * Purpose: Dynamic dispatch via central switch on the node kind.
 */
#include "ast/Node.h"
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

namespace pyinfer::ast {

void Node::accept(VisitorBase& v) const {
    switch (kind) {
        case NodeKind::Module: v.visit(static_cast<const Module&>(*this)); break;
        case NodeKind::FunctionDef: v.visit(static_cast<const FunctionDef&>(*this)); break;
        case NodeKind::ClassDef: v.visit(static_cast<const ClassDef&>(*this)); break;
        case NodeKind::ReturnStmt: v.visit(static_cast<const ReturnStmt&>(*this)); break;
        case NodeKind::AssignStmt: v.visit(static_cast<const AssignStmt&>(*this)); break;
        case NodeKind::ExprStmt: v.visit(static_cast<const ExprStmt&>(*this)); break;
        case NodeKind::IfStmt: v.visit(static_cast<const IfStmt&>(*this)); break;
        case NodeKind::WhileStmt: v.visit(static_cast<const WhileStmt&>(*this)); break;
        case NodeKind::ForStmt: v.visit(static_cast<const ForStmt&>(*this)); break;
        case NodeKind::PassStmt: v.visit(static_cast<const PassStmt&>(*this)); break;
        case NodeKind::Import: v.visit(static_cast<const Import&>(*this)); break;
        case NodeKind::ImportFrom: v.visit(static_cast<const ImportFrom&>(*this)); break;
        case NodeKind::Name: v.visit(static_cast<const Name&>(*this)); break;
        case NodeKind::Attribute: v.visit(static_cast<const Attribute&>(*this)); break;
        case NodeKind::Subscript: v.visit(static_cast<const Subscript&>(*this)); break;
        case NodeKind::Call: v.visit(static_cast<const Call&>(*this)); break;
        case NodeKind::TupleLiteral: v.visit(static_cast<const TupleLiteral&>(*this)); break;
        case NodeKind::ListLiteral: v.visit(static_cast<const ListLiteral&>(*this)); break;
        case NodeKind::IntLiteral: v.visit(static_cast<const IntLiteral&>(*this)); break;
        case NodeKind::BoolLiteral: v.visit(static_cast<const BoolLiteral&>(*this)); break;
        case NodeKind::FloatLiteral: v.visit(static_cast<const FloatLiteral&>(*this)); break;
        case NodeKind::StringLiteral: v.visit(static_cast<const StringLiteral&>(*this)); break;
        case NodeKind::BytesLiteral: v.visit(static_cast<const BytesLiteral&>(*this)); break;
        case NodeKind::NoneLiteral: v.visit(static_cast<const NoneLiteral&>(*this)); break;
        case NodeKind::EllipsisLiteral: v.visit(static_cast<const EllipsisLiteral&>(*this)); break;
        default: break;
    }
}

} // namespace pyinfer::ast
