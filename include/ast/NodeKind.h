#pragma once

namespace pyinfer::ast {
    enum class NodeKind {
        Module,
        FunctionDef,
        ClassDef,
        ReturnStmt,
        AssignStmt,
        ExprStmt,
        IfStmt,
        WhileStmt,
        ForStmt,
        PassStmt,
        Import,
        ImportFrom,
        Name,
        Attribute,
        Subscript,
        Call,
        TupleLiteral,
        ListLiteral,
        IntLiteral,
        BoolLiteral,
        FloatLiteral,
        StringLiteral,
        BytesLiteral,
        NoneLiteral,
        EllipsisLiteral
    };

    inline const char *to_string(const NodeKind element) {
        switch (element) {
            case NodeKind::Module: return "Module";
            case NodeKind::FunctionDef: return "FunctionDef";
            case NodeKind::ClassDef: return "ClassDef";
            case NodeKind::ReturnStmt: return "ReturnStmt";
            case NodeKind::AssignStmt: return "AssignStmt";
            case NodeKind::ExprStmt: return "ExprStmt";
            case NodeKind::IfStmt: return "IfStmt";
            case NodeKind::WhileStmt: return "WhileStmt";
            case NodeKind::ForStmt: return "ForStmt";
            case NodeKind::PassStmt: return "PassStmt";
            case NodeKind::Import: return "Import";
            case NodeKind::ImportFrom: return "ImportFrom";
            case NodeKind::Name: return "Name";
            case NodeKind::Attribute: return "Attribute";
            case NodeKind::Subscript: return "Subscript";
            case NodeKind::Call: return "Call";
            case NodeKind::TupleLiteral: return "TupleLiteral";
            case NodeKind::ListLiteral: return "ListLiteral";
            case NodeKind::IntLiteral: return "IntLiteral";
            case NodeKind::BoolLiteral: return "BoolLiteral";
            case NodeKind::FloatLiteral: return "FloatLiteral";
            case NodeKind::StringLiteral: return "StringLiteral";
            case NodeKind::BytesLiteral: return "BytesLiteral";
            case NodeKind::NoneLiteral: return "NoneLiteral";
            case NodeKind::EllipsisLiteral: return "EllipsisLiteral";
            default: return "unknown";
        }
    }
} // namespace pyinfer::ast
