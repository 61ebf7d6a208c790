#pragma once

#include <memory>
#include "Expr.h"
#include "Stmt.h"
#include "ast/HasBodyPair.h"

namespace pyinfer::ast {
    struct IfStmt final : Stmt, HasBodyPair<Stmt> {
        std::unique_ptr<Expr> cond;
        explicit IfStmt(std::unique_ptr<Expr> c) : Stmt(NodeKind::IfStmt), cond(std::move(c)) {}
    };

    struct WhileStmt final : Stmt, HasBodyPair<Stmt> {
        std::unique_ptr<Expr> cond;
        explicit WhileStmt(std::unique_ptr<Expr> c) : Stmt(NodeKind::WhileStmt), cond(std::move(c)) {}
    };

    struct ForStmt final : Stmt, HasBodyPair<Stmt> {
        std::unique_ptr<Expr> target;   // name, tuple, list or attribute
        std::unique_ptr<Expr> iterable;
        ForStmt(std::unique_ptr<Expr> t, std::unique_ptr<Expr> it)
            : Stmt(NodeKind::ForStmt), target(std::move(t)), iterable(std::move(it)) {}
    };
} // namespace pyinfer::ast
