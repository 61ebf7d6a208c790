#pragma once

#include <memory>
#include <vector>

#include "Expr.h"
#include "Stmt.h"

namespace pyinfer::ast {

    // targets: `a = b = value` yields two targets; each may be a Name, Attribute,
    // Subscript or a Tuple/List of targets.
    struct AssignStmt final : Stmt {
        std::vector<std::unique_ptr<Expr>> targets;
        std::unique_ptr<Expr> value;
        AssignStmt(std::unique_ptr<Expr> t, std::unique_ptr<Expr> v)
            : Stmt(NodeKind::AssignStmt), value(std::move(v)) { targets.push_back(std::move(t)); }
    };
} // namespace pyinfer::ast
