#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasName.h"
#include "ast/Param.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct FunctionDef final : Stmt, HasBody<Stmt>, HasName {
        std::vector<Param> params;
        std::vector<std::unique_ptr<Expr>> decorators; // optional decorator expressions
        explicit FunctionDef(std::string n) : Stmt(NodeKind::FunctionDef), HasName{std::move(n)} {}
    };

    struct ClassDef final : Stmt, HasBody<Stmt>, HasName {
        std::vector<std::unique_ptr<Expr>> bases;
        explicit ClassDef(std::string n) : Stmt(NodeKind::ClassDef), HasName{std::move(n)} {}
    };

} // namespace pyinfer::ast
