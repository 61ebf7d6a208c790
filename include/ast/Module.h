/**
 * @file
 * @brief AST module node declarations.
 */
#pragma once

#include <string>
#include "ast/HasBody.h"
#include "ast/Node.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct Module final : Node, HasBody<Stmt> {
        std::string file{};
        Module() : Node(NodeKind::Module) {}
    };
} // namespace pyinfer::ast
