/**
 * @file
 * @brief AST statement base; the statement walker dispatches on `kind`.
 */
#pragma once

#include "ast/Node.h"

namespace pyinfer::ast {
    struct Stmt : Node {
        using Node::Node;
    };
} // namespace pyinfer::ast
