/**
 * @file
 * @brief AST base node declarations.
 */
#pragma once

#include "NodeKind.h"
#include <string>

namespace pyinfer::ast {

    struct VisitorBase; // fwd

    struct Node {
        NodeKind kind;
        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;

        // Polymorphic dispatch entrypoint (central switch in Node.cpp)
        virtual void accept(VisitorBase& v) const;

        int line{0};
        int col{0};
    };

} // namespace pyinfer::ast
