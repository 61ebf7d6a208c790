/**
 * @file
 * @brief AST import statement declarations.
 */
#pragma once

#include <string>
#include <vector>
#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct Alias {
        std::string name;
        std::string asname; // empty if none
    };

    struct Import final : Stmt {
        std::vector<Alias> names;
        Import() : Stmt(NodeKind::Import) {}
    };

    struct ImportFrom final : Stmt {
        std::string module; // empty for relative-only
        int level{0};       // number of leading dots
        std::vector<Alias> names;
        ImportFrom() : Stmt(NodeKind::ImportFrom) {}
    };
}
