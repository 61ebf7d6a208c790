#pragma once
#include <memory>
#include <string>
#include <vector>

#include "Expr.h"

namespace pyinfer::ast {
    struct KeywordArg { std::string name; std::unique_ptr<Expr> value; };

    struct Call final : Expr {
        std::unique_ptr<Expr> callee; // typically Name or Attribute
        std::vector<std::unique_ptr<Expr>> args;      // positional
        std::vector<KeywordArg> keywords;             // named args
        explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace pyinfer::ast
