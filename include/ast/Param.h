#pragma once

#include <memory>
#include <string>

namespace pyinfer::ast {
    struct Expr; // fwd
    struct Param {
        std::string name;
        std::unique_ptr<Expr> defaultValue{}; // optional
        bool isVarArg{false};   // *args
        bool isKwVarArg{false}; // **kwargs
    };
} // namespace pyinfer::ast
