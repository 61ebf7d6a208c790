#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include "ast/Expr.h"

namespace pyinfer::ast {

template <typename T, NodeKind K>
struct Literal final : Expr {
    T value;
    explicit Literal(T v) : Expr(K), value(std::move(v)) {}
};

    using IntLiteral = Literal<int64_t, NodeKind::IntLiteral>;
    using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;
    using FloatLiteral = Literal<double, NodeKind::FloatLiteral>;
    using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;
    // Raw byte payload of a b'...' literal.
    using BytesLiteral = Literal<std::string, NodeKind::BytesLiteral>;

struct NoneLiteral final : Expr {
  NoneLiteral() : Expr(NodeKind::NoneLiteral) {}
};

struct EllipsisLiteral final : Expr {
  EllipsisLiteral() : Expr(NodeKind::EllipsisLiteral) {}
};

} // namespace pyinfer::ast
