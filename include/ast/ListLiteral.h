/**
 * @file
 * @brief AST list and tuple literal declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace pyinfer::ast {

struct ListLiteral final : Expr {
  std::vector<std::unique_ptr<Expr>> elements;
  ListLiteral() : Expr(NodeKind::ListLiteral) {}
};

struct TupleLiteral final : Expr {
  std::vector<std::unique_ptr<Expr>> elements;
  TupleLiteral() : Expr(NodeKind::TupleLiteral) {}
};

} // namespace pyinfer::ast
