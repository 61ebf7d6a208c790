/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <string>
#include "ast/Expr.h"

namespace pyinfer::ast {

struct Attribute final : Expr {
  std::unique_ptr<Expr> value;
  std::string attr;
  Attribute(std::unique_ptr<Expr> v, std::string a)
      : Expr(NodeKind::Attribute), value(std::move(v)), attr(std::move(a)) {}
};

} // namespace pyinfer::ast
