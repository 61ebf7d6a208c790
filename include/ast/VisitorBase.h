#pragma once

#include <cstdint>
#include <string>
#include "ast/NodeKind.h"

namespace pyinfer::ast {

// Forward declarations to break include cycles
template <typename T, NodeKind K> struct Literal;
struct Module; struct FunctionDef; struct ClassDef;
struct ReturnStmt; struct AssignStmt; struct ExprStmt; struct IfStmt; struct WhileStmt; struct ForStmt; struct PassStmt;
struct Import; struct ImportFrom;
struct Name; struct Attribute; struct Subscript; struct Call; struct TupleLiteral; struct ListLiteral;
struct NoneLiteral; struct EllipsisLiteral;

// Virtual visitor interface for AST traversal. Every overload defaults to a no-op
// so that visitors only spell out the nodes they handle.
struct VisitorBase {
  virtual ~VisitorBase() = default;
  virtual void visit(const Module&) {}
  virtual void visit(const FunctionDef&) {}
  virtual void visit(const ClassDef&) {}
  virtual void visit(const ReturnStmt&) {}
  virtual void visit(const AssignStmt&) {}
  virtual void visit(const ExprStmt&) {}
  virtual void visit(const IfStmt&) {}
  virtual void visit(const WhileStmt&) {}
  virtual void visit(const ForStmt&) {}
  virtual void visit(const PassStmt&) {}
  virtual void visit(const Import&) {}
  virtual void visit(const ImportFrom&) {}
  virtual void visit(const Name&) {}
  virtual void visit(const Attribute&) {}
  virtual void visit(const Subscript&) {}
  virtual void visit(const Call&) {}
  virtual void visit(const TupleLiteral&) {}
  virtual void visit(const ListLiteral&) {}
  virtual void visit(const Literal<int64_t, NodeKind::IntLiteral>&) {}
  virtual void visit(const Literal<bool, NodeKind::BoolLiteral>&) {}
  virtual void visit(const Literal<double, NodeKind::FloatLiteral>&) {}
  virtual void visit(const Literal<std::string, NodeKind::StringLiteral>&) {}
  virtual void visit(const Literal<std::string, NodeKind::BytesLiteral>&) {}
  virtual void visit(const NoneLiteral&) {}
  virtual void visit(const EllipsisLiteral&) {}
};

} // namespace pyinfer::ast
