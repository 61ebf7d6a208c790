// Utility: terse constructors for analysis-test syntax trees
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ast/Nodes.h"

namespace testutil {


using ExprPtr = std::unique_ptr<pyinfer::ast::Expr>;
using StmtPtr = std::unique_ptr<pyinfer::ast::Stmt>;

// Statements get distinct lines so their locations never collide.
inline int nextLine() {
  static int line = 0;
  return ++line;
}

template <typename T>
std::unique_ptr<T> at(std::unique_ptr<T> node) {
  node->line = nextLine();
  return node;
}

template <typename T, typename... Items>
std::vector<std::unique_ptr<T>> many(Items&&... items) {
  std::vector<std::unique_ptr<T>> out;
  (out.push_back(std::forward<Items>(items)), ...);
  return out;
}

/*** Expressions */
inline ExprPtr name(std::string id) { return std::make_unique<pyinfer::ast::Name>(std::move(id)); }
inline ExprPtr intLit(int64_t v) { return std::make_unique<pyinfer::ast::IntLiteral>(v); }
inline ExprPtr boolLit(bool v) { return std::make_unique<pyinfer::ast::BoolLiteral>(v); }
inline ExprPtr floatLit(double v) { return std::make_unique<pyinfer::ast::FloatLiteral>(v); }
inline ExprPtr strLit(std::string v) { return std::make_unique<pyinfer::ast::StringLiteral>(std::move(v)); }
inline ExprPtr bytesLit(std::string v) { return std::make_unique<pyinfer::ast::BytesLiteral>(std::move(v)); }
inline ExprPtr none() { return std::make_unique<pyinfer::ast::NoneLiteral>(); }

inline ExprPtr attr(ExprPtr value, std::string attribute) {
  return std::make_unique<pyinfer::ast::Attribute>(std::move(value), std::move(attribute));
}

inline ExprPtr subscript(ExprPtr value, ExprPtr slice) {
  return std::make_unique<pyinfer::ast::Subscript>(std::move(value), std::move(slice));
}

template <typename... Args>
ExprPtr call(ExprPtr callee, Args&&... args) {
  auto node = std::make_unique<pyinfer::ast::Call>(std::move(callee));
  node->args = many<pyinfer::ast::Expr>(std::forward<Args>(args)...);
  return node;
}

inline ExprPtr callKw(ExprPtr callee, std::vector<ExprPtr> args, std::string keyword, ExprPtr value) {
  auto node = std::make_unique<pyinfer::ast::Call>(std::move(callee));
  node->args = std::move(args);
  node->keywords.push_back(pyinfer::ast::KeywordArg{std::move(keyword), std::move(value)});
  return node;
}

template <typename... Items>
ExprPtr list(Items&&... items) {
  auto node = std::make_unique<pyinfer::ast::ListLiteral>();
  node->elements = many<pyinfer::ast::Expr>(std::forward<Items>(items)...);
  return node;
}

template <typename... Items>
ExprPtr tuple(Items&&... items) {
  auto node = std::make_unique<pyinfer::ast::TupleLiteral>();
  node->elements = many<pyinfer::ast::Expr>(std::forward<Items>(items)...);
  return node;
}

/*** Statements */
inline StmtPtr assign(ExprPtr target, ExprPtr value) {
  return at(std::make_unique<pyinfer::ast::AssignStmt>(std::move(target), std::move(value)));
}

inline StmtPtr assign(const std::string& target, ExprPtr value) { return assign(name(target), std::move(value)); }

inline StmtPtr expr(ExprPtr value) { return at(std::make_unique<pyinfer::ast::ExprStmt>(std::move(value))); }

inline StmtPtr ret(ExprPtr value = nullptr) { return at(std::make_unique<pyinfer::ast::ReturnStmt>(std::move(value))); }

inline StmtPtr pass() { return at(std::make_unique<pyinfer::ast::PassStmt>()); }

inline pyinfer::ast::Param param(std::string id) {
  pyinfer::ast::Param p;
  p.name = std::move(id);
  return p;
}

inline pyinfer::ast::Param varArgs(std::string id) {
  pyinfer::ast::Param p = param(std::move(id));
  p.isVarArg = true;
  return p;
}

inline pyinfer::ast::Param kwArgs(std::string id) {
  pyinfer::ast::Param p = param(std::move(id));
  p.isKwVarArg = true;
  return p;
}

template <typename... Body>
StmtPtr def(std::string fn, std::vector<std::string> params, Body&&... body) {
  auto node = std::make_unique<pyinfer::ast::FunctionDef>(std::move(fn));
  for (auto& p : params) { node->params.push_back(param(std::move(p))); }
  node->body = many<pyinfer::ast::Stmt>(std::forward<Body>(body)...);
  return at(std::move(node));
}

template <typename... Body>
StmtPtr defWith(std::string fn, std::vector<pyinfer::ast::Param> params, Body&&... body) {
  auto node = std::make_unique<pyinfer::ast::FunctionDef>(std::move(fn));
  node->params = std::move(params);
  node->body = many<pyinfer::ast::Stmt>(std::forward<Body>(body)...);
  return at(std::move(node));
}

template <typename... Body>
StmtPtr cls(std::string cn, std::vector<ExprPtr> bases, Body&&... body) {
  auto node = std::make_unique<pyinfer::ast::ClassDef>(std::move(cn));
  node->bases = std::move(bases);
  node->body = many<pyinfer::ast::Stmt>(std::forward<Body>(body)...);
  return at(std::move(node));
}

inline StmtPtr importStmt(std::string module, std::string asname = {}) {
  auto node = std::make_unique<pyinfer::ast::Import>();
  node->names.push_back(pyinfer::ast::Alias{std::move(module), std::move(asname)});
  return at(std::move(node));
}

inline StmtPtr importFrom(std::string module, std::vector<std::string> names, int level = 0) {
  auto node = std::make_unique<pyinfer::ast::ImportFrom>();
  node->module = std::move(module);
  node->level = level;
  for (auto& n : names) { node->names.push_back(pyinfer::ast::Alias{std::move(n), {}}); }
  return at(std::move(node));
}

template <typename... Body>
StmtPtr forIn(ExprPtr target, ExprPtr iterable, Body&&... body) {
  auto node = std::make_unique<pyinfer::ast::ForStmt>(std::move(target), std::move(iterable));
  node->thenBody = many<pyinfer::ast::Stmt>(std::forward<Body>(body)...);
  return at(std::move(node));
}

inline StmtPtr ifElse(ExprPtr cond, StmtPtr then, StmtPtr otherwise) {
  auto node = std::make_unique<pyinfer::ast::IfStmt>(std::move(cond));
  node->thenBody.push_back(std::move(then));
  node->elseBody.push_back(std::move(otherwise));
  return at(std::move(node));
}

template <typename... Body>
std::shared_ptr<const pyinfer::ast::Module> module(Body&&... body) {
  auto node = std::make_shared<pyinfer::ast::Module>();
  node->body = many<pyinfer::ast::Stmt>(std::forward<Body>(body)...);
  return node;
}

}  // namespace testutil
