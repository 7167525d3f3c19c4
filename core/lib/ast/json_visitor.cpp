// assert_lint/ast/json_visitor.cpp - JSON serialization implementation
//
#include "assert_lint/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "assert_lint/ast/ast_enums.hpp"
#include "assert_lint/basic/casting.hpp"
#include "assert_lint/basic/source_manager.hpp"
#include "assert_lint/sema/symbols/symbol.hpp"

namespace assert_lint
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

uint32_t begin_off(SourceRange r) { return r.get_begin().get_offset(); }
uint32_t end_off(SourceRange r) { return r.get_end().get_offset(); }

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", begin_off(r)}, {"end", end_off(r)}};
}

json j_symbol(const MethodSymbol * s)
{
  if (!s) return nullptr;
  json out{{"id", s->id}, {"name", s->name}};
  out["owner"] = s->owner ? json(s->owner->name) : json(nullptr);
  out["local"] = s->declaration != nullptr;
  return out;
}

json j_string(std::string_view s) { return std::string(s); }

// Forward declarations
json j_expr(const Expr * e);
json j_stmt(const Stmt * s);
json j_decl(const Decl * d);

template <typename T, typename Fn>
json j_list(gsl::span<T *> items, Fn fn)
{
  json out = json::array();
  for (const auto * item : items) out.push_back(fn(item));
  return out;
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr(const Expr * e)
{
  if (!e) return nullptr;

  if (const auto * lit = dyn_cast<LiteralExpr>(e)) {
    return json{
      {"type", "LiteralExpr"}, {"range", j_range(lit->get_range())}, {"value", j_string(lit->value)}};
  }

  if (const auto * name = dyn_cast<NameExpr>(e)) {
    return json{
      {"type", "NameExpr"}, {"range", j_range(name->get_range())}, {"name", j_string(name->name)}};
  }

  if (const auto * call = dyn_cast<InvocationExpr>(e)) {
    return json{
      {"type", "InvocationExpr"},
      {"range", j_range(call->get_range())},
      {"name", j_string(call->name)},
      {"nameRange", j_range(call->nameRange)},
      {"receiver", j_expr(call->receiver)},
      {"args", j_list(call->args, j_expr)},
      {"symbol", j_symbol(call->symbol)}};
  }

  if (const auto * ref = dyn_cast<MethodRefExpr>(e)) {
    return json{
      {"type", "MethodRefExpr"},
      {"range", j_range(ref->get_range())},
      {"name", j_string(ref->name)},
      {"receiver", j_expr(ref->receiver)},
      {"symbol", j_symbol(ref->symbol)}};
  }

  if (const auto * obj = dyn_cast<NewObjectExpr>(e)) {
    return json{
      {"type", "NewObjectExpr"},
      {"range", j_range(obj->get_range())},
      {"typeName", j_string(obj->typeName)},
      {"args", j_list(obj->args, j_expr)},
      {"classBody", j_list(obj->classBody, j_decl)},
      {"constructor", j_symbol(obj->constructor)}};
  }

  if (const auto * lambda = dyn_cast<LambdaExpr>(e)) {
    return json{
      {"type", "LambdaExpr"},
      {"range", j_range(lambda->get_range())},
      {"body", j_list(lambda->body, j_stmt)}};
  }

  return json{{"type", "UnknownExpr"}, {"range", j_range(e->get_range())}};
}

// ============================================================================
// Statement serialization
// ============================================================================

json j_stmt(const Stmt * s)
{
  if (!s) return nullptr;

  if (const auto * es = dyn_cast<ExprStmt>(s)) {
    return json{{"type", "ExprStmt"}, {"range", j_range(es->get_range())}, {"expr", j_expr(es->expr)}};
  }

  if (const auto * var = dyn_cast<VarDeclStmt>(s)) {
    return json{
      {"type", "VarDeclStmt"},
      {"range", j_range(var->get_range())},
      {"name", j_string(var->name)},
      {"init", j_expr(var->init)}};
  }

  if (const auto * ret = dyn_cast<ReturnStmt>(s)) {
    return json{
      {"type", "ReturnStmt"}, {"range", j_range(ret->get_range())}, {"value", j_expr(ret->value)}};
  }

  if (const auto * block = dyn_cast<BlockStmt>(s)) {
    return json{
      {"type", "BlockStmt"},
      {"range", j_range(block->get_range())},
      {"body", j_list(block->body, j_stmt)}};
  }

  if (const auto * cls = dyn_cast<ClassDeclStmt>(s)) {
    return json{
      {"type", "ClassDeclStmt"}, {"range", j_range(cls->get_range())}, {"decl", j_decl(cls->decl)}};
  }

  return json{{"type", "UnknownStmt"}, {"range", j_range(s->get_range())}};
}

// ============================================================================
// Declaration serialization
// ============================================================================

json j_decl(const Decl * d)
{
  if (!d) return nullptr;

  if (const auto * field = dyn_cast<FieldDecl>(d)) {
    return json{
      {"type", "FieldDecl"},
      {"range", j_range(field->get_range())},
      {"name", j_string(field->name)},
      {"init", j_expr(field->init)}};
  }

  if (const auto * method = dyn_cast<MethodDecl>(d)) {
    json out{
      {"type", "MethodDecl"},
      {"range", j_range(method->get_range())},
      {"name", j_string(method->name)},
      {"nameRange", j_range(method->nameRange)},
      {"isAbstract", method->isAbstract},
      {"hasBody", method->hasBody},
      {"symbol", j_symbol(method->symbol)}};
    if (method->hasBody) {
      out["body"] = j_list(method->body, j_stmt);
    }
    return out;
  }

  if (const auto * cls = dyn_cast<ClassDecl>(d)) {
    return json{
      {"type", "ClassDecl"},
      {"range", j_range(cls->get_range())},
      {"name", j_string(cls->name)},
      {"typeSymbol", cls->type ? json(cls->type->name) : json(nullptr)},
      {"members", j_list(cls->members, j_decl)}};
  }

  return json{{"type", "UnknownDecl"}, {"range", j_range(d->get_range())}};
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};

  if (isa<CompilationUnit>(node)) {
    return to_json(cast<CompilationUnit>(node));
  }
  if (isa<Decl>(node)) {
    return j_decl(cast<Decl>(node));
  }
  if (isa<Stmt>(node)) {
    return j_stmt(cast<Stmt>(node));
  }
  if (isa<Expr>(node)) {
    return j_expr(cast<Expr>(node));
  }

  return nlohmann::json{
    {"type", std::string(to_string(node->get_kind()))}, {"range", j_range(node->get_range())}};
}

nlohmann::json to_json(const CompilationUnit * unit)
{
  if (!unit)
    return nlohmann::json{
      {"type", "CompilationUnit"}, {"range", j_range({})}, {"classes", nlohmann::json::array()}};

  nlohmann::json classes = nlohmann::json::array();

  for (const auto * c : unit->classes) classes.push_back(j_decl(c));

  return nlohmann::json{
    {"type", "CompilationUnit"}, {"range", j_range(unit->get_range())}, {"classes", classes}};
}

}  // namespace assert_lint
