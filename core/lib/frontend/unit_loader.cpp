// assert_lint/frontend/unit_loader.cpp - JSON unit document -> AST + symbols
//
#include "assert_lint/frontend/unit_loader.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <fstream>
#include <gsl/span>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>
#include <vector>

namespace assert_lint
{

namespace
{

using nlohmann::json;

[[noreturn]] void fail(const std::string & message) { throw UnitLoadError(message); }

const json & require(const json & node, const char * key, std::string_view where)
{
  if (!node.is_object()) {
    fail(fmt::format("{}: expected an object", where));
  }
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    fail(fmt::format("{}: missing required key '{}'", where, key));
  }
  return *it;
}

const json * optional_key(const json & node, const char * key)
{
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

const std::string & as_string(const json & value, std::string_view where)
{
  if (!value.is_string()) {
    fail(fmt::format("{}: expected a string", where));
  }
  return value.get_ref<const std::string &>();
}

const json & as_array(const json & value, std::string_view where)
{
  if (!value.is_array()) {
    fail(fmt::format("{}: expected an array", where));
  }
  return value;
}

SourceRange parse_range(const json * value, std::string_view where)
{
  if (value == nullptr) {
    return {};
  }
  if (!value->is_array() || value->size() != 2 || !(*value)[0].is_number_unsigned() ||
      !(*value)[1].is_number_unsigned()) {
    fail(fmt::format("{}: a range must be [start, end] byte offsets", where));
  }
  const auto begin = (*value)[0].get<uint64_t>();
  const auto end = (*value)[1].get<uint64_t>();
  if (begin > end || end >= std::numeric_limits<uint32_t>::max()) {
    fail(fmt::format("{}: invalid range [{}, {}]", where, begin, end));
  }
  return {static_cast<uint32_t>(begin), static_cast<uint32_t>(end)};
}

// ============================================================================
// UnitBuilder
// ============================================================================

// Writes into the unit's AstContext and SymbolTable; owns nothing.
class UnitBuilder
{
public:
  explicit UnitBuilder(AnalysisUnit & unit) : unit_(unit), ast_(*unit.ast) {}

  void build(const json & doc);

private:
  // Symbols
  void declare_types(const json & types);
  void declare_methods(const json & methods);
  [[nodiscard]] MethodSymbol * resolve(const json & node, std::string_view where);

  // Declarations
  [[nodiscard]] ClassDecl * build_class(const json & node);
  [[nodiscard]] Decl * build_member(const json & node);
  [[nodiscard]] MethodDecl * build_method(const json & node);
  [[nodiscard]] gsl::span<Decl *> build_members(const json * members, std::string_view where);

  // Statements
  [[nodiscard]] Stmt * build_stmt(const json & node);
  [[nodiscard]] gsl::span<Stmt *> build_stmts(const json * body, std::string_view where);

  // Expressions
  [[nodiscard]] Expr * build_expr(const json & node);
  [[nodiscard]] Expr * build_optional_expr(const json & node, const char * key);
  [[nodiscard]] gsl::span<Expr *> build_args(const json & node);

  [[nodiscard]] static std::string_view kind_of(const json & node, std::string_view where);
  [[nodiscard]] std::string_view intern(const json & value, std::string_view where);

  AnalysisUnit & unit_;
  AstContext & ast_;
};

void UnitBuilder::build(const json & doc)
{
  if (!doc.is_object()) {
    fail("unit document must be a JSON object");
  }

  if (const json * file = optional_key(doc, "file")) {
    unit_.source.set_path(as_string(*file, "file"));
  }
  if (const json * source = optional_key(doc, "source")) {
    unit_.source.set_content(as_string(*source, "source"));
  }

  if (const json * types = optional_key(doc, "types")) {
    declare_types(as_array(*types, "types"));
  }
  if (const json * methods = optional_key(doc, "methods")) {
    declare_methods(as_array(*methods, "methods"));
  }

  std::vector<ClassDecl *> classes;
  if (const json * cls = optional_key(doc, "classes")) {
    for (const auto & c : as_array(*cls, "classes")) {
      classes.push_back(build_class(c));
    }
  }

  unit_.root = ast_.create<CompilationUnit>();
  unit_.root->classes = ast_.copy_to_arena(classes);
}

// ----------------------------------------------------------------------------
// Symbols
// ----------------------------------------------------------------------------

void UnitBuilder::declare_types(const json & types)
{
  // Names first, so supertypes may be listed in any order.
  for (const auto & t : types) {
    (void)unit_.symbols.get_or_create_type(as_string(require(t, "name", "type"), "type.name"));
  }

  for (const auto & t : types) {
    TypeSymbol & type = unit_.symbols.get_or_create_type(t.at("name").get_ref<const std::string &>());
    const json * supers = optional_key(t, "supertypes");
    if (!supers) continue;
    for (const auto & s : as_array(*supers, "type.supertypes")) {
      type.supertypes.push_back(
        &unit_.symbols.get_or_create_type(as_string(s, "type.supertypes[]")));
    }
  }
}

void UnitBuilder::declare_methods(const json & methods)
{
  for (const auto & m : methods) {
    const std::string & id = as_string(require(m, "id", "method"), "method.id");
    const std::string where = fmt::format("method '{}'", id);

    MethodSymbol symbol;
    symbol.name = as_string(require(m, "name", where), where + ".name");

    if (const json * owner = optional_key(m, "owner")) {
      symbol.owner = &unit_.symbols.get_or_create_type(as_string(*owner, where + ".owner"));
    }

    if (const json * params = optional_key(m, "params")) {
      if (!params->is_number_unsigned()) {
        fail(where + ".params: expected a non-negative integer");
      }
      symbol.paramCount = params->get<size_t>();
    }

    if (const json * annotations = optional_key(m, "annotations")) {
      for (const auto & a : as_array(*annotations, where + ".annotations")) {
        Annotation annotation;
        annotation.type = as_string(require(a, "type", where), where + ".annotations[].type");
        if (const json * values = optional_key(a, "values")) {
          if (!values->is_object()) {
            fail(where + ".annotations[].values: expected an object");
          }
          for (const auto & [key, value] : values->items()) {
            annotation.values.push_back(
              AnnotationValue{key, value.is_string() ? value.get<std::string>() : value.dump()});
          }
        }
        symbol.annotations.push_back(std::move(annotation));
      }
    }

    if (!unit_.symbols.define_method(id, std::move(symbol))) {
      fail(fmt::format("duplicate method id '{}'", id));
    }
  }

  // Override chains may point forward.
  for (const auto & m : methods) {
    const json * overrides = optional_key(m, "overrides");
    if (!overrides) continue;
    const std::string & id = m.at("id").get_ref<const std::string &>();
    MethodSymbol * symbol = unit_.symbols.find_method(id);
    symbol->overridden =
      unit_.symbols.find_method(as_string(*overrides, fmt::format("method '{}'.overrides", id)));
  }
}

MethodSymbol * UnitBuilder::resolve(const json & node, std::string_view where)
{
  const json * id = optional_key(node, "symbol");
  if (!id) {
    return nullptr;
  }
  return unit_.symbols.find_method(as_string(*id, fmt::format("{}.symbol", where)));
}

// ----------------------------------------------------------------------------
// Declarations
// ----------------------------------------------------------------------------

ClassDecl * UnitBuilder::build_class(const json & node)
{
  const std::string_view name = intern(require(node, "name", "class"), "class.name");
  auto * cls = ast_.create<ClassDecl>(name, parse_range(optional_key(node, "range"), "class.range"));

  if (const json * type = optional_key(node, "type")) {
    cls->type = &unit_.symbols.get_or_create_type(as_string(*type, "class.type"));
  }
  cls->members = build_members(optional_key(node, "members"), "class.members");
  return cls;
}

gsl::span<Decl *> UnitBuilder::build_members(const json * members, std::string_view where)
{
  if (!members) {
    return {};
  }
  std::vector<Decl *> out;
  for (const auto & m : as_array(*members, where)) {
    out.push_back(build_member(m));
  }
  return ast_.copy_to_arena(out);
}

Decl * UnitBuilder::build_member(const json & node)
{
  const std::string_view kind = kind_of(node, "member");

  if (kind == "method") {
    return build_method(node);
  }
  if (kind == "field") {
    auto * field = ast_.create<FieldDecl>(
      intern(require(node, "name", "field"), "field.name"), build_optional_expr(node, "init"),
      parse_range(optional_key(node, "range"), "field.range"));
    return field;
  }
  if (kind == "class") {
    return build_class(node);
  }
  fail(fmt::format("unknown member kind '{}'", kind));
}

MethodDecl * UnitBuilder::build_method(const json & node)
{
  const std::string_view name = intern(require(node, "name", "method"), "method.name");
  const std::string where = fmt::format("method declaration '{}'", name);

  auto * method =
    ast_.create<MethodDecl>(name, parse_range(optional_key(node, "range"), where + ".range"));
  method->nameRange = parse_range(optional_key(node, "name_range"), where + ".name_range");

  if (const json * abstract = optional_key(node, "abstract")) {
    if (!abstract->is_boolean()) {
      fail(where + ".abstract: expected a boolean");
    }
    method->isAbstract = abstract->get<bool>();
  }

  if (const json * body = optional_key(node, "body")) {
    method->hasBody = true;
    method->body = build_stmts(body, where + ".body");
  }

  if (MethodSymbol * symbol = resolve(node, where)) {
    if (symbol->declaration != nullptr) {
      fail(fmt::format("method symbol '{}' is declared twice", symbol->id));
    }
    symbol->declaration = method;
    method->symbol = symbol;
  }
  return method;
}

// ----------------------------------------------------------------------------
// Statements
// ----------------------------------------------------------------------------

gsl::span<Stmt *> UnitBuilder::build_stmts(const json * body, std::string_view where)
{
  if (!body) {
    return {};
  }
  std::vector<Stmt *> out;
  for (const auto & s : as_array(*body, where)) {
    out.push_back(build_stmt(s));
  }
  return ast_.copy_to_arena(out);
}

Stmt * UnitBuilder::build_stmt(const json & node)
{
  const std::string_view kind = kind_of(node, "statement");
  const SourceRange range = parse_range(optional_key(node, "range"), "statement.range");

  if (kind == "expr") {
    return ast_.create<ExprStmt>(build_expr(require(node, "expr", "expr statement")), range);
  }
  if (kind == "var") {
    return ast_.create<VarDeclStmt>(
      intern(require(node, "name", "var statement"), "var.name"), build_optional_expr(node, "init"),
      range);
  }
  if (kind == "return") {
    return ast_.create<ReturnStmt>(build_optional_expr(node, "value"), range);
  }
  if (kind == "block") {
    auto * block = ast_.create<BlockStmt>(range);
    block->body = build_stmts(optional_key(node, "body"), "block.body");
    return block;
  }
  if (kind == "class") {
    return ast_.create<ClassDeclStmt>(build_class(require(node, "class", "class statement")), range);
  }
  fail(fmt::format("unknown statement kind '{}'", kind));
}

// ----------------------------------------------------------------------------
// Expressions
// ----------------------------------------------------------------------------

Expr * UnitBuilder::build_optional_expr(const json & node, const char * key)
{
  const json * value = optional_key(node, key);
  return value ? build_expr(*value) : nullptr;
}

gsl::span<Expr *> UnitBuilder::build_args(const json & node)
{
  const json * args = optional_key(node, "args");
  if (!args) {
    return {};
  }
  std::vector<Expr *> out;
  for (const auto & a : as_array(*args, "args")) {
    out.push_back(build_expr(a));
  }
  return ast_.copy_to_arena(out);
}

Expr * UnitBuilder::build_expr(const json & node)
{
  const std::string_view kind = kind_of(node, "expression");
  const SourceRange range = parse_range(optional_key(node, "range"), "expression.range");

  if (kind == "call") {
    auto * call = ast_.create<InvocationExpr>(intern(require(node, "name", "call"), "call.name"), range);
    call->nameRange = parse_range(optional_key(node, "name_range"), "call.name_range");
    call->receiver = build_optional_expr(node, "receiver");
    call->args = build_args(node);
    call->symbol = resolve(node, "call");
    return call;
  }
  if (kind == "method_ref") {
    auto * ref =
      ast_.create<MethodRefExpr>(intern(require(node, "name", "method_ref"), "method_ref.name"), range);
    ref->nameRange = parse_range(optional_key(node, "name_range"), "method_ref.name_range");
    ref->receiver = build_optional_expr(node, "receiver");
    ref->symbol = resolve(node, "method_ref");
    return ref;
  }
  if (kind == "new") {
    const json * type = optional_key(node, "type");
    auto * object = ast_.create<NewObjectExpr>(type ? intern(*type, "new.type") : std::string_view{}, range);
    object->args = build_args(node);
    object->classBody = build_members(optional_key(node, "body"), "new.body");
    object->constructor = resolve(node, "new");
    return object;
  }
  if (kind == "lambda") {
    auto * lambda = ast_.create<LambdaExpr>(range);
    lambda->body = build_stmts(optional_key(node, "body"), "lambda.body");
    return lambda;
  }
  if (kind == "name") {
    return ast_.create<NameExpr>(intern(require(node, "name", "name"), "name.name"), range);
  }
  if (kind == "literal") {
    const json * value = optional_key(node, "value");
    std::string_view text;
    if (value) {
      text = value->is_string() ? ast_.intern(value->get_ref<const std::string &>())
                                : ast_.intern(value->dump());
    }
    return ast_.create<LiteralExpr>(text, range);
  }
  fail(fmt::format("unknown expression kind '{}'", kind));
}

// ----------------------------------------------------------------------------
// Utility
// ----------------------------------------------------------------------------

std::string_view UnitBuilder::kind_of(const json & node, std::string_view where)
{
  return as_string(require(node, "kind", where), fmt::format("{}.kind", where));
}

std::string_view UnitBuilder::intern(const json & value, std::string_view where)
{
  return ast_.intern(as_string(value, where));
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

AnalysisUnit load_unit_from_string(std::string_view json_text, const std::filesystem::path & source_path)
{
  json doc;
  try {
    doc = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error & e) {
    throw UnitLoadError(fmt::format("invalid JSON: {}", e.what()));
  }

  AnalysisUnit unit;
  unit.source.set_path(source_path);
  unit.ast = std::make_unique<AstContext>();

  try {
    UnitBuilder(unit).build(doc);
  } catch (const json::exception & e) {
    throw UnitLoadError(fmt::format("malformed unit: {}", e.what()));
  }
  return unit;
}

AnalysisUnit load_unit_from_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw UnitLoadError(fmt::format("cannot read unit file: {}", path.string()));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  try {
    return load_unit_from_string(buffer.str(), path);
  } catch (const UnitLoadError & e) {
    throw UnitLoadError(fmt::format("{}: {}", path.string(), e.what()));
  }
}

}  // namespace assert_lint
