// assert_lint/ast/ast.hpp - AST node class definitions
//
// The tree of one analysis unit as handed over by the front-end: classes,
// their members, method bodies, and the call-shaped expressions the checks
// look at. Nodes follow the LLVM/Clang style with classof() for RTTI and are
// owned by AstContext.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "assert_lint/ast/ast_enums.hpp"
#include "assert_lint/basic/casting.hpp"
#include "assert_lint/basic/source_manager.hpp"

namespace assert_lint
{

// Resolved symbols (sema/symbols/symbol.hpp)
struct TypeSymbol;
struct MethodSymbol;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node has a NodeKind for RTTI and a SourceRange (byte offsets).
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Literal of any type, kept as its source spelling.
class LiteralExpr : public NodeBase<LiteralExpr, Expr, NodeKind::Literal>
{
public:
  std::string_view value;

  explicit LiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Plain identifier reference (local, field, type name used as qualifier).
class NameExpr : public NodeBase<NameExpr, Expr, NodeKind::Name>
{
public:
  std::string_view name;

  explicit NameExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Method invocation: receiver.name(args).
class InvocationExpr : public NodeBase<InvocationExpr, Expr, NodeKind::Invocation>
{
public:
  Expr * receiver = nullptr;  ///< nullptr for unqualified calls
  std::string_view name;
  SourceRange nameRange;
  gsl::span<Expr *> args;

  /// Resolved callee (nullptr when the front-end could not resolve it)
  const MethodSymbol * symbol = nullptr;

  InvocationExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Method or constructor reference used as a value: receiver::name.
class MethodRefExpr : public NodeBase<MethodRefExpr, Expr, NodeKind::MethodRef>
{
public:
  Expr * receiver = nullptr;
  std::string_view name;  ///< "new" for constructor references
  SourceRange nameRange;

  /// Resolved referenced method (nullptr when unresolved)
  const MethodSymbol * symbol = nullptr;

  MethodRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Object construction: new T(args) { classBody }.
class NewObjectExpr : public NodeBase<NewObjectExpr, Expr, NodeKind::NewObject>
{
public:
  std::string_view typeName;
  gsl::span<Expr *> args;
  gsl::span<Decl *> classBody;  ///< Members of an anonymous class, empty otherwise

  /// Resolved constructor (nullptr when unresolved)
  const MethodSymbol * constructor = nullptr;

  explicit NewObjectExpr(std::string_view t, SourceRange r = {}) : NodeBase(r), typeName(t) {}
};

/// Lambda expression. Not a declaration: it does not open a test scope.
class LambdaExpr : public NodeBase<LambdaExpr, Expr, NodeKind::Lambda>
{
public:
  gsl::span<Stmt *> body;

  explicit LambdaExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/// Local variable declaration with optional initializer.
class VarDeclStmt : public NodeBase<VarDeclStmt, Stmt, NodeKind::VarDeclStmt>
{
public:
  std::string_view name;
  Expr * init = nullptr;

  VarDeclStmt(std::string_view n, Expr * i, SourceRange r = {}) : NodeBase(r), name(n), init(i)
  {
  }
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value = nullptr;

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Nested block (also stands in for the bodies of if/for/try statements).
class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<Stmt *> body;

  explicit BlockStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ClassDecl;

/// Local class declared inside a method body.
class ClassDeclStmt : public NodeBase<ClassDeclStmt, Stmt, NodeKind::ClassDeclStmt>
{
public:
  ClassDecl * decl;

  explicit ClassDeclStmt(ClassDecl * d, SourceRange r = {}) : NodeBase(r), decl(d) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

class FieldDecl : public NodeBase<FieldDecl, Decl, NodeKind::FieldDecl>
{
public:
  std::string_view name;
  Expr * init = nullptr;

  FieldDecl(std::string_view n, Expr * i, SourceRange r = {}) : NodeBase(r), name(n), init(i) {}
};

/// Method or constructor declaration.
class MethodDecl : public NodeBase<MethodDecl, Decl, NodeKind::MethodDecl>
{
public:
  std::string_view name;
  SourceRange nameRange;
  bool isAbstract = false;
  bool hasBody = false;  ///< false for abstract/interface/native methods
  gsl::span<Stmt *> body;

  /// Resolved symbol of this declaration (nullptr when unresolved)
  const MethodSymbol * symbol = nullptr;

  explicit MethodDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}

  /// Abstract and bodiless declarations are never checked.
  [[nodiscard]] bool is_checkable() const noexcept { return !isAbstract && hasBody; }
};

class ClassDecl : public NodeBase<ClassDecl, Decl, NodeKind::ClassDecl>
{
public:
  std::string_view name;
  gsl::span<Decl *> members;

  /// Resolved type of this class (nullptr when unresolved)
  const TypeSymbol * type = nullptr;

  explicit ClassDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

// ============================================================================
// CompilationUnit (Root Node)
// ============================================================================

class CompilationUnit : public NodeBase<CompilationUnit, AstNode, NodeKind::CompilationUnit>
{
public:
  gsl::span<ClassDecl *> classes;

  explicit CompilationUnit(SourceRange r = {}) : NodeBase(r) {}
};

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace assert_lint
