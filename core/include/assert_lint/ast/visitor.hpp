// assert_lint/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// Dispatch is a switch over the closed NodeKind set (generated from
// ast_nodes.def); no virtual functions are involved.
//
#pragma once

#include <type_traits>

#include "assert_lint/ast/ast.hpp"
#include "assert_lint/ast/ast_enums.hpp"
#include "assert_lint/basic/casting.hpp"

namespace assert_lint
{

namespace detail
{

/// Propagate const from NodePtrT to a derived node type
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor. The derived class implements visit_<snake> methods for
 * the node types it cares about; everything else falls back to the category
 * handler (visit_expr / visit_stmt / visit_decl) and finally visit_node.
 *
 * Usage:
 * @code
 *   class CallCounter : public ConstAstVisitor<CallCounter, void> {
 *   public:
 *     void visit_invocation_expr(const InvocationExpr* node) { ++count; }
 *     int count = 0;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  /**
   * Visit a node, dispatching on its kind.
   */
  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "assert_lint/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (generated from the X-Macro)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "assert_lint/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that walks every child node in source order.
 *
 * Override a visit method to customize behavior. Call the base
 * implementation to continue into the children; return false from any
 * visit method to stop the whole traversal.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  // ===========================================================================
  // Expressions
  // ===========================================================================

  bool visit_invocation_expr(NodePtr<InvocationExpr> node)
  {
    if (node->receiver && !get_derived().visit(node->receiver)) return false;
    for (auto * arg : node->args) {
      if (arg && !get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_method_ref_expr(NodePtr<MethodRefExpr> node)
  {
    return !node->receiver || get_derived().visit(node->receiver);
  }

  bool visit_new_object_expr(NodePtr<NewObjectExpr> node)
  {
    for (auto * arg : node->args) {
      if (arg && !get_derived().visit(arg)) return false;
    }
    for (auto * member : node->classBody) {
      if (member && !get_derived().visit(member)) return false;
    }
    return true;
  }

  bool visit_lambda_expr(NodePtr<LambdaExpr> node)
  {
    for (auto * stmt : node->body) {
      if (stmt && !get_derived().visit(stmt)) return false;
    }
    return true;
  }

  bool visit_literal_expr(NodePtr<LiteralExpr> node)
  {
    (void)node;
    return true;
  }

  bool visit_name_expr(NodePtr<NameExpr> node)
  {
    (void)node;
    return true;
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  bool visit_expr_stmt(NodePtr<ExprStmt> node)
  {
    return !node->expr || get_derived().visit(node->expr);
  }

  bool visit_var_decl_stmt(NodePtr<VarDeclStmt> node)
  {
    return !node->init || get_derived().visit(node->init);
  }

  bool visit_return_stmt(NodePtr<ReturnStmt> node)
  {
    return !node->value || get_derived().visit(node->value);
  }

  bool visit_block_stmt(NodePtr<BlockStmt> node)
  {
    for (auto * stmt : node->body) {
      if (stmt && !get_derived().visit(stmt)) return false;
    }
    return true;
  }

  bool visit_class_decl_stmt(NodePtr<ClassDeclStmt> node)
  {
    return !node->decl || get_derived().visit(node->decl);
  }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  bool visit_field_decl(NodePtr<FieldDecl> node)
  {
    return !node->init || get_derived().visit(node->init);
  }

  bool visit_method_decl(NodePtr<MethodDecl> node)
  {
    for (auto * stmt : node->body) {
      if (stmt && !get_derived().visit(stmt)) return false;
    }
    return true;
  }

  bool visit_class_decl(NodePtr<ClassDecl> node)
  {
    for (auto * member : node->members) {
      if (member && !get_derived().visit(member)) return false;
    }
    return true;
  }

  bool visit_compilation_unit(NodePtr<CompilationUnit> node)
  {
    for (auto * cls : node->classes) {
      if (cls && !get_derived().visit(cls)) return false;
    }
    return true;
  }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace assert_lint
