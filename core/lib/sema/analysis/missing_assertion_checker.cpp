// assert_lint/sema/analysis/missing_assertion_checker.cpp - Scope-tracking traversal

#include "assert_lint/sema/analysis/missing_assertion_checker.hpp"

#include <optional>
#include <string>
#include <vector>

#include "assert_lint/ast/visitor.hpp"

namespace assert_lint
{

namespace
{

struct ScopeFrame
{
  bool isTest = false;
  bool hasAssertion = false;  ///< Only ever flips from false to true
};

}  // namespace

class MissingAssertionChecker::ScopeTracker : public ConstRecursiveAstVisitor<ScopeTracker>
{
  using Base = ConstRecursiveAstVisitor<ScopeTracker>;

public:
  explicit ScopeTracker(MissingAssertionChecker & checker) : checker_(checker) {}

  void run(const CompilationUnit & unit)
  {
    scopes_.clear();
    scopes_.push_back(ScopeFrame{});
    (void)visit(&unit);
    scopes_.pop_back();
  }

  bool visit_method_decl(const MethodDecl * node)
  {
    if (!node->is_checkable()) {
      return true;
    }

    scopes_.push_back(ScopeFrame{checker_.tests_.is_unit_test(*node), false});
    (void)Base::visit_method_decl(node);
    const ScopeFrame frame = scopes_.back();
    scopes_.pop_back();

    if (frame.isTest && !frame.hasAssertion && !checker_.tests_.expects_exception(*node)) {
      checker_.report_missing_assertion(*node);
    }
    return true;
  }

  bool visit_invocation_expr(const InvocationExpr * node)
  {
    (void)Base::visit_invocation_expr(node);
    record_call(node->name, node->symbol);
    return true;
  }

  bool visit_method_ref_expr(const MethodRefExpr * node)
  {
    (void)Base::visit_method_ref_expr(node);
    record_call(node->name, node->symbol);
    return true;
  }

  bool visit_new_object_expr(const NewObjectExpr * node)
  {
    (void)Base::visit_new_object_expr(node);
    record_call(std::nullopt, node->constructor);
    return true;
  }

private:
  void record_call(std::optional<std::string_view> name, const MethodSymbol * symbol)
  {
    ScopeFrame & top = scopes_.back();
    if (top.isTest && !top.hasAssertion &&
        checker_.classifier_.is_assertion(name, symbol)) {
      top.hasAssertion = true;
    }
  }

  MissingAssertionChecker & checker_;
  std::vector<ScopeFrame> scopes_;
};

bool MissingAssertionChecker::check(const CompilationUnit & unit)
{
  findingCount_ = 0;
  classifier_.reset();

  ScopeTracker tracker(*this);
  tracker.run(unit);

  classifier_.reset();
  return findingCount_ == 0;
}

void MissingAssertionChecker::report_missing_assertion(const MethodDecl & method)
{
  ++findingCount_;
  if (!diags_) {
    return;
  }
  const SourceRange range = method.nameRange.is_valid() ? method.nameRange : method.get_range();
  diags_->report_warning(range, std::string(k_message))
    .with_code(diag_codes::k_missing_assertion);
}

}  // namespace assert_lint
