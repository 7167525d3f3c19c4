// assert_lint/sema/analysis/assertion_classifier.cpp - Assertion classification
#include "assert_lint/sema/analysis/assertion_classifier.hpp"

#include <algorithm>
#include <array>
#include <limits>

#include "assert_lint/ast/ast.hpp"
#include "assert_lint/ast/visitor.hpp"

namespace assert_lint
{

bool matches_assertion_name(std::string_view name) noexcept
{
  static constexpr std::array<std::string_view, 6> k_prefixes = {
    "assert", "verify", "fail", "should", "check", "expect"};

  for (const auto prefix : k_prefixes) {
    if (name.substr(0, prefix.size()) == prefix) {
      return true;
    }
  }
  return false;
}

// ============================================================================
// LocalMethodMemo
// ============================================================================

std::optional<LocalMethodMemo::State> LocalMethodMemo::lookup(const MethodSymbol * symbol) const
{
  auto it = states_.find(symbol);
  if (it == states_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void LocalMethodMemo::mark_computing(const MethodSymbol * symbol)
{
  states_[symbol] = State::Computing;
}

void LocalMethodMemo::record(const MethodSymbol * symbol, bool has_assertion)
{
  states_[symbol] = has_assertion ? State::HasAssertion : State::NoAssertion;
}

// ============================================================================
// Isolated body traversal
// ============================================================================

namespace
{

/**
 * Looks for any assertion call in a method body, at any depth. Knows nothing
 * about tests or scopes; stops at the first hit.
 */
class AssertionFinder : public ConstRecursiveAstVisitor<AssertionFinder>
{
  using Base = ConstRecursiveAstVisitor<AssertionFinder>;

public:
  explicit AssertionFinder(AssertionClassifier & classifier) : classifier_(classifier) {}

  [[nodiscard]] bool found() const noexcept { return found_; }

  bool visit_invocation_expr(const InvocationExpr * node)
  {
    if (!Base::visit_invocation_expr(node)) return false;
    return !check(node->name, node->symbol);
  }

  bool visit_method_ref_expr(const MethodRefExpr * node)
  {
    if (!Base::visit_method_ref_expr(node)) return false;
    return !check(node->name, node->symbol);
  }

  bool visit_new_object_expr(const NewObjectExpr * node)
  {
    if (!Base::visit_new_object_expr(node)) return false;
    return !check(std::nullopt, node->constructor);
  }

private:
  bool check(std::optional<std::string_view> name, const MethodSymbol * symbol)
  {
    found_ = classifier_.is_assertion(name, symbol);
    return found_;
  }

  AssertionClassifier & classifier_;
  bool found_ = false;
};

}  // namespace

// ============================================================================
// AssertionClassifier
// ============================================================================

bool AssertionClassifier::is_assertion(
  std::optional<std::string_view> name, const MethodSymbol * symbol)
{
  if (name && matches_assertion_name(*name)) {
    return true;
  }
  if (builtin_.any_match(symbol) || custom_.any_match(symbol)) {
    return true;
  }
  return symbol != nullptr && symbol->declaration != nullptr && has_local_assertion(symbol);
}

size_t AssertionClassifier::in_progress_depth(const MethodSymbol * symbol) const noexcept
{
  for (size_t i = 0; i < inProgress_.size(); ++i) {
    if (inProgress_[i] == symbol) {
      return i;
    }
  }
  return inProgress_.size();
}

bool AssertionClassifier::has_local_assertion(const MethodSymbol * symbol)
{
  if (symbol == nullptr) {
    return false;
  }

  if (auto state = memo_.lookup(symbol)) {
    if (*state == LocalMethodMemo::State::Computing) {
      shallowestDependency_ = std::min(shallowestDependency_, in_progress_depth(symbol));
      return false;
    }
    return *state == LocalMethodMemo::State::HasAssertion;
  }

  if (symbol->declaration == nullptr) {
    memo_.record(symbol, false);
    return false;
  }

  const size_t depth = inProgress_.size();
  const size_t outerDependency = shallowestDependency_;
  shallowestDependency_ = std::numeric_limits<size_t>::max();

  memo_.mark_computing(symbol);
  inProgress_.push_back(symbol);
  ++traversalCount_;

  AssertionFinder finder(*this);
  finder.visit(symbol->declaration);

  inProgress_.pop_back();
  const bool found = finder.found();

  if (found || shallowestDependency_ >= depth) {
    // Only this symbol's own recursion was cut short, so the answer is final.
    memo_.record(symbol, found);
    shallowestDependency_ = outerDependency;
  } else {
    // The answer depends on an enclosing symbol that is still unfinished.
    memo_.forget(symbol);
    shallowestDependency_ = std::min(outerDependency, shallowestDependency_);
  }
  return found;
}

}  // namespace assert_lint
