// assert_lint/sema/analysis/assertion_classifier.hpp - Is this call an assertion?
//
// A call is an assertion when, in order:
//   1. its name matches (assert|verify|fail|should|check|expect).*
//   2. the built-in matcher set matches the call target
//   3. the custom matcher set matches the call target
//   4. the call target is declared in the current unit and its body
//      (transitively) performs an assertion
//
// Step 4 is memoized per symbol for the lifetime of one analysis unit.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "assert_lint/sema/matching/method_matcher.hpp"
#include "assert_lint/sema/symbols/symbol.hpp"

namespace assert_lint
{

/// Anchored, case-sensitive match of the assertion name pattern.
[[nodiscard]] bool matches_assertion_name(std::string_view name) noexcept;

// ============================================================================
// LocalMethodMemo
// ============================================================================

/**
 * Per-unit cache of "does this method body contain an assertion".
 *
 * A symbol is Computing while its body is being traversed; re-entrant
 * lookups (self or mutual recursion) see that state and answer false.
 * A negative answer that relied on such a lookup is not final and is
 * forgotten instead of recorded.
 */
class LocalMethodMemo
{
public:
  enum class State : uint8_t {
    Computing,
    HasAssertion,
    NoAssertion,
  };

  [[nodiscard]] std::optional<State> lookup(const MethodSymbol * symbol) const;

  void mark_computing(const MethodSymbol * symbol);
  void record(const MethodSymbol * symbol, bool has_assertion);
  void forget(const MethodSymbol * symbol) { states_.erase(symbol); }

  [[nodiscard]] size_t size() const noexcept { return states_.size(); }
  void clear() noexcept { states_.clear(); }

private:
  std::unordered_map<const MethodSymbol *, State> states_;
};

// ============================================================================
// AssertionClassifier
// ============================================================================

class AssertionClassifier
{
public:
  /// Both matcher sets must outlive the classifier.
  AssertionClassifier(const MatcherSet & builtin, const MatcherSet & custom)
  : builtin_(builtin), custom_(custom)
  {
  }

  AssertionClassifier(const AssertionClassifier &) = delete;
  AssertionClassifier & operator=(const AssertionClassifier &) = delete;

  /**
   * Classify one call site.
   *
   * @param name   Invoked or referenced identifier; nullopt for constructions
   * @param symbol Resolved call target; nullptr if unresolved
   */
  [[nodiscard]] bool is_assertion(std::optional<std::string_view> name, const MethodSymbol * symbol);

  /**
   * Whether the body of a method declared in this unit performs an assertion.
   * Symbols without a declaration answer false.
   */
  [[nodiscard]] bool has_local_assertion(const MethodSymbol * symbol);

  /// Forget everything learned about the previous unit.
  void reset() noexcept
  {
    memo_.clear();
    inProgress_.clear();
    traversalCount_ = 0;
  }

  [[nodiscard]] const LocalMethodMemo & memo() const noexcept { return memo_; }

  /// Number of method bodies traversed by has_local_assertion so far.
  [[nodiscard]] size_t traversal_count() const noexcept { return traversalCount_; }

private:
  const MatcherSet & builtin_;
  const MatcherSet & custom_;
  /// Depth of `symbol` on the in-progress stack, or the stack size if absent.
  [[nodiscard]] size_t in_progress_depth(const MethodSymbol * symbol) const noexcept;

  LocalMethodMemo memo_;
  // Symbols whose bodies are being traversed, outermost first.
  std::vector<const MethodSymbol *> inProgress_;
  // Shallowest in-progress symbol the current traversal has observed.
  size_t shallowestDependency_ = 0;
  size_t traversalCount_ = 0;
};

}  // namespace assert_lint
