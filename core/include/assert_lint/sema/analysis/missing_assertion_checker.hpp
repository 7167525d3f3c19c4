// assert_lint/sema/analysis/missing_assertion_checker.hpp - Test methods without assertions
//
// Walks one compilation unit, keeping a stack of scope frames (one per
// entered method declaration), and reports every test method in which no
// assertion call was made at the method's own level.
//
// Calls inside a nested method (local or anonymous class) are attributed to
// that nested method's frame and never to the enclosing test. Lambdas do not
// open a frame.
//
#pragma once

#include <cstddef>
#include <string_view>

#include "assert_lint/ast/ast.hpp"
#include "assert_lint/basic/diagnostic.hpp"
#include "assert_lint/sema/analysis/assertion_classifier.hpp"
#include "assert_lint/sema/analysis/test_classifier.hpp"
#include "assert_lint/sema/matching/method_matcher.hpp"

namespace assert_lint
{

class MissingAssertionChecker
{
public:
  static constexpr std::string_view k_message = "Add at least one assertion to this test case.";

  /**
   * @param tests   Test method recognition
   * @param builtin Built-in assertion matchers (must outlive the checker)
   * @param custom  Custom assertion matchers (must outlive the checker)
   * @param diags   Findings sink, may be nullptr to only count
   */
  MissingAssertionChecker(
    const UnitTestClassifier & tests, const MatcherSet & builtin, const MatcherSet & custom,
    DiagnosticBag * diags = nullptr)
  : tests_(tests), classifier_(builtin, custom), diags_(diags)
  {
  }

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Check one compilation unit. State from a previous unit is discarded.
   *
   * @return true if no finding was reported
   */
  bool check(const CompilationUnit & unit);

  [[nodiscard]] size_t finding_count() const noexcept { return findingCount_; }

private:
  class ScopeTracker;

  void report_missing_assertion(const MethodDecl & method);

  const UnitTestClassifier & tests_;
  AssertionClassifier classifier_;
  DiagnosticBag * diags_ = nullptr;
  size_t findingCount_ = 0;
};

}  // namespace assert_lint
