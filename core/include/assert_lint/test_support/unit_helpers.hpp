// assert_lint/test_support/unit_helpers.hpp - helpers for unit/integration tests
//
// Load a unit document from a string and run the missing-assertion check on
// it in one call.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "assert_lint/basic/diagnostic.hpp"
#include "assert_lint/driver/analyzer.hpp"
#include "assert_lint/frontend/analysis_unit.hpp"
#include "assert_lint/frontend/unit_loader.hpp"
#include "assert_lint/sema/analysis/test_classifier.hpp"
#include "assert_lint/sema/matching/custom_matchers.hpp"

namespace assert_lint::test_support
{

struct CheckedUnit
{
  AnalysisUnit unit;
  DiagnosticBag diags;
  size_t findings = 0;
};

[[nodiscard]] inline AnalysisUnit load(
  std::string_view json_text, const std::filesystem::path & virtual_path = "<test>.json")
{
  return load_unit_from_string(json_text, virtual_path);
}

[[nodiscard]] inline CheckedUnit check(
  std::string_view json_text, std::string custom_assertion_methods = {},
  TestFrameworkConfig tests = {})
{
  CheckedUnit out;
  out.unit = load(json_text);

  const CustomAssertionMethods custom(std::move(custom_assertion_methods));
  const UnitTestClassifier classifier(std::move(tests));
  out.findings = Analyzer::check_unit(out.unit, classifier, custom.matchers(), out.diags);
  out.diags.merge(custom.diagnostics());
  return out;
}

}  // namespace assert_lint::test_support
