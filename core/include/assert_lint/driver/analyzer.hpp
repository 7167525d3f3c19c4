// assert_lint/driver/analyzer.hpp - Analysis driver
//
// Single entry point for the check pipeline: load each unit document, run the
// missing-assertion check on it and collect the diagnostics per unit.
// Used by the CLI and the integration tests.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "assert_lint/basic/diagnostic.hpp"
#include "assert_lint/basic/source_manager.hpp"
#include "assert_lint/frontend/analysis_unit.hpp"
#include "assert_lint/project/project_config.hpp"
#include "assert_lint/sema/analysis/test_classifier.hpp"
#include "assert_lint/sema/matching/method_matcher.hpp"

namespace assert_lint
{

// ============================================================================
// Analyze Options
// ============================================================================

struct AnalyzeOptions
{
  /// Comma-separated "Type#method" entries recognized as assertions
  std::string custom_assertion_methods;

  /// How test methods are recognized
  TestFrameworkConfig tests;

  /// Worker threads; 0 means one per hardware thread
  unsigned jobs = 1;
};

/**
 * Options described by a project configuration.
 */
[[nodiscard]] AnalyzeOptions make_analyze_options(const ProjectConfig & config);

// ============================================================================
// Analyze Result
// ============================================================================

struct UnitResult
{
  /// Path given on input
  std::filesystem::path path;

  /// Reported path and source text, for printing diagnostics
  SourceFile source;

  DiagnosticBag diagnostics;

  size_t finding_count = 0;

  /// false if the unit document could not be loaded
  bool loaded = false;
};

struct AnalyzeResult
{
  /// No errors (findings are warnings and do not fail the run)
  bool success = false;

  /// One entry per input, in input order
  std::vector<UnitResult> units;

  /// Diagnostics that belong to no unit (custom assertion configuration)
  DiagnosticBag run_diagnostics;

  size_t finding_count = 0;
  size_t error_count = 0;
};

// ============================================================================
// Analyzer
// ============================================================================

class Analyzer
{
public:
  /**
   * Check a set of unit documents.
   *
   * Each unit is analyzed in isolation (own AST, symbols, scope stack and
   * memo); with `jobs != 1` units are spread over worker threads. A unit that
   * fails to load gets an error diagnostic and the others are still checked.
   */
  [[nodiscard]] static AnalyzeResult analyze_files(
    const std::vector<std::filesystem::path> & files, const AnalyzeOptions & options);

  /**
   * Check every source listed in a project configuration.
   */
  [[nodiscard]] static AnalyzeResult analyze_project(const ProjectConfig & config);

  /**
   * Run the missing-assertion check on an already loaded unit.
   *
   * @return Number of findings added to `diags`
   */
  static size_t check_unit(
    const AnalysisUnit & unit, const UnitTestClassifier & tests, const MatcherSet & custom,
    DiagnosticBag & diags);
};

}  // namespace assert_lint
