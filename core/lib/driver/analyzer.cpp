// assert_lint/driver/analyzer.cpp - Analysis driver implementation
//
#include "assert_lint/driver/analyzer.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <utility>

#include "assert_lint/frontend/unit_loader.hpp"
#include "assert_lint/sema/analysis/missing_assertion_checker.hpp"
#include "assert_lint/sema/matching/assertion_library.hpp"
#include "assert_lint/sema/matching/custom_matchers.hpp"

namespace assert_lint
{

namespace
{

unsigned effective_jobs(unsigned requested, size_t unit_count)
{
  unsigned jobs = requested;
  if (jobs == 0) {
    jobs = std::max(1U, std::thread::hardware_concurrency());
  }
  return static_cast<unsigned>(std::min<size_t>(jobs, std::max<size_t>(unit_count, 1)));
}

UnitResult analyze_one(
  const std::filesystem::path & file, const UnitTestClassifier & tests,
  const CustomAssertionMethods & custom)
{
  UnitResult result;
  result.path = file;
  result.source.set_path(file);

  try {
    AnalysisUnit unit = load_unit_from_file(file);
    result.finding_count = Analyzer::check_unit(unit, tests, custom.matchers(), result.diagnostics);
    result.loaded = true;
    result.source = std::move(unit.source);
  } catch (const UnitLoadError & e) {
    result.diagnostics.report_error(SourceRange{}, e.what())
      .with_code(diag_codes::k_unit_load_failure);
  } catch (const std::exception & e) {
    // Contain failures to the unit that caused them.
    result.diagnostics
      .report_error(SourceRange{}, std::string("internal error while analyzing unit: ") + e.what())
      .with_code(diag_codes::k_unit_load_failure);
  }
  return result;
}

}  // namespace

AnalyzeOptions make_analyze_options(const ProjectConfig & config)
{
  const auto & rule = config.rules.missing_assertion;

  AnalyzeOptions options;
  options.custom_assertion_methods = rule.custom_assertion_methods;
  options.tests.test_annotations = rule.test_annotations;
  options.tests.legacy_test_base = rule.legacy_test_base;
  options.tests.test_method_prefix = rule.test_method_prefix;
  options.jobs = config.jobs;
  return options;
}

size_t Analyzer::check_unit(
  const AnalysisUnit & unit, const UnitTestClassifier & tests, const MatcherSet & custom,
  DiagnosticBag & diags)
{
  if (unit.root == nullptr) {
    return 0;
  }
  MissingAssertionChecker checker(tests, builtin_assertion_matchers(), custom, &diags);
  checker.check(*unit.root);
  return checker.finding_count();
}

AnalyzeResult Analyzer::analyze_files(
  const std::vector<std::filesystem::path> & files, const AnalyzeOptions & options)
{
  AnalyzeResult result;
  result.units.resize(files.size());

  const UnitTestClassifier tests(options.tests);
  const CustomAssertionMethods custom(options.custom_assertion_methods);

  const unsigned jobs = effective_jobs(options.jobs, files.size());
  if (jobs <= 1) {
    for (size_t i = 0; i < files.size(); ++i) {
      result.units[i] = analyze_one(files[i], tests, custom);
    }
  } else {
    std::atomic<size_t> next{0};
    auto worker = [&] {
      for (size_t i = next.fetch_add(1); i < files.size(); i = next.fetch_add(1)) {
        result.units[i] = analyze_one(files[i], tests, custom);
      }
    };

    std::vector<std::thread> pool;
    pool.reserve(jobs);
    for (unsigned t = 0; t < jobs; ++t) {
      pool.emplace_back(worker);
    }
    for (auto & th : pool) {
      th.join();
    }
  }

  // Configuration warnings are reported once per run, not once per unit.
  result.run_diagnostics.merge(custom.diagnostics());

  for (const auto & unit : result.units) {
    result.finding_count += unit.finding_count;
    result.error_count += unit.diagnostics.errors().size();
  }
  result.error_count += result.run_diagnostics.errors().size();
  result.success = result.error_count == 0;
  return result;
}

AnalyzeResult Analyzer::analyze_project(const ProjectConfig & config)
{
  return analyze_files(config.sources, make_analyze_options(config));
}

}  // namespace assert_lint
