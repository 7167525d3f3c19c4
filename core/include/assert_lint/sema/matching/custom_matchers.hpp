// assert_lint/sema/matching/custom_matchers.hpp - User-configured assertion methods
//
// Configuration format: comma-separated "<fully.qualified.Type>#<method>"
// entries. A method name ending in '*' matches by prefix:
//
//   com.example.Helper#checkSomething*,org.foo.Bar#verify
//
#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "assert_lint/basic/diagnostic.hpp"
#include "assert_lint/sema/matching/method_matcher.hpp"

namespace assert_lint
{

struct CustomMatcherCompilation
{
  MatcherSet matchers;
  DiagnosticBag diagnostics;  ///< One warning per dropped entry
};

/**
 * Compile a configuration string into a matcher set.
 *
 * Malformed entries (not exactly one '#', empty type or empty method name)
 * are dropped with an `invalid-custom-assertion` warning. Never fails.
 */
[[nodiscard]] CustomMatcherCompilation compile_custom_matchers(std::string_view config);

/**
 * Lazily compiled custom matcher set for one run.
 *
 * The first call to matchers() or diagnostics() compiles the configuration,
 * exactly once even when several worker threads race on it. The result is
 * read-only afterwards.
 */
class CustomAssertionMethods
{
public:
  explicit CustomAssertionMethods(std::string config = {}) : config_(std::move(config)) {}

  CustomAssertionMethods(const CustomAssertionMethods &) = delete;
  CustomAssertionMethods & operator=(const CustomAssertionMethods &) = delete;

  [[nodiscard]] const MatcherSet & matchers() const;

  /// Warnings produced while compiling
  [[nodiscard]] const DiagnosticBag & diagnostics() const;

  [[nodiscard]] const std::string & config() const noexcept { return config_; }

private:
  void ensure_compiled() const;

  std::string config_;
  mutable std::once_flag once_;
  mutable CustomMatcherCompilation result_;
};

}  // namespace assert_lint
