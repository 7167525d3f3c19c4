// assert_lint/sema/matching/custom_matchers.cpp - Custom assertion method compiler
#include "assert_lint/sema/matching/custom_matchers.hpp"

#include <fmt/core.h>

#include <vector>

namespace assert_lint
{

namespace
{

std::string_view trim(std::string_view s)
{
  constexpr std::string_view k_ws = " \t\r\n";
  const auto first = s.find_first_not_of(k_ws);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(k_ws);
  return s.substr(first, last - first + 1);
}

std::vector<std::string_view> split(std::string_view s, char sep)
{
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    const auto pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

void report_malformed(DiagnosticBag & diags, std::string_view entry)
{
  diags
    .report_warning(
      SourceRange{},
      fmt::format(
        "Unable to create a corresponding matcher for custom assertion method, please check the "
        "format of the following symbol: '{}'",
        entry))
    .with_code(diag_codes::k_invalid_custom_assertion)
    .with_help("expected '<fully.qualified.Type>#<method>', a trailing '*' matches a name prefix");
}

}  // namespace

CustomMatcherCompilation compile_custom_matchers(std::string_view config)
{
  CustomMatcherCompilation out;
  if (trim(config).empty()) {
    return out;
  }

  std::vector<MethodMatcher> matchers;
  for (const auto raw_entry : split(config, ',')) {
    const auto entry = trim(raw_entry);
    const auto parts = split(entry, '#');
    if (parts.size() != 2) {
      report_malformed(out.diagnostics, entry);
      continue;
    }

    const auto type = trim(parts[0]);
    auto method = trim(parts[1]);
    if (type.empty() || method.empty()) {
      report_malformed(out.diagnostics, entry);
      continue;
    }

    if (method.back() == '*') {
      method.remove_suffix(1);
      matchers.emplace_back(
        TypeCriteria::is(std::string(type)), NameCriteria::starts_with(std::string(method)));
    } else {
      matchers.emplace_back(
        TypeCriteria::is(std::string(type)), NameCriteria::is(std::string(method)));
    }
  }

  out.matchers = MatcherSet(std::move(matchers));
  return out;
}

// ============================================================================
// CustomAssertionMethods
// ============================================================================

void CustomAssertionMethods::ensure_compiled() const
{
  std::call_once(once_, [this] { result_ = compile_custom_matchers(config_); });
}

const MatcherSet & CustomAssertionMethods::matchers() const
{
  ensure_compiled();
  return result_.matchers;
}

const DiagnosticBag & CustomAssertionMethods::diagnostics() const
{
  ensure_compiled();
  return result_.diagnostics;
}

}  // namespace assert_lint
