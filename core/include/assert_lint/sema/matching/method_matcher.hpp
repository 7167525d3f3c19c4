// assert_lint/sema/matching/method_matcher.hpp - Predicates over resolved call targets
//
// A MethodMatcher recognizes a call target by its declaring type, its simple
// name and, optionally, its arity. A MatcherSet is a plain disjunction of
// matchers.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "assert_lint/sema/symbols/symbol.hpp"

namespace assert_lint
{

// ============================================================================
// Criteria
// ============================================================================

/**
 * Criteria on the declaring type of a method.
 */
class TypeCriteria
{
public:
  enum class Kind : uint8_t {
    Is,         ///< Exact fully qualified name
    SubtypeOf,  ///< Reflexive, transitive subtype
    Any,
  };

  [[nodiscard]] static TypeCriteria is(std::string qualified_name);
  [[nodiscard]] static TypeCriteria subtype_of(std::string qualified_name);
  [[nodiscard]] static TypeCriteria any_type();

  /// An unknown (null) type only matches Any.
  [[nodiscard]] bool matches(const TypeSymbol * type) const;

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string & name() const noexcept { return name_; }

private:
  TypeCriteria(Kind kind, std::string name) : kind_(kind), name_(std::move(name)) {}

  Kind kind_;
  std::string name_;
};

/**
 * Criteria on the simple name of a method.
 */
class NameCriteria
{
public:
  enum class Kind : uint8_t {
    Is,
    StartsWith,
    Any,
  };

  [[nodiscard]] static NameCriteria is(std::string name);
  [[nodiscard]] static NameCriteria starts_with(std::string prefix);
  [[nodiscard]] static NameCriteria any();

  [[nodiscard]] bool matches(std::string_view name) const noexcept;

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string & text() const noexcept { return text_; }

private:
  NameCriteria(Kind kind, std::string text) : kind_(kind), text_(std::move(text)) {}

  Kind kind_;
  std::string text_;
};

// ============================================================================
// MethodMatcher
// ============================================================================

class MethodMatcher
{
public:
  /// Matcher accepting any number of parameters.
  MethodMatcher(TypeCriteria type, NameCriteria name);

  /// Restrict to methods taking exactly `count` parameters (of any type).
  MethodMatcher & with_parameter_count(size_t count);
  MethodMatcher & with_any_parameters();

  /**
   * Declaring type, simple name and arity all match.
   * A null symbol never matches.
   */
  [[nodiscard]] bool matches(const MethodSymbol * symbol) const;

  [[nodiscard]] const TypeCriteria & type_criteria() const noexcept { return type_; }
  [[nodiscard]] const NameCriteria & name_criteria() const noexcept { return name_; }
  [[nodiscard]] std::optional<size_t> parameter_count() const noexcept { return paramCount_; }

  /// Human-readable form, e.g. "subtype of org.assertj.core.api.AbstractAssert#*"
  [[nodiscard]] std::string to_string() const;

private:
  TypeCriteria type_;
  NameCriteria name_;
  std::optional<size_t> paramCount_;
};

// ============================================================================
// MatcherSet
// ============================================================================

/**
 * Ordered disjunction of matchers. Immutable after construction, so one
 * instance may be read concurrently by several analysis units.
 */
class MatcherSet
{
public:
  MatcherSet() = default;
  explicit MatcherSet(std::vector<MethodMatcher> matchers) : matchers_(std::move(matchers)) {}

  [[nodiscard]] bool any_match(const MethodSymbol * symbol) const;

  [[nodiscard]] bool empty() const noexcept { return matchers_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return matchers_.size(); }

  [[nodiscard]] auto begin() const { return matchers_.begin(); }
  [[nodiscard]] auto end() const { return matchers_.end(); }

private:
  std::vector<MethodMatcher> matchers_;
};

}  // namespace assert_lint
