// assert_lint/sema/matching/method_matcher.cpp - Criteria and matcher implementation
#include "assert_lint/sema/matching/method_matcher.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace assert_lint
{

// ============================================================================
// TypeCriteria
// ============================================================================

TypeCriteria TypeCriteria::is(std::string qualified_name)
{
  return {Kind::Is, std::move(qualified_name)};
}

TypeCriteria TypeCriteria::subtype_of(std::string qualified_name)
{
  return {Kind::SubtypeOf, std::move(qualified_name)};
}

TypeCriteria TypeCriteria::any_type() { return {Kind::Any, {}}; }

bool TypeCriteria::matches(const TypeSymbol * type) const
{
  switch (kind_) {
    case Kind::Any:
      return true;
    case Kind::Is:
      return type != nullptr && type->is(name_);
    case Kind::SubtypeOf:
      return type != nullptr && type->is_subtype_of(name_);
  }
  return false;
}

// ============================================================================
// NameCriteria
// ============================================================================

NameCriteria NameCriteria::is(std::string name) { return {Kind::Is, std::move(name)}; }

NameCriteria NameCriteria::starts_with(std::string prefix)
{
  return {Kind::StartsWith, std::move(prefix)};
}

NameCriteria NameCriteria::any() { return {Kind::Any, {}}; }

bool NameCriteria::matches(std::string_view name) const noexcept
{
  switch (kind_) {
    case Kind::Any:
      return true;
    case Kind::Is:
      return name == text_;
    case Kind::StartsWith:
      return name.substr(0, text_.size()) == text_;
  }
  return false;
}

// ============================================================================
// MethodMatcher
// ============================================================================

MethodMatcher::MethodMatcher(TypeCriteria type, NameCriteria name)
: type_(std::move(type)), name_(std::move(name))
{
}

MethodMatcher & MethodMatcher::with_parameter_count(size_t count)
{
  paramCount_ = count;
  return *this;
}

MethodMatcher & MethodMatcher::with_any_parameters()
{
  paramCount_.reset();
  return *this;
}

bool MethodMatcher::matches(const MethodSymbol * symbol) const
{
  if (symbol == nullptr) {
    return false;
  }
  if (!name_.matches(symbol->name) || !type_.matches(symbol->owner)) {
    return false;
  }
  if (paramCount_) {
    return symbol->paramCount && *symbol->paramCount == *paramCount_;
  }
  return true;
}

std::string MethodMatcher::to_string() const
{
  std::string type;
  switch (type_.kind()) {
    case TypeCriteria::Kind::Is:
      type = type_.name();
      break;
    case TypeCriteria::Kind::SubtypeOf:
      type = "subtype of " + type_.name();
      break;
    case TypeCriteria::Kind::Any:
      type = "*";
      break;
  }

  std::string name;
  switch (name_.kind()) {
    case NameCriteria::Kind::Is:
      name = name_.text();
      break;
    case NameCriteria::Kind::StartsWith:
      name = name_.text() + "*";
      break;
    case NameCriteria::Kind::Any:
      name = "*";
      break;
  }

  if (paramCount_) {
    return fmt::format("{}#{}/{}", type, name, *paramCount_);
  }
  return fmt::format("{}#{}", type, name);
}

// ============================================================================
// MatcherSet
// ============================================================================

bool MatcherSet::any_match(const MethodSymbol * symbol) const
{
  if (symbol == nullptr) {
    return false;
  }
  return std::any_of(matchers_.begin(), matchers_.end(), [symbol](const MethodMatcher & m) {
    return m.matches(symbol);
  });
}

}  // namespace assert_lint
