// assert_lint/sema/matching/assertion_library.cpp - Built-in assertion matcher table
#include "assert_lint/sema/matching/assertion_library.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace assert_lint
{

namespace
{

struct LibraryEntry
{
  TypeCriteria::Kind typeKind;
  std::string_view type;
  NameCriteria::Kind nameKind;
  std::string_view name;
  std::optional<size_t> paramCount;
};

constexpr std::string_view k_rest_assured_response =
  "io.restassured.response.ValidatableResponseOptions";

using TK = TypeCriteria::Kind;
using NK = NameCriteria::Kind;

// clang-format off
constexpr std::array<LibraryEntry, 12> k_library = {{
  // FEST 1.x / 2.x
  {TK::SubtypeOf, "org.fest.assertions.GenericAssert",             NK::Any,        "",          std::nullopt},
  {TK::SubtypeOf, "org.fest.assertions.api.AbstractAssert",        NK::Any,        "",          std::nullopt},
  // REST-assured 2.x / 3.x
  {TK::Is,        k_rest_assured_response,                         NK::Is,         "body",      std::nullopt},
  {TK::Is,        k_rest_assured_response,                         NK::Is,         "time",      std::nullopt},
  {TK::Is,        k_rest_assured_response,                         NK::StartsWith, "content",   std::nullopt},
  {TK::Is,        k_rest_assured_response,                         NK::StartsWith, "status",    std::nullopt},
  {TK::Is,        k_rest_assured_response,                         NK::StartsWith, "header",    std::nullopt},
  {TK::Is,        k_rest_assured_response,                         NK::StartsWith, "cookie",    std::nullopt},
  {TK::Is,        k_rest_assured_response,                         NK::StartsWith, "spec",      std::nullopt},
  // AssertJ
  {TK::SubtypeOf, "org.assertj.core.api.AbstractAssert",           NK::Any,        "",          std::nullopt},
  // Spring MockMvc
  {TK::Is,        "org.springframework.test.web.servlet.ResultActions", NK::Is,    "andExpect", size_t{1}},
  // JMockit
  {TK::Is,        "mockit.Verifications",                          NK::Is,         "<init>",    std::nullopt},
}};
// clang-format on

TypeCriteria make_type_criteria(const LibraryEntry & e)
{
  switch (e.typeKind) {
    case TK::Is:
      return TypeCriteria::is(std::string(e.type));
    case TK::SubtypeOf:
      return TypeCriteria::subtype_of(std::string(e.type));
    case TK::Any:
      break;
  }
  return TypeCriteria::any_type();
}

NameCriteria make_name_criteria(const LibraryEntry & e)
{
  switch (e.nameKind) {
    case NK::Is:
      return NameCriteria::is(std::string(e.name));
    case NK::StartsWith:
      return NameCriteria::starts_with(std::string(e.name));
    case NK::Any:
      break;
  }
  return NameCriteria::any();
}

MatcherSet build_library()
{
  std::vector<MethodMatcher> matchers;
  matchers.reserve(k_library.size());
  for (const auto & entry : k_library) {
    MethodMatcher m(make_type_criteria(entry), make_name_criteria(entry));
    if (entry.paramCount) {
      m.with_parameter_count(*entry.paramCount);
    }
    matchers.push_back(std::move(m));
  }
  return MatcherSet(std::move(matchers));
}

}  // namespace

const MatcherSet & builtin_assertion_matchers()
{
  static const MatcherSet k_matchers = build_library();
  return k_matchers;
}

}  // namespace assert_lint
