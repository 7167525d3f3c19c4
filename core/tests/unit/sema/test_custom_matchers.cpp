// tests/unit/sema/test_custom_matchers.cpp - Custom assertion method configuration

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "assert_lint/sema/matching/custom_matchers.hpp"
#include "assert_lint/sema/symbols/symbol_table.hpp"

using namespace assert_lint;

namespace
{

MethodSymbol method_of(const TypeSymbol & owner, std::string name)
{
  MethodSymbol m;
  m.owner = &owner;
  m.name = std::move(name);
  return m;
}

}  // namespace

TEST(CustomMatchers, EmptyConfigurationYieldsNothing)
{
  for (const char * config : {"", "   ", "\t\n"}) {
    const auto result = compile_custom_matchers(config);
    EXPECT_TRUE(result.matchers.empty()) << "'" << config << "'";
    EXPECT_TRUE(result.diagnostics.empty()) << "'" << config << "'";
  }
}

TEST(CustomMatchers, ExactAndPrefixEntries)
{
  const auto result =
    compile_custom_matchers("com.example.Helper#checkSomething*, org.foo.Bar#verifyAll");
  ASSERT_TRUE(result.diagnostics.empty());
  ASSERT_EQ(result.matchers.size(), 2U);

  SymbolTable table;
  const TypeSymbol & helper = table.get_or_create_type("com.example.Helper");
  const TypeSymbol & bar = table.get_or_create_type("org.foo.Bar");

  const MethodSymbol prefixed = method_of(helper, "checkSomethingSpecial");
  const MethodSymbol exact = method_of(bar, "verifyAll");
  const MethodSymbol longer = method_of(bar, "verifyAllOf");
  const MethodSymbol other = method_of(bar, "checkSomething");

  EXPECT_TRUE(result.matchers.any_match(&prefixed));
  EXPECT_TRUE(result.matchers.any_match(&exact));
  EXPECT_FALSE(result.matchers.any_match(&longer));
  EXPECT_FALSE(result.matchers.any_match(&other));
}

TEST(CustomMatchers, TypeMustMatchExactly)
{
  const auto result = compile_custom_matchers("a.Base#check*");

  SymbolTable table;
  TypeSymbol & base = table.get_or_create_type("a.Base");
  TypeSymbol & derived = table.get_or_create_type("a.Derived");
  derived.supertypes.push_back(&base);

  const MethodSymbol inherited = method_of(derived, "checkIt");
  EXPECT_FALSE(result.matchers.any_match(&inherited));
}

TEST(CustomMatchers, StarAloneMatchesEveryMethodOfTheType)
{
  const auto result = compile_custom_matchers("a.Checks#*");
  ASSERT_EQ(result.matchers.size(), 1U);

  SymbolTable table;
  const TypeSymbol & checks = table.get_or_create_type("a.Checks");
  const MethodSymbol any = method_of(checks, "whatever");
  EXPECT_TRUE(result.matchers.any_match(&any));
}

TEST(CustomMatchers, MalformedEntriesAreDroppedWithAWarning)
{
  const auto result = compile_custom_matchers(
    "noHashHere, a.B#c#d, #method, a.B#, a.Valid#ok, ,a.B#*x*");

  // "a.B#*x*" is well-formed: prefix "*x".
  EXPECT_EQ(result.matchers.size(), 2U);
  EXPECT_EQ(result.diagnostics.size(), 5U);
  EXPECT_EQ(result.diagnostics.count_code(diag_codes::k_invalid_custom_assertion), 5U);

  for (const auto & d : result.diagnostics) {
    EXPECT_EQ(d.severity, Severity::Warning);
    EXPECT_TRUE(d.help_message.has_value());
  }
}

TEST(CustomMatchers, WarningNamesTheEntry)
{
  const auto result = compile_custom_matchers("org.foo.Bar#verifyAll, org.foo.Baz");
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(
    result.diagnostics.all().front().message,
    "Unable to create a corresponding matcher for custom assertion method, please check the "
    "format of the following symbol: 'org.foo.Baz'");
  EXPECT_EQ(result.matchers.size(), 1U);
}

TEST(CustomAssertionMethods, CompiledOnceAcrossThreads)
{
  const CustomAssertionMethods custom("a.B#check*, broken");

  std::vector<const MatcherSet *> seen(8, nullptr);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < seen.size(); ++i) {
    threads.emplace_back([&custom, &seen, i] { seen[i] = &custom.matchers(); });
  }
  for (auto & t : threads) {
    t.join();
  }

  for (const auto * s : seen) {
    EXPECT_EQ(s, &custom.matchers());
  }
  EXPECT_EQ(custom.matchers().size(), 1U);
  EXPECT_EQ(custom.diagnostics().size(), 1U);
  EXPECT_EQ(custom.config(), "a.B#check*, broken");
}
