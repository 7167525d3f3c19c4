// tests/unit/sema/test_missing_assertion.cpp - Unit tests for the missing-assertion check

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "assert_lint/sema/analysis/missing_assertion_checker.hpp"
#include "assert_lint/test_support/unit_helpers.hpp"

using namespace assert_lint;

namespace
{

size_t count_findings(const DiagnosticBag & diags)
{
  return diags.count_code(diag_codes::k_missing_assertion);
}

}  // namespace

// ============================================================================
// Basic detection
// ============================================================================

TEST(MissingAssertion, EmptyTestIsFlaggedAtItsName)
{
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "FooTest#emptyTest", "owner": "com.example.FooTest", "name": "emptyTest",
       "params": 0, "annotations": [{"type": "org.junit.Test"}]}
    ],
    "classes": [{"name": "FooTest", "type": "com.example.FooTest", "members": [
      {"kind": "method", "name": "emptyTest", "symbol": "FooTest#emptyTest",
       "range": [24, 52], "name_range": [38, 47], "body": []}
    ]}]
  })json");

  ASSERT_EQ(r.findings, 1U);
  ASSERT_EQ(r.diags.size(), 1U);
  const Diagnostic & d = r.diags.all().front();
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, diag_codes::k_missing_assertion);
  EXPECT_EQ(d.message, "Add at least one assertion to this test case.");
  EXPECT_EQ(d.primary_range(), SourceRange(38, 47));
}

TEST(MissingAssertion, DirectAssertionSuppressesFinding)
{
  // assertThat(5).isLessThan(3);
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "isLessThan",
          "receiver": {"kind": "call", "name": "assertThat", "args": [{"kind": "literal", "value": 5}]},
          "args": [{"kind": "literal", "value": 3}]}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
  EXPECT_TRUE(r.diags.empty());
}

TEST(MissingAssertion, NonAssertionCallsDoNotCount)
{
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "var", "name": "list", "init": {"kind": "new", "type": "java.util.ArrayList"}},
        {"kind": "expr", "expr": {"kind": "call", "name": "add",
          "receiver": {"kind": "name", "name": "list"}, "args": [{"kind": "literal", "value": "x"}]}},
        {"kind": "expr", "expr": {"kind": "call", "name": "isAssertable"}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 1U);
}

TEST(MissingAssertion, ExpectedExceptionExemptsTest)
{
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#throws", "owner": "T", "name": "throws", "annotations": [
        {"type": "org.junit.Test", "values": {"expected": "java.lang.IllegalStateException"}}]}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "throws", "symbol": "T#throws", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "explode"}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
}

TEST(MissingAssertion, OtherAnnotationValuesDoNotExempt)
{
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#slow", "owner": "T", "name": "slow", "annotations": [
        {"type": "org.junit.Test", "values": {"timeout": 100}}]}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "slow", "symbol": "T#slow", "body": []}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 1U);
}

TEST(MissingAssertion, NonTestMethodsAreNeverFlagged)
{
  auto r = test_support::check(R"json({
    "methods": [{"id": "T#setUp", "owner": "T", "name": "setUp"}],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "setUp", "symbol": "T#setUp", "body": []},
      {"kind": "method", "name": "unresolved", "body": []}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
}

TEST(MissingAssertion, AbstractAndBodilessMethodsAreSkipped)
{
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#a", "owner": "T", "name": "a", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "T#b", "owner": "T", "name": "b", "annotations": [{"type": "org.junit.Test"}]}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "a", "symbol": "T#a", "abstract": true},
      {"kind": "method", "name": "b", "symbol": "T#b"}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
}

// ============================================================================
// Test recognition
// ============================================================================

TEST(MissingAssertion, AnnotationInheritedThroughOverride)
{
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "Base#run", "owner": "Base", "name": "run", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "T#run", "owner": "T", "name": "run", "overrides": "Base#run"}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "run", "symbol": "T#run", "body": []}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 1U);
}

TEST(MissingAssertion, LegacyTestCaseMethodsArePrefixed)
{
  auto r = test_support::check(R"json({
    "types": [{"name": "com.example.LegacyTest", "supertypes": ["junit.framework.TestCase"]}],
    "methods": [
      {"id": "L#testNothing", "owner": "com.example.LegacyTest", "name": "testNothing"},
      {"id": "L#helper", "owner": "com.example.LegacyTest", "name": "helper"}
    ],
    "classes": [{"name": "LegacyTest", "type": "com.example.LegacyTest", "members": [
      {"kind": "method", "name": "testNothing", "symbol": "L#testNothing", "body": []},
      {"kind": "method", "name": "helper", "symbol": "L#helper", "body": []}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 1U);
}

TEST(MissingAssertion, ConfiguredTestAnnotation)
{
  constexpr std::string_view k_unit = R"json({
    "methods": [
      {"id": "T#t", "owner": "T", "name": "t", "annotations": [{"type": "org.junit.jupiter.api.Test"}]}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "t", "symbol": "T#t", "body": []}
    ]}]
  })json";

  EXPECT_EQ(test_support::check(k_unit).findings, 0U);

  TestFrameworkConfig config;
  config.test_annotations.push_back("org.junit.jupiter.api.Test");
  EXPECT_EQ(test_support::check(k_unit, "", config).findings, 1U);
}

// ============================================================================
// Helper delegation
// ============================================================================

TEST(MissingAssertion, ResolvableHelperWithAssertion)
{
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "T#helper", "owner": "T", "name": "helper"}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "helper", "symbol": "T#helper"}}
      ]},
      {"kind": "method", "name": "helper", "symbol": "T#helper", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "assertEquals",
          "args": [{"kind": "literal", "value": 1}, {"kind": "literal", "value": 1}]}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
}

TEST(MissingAssertion, HelperDelegationIsTransitive)
{
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "T#outer", "owner": "T", "name": "outer"},
      {"id": "T#inner", "owner": "T", "name": "inner"}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "outer", "symbol": "T#outer"}}
      ]},
      {"kind": "method", "name": "outer", "symbol": "T#outer", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "prepare"}},
        {"kind": "expr", "expr": {"kind": "call", "name": "inner", "symbol": "T#inner"}}
      ]},
      {"kind": "method", "name": "inner", "symbol": "T#inner", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "assertTrue",
          "args": [{"kind": "name", "name": "ok"}]}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
}

TEST(MissingAssertion, HelperWithoutAssertionDoesNotCount)
{
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "T#helper", "owner": "T", "name": "helper"}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "helper", "symbol": "T#helper"}}
      ]},
      {"kind": "method", "name": "helper", "symbol": "T#helper", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "println"}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 1U);
}

TEST(MissingAssertion, UnresolvedHelperIsFlagged)
{
  // The helper is declared in another unit; its body is not available.
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "Util#helper", "owner": "com.example.Util", "name": "helper"}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "helper", "symbol": "Util#helper"}},
        {"kind": "expr", "expr": {"kind": "call", "name": "other", "symbol": "Nowhere#other"}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 1U);
}

TEST(MissingAssertion, RecursiveHelpersTerminate)
{
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "T#loop", "owner": "T", "name": "loop"}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "loop", "symbol": "T#loop"}}
      ]},
      {"kind": "method", "name": "loop", "symbol": "T#loop", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "loop", "symbol": "T#loop"}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 1U);
}

TEST(MissingAssertion, MutualRecursionStillFindsLaterAssertion)
{
  // a() { b(); assertX(); }  b() { a(); }
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "T#a", "owner": "T", "name": "a"},
      {"id": "T#b", "owner": "T", "name": "b"}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "a", "symbol": "T#a"}}
      ]},
      {"kind": "method", "name": "a", "symbol": "T#a", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "b", "symbol": "T#b"}},
        {"kind": "expr", "expr": {"kind": "call", "name": "assertX"}}
      ]},
      {"kind": "method", "name": "b", "symbol": "T#b", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "a", "symbol": "T#a"}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
}

TEST(MissingAssertion, MutualRecursionVerdictDoesNotDependOnDeclarationOrder)
{
  // a() { b(); assertX(); }  b() { a(); }, one test calling each helper.
  const std::string calls_a = R"json(
      {"kind": "method", "name": "callsA", "symbol": "T#callsA", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "a", "symbol": "T#a"}}
      ]})json";
  const std::string calls_b = R"json(
      {"kind": "method", "name": "callsB", "symbol": "T#callsB", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "b", "symbol": "T#b"}}
      ]})json";

  const auto unit_with = [](const std::string & first, const std::string & second) {
    return std::string(R"json({
    "methods": [
      {"id": "T#callsA", "owner": "T", "name": "callsA", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "T#callsB", "owner": "T", "name": "callsB", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "T#a", "owner": "T", "name": "a"},
      {"id": "T#b", "owner": "T", "name": "b"}
    ],
    "classes": [{"name": "T", "type": "T", "members": [)json") +
           first + "," + second + R"json(,
      {"kind": "method", "name": "a", "symbol": "T#a", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "b", "symbol": "T#b"}},
        {"kind": "expr", "expr": {"kind": "call", "name": "assertX"}}
      ]},
      {"kind": "method", "name": "b", "symbol": "T#b", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "a", "symbol": "T#a"}}
      ]}
    ]}]
  })json";
  };

  EXPECT_EQ(test_support::check(unit_with(calls_a, calls_b)).findings, 0U);
  EXPECT_EQ(test_support::check(unit_with(calls_b, calls_a)).findings, 0U);
}

// ============================================================================
// Call shapes
// ============================================================================

TEST(MissingAssertion, MethodReferenceCountsAsAssertionSite)
{
  // values.forEach(Assert::assertNotNull);
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "forEach",
          "receiver": {"kind": "name", "name": "values"},
          "args": [{"kind": "method_ref", "name": "assertNotNull",
                    "receiver": {"kind": "name", "name": "Assert"}}]}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
}

TEST(MissingAssertion, ConstructionOfVerificationBlock)
{
  // new Verifications() {{ mock.call(); }};
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "V#<init>", "owner": "mockit.Verifications", "name": "<init>", "params": 0}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "new", "type": "mockit.Verifications", "symbol": "V#<init>"}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
}

TEST(MissingAssertion, FluentAssertionChainByType)
{
  // assertThat(x).isEqualTo(3), with only isEqualTo resolved to an AssertJ type
  auto r = test_support::check(R"json({
    "types": [
      {"name": "org.assertj.core.api.AbstractIntegerAssert",
       "supertypes": ["org.assertj.core.api.AbstractComparableAssert"]},
      {"name": "org.assertj.core.api.AbstractComparableAssert",
       "supertypes": ["org.assertj.core.api.AbstractAssert"]}
    ],
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "A#isEqualTo", "owner": "org.assertj.core.api.AbstractIntegerAssert", "name": "isEqualTo", "params": 1}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "isEqualTo", "symbol": "A#isEqualTo",
          "receiver": {"kind": "name", "name": "integerAssert"},
          "args": [{"kind": "literal", "value": 3}]}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
}

TEST(MissingAssertion, MockMvcExpectationNeedsOneArgument)
{
  constexpr std::string_view k_template = R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "R#andExpect", "owner": "org.springframework.test.web.servlet.ResultActions",
       "name": "andExpect", "params": PARAMS}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "andExpect", "symbol": "R#andExpect"}}
      ]}
    ]}]
  })json";

  auto with_params = [&](std::string_view n) {
    std::string doc(k_template);
    doc.replace(doc.find("PARAMS"), 6, n);
    return doc;
  };

  EXPECT_EQ(test_support::check(with_params("1")).findings, 0U);
  EXPECT_EQ(test_support::check(with_params("2")).findings, 1U);

  // An arity the front-end did not export never satisfies an exact-arity matcher.
  constexpr std::string_view k_params = R"(, "params": PARAMS)";
  std::string without_params(k_template);
  without_params.erase(without_params.find(k_params), k_params.size());
  EXPECT_EQ(test_support::check(without_params).findings, 1U);
}

// ============================================================================
// Scope isolation
// ============================================================================

TEST(MissingAssertion, AssertionInAnonymousClassDoesNotLeakOutward)
{
  // @Test void test() { new Runnable() { public void run() { assertTrue(x); } }; }
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "T$1#run", "owner": "T$1", "name": "run"}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "name_range": [10, 14], "body": [
        {"kind": "expr", "expr": {"kind": "new", "type": "java.lang.Runnable", "body": [
          {"kind": "method", "name": "run", "symbol": "T$1#run", "body": [
            {"kind": "expr", "expr": {"kind": "call", "name": "assertTrue",
              "args": [{"kind": "name", "name": "x"}]}}
          ]}
        ]}}
      ]}
    ]}]
  })json");

  ASSERT_EQ(r.findings, 1U);
  EXPECT_EQ(r.diags.all().front().primary_range(), SourceRange(10, 14));
}

TEST(MissingAssertion, AssertionInLocalClassDoesNotLeakOutward)
{
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "Local#check", "owner": "T$Local", "name": "go"}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "class", "class": {"name": "Local", "type": "T$Local", "members": [
          {"kind": "method", "name": "go", "symbol": "Local#check", "body": [
            {"kind": "expr", "expr": {"kind": "call", "name": "assertTrue"}}
          ]}
        ]}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 1U);
}

TEST(MissingAssertion, NestedTestGetsItsOwnFrame)
{
  // The outer test asserts; the nested test inside its anonymous class does not.
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#outer", "owner": "T", "name": "outer", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "N#inner", "owner": "T$1", "name": "inner", "annotations": [{"type": "org.junit.Test"}]}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "outer", "symbol": "T#outer", "body": [
        {"kind": "expr", "expr": {"kind": "new", "type": "Object", "body": [
          {"kind": "method", "name": "inner", "symbol": "N#inner", "name_range": [100, 105], "body": []}
        ]}},
        {"kind": "expr", "expr": {"kind": "call", "name": "assertNotNull"}}
      ]}
    ]}]
  })json");

  ASSERT_EQ(r.findings, 1U);
  EXPECT_EQ(r.diags.all().front().primary_range(), SourceRange(100, 105));
}

TEST(MissingAssertion, AssertionInsideLambdaCountsForEnclosingTest)
{
  // assertThrows-like helpers take lambdas; lambdas do not open a frame.
  auto r = test_support::check(R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "submit", "args": [
          {"kind": "lambda", "body": [
            {"kind": "expr", "expr": {"kind": "call", "name": "assertTrue"}}
          ]}
        ]}}
      ]}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
}

TEST(MissingAssertion, FieldInitializersOutsideMethodsAreIgnored)
{
  auto r = test_support::check(R"json({
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "field", "name": "rule", "init": {"kind": "call", "name": "assertSomething"}}
    ]}]
  })json");

  EXPECT_EQ(r.findings, 0U);
  EXPECT_TRUE(r.diags.empty());
}

// ============================================================================
// Custom assertion methods
// ============================================================================

TEST(MissingAssertion, CustomAssertionMethodByPrefix)
{
  constexpr std::string_view k_unit = R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "H#ensureValid", "owner": "com.example.Helper", "name": "ensureValid", "params": 1}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "ensureValid", "symbol": "H#ensureValid",
          "args": [{"kind": "name", "name": "order"}]}}
      ]}
    ]}]
  })json";

  EXPECT_EQ(test_support::check(k_unit).findings, 1U);
  EXPECT_EQ(test_support::check(k_unit, "com.example.Helper#ensure*").findings, 0U);
  EXPECT_EQ(test_support::check(k_unit, "com.example.Helper#ensure").findings, 1U);
  EXPECT_EQ(test_support::check(k_unit, "com.example.Other#ensure*").findings, 1U);
}

TEST(MissingAssertion, MalformedCustomEntryIsDroppedOthersApply)
{
  constexpr std::string_view k_unit = R"json({
    "methods": [
      {"id": "T#test", "owner": "T", "name": "test", "annotations": [{"type": "org.junit.Test"}]},
      {"id": "H#ensureValid", "owner": "com.example.Helper", "name": "ensureValid"}
    ],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "test", "symbol": "T#test", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "ensureValid", "symbol": "H#ensureValid"}}
      ]}
    ]}]
  })json";

  auto r = test_support::check(k_unit, "com.example.Helper, com.example.Helper#ensureValid");
  EXPECT_EQ(r.findings, 0U);
  EXPECT_EQ(r.diags.count_code(diag_codes::k_invalid_custom_assertion), 1U);
  EXPECT_EQ(count_findings(r.diags), 0U);
}

// ============================================================================
// Checker state
// ============================================================================

TEST(MissingAssertion, CheckerCanBeReusedAcrossUnits)
{
  auto flagged = test_support::load(R"json({
    "methods": [{"id": "T#t", "owner": "T", "name": "t", "annotations": [{"type": "org.junit.Test"}]}],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "t", "symbol": "T#t", "body": []}]}]
  })json");
  auto clean = test_support::load(R"json({
    "methods": [{"id": "T#t", "owner": "T", "name": "t", "annotations": [{"type": "org.junit.Test"}]}],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "t", "symbol": "T#t", "body": [
        {"kind": "expr", "expr": {"kind": "call", "name": "verifyAll"}}]}]}]
  })json");

  const UnitTestClassifier tests;
  const MatcherSet none;
  DiagnosticBag diags;
  MissingAssertionChecker checker(tests, none, none, &diags);

  EXPECT_FALSE(checker.check(*flagged.root));
  EXPECT_EQ(checker.finding_count(), 1U);
  EXPECT_TRUE(checker.check(*clean.root));
  EXPECT_EQ(checker.finding_count(), 0U);
  EXPECT_EQ(count_findings(diags), 1U);
}

TEST(MissingAssertion, NullSinkOnlyCounts)
{
  auto unit = test_support::load(R"json({
    "methods": [{"id": "T#t", "owner": "T", "name": "t", "annotations": [{"type": "org.junit.Test"}]}],
    "classes": [{"name": "T", "type": "T", "members": [
      {"kind": "method", "name": "t", "symbol": "T#t", "body": []}]}]
  })json");

  const UnitTestClassifier tests;
  const MatcherSet none;
  MissingAssertionChecker checker(tests, none, none);
  EXPECT_FALSE(checker.check(*unit.root));
  EXPECT_EQ(checker.finding_count(), 1U);
}
