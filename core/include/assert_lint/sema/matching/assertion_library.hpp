// assert_lint/sema/matching/assertion_library.hpp - Known assertion entry points
//
// Call targets recognized as assertions regardless of their name: fluent
// assertion chains (FEST, AssertJ), REST-assured response validation,
// Spring MockMvc expectations and JMockit verification blocks.
//
#pragma once

#include "assert_lint/sema/matching/method_matcher.hpp"

namespace assert_lint
{

/**
 * The built-in matcher set.
 *
 * Built once, on first use, and immutable afterwards; safe to share between
 * threads.
 */
[[nodiscard]] const MatcherSet & builtin_assertion_matchers();

}  // namespace assert_lint
