// assert_lint/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Used by `assert_lint dump` to show what the loader built from a unit,
// including which symbol every call site resolved to.
//
#pragma once

#include <nlohmann/json.hpp>

#include "assert_lint/ast/ast.hpp"

namespace assert_lint
{

/**
 * Serialize an AST node (any kind) and its children.
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a whole compilation unit.
 */
[[nodiscard]] nlohmann::json to_json(const CompilationUnit * unit);

}  // namespace assert_lint
