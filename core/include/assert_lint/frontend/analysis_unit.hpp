// assert_lint/frontend/analysis_unit.hpp - Everything known about one source file
//
// An analysis unit bundles the AST of one compilation unit with the symbols
// the front-end resolved for it. Units are independent of each other and may
// be analyzed on different threads.
//
#pragma once

#include <memory>

#include "assert_lint/ast/ast.hpp"
#include "assert_lint/ast/ast_context.hpp"
#include "assert_lint/basic/source_manager.hpp"
#include "assert_lint/sema/symbols/symbol_table.hpp"

namespace assert_lint
{

struct AnalysisUnit
{
  SourceFile source;
  std::unique_ptr<AstContext> ast;
  SymbolTable symbols;
  CompilationUnit * root = nullptr;  ///< Owned by `ast`
};

}  // namespace assert_lint
