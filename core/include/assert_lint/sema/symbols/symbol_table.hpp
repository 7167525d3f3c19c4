// assert_lint/sema/symbols/symbol_table.hpp - Symbol storage for one analysis unit
#pragma once

#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

#include "assert_lint/sema/symbols/symbol.hpp"

namespace assert_lint
{

/**
 * Owns the type and method symbols of one analysis unit.
 *
 * Symbols have stable addresses for the lifetime of the table, so AST nodes
 * and other symbols may point at them.
 */
class SymbolTable
{
public:
  SymbolTable() = default;

  SymbolTable(const SymbolTable &) = delete;
  SymbolTable & operator=(const SymbolTable &) = delete;
  SymbolTable(SymbolTable &&) = default;
  SymbolTable & operator=(SymbolTable &&) = default;

  // ===========================================================================
  // Types
  // ===========================================================================

  /// Return the type with this name, creating it (without supertypes) if needed.
  TypeSymbol & get_or_create_type(std::string_view qualified_name);

  [[nodiscard]] const TypeSymbol * find_type(std::string_view qualified_name) const;

  [[nodiscard]] size_t type_count() const noexcept { return types_.size(); }

  // ===========================================================================
  // Methods
  // ===========================================================================

  /**
   * Register a method symbol under a front-end id (e.g. "com.foo.Bar#baz(int)").
   *
   * @return The stored symbol, or nullptr if the id is already taken
   */
  MethodSymbol * define_method(std::string_view id, MethodSymbol symbol);

  [[nodiscard]] MethodSymbol * find_method(std::string_view id);
  [[nodiscard]] const MethodSymbol * find_method(std::string_view id) const;

  [[nodiscard]] size_t method_count() const noexcept { return methods_.size(); }

private:
  std::deque<TypeSymbol> types_;
  std::deque<MethodSymbol> methods_;
  // Keys view strings owned by the stored symbols
  std::unordered_map<std::string_view, TypeSymbol *> typesByName_;
  std::unordered_map<std::string_view, MethodSymbol *> methodsById_;
};

}  // namespace assert_lint
