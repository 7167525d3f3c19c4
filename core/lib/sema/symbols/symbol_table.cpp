// assert_lint/sema/symbols/symbol_table.cpp - Symbol and SymbolTable implementation
#include "assert_lint/sema/symbols/symbol_table.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>
#include <vector>

namespace assert_lint
{

// ============================================================================
// TypeSymbol
// ============================================================================

bool TypeSymbol::is_subtype_of(std::string_view qualified_name) const
{
  std::vector<const TypeSymbol *> worklist{this};
  std::unordered_set<const TypeSymbol *> visited;

  while (!worklist.empty()) {
    const TypeSymbol * current = worklist.back();
    worklist.pop_back();
    if (!current || !visited.insert(current).second) {
      continue;
    }
    if (current->is(qualified_name)) {
      return true;
    }
    worklist.insert(worklist.end(), current->supertypes.begin(), current->supertypes.end());
  }
  return false;
}

// ============================================================================
// MethodSymbol
// ============================================================================

bool MethodSymbol::is_annotated_with(std::string_view annotation_type) const noexcept
{
  return values_for_annotation(annotation_type) != nullptr;
}

const std::vector<AnnotationValue> * MethodSymbol::values_for_annotation(
  std::string_view annotation_type) const noexcept
{
  const auto it = std::find_if(
    annotations.begin(), annotations.end(),
    [annotation_type](const Annotation & a) { return a.type == annotation_type; });
  return it == annotations.end() ? nullptr : &it->values;
}

// ============================================================================
// SymbolTable
// ============================================================================

TypeSymbol & SymbolTable::get_or_create_type(std::string_view qualified_name)
{
  if (auto it = typesByName_.find(qualified_name); it != typesByName_.end()) {
    return *it->second;
  }

  TypeSymbol & type = types_.emplace_back();
  type.name = std::string(qualified_name);
  typesByName_.emplace(type.name, &type);
  return type;
}

const TypeSymbol * SymbolTable::find_type(std::string_view qualified_name) const
{
  auto it = typesByName_.find(qualified_name);
  return it == typesByName_.end() ? nullptr : it->second;
}

MethodSymbol * SymbolTable::define_method(std::string_view id, MethodSymbol symbol)
{
  if (methodsById_.find(id) != methodsById_.end()) {
    return nullptr;
  }

  MethodSymbol & stored = methods_.emplace_back(std::move(symbol));
  stored.id = std::string(id);
  methodsById_.emplace(stored.id, &stored);
  return &stored;
}

MethodSymbol * SymbolTable::find_method(std::string_view id)
{
  auto it = methodsById_.find(id);
  return it == methodsById_.end() ? nullptr : it->second;
}

const MethodSymbol * SymbolTable::find_method(std::string_view id) const
{
  auto it = methodsById_.find(id);
  return it == methodsById_.end() ? nullptr : it->second;
}

}  // namespace assert_lint
