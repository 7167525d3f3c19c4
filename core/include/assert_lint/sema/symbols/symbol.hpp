// assert_lint/sema/symbols/symbol.hpp - Resolved type and method symbols
//
// Symbols are produced by the front-end's resolution step and handed over
// together with the AST. They answer the questions the checks ask about a
// call target: which type declares it, what it overrides, where its body is,
// and which annotations it carries.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace assert_lint
{

class MethodDecl;

// ============================================================================
// Annotations
// ============================================================================

/// One `name = value` pair of an annotation usage.
struct AnnotationValue
{
  std::string name;
  std::string value;
};

/// An annotation usage on a declaration, e.g. @org.junit.Test(expected = X.class).
struct Annotation
{
  std::string type;  ///< Fully qualified annotation type
  std::vector<AnnotationValue> values;
};

// ============================================================================
// TypeSymbol
// ============================================================================

/**
 * A class or interface, identified by its fully qualified name.
 */
struct TypeSymbol
{
  std::string name;
  std::vector<const TypeSymbol *> supertypes;  ///< Direct supertypes only

  [[nodiscard]] bool is(std::string_view qualified_name) const noexcept
  {
    return name == qualified_name;
  }

  /**
   * Reflexive, transitive subtype test against a fully qualified name.
   * Terminates on cyclic supertype graphs.
   */
  [[nodiscard]] bool is_subtype_of(std::string_view qualified_name) const;
};

// ============================================================================
// MethodSymbol
// ============================================================================

/// Simple name the front-end gives constructors.
inline constexpr std::string_view k_constructor_name = "<init>";

/**
 * A method or constructor.
 */
struct MethodSymbol
{
  std::string id;                               ///< Front-end id, unique within a unit
  std::string name;
  const TypeSymbol * owner = nullptr;           ///< Declaring type, nullptr if unknown
  std::optional<size_t> paramCount;             ///< nullopt if unknown
  const MethodSymbol * overridden = nullptr;    ///< Next symbol up the override chain
  const MethodDecl * declaration = nullptr;     ///< nullptr when declared in another unit
  std::vector<Annotation> annotations;

  [[nodiscard]] bool is_constructor() const noexcept { return name == k_constructor_name; }

  [[nodiscard]] bool is_annotated_with(std::string_view annotation_type) const noexcept;

  /**
   * Values of an annotation carried directly by this symbol.
   *
   * @return nullptr if the annotation is absent; an empty vector if it is
   *         present without values
   */
  [[nodiscard]] const std::vector<AnnotationValue> * values_for_annotation(
    std::string_view annotation_type) const noexcept;
};

}  // namespace assert_lint
