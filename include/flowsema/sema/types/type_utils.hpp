// flowsema/sema/types/type_utils.hpp - Type compatibility oracle and helpers
//
// The checks here answer the questions the analyzer delegates to the type
// system: can a value of one type be stored where another is expected, and
// do two type expressions denote the same type.
//
#pragma once

#include <string>
#include <vector>

#include "flowsema/sema/types/literal_value.hpp"
#include "flowsema/sema/types/type.hpp"

namespace flowsema
{

// ============================================================================
// Type Compatibility
// ============================================================================

/**
 * Check if a value of type `source` can be assigned to `target`.
 *
 * - Identical types and the error sentinel on either side are compatible
 * - A union source needs every member assignable; a union target needs one
 * - `any` accepts everything except error values
 * - `anydata` and `json` accept their pure-data subsets
 * - byte widens to int; finite types go to the base type of their values
 * - Tuples, arrays, maps and records compare structurally
 *
 * @param target The type being assigned to
 * @param source The type being assigned from
 */
[[nodiscard]] bool is_assignable(const Type * target, const Type * source);

/**
 * Check if two types denote the same type.
 *
 * Unions compare as sets; records, objects and named errors are nominal.
 */
[[nodiscard]] bool is_same_type(const Type * a, const Type * b);

/// Can a value of `target` hold the literal `value`?
[[nodiscard]] bool accepts_literal(const Type * target, const LiteralValue & value);

// ============================================================================
// Type Classification
// ============================================================================

/// Pure data: value types, json, and containers/records of anydata.
[[nodiscard]] bool is_anydata(const Type * type);

/// Types storable in a json value.
[[nodiscard]] bool is_json_compatible(const Type * type);

/// True for the error sentinel (or a missing type).
[[nodiscard]] inline bool is_semantic_error(const Type * type) noexcept
{
  return type == nullptr || type->kind == TypeKind::SemanticError;
}

/// Union members, or the type itself as a one-element list.
[[nodiscard]] std::vector<const Type *> member_types(const Type * type);

/// Does the type have an error member (error itself, or a union containing one)?
[[nodiscard]] bool has_error_member(const Type * type);

/// Does every member of the type denote an error value?
[[nodiscard]] bool is_error_only(const Type * type);

/// Do the two types share at least one possible value?
[[nodiscard]] bool types_intersect(const Type * a, const Type * b);

/// Type of a literal as written ("5" is int, "()" is nil).
[[nodiscard]] const Type * literal_type(const TypeContext & types, const LiteralValue & value);

// ============================================================================
// Type Display
// ============================================================================

/// Source-like rendering: "int", "int|string", "[int,string]", "map<json>".
[[nodiscard]] std::string to_string(const Type * type);

}  // namespace flowsema
