// flowsema/sema/types/type.hpp - Semantic type representation
//
// Resolved types as produced by the type checker. Structural types are
// interned by TypeContext; named record/object/error/finite types are
// nominal and created once per declaration.
//
#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

#include "flowsema/sema/types/literal_value.hpp"

namespace flowsema
{

struct Symbol;

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  // Simple value types
  Nil,
  Boolean,
  Int,
  Byte,
  Float,
  Decimal,
  String,

  // Top-like types
  Any,
  AnyData,
  Json,

  // Error values of the analysed language
  Error,

  // Structural types
  Union,
  Tuple,
  Array,
  Map,
  Record,
  Object,
  Future,
  Finite,  ///< set of literal values, e.g. "on"|"off"
  Typedesc,
  Stream,

  /// Type of the `_` wildcard in a pattern: matches without binding
  None,

  /// Error recovery placeholder: already reported upstream, checks skip it
  SemanticError,
};

struct Type;

/// Field of a record or object type.
struct TypeField
{
  std::string_view name;
  const Type * type = nullptr;
  bool is_public = false;
};

// ============================================================================
// Type
// ============================================================================

/**
 * Semantic type.
 *
 * Which fields are meaningful depends on `kind`:
 * - Union / Tuple: `members`
 * - Array: `element`, `size` (-1 for an open array)
 * - Map / Future / Typedesc / Stream: `element` is the constraint
 * - Record: `fields`, `sealed`, `element` is the rest-field type (null when sealed)
 * - Object: `fields`, `remote_methods`, `client`
 * - Finite: `values`
 * - Record / Object / Error / Finite: `name` and `symbol` when declared by name
 */
struct Type
{
  TypeKind kind = TypeKind::SemanticError;

  std::string_view name;
  const Symbol * symbol = nullptr;

  std::vector<const Type *> members;
  std::vector<TypeField> fields;
  std::vector<std::string_view> remote_methods;
  std::vector<LiteralValue> values;

  const Type * element = nullptr;
  int64_t size = -1;
  bool sealed = false;
  bool client = false;

  /// Future created by a worker declaration (the worker's handle)
  bool worker_derivative = false;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_semantic_error() const noexcept { return kind == TypeKind::SemanticError; }
  [[nodiscard]] bool is_nil() const noexcept { return kind == TypeKind::Nil; }
  [[nodiscard]] bool is_error() const noexcept { return kind == TypeKind::Error; }
  [[nodiscard]] bool is_union() const noexcept { return kind == TypeKind::Union; }
  [[nodiscard]] bool is_sealed_array() const noexcept
  {
    return kind == TypeKind::Array && size >= 0;
  }

  [[nodiscard]] const TypeField * find_field(std::string_view field_name) const noexcept
  {
    for (const auto & f : fields) {
      if (f.name == field_name) return &f;
    }
    return nullptr;
  }
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Owns every type of one analysis run.
 *
 * Simple types are singletons. Structural types (union, tuple, array, map,
 * future, typedesc, stream) are interned by structure, so pointer equality
 * holds for structurally equal instances created through this context.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Built-in Types (Singletons)
  // ===========================================================================

  [[nodiscard]] const Type * nil_type() const noexcept { return &nil_; }
  [[nodiscard]] const Type * boolean_type() const noexcept { return &boolean_; }
  [[nodiscard]] const Type * int_type() const noexcept { return &int_; }
  [[nodiscard]] const Type * byte_type() const noexcept { return &byte_; }
  [[nodiscard]] const Type * float_type() const noexcept { return &float_; }
  [[nodiscard]] const Type * decimal_type() const noexcept { return &decimal_; }
  [[nodiscard]] const Type * string_type() const noexcept { return &string_; }
  [[nodiscard]] const Type * any_type() const noexcept { return &any_; }
  [[nodiscard]] const Type * anydata_type() const noexcept { return &anydata_; }
  [[nodiscard]] const Type * json_type() const noexcept { return &json_; }
  [[nodiscard]] const Type * error_type() const noexcept { return &error_; }
  [[nodiscard]] const Type * none_type() const noexcept { return &none_; }
  [[nodiscard]] const Type * semantic_error_type() const noexcept { return &semantic_error_; }

  /// Look up a built-in type by its source name ("int", "string", "()", ...).
  [[nodiscard]] const Type * lookup_builtin(std::string_view name) const noexcept;

  // ===========================================================================
  // Structural Types (Interned)
  // ===========================================================================

  /**
   * Union of `members`, flattened and de-duplicated in first-seen order.
   * A single remaining member is returned as is; an empty list yields nil.
   */
  const Type * get_union_type(const std::vector<const Type *> & members);

  const Type * get_tuple_type(const std::vector<const Type *> & members);

  /// Array type; `size` < 0 means open.
  const Type * get_array_type(const Type * element, int64_t size = -1);

  const Type * get_map_type(const Type * constraint);

  const Type * get_future_type(const Type * constraint, bool worker_derivative = false);

  const Type * get_typedesc_type(const Type * constraint);

  const Type * get_stream_type(const Type * constraint);

  // ===========================================================================
  // Nominal Types (one per declaration)
  // ===========================================================================

  /// Record type. `rest` is ignored when `sealed` is true.
  Type * create_record_type(
    std::string_view name, std::vector<TypeField> fields, bool sealed, const Type * rest,
    const Symbol * symbol = nullptr);

  Type * create_object_type(
    std::string_view name, std::vector<TypeField> fields, const Symbol * symbol = nullptr);

  /// Named error type, distinct from the generic `error`.
  Type * create_error_type(std::string_view name, const Symbol * symbol = nullptr);

  Type * create_finite_type(
    std::string_view name, std::vector<LiteralValue> values, const Symbol * symbol = nullptr);

  /// Copy `text` into storage owned by this context.
  std::string_view intern(std::string_view text);

private:
  Type nil_, boolean_, int_, byte_, float_, decimal_, string_;
  Type any_, anydata_, json_, error_, none_, semantic_error_;

  // Pointers into these containers are handed out: they must keep
  // stable element addresses.
  std::deque<Type> composite_types_;
  std::deque<std::string> strings_;
};

}  // namespace flowsema
