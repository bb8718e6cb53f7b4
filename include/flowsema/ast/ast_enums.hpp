// flowsema/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, invokable kinds and operators used by the typed AST.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace flowsema
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
#define AST_NODE(Class, Kind, Snake) Kind,
#include "flowsema/ast/ast_nodes.def"
};

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE(Class, Kind, Snake) \
  case NodeKind::Kind:               \
    return #Snake;
#include "flowsema/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// Invokables
// ============================================================================

/// What kind of body a FunctionDecl carries.
enum class InvokableKind : uint8_t {
  Function,  ///< top-level function or object method
  Lambda,    ///< anonymous function expression
  Worker,    ///< named worker body
};

[[nodiscard]] constexpr std::string_view to_string(InvokableKind kind) noexcept
{
  switch (kind) {
    case InvokableKind::Function:
      return "function";
    case InvokableKind::Lambda:
      return "lambda";
    case InvokableKind::Worker:
      return "worker";
  }
  return "";
}

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Logical
  And,  ///< &&
  Or,   ///< ||
  // Bitwise
  BitAnd,  ///< &
  BitOr,   ///< |
  // Nil handling
  Elvis,  ///< ?:
};

enum class UnaryOp : uint8_t {
  Not,  ///< !
  Neg,  ///< -
};

enum class AssignOp : uint8_t {
  Assign,     ///< =
  AddAssign,  ///< +=
  SubAssign,  ///< -=
  MulAssign,  ///< *=
  DivAssign,  ///< /=
};

/// Target shape of a destructuring assignment.
enum class DestructureKind : uint8_t {
  Tuple,
  Record,
  Error,
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::Elvis:
      return "?:";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::AddAssign:
      return "+=";
    case AssignOp::SubAssign:
      return "-=";
    case AssignOp::MulAssign:
      return "*=";
    case AssignOp::DivAssign:
      return "/=";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(DestructureKind kind) noexcept
{
  switch (kind) {
    case DestructureKind::Tuple:
      return "tuple";
    case DestructureKind::Record:
      return "record";
    case DestructureKind::Error:
      return "error";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::Literal;
inline constexpr NodeKind k_last_expr_kind = NodeKind::WorkerFlush;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::Block;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::Forever;

inline constexpr NodeKind k_first_decl_kind = NodeKind::Function;
inline constexpr NodeKind k_last_decl_kind = NodeKind::TypeDefinition;

inline constexpr NodeKind k_first_binding_kind = NodeKind::VarBinding;
inline constexpr NodeKind k_last_binding_kind = NodeKind::RecordBinding;

inline constexpr NodeKind k_first_clause_kind = NodeKind::StaticClause;
inline constexpr NodeKind k_last_clause_kind = NodeKind::StructuredClause;

}  // namespace detail

/// Check if a NodeKind is an expression
[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

/// Check if a NodeKind is a statement
[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

/// Check if a NodeKind is a declaration
[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

/// Check if a NodeKind is a binding pattern of a structured match clause
[[nodiscard]] constexpr bool is_binding_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_binding_kind && kind <= detail::k_last_binding_kind;
}

/// Check if a NodeKind is a match clause
[[nodiscard]] constexpr bool is_clause_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_clause_kind && kind <= detail::k_last_clause_kind;
}

}  // namespace flowsema
