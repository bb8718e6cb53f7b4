// flowsema/basic/casting.hpp - isa/cast/dyn_cast over classof() hierarchies
//
// Works for any hierarchy whose classes expose `static bool classof(const Base *)`.
// The AST uses it with NodeKind, the type model does not need it.
//
#pragma once

#include <cassert>
#include <type_traits>

namespace flowsema
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

}  // namespace detail

/// True when `node` is non-null and its dynamic kind belongs to T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::HasClassof<T, From>::value, "T must provide classof()");
  return node != nullptr && T::classof(node);
}

/// Checked downcast; the caller guarantees the kind.
template <typename T, typename From>
[[nodiscard]] inline auto cast(From * node) noexcept
  -> std::conditional_t<std::is_const_v<From>, const T *, T *>
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<std::conditional_t<std::is_const_v<From>, const T *, T *>>(node);
}

/// Downcast returning nullptr when the kind does not match (null input allowed).
template <typename T, typename From>
[[nodiscard]] inline auto dyn_cast(From * node) noexcept
  -> std::conditional_t<std::is_const_v<From>, const T *, T *>
{
  using Result = std::conditional_t<std::is_const_v<From>, const T *, T *>;
  return isa<T>(node) ? static_cast<Result>(node) : nullptr;
}

}  // namespace flowsema
