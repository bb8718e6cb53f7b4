// flowsema/sema/symbol.hpp - Resolved symbols and their flags
//
// Symbols are produced by name resolution (outside this pass) and are only
// queried here, for visibility, deprecation and listener checks.
//
#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>

namespace flowsema
{

/// Bit flags carried by a resolved symbol.
enum class SymbolFlag : uint32_t {
  None = 0,
  Public = 1U << 0U,
  Native = 1U << 1U,
  Deprecated = 1U << 2U,
  Listener = 1U << 3U,
  Endpoint = 1U << 4U,
  Remote = 1U << 5U,
  Client = 1U << 6U,
  Worker = 1U << 7U,
  Lambda = 1U << 8U,
  Constant = 1U << 9U,
};

[[nodiscard]] constexpr uint32_t operator|(SymbolFlag a, SymbolFlag b) noexcept
{
  return static_cast<uint32_t>(a) | static_cast<uint32_t>(b);
}

[[nodiscard]] constexpr uint32_t operator|(uint32_t a, SymbolFlag b) noexcept
{
  return a | static_cast<uint32_t>(b);
}

enum class SymbolKind : uint8_t {
  Variable,
  Function,
  Type,
  Worker,
  Package,
};

struct Symbol
{
  std::string_view name;
  SymbolKind kind = SymbolKind::Variable;
  /// Owning package ("" for the builtin namespace)
  std::string_view package;
  uint32_t flags = 0;

  [[nodiscard]] bool has(SymbolFlag f) const noexcept
  {
    return (flags & static_cast<uint32_t>(f)) != 0;
  }
  [[nodiscard]] bool is_public() const noexcept { return has(SymbolFlag::Public); }
  [[nodiscard]] bool is_native() const noexcept { return has(SymbolFlag::Native); }
  [[nodiscard]] bool is_deprecated() const noexcept { return has(SymbolFlag::Deprecated); }
};

/**
 * Owns the symbols of one analysis run. Addresses are stable.
 */
class SymbolTable
{
public:
  /// Create a symbol; `name` and `package` are copied into the table.
  Symbol * create(std::string_view name, SymbolKind kind, std::string_view package, uint32_t flags)
  {
    names_.emplace_back(name);
    const std::string_view stored_name = names_.back();
    names_.emplace_back(package);
    const std::string_view stored_package = names_.back();
    symbols_.push_back(Symbol{stored_name, kind, stored_package, flags});
    return &symbols_.back();
  }

  [[nodiscard]] size_t size() const noexcept { return symbols_.size(); }

private:
  std::deque<std::string> names_;
  std::deque<Symbol> symbols_;
};

[[nodiscard]] constexpr std::string_view to_string(SymbolFlag flag) noexcept
{
  switch (flag) {
    case SymbolFlag::None:
      return "none";
    case SymbolFlag::Public:
      return "public";
    case SymbolFlag::Native:
      return "native";
    case SymbolFlag::Deprecated:
      return "deprecated";
    case SymbolFlag::Listener:
      return "listener";
    case SymbolFlag::Endpoint:
      return "endpoint";
    case SymbolFlag::Remote:
      return "remote";
    case SymbolFlag::Client:
      return "client";
    case SymbolFlag::Worker:
      return "worker";
    case SymbolFlag::Lambda:
      return "lambda";
    case SymbolFlag::Constant:
      return "constant";
  }
  return "";
}

}  // namespace flowsema
