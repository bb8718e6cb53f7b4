// flowsema/sema/types/literal_value.hpp - Literal value carried by literal
// expressions and finite types
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace flowsema
{

enum class LiteralKind : uint8_t {
  Int,
  Float,
  Decimal,
  Bool,
  String,
  Nil,
};

/**
 * A literal value as written in source.
 *
 * Trivially destructible so it can live inside arena-allocated AST nodes;
 * string payloads must be interned by the owning AstContext or TypeContext.
 */
class LiteralValue
{
public:
  static LiteralValue make_int(int64_t v)
  {
    LiteralValue out(LiteralKind::Int);
    out.int_ = v;
    return out;
  }

  static LiteralValue make_float(double v, bool decimal = false)
  {
    LiteralValue out(decimal ? LiteralKind::Decimal : LiteralKind::Float);
    out.float_ = v;
    return out;
  }

  static LiteralValue make_bool(bool v)
  {
    LiteralValue out(LiteralKind::Bool);
    out.bool_ = v;
    return out;
  }

  static LiteralValue make_string(std::string_view v)
  {
    LiteralValue out(LiteralKind::String);
    out.string_ = v;
    return out;
  }

  static LiteralValue make_nil() { return LiteralValue(LiteralKind::Nil); }

  LiteralValue() = default;

  [[nodiscard]] LiteralKind kind() const noexcept { return kind_; }
  [[nodiscard]] int64_t as_int() const noexcept { return int_; }
  [[nodiscard]] double as_float() const noexcept { return float_; }
  [[nodiscard]] bool as_bool() const noexcept { return bool_; }
  [[nodiscard]] std::string_view as_string() const noexcept { return string_; }

  /// Same kind and same value. Int and float are never equal to each other.
  [[nodiscard]] bool operator==(const LiteralValue & other) const noexcept
  {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
      case LiteralKind::Int:
        return int_ == other.int_;
      case LiteralKind::Float:
      case LiteralKind::Decimal:
        return float_ == other.float_;
      case LiteralKind::Bool:
        return bool_ == other.bool_;
      case LiteralKind::String:
        return string_ == other.string_;
      case LiteralKind::Nil:
        return true;
    }
    return false;
  }
  [[nodiscard]] bool operator!=(const LiteralValue & other) const noexcept
  {
    return !(*this == other);
  }

  /// Source-like rendering: 5, 1.5, true, "x", ()
  [[nodiscard]] std::string to_source() const;

private:
  explicit LiteralValue(LiteralKind k) : kind_(k) {}

  LiteralKind kind_ = LiteralKind::Nil;
  int64_t int_ = 0;
  double float_ = 0.0;
  bool bool_ = false;
  std::string_view string_;
};

}  // namespace flowsema
