// flowsema/sema/types/type.cpp - TypeContext and LiteralValue
#include "flowsema/sema/types/type.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace flowsema
{

std::string LiteralValue::to_source() const
{
  switch (kind_) {
    case LiteralKind::Int:
      return std::to_string(int_);
    case LiteralKind::Float:
      return fmt::format("{}", float_);
    case LiteralKind::Decimal:
      return fmt::format("{}d", float_);
    case LiteralKind::Bool:
      return bool_ ? "true" : "false";
    case LiteralKind::String:
      return fmt::format("\"{}\"", string_);
    case LiteralKind::Nil:
      return "()";
  }
  return "";
}

// ============================================================================
// TypeContext
// ============================================================================

TypeContext::TypeContext()
{
  nil_.kind = TypeKind::Nil;
  boolean_.kind = TypeKind::Boolean;
  int_.kind = TypeKind::Int;
  byte_.kind = TypeKind::Byte;
  float_.kind = TypeKind::Float;
  decimal_.kind = TypeKind::Decimal;
  string_.kind = TypeKind::String;
  any_.kind = TypeKind::Any;
  anydata_.kind = TypeKind::AnyData;
  json_.kind = TypeKind::Json;
  error_.kind = TypeKind::Error;
  none_.kind = TypeKind::None;
  semantic_error_.kind = TypeKind::SemanticError;
}

const Type * TypeContext::lookup_builtin(std::string_view name) const noexcept
{
  if (name == "()" || name == "nil") return &nil_;
  if (name == "boolean") return &boolean_;
  if (name == "int") return &int_;
  if (name == "byte") return &byte_;
  if (name == "float") return &float_;
  if (name == "decimal") return &decimal_;
  if (name == "string") return &string_;
  if (name == "any") return &any_;
  if (name == "anydata") return &anydata_;
  if (name == "json") return &json_;
  if (name == "error") return &error_;
  if (name == "_") return &none_;
  return nullptr;
}

const Type * TypeContext::get_union_type(const std::vector<const Type *> & members)
{
  std::vector<const Type *> flat;
  for (const Type * m : members) {
    if (m == nullptr) continue;
    const auto append = [&flat](const Type * t) {
      if (std::find(flat.begin(), flat.end(), t) == flat.end()) flat.push_back(t);
    };
    if (m->kind == TypeKind::Union) {
      std::for_each(m->members.begin(), m->members.end(), append);
    } else {
      append(m);
    }
  }

  if (flat.empty()) return &nil_;
  if (flat.size() == 1) return flat.front();

  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Union && t.members == flat) return &t;
  }
  Type & u = composite_types_.emplace_back();
  u.kind = TypeKind::Union;
  u.members = std::move(flat);
  return &u;
}

const Type * TypeContext::get_tuple_type(const std::vector<const Type *> & members)
{
  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Tuple && t.members == members) return &t;
  }
  Type & tuple = composite_types_.emplace_back();
  tuple.kind = TypeKind::Tuple;
  tuple.members = members;
  return &tuple;
}

const Type * TypeContext::get_array_type(const Type * element, int64_t size)
{
  if (size < 0) size = -1;
  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Array && t.element == element && t.size == size) return &t;
  }
  Type & arr = composite_types_.emplace_back();
  arr.kind = TypeKind::Array;
  arr.element = element;
  arr.size = size;
  return &arr;
}

namespace
{

const Type * find_constrained(
  const std::deque<Type> & types, TypeKind kind, const Type * constraint, bool worker = false)
{
  for (const auto & t : types) {
    if (t.kind == kind && t.element == constraint && t.worker_derivative == worker) return &t;
  }
  return nullptr;
}

}  // namespace

const Type * TypeContext::get_map_type(const Type * constraint)
{
  if (const Type * t = find_constrained(composite_types_, TypeKind::Map, constraint)) return t;
  Type & m = composite_types_.emplace_back();
  m.kind = TypeKind::Map;
  m.element = constraint;
  return &m;
}

const Type * TypeContext::get_future_type(const Type * constraint, bool worker_derivative)
{
  if (const Type * t =
        find_constrained(composite_types_, TypeKind::Future, constraint, worker_derivative)) {
    return t;
  }
  Type & f = composite_types_.emplace_back();
  f.kind = TypeKind::Future;
  f.element = constraint;
  f.worker_derivative = worker_derivative;
  return &f;
}

const Type * TypeContext::get_typedesc_type(const Type * constraint)
{
  if (const Type * t = find_constrained(composite_types_, TypeKind::Typedesc, constraint)) {
    return t;
  }
  Type & td = composite_types_.emplace_back();
  td.kind = TypeKind::Typedesc;
  td.element = constraint;
  return &td;
}

const Type * TypeContext::get_stream_type(const Type * constraint)
{
  if (const Type * t = find_constrained(composite_types_, TypeKind::Stream, constraint)) return t;
  Type & s = composite_types_.emplace_back();
  s.kind = TypeKind::Stream;
  s.element = constraint;
  return &s;
}

Type * TypeContext::create_record_type(
  std::string_view name, std::vector<TypeField> fields, bool sealed, const Type * rest,
  const Symbol * symbol)
{
  Type & r = composite_types_.emplace_back();
  r.kind = TypeKind::Record;
  r.name = intern(name);
  r.symbol = symbol;
  r.fields = std::move(fields);
  r.sealed = sealed;
  r.element = sealed ? nullptr : (rest != nullptr ? rest : &anydata_);
  return &r;
}

Type * TypeContext::create_object_type(
  std::string_view name, std::vector<TypeField> fields, const Symbol * symbol)
{
  Type & o = composite_types_.emplace_back();
  o.kind = TypeKind::Object;
  o.name = intern(name);
  o.symbol = symbol;
  o.fields = std::move(fields);
  return &o;
}

Type * TypeContext::create_error_type(std::string_view name, const Symbol * symbol)
{
  Type & e = composite_types_.emplace_back();
  e.kind = TypeKind::Error;
  e.name = intern(name);
  e.symbol = symbol;
  return &e;
}

Type * TypeContext::create_finite_type(
  std::string_view name, std::vector<LiteralValue> values, const Symbol * symbol)
{
  Type & f = composite_types_.emplace_back();
  f.kind = TypeKind::Finite;
  f.name = intern(name);
  f.symbol = symbol;
  for (auto & v : values) {
    if (v.kind() == LiteralKind::String) v = LiteralValue::make_string(intern(v.as_string()));
  }
  f.values = std::move(values);
  return &f;
}

std::string_view TypeContext::intern(std::string_view text)
{
  if (text.empty()) return {};
  for (const auto & s : strings_) {
    if (s == text) return s;
  }
  return strings_.emplace_back(text);
}

}  // namespace flowsema
