// flowsema/sema/types/type_utils.cpp - Type compatibility implementation
#include "flowsema/sema/types/type_utils.hpp"

#include <algorithm>

namespace flowsema
{

namespace
{

bool is_simple_kind(TypeKind k) noexcept { return k <= TypeKind::String; }

bool assignable_to_record(const Type * target, const Type * source)
{
  if (source->kind == TypeKind::Record) {
    for (const auto & tf : target->fields) {
      const TypeField * sf = source->find_field(tf.name);
      if (sf == nullptr || !is_assignable(tf.type, sf->type)) return false;
    }
    for (const auto & sf : source->fields) {
      if (target->find_field(sf.name) != nullptr) continue;
      if (target->sealed || !is_assignable(target->element, sf.type)) return false;
    }
    if (!source->sealed) {
      return !target->sealed && is_assignable(target->element, source->element);
    }
    return true;
  }
  if (source->kind == TypeKind::Map) {
    // An open map may lack required fields
    return false;
  }
  return false;
}

bool assignable_to_array(const Type * target, const Type * source)
{
  if (source->kind == TypeKind::Array) {
    if (target->size >= 0 && target->size != source->size) return false;
    return is_assignable(target->element, source->element);
  }
  if (source->kind == TypeKind::Tuple) {
    if (target->size >= 0 && static_cast<size_t>(target->size) != source->members.size()) {
      return false;
    }
    return std::all_of(source->members.begin(), source->members.end(), [&](const Type * m) {
      return is_assignable(target->element, m);
    });
  }
  return false;
}

bool assignable_to_map(const Type * target, const Type * source)
{
  if (source->kind == TypeKind::Map) {
    return is_assignable(target->element, source->element);
  }
  if (source->kind == TypeKind::Record) {
    const bool fields_ok =
      std::all_of(source->fields.begin(), source->fields.end(), [&](const TypeField & f) {
        return is_assignable(target->element, f.type);
      });
    return fields_ok && (source->sealed || is_assignable(target->element, source->element));
  }
  return false;
}

bool assignable_to_object(const Type * target, const Type * source)
{
  if (source->kind != TypeKind::Object) return false;
  if (!target->name.empty() && target->name == source->name) return true;
  for (const auto & tf : target->fields) {
    const TypeField * sf = source->find_field(tf.name);
    if (sf == nullptr || !is_same_type(tf.type, sf->type)) return false;
  }
  return std::all_of(
    target->remote_methods.begin(), target->remote_methods.end(), [&](std::string_view m) {
      return std::find(source->remote_methods.begin(), source->remote_methods.end(), m) !=
             source->remote_methods.end();
    });
}

}  // namespace

// ============================================================================
// Type Compatibility
// ============================================================================

bool accepts_literal(const Type * target, const LiteralValue & value)
{
  if (is_semantic_error(target)) return true;

  switch (target->kind) {
    case TypeKind::Union:
      return std::any_of(target->members.begin(), target->members.end(), [&](const Type * m) {
        return accepts_literal(m, value);
      });
    case TypeKind::Finite:
      return std::find(target->values.begin(), target->values.end(), value) !=
             target->values.end();
    case TypeKind::Any:
    case TypeKind::AnyData:
      return true;
    case TypeKind::Json:
      return value.kind() != LiteralKind::Decimal;
    case TypeKind::Nil:
      return value.kind() == LiteralKind::Nil;
    case TypeKind::Boolean:
      return value.kind() == LiteralKind::Bool;
    case TypeKind::Int:
      return value.kind() == LiteralKind::Int;
    case TypeKind::Byte:
      return value.kind() == LiteralKind::Int && value.as_int() >= 0 && value.as_int() <= 255;
    case TypeKind::Float:
      return value.kind() == LiteralKind::Float;
    case TypeKind::Decimal:
      return value.kind() == LiteralKind::Decimal || value.kind() == LiteralKind::Float;
    case TypeKind::String:
      return value.kind() == LiteralKind::String;
    default:
      return false;
  }
}

bool is_assignable(const Type * target, const Type * source)
{
  if (target == nullptr || source == nullptr) return false;
  if (is_semantic_error(target) || is_semantic_error(source)) return true;
  if (target == source) return true;

  if (source->kind == TypeKind::None) return true;

  if (source->kind == TypeKind::Union) {
    return std::all_of(source->members.begin(), source->members.end(), [&](const Type * m) {
      return is_assignable(target, m);
    });
  }

  if (source->kind == TypeKind::Finite) {
    return std::all_of(source->values.begin(), source->values.end(), [&](const LiteralValue & v) {
      return accepts_literal(target, v);
    });
  }

  switch (target->kind) {
    case TypeKind::Union:
      return std::any_of(target->members.begin(), target->members.end(), [&](const Type * m) {
        return is_assignable(m, source);
      });
    case TypeKind::Any:
      return source->kind != TypeKind::Error;
    case TypeKind::AnyData:
      return is_anydata(source);
    case TypeKind::Json:
      return is_json_compatible(source);
    case TypeKind::Int:
      return source->kind == TypeKind::Int || source->kind == TypeKind::Byte;
    case TypeKind::Nil:
    case TypeKind::Boolean:
    case TypeKind::Byte:
    case TypeKind::Float:
    case TypeKind::Decimal:
    case TypeKind::String:
      return source->kind == target->kind;
    case TypeKind::Error:
      return source->kind == TypeKind::Error && (target->name.empty() || target == source);
    case TypeKind::Tuple:
      if (source->kind != TypeKind::Tuple || source->members.size() != target->members.size()) {
        return false;
      }
      for (size_t i = 0; i < target->members.size(); ++i) {
        if (!is_assignable(target->members[i], source->members[i])) return false;
      }
      return true;
    case TypeKind::Array:
      return assignable_to_array(target, source);
    case TypeKind::Map:
      return assignable_to_map(target, source);
    case TypeKind::Record:
      return assignable_to_record(target, source);
    case TypeKind::Object:
      return assignable_to_object(target, source);
    case TypeKind::Future:
    case TypeKind::Typedesc:
    case TypeKind::Stream:
      return source->kind == target->kind && is_assignable(target->element, source->element);
    case TypeKind::Finite:
    case TypeKind::None:
    case TypeKind::SemanticError:
      return false;
  }
  return false;
}

bool is_same_type(const Type * a, const Type * b)
{
  if (a == b) return true;
  if (a == nullptr || b == nullptr || a->kind != b->kind) return false;

  switch (a->kind) {
    case TypeKind::Union:
      return std::all_of(a->members.begin(), a->members.end(), [&](const Type * m) {
               return std::any_of(b->members.begin(), b->members.end(), [&](const Type * n) {
                 return is_same_type(m, n);
               });
             }) &&
             std::all_of(b->members.begin(), b->members.end(), [&](const Type * n) {
               return std::any_of(a->members.begin(), a->members.end(), [&](const Type * m) {
                 return is_same_type(m, n);
               });
             });
    case TypeKind::Tuple:
      if (a->members.size() != b->members.size()) return false;
      for (size_t i = 0; i < a->members.size(); ++i) {
        if (!is_same_type(a->members[i], b->members[i])) return false;
      }
      return true;
    case TypeKind::Array:
      return a->size == b->size && is_same_type(a->element, b->element);
    case TypeKind::Map:
    case TypeKind::Future:
    case TypeKind::Typedesc:
    case TypeKind::Stream:
      return is_same_type(a->element, b->element);
    case TypeKind::Finite:
      return a->values.size() == b->values.size() &&
             std::all_of(a->values.begin(), a->values.end(), [&](const LiteralValue & v) {
               return std::find(b->values.begin(), b->values.end(), v) != b->values.end();
             });
    case TypeKind::Error:
      return a->name.empty() && b->name.empty();
    case TypeKind::Record:
    case TypeKind::Object:
      return false;
    default:
      return is_simple_kind(a->kind) || a->kind == TypeKind::Any ||
             a->kind == TypeKind::AnyData || a->kind == TypeKind::Json ||
             a->kind == TypeKind::None || a->kind == TypeKind::SemanticError;
  }
}

// ============================================================================
// Type Classification
// ============================================================================

bool is_anydata(const Type * type)
{
  if (is_semantic_error(type)) return true;
  switch (type->kind) {
    case TypeKind::Nil:
    case TypeKind::Boolean:
    case TypeKind::Int:
    case TypeKind::Byte:
    case TypeKind::Float:
    case TypeKind::Decimal:
    case TypeKind::String:
    case TypeKind::AnyData:
    case TypeKind::Json:
    case TypeKind::Finite:
      return true;
    case TypeKind::Union:
    case TypeKind::Tuple:
      return std::all_of(type->members.begin(), type->members.end(), is_anydata);
    case TypeKind::Array:
    case TypeKind::Map:
      return is_anydata(type->element);
    case TypeKind::Record:
      return std::all_of(
               type->fields.begin(), type->fields.end(),
               [](const TypeField & f) { return is_anydata(f.type); }) &&
             (type->sealed || is_anydata(type->element));
    default:
      return false;
  }
}

bool is_json_compatible(const Type * type)
{
  if (is_semantic_error(type)) return true;
  switch (type->kind) {
    case TypeKind::Nil:
    case TypeKind::Boolean:
    case TypeKind::Int:
    case TypeKind::Float:
    case TypeKind::String:
    case TypeKind::Json:
      return true;
    case TypeKind::Finite:
      return std::all_of(type->values.begin(), type->values.end(), [](const LiteralValue & v) {
        return v.kind() != LiteralKind::Decimal;
      });
    case TypeKind::Union:
    case TypeKind::Tuple:
      return std::all_of(type->members.begin(), type->members.end(), is_json_compatible);
    case TypeKind::Array:
    case TypeKind::Map:
      return is_json_compatible(type->element);
    default:
      return false;
  }
}

std::vector<const Type *> member_types(const Type * type)
{
  if (type == nullptr) return {};
  if (type->kind == TypeKind::Union) return type->members;
  return {type};
}

bool has_error_member(const Type * type)
{
  if (type == nullptr) return false;
  if (type->kind == TypeKind::Error) return true;
  if (type->kind == TypeKind::Union) {
    return std::any_of(type->members.begin(), type->members.end(), has_error_member);
  }
  return false;
}

bool is_error_only(const Type * type)
{
  if (type == nullptr) return false;
  if (type->kind == TypeKind::Union) {
    return std::all_of(type->members.begin(), type->members.end(), is_error_only);
  }
  return type->kind == TypeKind::Error;
}

bool types_intersect(const Type * a, const Type * b)
{
  if (is_semantic_error(a) || is_semantic_error(b)) return true;
  for (const Type * ma : member_types(a)) {
    for (const Type * mb : member_types(b)) {
      if (is_assignable(ma, mb) || is_assignable(mb, ma)) return true;
    }
  }
  return false;
}

const Type * literal_type(const TypeContext & types, const LiteralValue & value)
{
  switch (value.kind()) {
    case LiteralKind::Int:
      return types.int_type();
    case LiteralKind::Float:
      return types.float_type();
    case LiteralKind::Decimal:
      return types.decimal_type();
    case LiteralKind::Bool:
      return types.boolean_type();
    case LiteralKind::String:
      return types.string_type();
    case LiteralKind::Nil:
      return types.nil_type();
  }
  return types.semantic_error_type();
}

// ============================================================================
// Type Display
// ============================================================================

std::string to_string(const Type * type)
{
  if (type == nullptr) return "<null>";

  const auto constrained = [](std::string_view head, const Type * t) {
    return std::string(head) + "<" + to_string(t) + ">";
  };
  const auto joined = [](const std::vector<const Type *> & ts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < ts.size(); ++i) {
      if (i != 0) out += sep;
      out += to_string(ts[i]);
    }
    return out;
  };

  switch (type->kind) {
    case TypeKind::Nil:
      return "()";
    case TypeKind::Boolean:
      return "boolean";
    case TypeKind::Int:
      return "int";
    case TypeKind::Byte:
      return "byte";
    case TypeKind::Float:
      return "float";
    case TypeKind::Decimal:
      return "decimal";
    case TypeKind::String:
      return "string";
    case TypeKind::Any:
      return "any";
    case TypeKind::AnyData:
      return "anydata";
    case TypeKind::Json:
      return "json";
    case TypeKind::Error:
      return type->name.empty() ? "error" : std::string(type->name);
    case TypeKind::Union:
      return joined(type->members, "|");
    case TypeKind::Tuple:
      return "[" + joined(type->members, ",") + "]";
    case TypeKind::Array: {
      std::string elem = to_string(type->element);
      if (type->element != nullptr && type->element->kind == TypeKind::Union) {
        elem = "(" + elem + ")";
      }
      return elem + (type->size >= 0 ? "[" + std::to_string(type->size) + "]" : "[]");
    }
    case TypeKind::Map:
      return constrained("map", type->element);
    case TypeKind::Future:
      return constrained("future", type->element);
    case TypeKind::Typedesc:
      return constrained("typedesc", type->element);
    case TypeKind::Stream:
      return constrained("stream", type->element);
    case TypeKind::Record:
    case TypeKind::Object: {
      if (!type->name.empty()) return std::string(type->name);
      std::string out = type->kind == TypeKind::Record ? "record {" : "object {";
      for (const auto & f : type->fields) {
        out += " " + to_string(f.type) + " " + std::string(f.name) + ";";
      }
      return out + " }";
    }
    case TypeKind::Finite: {
      if (!type->name.empty()) return std::string(type->name);
      std::string out;
      for (size_t i = 0; i < type->values.size(); ++i) {
        if (i != 0) out += "|";
        out += type->values[i].to_source();
      }
      return out;
    }
    case TypeKind::None:
      return "_";
    case TypeKind::SemanticError:
      return "<error>";
  }
  return "<unknown>";
}

}  // namespace flowsema
