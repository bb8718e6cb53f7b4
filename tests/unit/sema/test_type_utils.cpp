// tests/sema/test_type_utils.cpp - Unit tests for the type compatibility oracle
//
#include <gtest/gtest.h>

#include "flowsema/sema/types/type.hpp"
#include "flowsema/sema/types/type_utils.hpp"

using namespace flowsema;

// ============================================================================
// Type Context
// ============================================================================

TEST(SemaTypeUtils, StructuralTypesAreInterned)
{
  TypeContext types;
  const Type * a = types.get_array_type(types.int_type(), 3);
  EXPECT_EQ(a, types.get_array_type(types.int_type(), 3));
  EXPECT_NE(a, types.get_array_type(types.int_type()));

  const Type * u = types.get_union_type({types.int_type(), types.string_type()});
  EXPECT_EQ(u, types.get_union_type({types.int_type(), types.string_type()}));
}

TEST(SemaTypeUtils, UnionConstructionFlattens)
{
  TypeContext types;
  const Type * int_t = types.int_type();
  const Type * inner = types.get_union_type({int_t, types.string_type()});
  const Type * outer = types.get_union_type({inner, types.nil_type(), int_t});

  ASSERT_TRUE(outer->is_union());
  EXPECT_EQ(outer->members.size(), 3U);
  EXPECT_EQ(types.get_union_type({int_t}), int_t);
  EXPECT_EQ(types.get_union_type({}), types.nil_type());
}

TEST(SemaTypeUtils, LookupBuiltin)
{
  TypeContext types;
  EXPECT_EQ(types.lookup_builtin("int"), types.int_type());
  EXPECT_EQ(types.lookup_builtin("anydata"), types.anydata_type());
  EXPECT_EQ(types.lookup_builtin("Point"), nullptr);
}

// ============================================================================
// Assignability
// ============================================================================

TEST(SemaTypeUtils, SimpleAssignability)
{
  TypeContext types;
  EXPECT_TRUE(is_assignable(types.int_type(), types.int_type()));
  EXPECT_TRUE(is_assignable(types.int_type(), types.byte_type()));
  EXPECT_FALSE(is_assignable(types.byte_type(), types.int_type()));
  EXPECT_FALSE(is_assignable(types.string_type(), types.int_type()));
  EXPECT_TRUE(is_assignable(types.any_type(), types.string_type()));
  EXPECT_FALSE(is_assignable(types.any_type(), types.error_type()));
}

TEST(SemaTypeUtils, UnionAssignability)
{
  TypeContext types;
  const Type * int_t = types.int_type();
  const Type * err = types.error_type();
  const Type * a = types.get_union_type({int_t, err});
  const Type * b = types.get_union_type({err, int_t});

  EXPECT_TRUE(is_assignable(a, int_t));
  EXPECT_FALSE(is_assignable(int_t, a));
  EXPECT_TRUE(is_assignable(a, b));
  EXPECT_TRUE(is_same_type(a, b));
  EXPECT_FALSE(is_assignable(types.nil_type(), types.get_union_type({err, types.nil_type()})));
}

TEST(SemaTypeUtils, ErrorSentinelIsCompatibleWithEverything)
{
  TypeContext types;
  const Type * bad = types.semantic_error_type();
  EXPECT_TRUE(is_assignable(bad, types.int_type()));
  EXPECT_TRUE(is_assignable(types.string_type(), bad));
  EXPECT_TRUE(types_intersect(bad, types.int_type()));
  EXPECT_TRUE(is_semantic_error(nullptr));
}

TEST(SemaTypeUtils, AnydataClassification)
{
  TypeContext types;
  const Type * int_t = types.int_type();
  Type * client = types.create_object_type("Client", {});

  EXPECT_TRUE(is_anydata(types.get_array_type(int_t)));
  EXPECT_TRUE(is_anydata(types.get_map_type(types.json_type())));
  EXPECT_FALSE(is_anydata(client));
  EXPECT_FALSE(is_anydata(types.get_union_type({int_t, client})));
  EXPECT_TRUE(is_assignable(types.anydata_type(), types.get_tuple_type({int_t, types.string_type()})));
}

TEST(SemaTypeUtils, RecordAssignability)
{
  TypeContext types;
  const Type * int_t = types.int_type();
  const Type * point = types.create_record_type("Point", {{"x", int_t, true}}, true, nullptr);
  const Type * point3 = types.create_record_type(
    "Point3", {{"x", int_t, true}, {"z", int_t, true}}, true, nullptr);
  const Type * open = types.create_record_type("Open", {{"x", int_t, true}}, false, int_t);

  EXPECT_FALSE(is_assignable(point, point3));
  EXPECT_TRUE(is_assignable(open, point3));
  EXPECT_TRUE(is_assignable(types.get_map_type(int_t), point3));
  EXPECT_FALSE(is_same_type(point, point3));
}

TEST(SemaTypeUtils, FiniteTypes)
{
  TypeContext types;
  const Type * color = types.create_finite_type(
    "Color", {LiteralValue::make_string("red"), LiteralValue::make_string("green")});

  EXPECT_TRUE(is_assignable(types.string_type(), color));
  EXPECT_FALSE(is_assignable(color, types.string_type()));
  EXPECT_TRUE(accepts_literal(color, LiteralValue::make_string("red")));
  EXPECT_FALSE(accepts_literal(color, LiteralValue::make_string("blue")));
  EXPECT_FALSE(accepts_literal(types.byte_type(), LiteralValue::make_int(256)));
}

// ============================================================================
// Members and Errors
// ============================================================================

TEST(SemaTypeUtils, ErrorMembers)
{
  TypeContext types;
  const Type * err = types.error_type();
  const Type * io = types.create_error_type("IoError");
  const Type * mixed = types.get_union_type({types.int_type(), io});

  EXPECT_TRUE(has_error_member(mixed));
  EXPECT_FALSE(is_error_only(mixed));
  EXPECT_TRUE(is_error_only(types.get_union_type({err, io})));
  EXPECT_FALSE(has_error_member(types.nil_type()));
  EXPECT_TRUE(is_assignable(err, io));
  EXPECT_FALSE(is_assignable(io, err));
}

TEST(SemaTypeUtils, Intersection)
{
  TypeContext types;
  const Type * int_t = types.int_type();
  const Type * string_t = types.string_type();

  EXPECT_TRUE(types_intersect(types.get_union_type({int_t, string_t}), int_t));
  EXPECT_FALSE(types_intersect(int_t, string_t));
  EXPECT_TRUE(types_intersect(types.anydata_type(), string_t));
}

// ============================================================================
// Display
// ============================================================================

TEST(SemaTypeUtils, Rendering)
{
  TypeContext types;
  const Type * int_t = types.int_type();
  const Type * string_t = types.string_type();

  EXPECT_EQ(to_string(types.nil_type()), "()");
  EXPECT_EQ(to_string(types.get_union_type({int_t, string_t})), "int|string");
  EXPECT_EQ(to_string(types.get_array_type(int_t, 3)), "int[3]");
  EXPECT_EQ(to_string(types.get_array_type(types.get_union_type({int_t, string_t}))), "(int|string)[]");
  EXPECT_EQ(to_string(types.get_tuple_type({int_t, string_t})), "[int,string]");
  EXPECT_EQ(to_string(types.get_map_type(types.json_type())), "map<json>");
  EXPECT_EQ(to_string(types.create_error_type("IoError")), "IoError");
  EXPECT_EQ(to_string(types.semantic_error_type()), "<error>");
}

TEST(SemaTypeUtils, LiteralTypes)
{
  TypeContext types;
  EXPECT_EQ(literal_type(types, LiteralValue::make_int(5)), types.int_type());
  EXPECT_EQ(literal_type(types, LiteralValue::make_nil()), types.nil_type());
  EXPECT_EQ(literal_type(types, LiteralValue::make_float(1.5, true)), types.decimal_type());
}
