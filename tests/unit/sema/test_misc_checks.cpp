// tests/sema/test_misc_checks.cpp - Visibility, literal, invocation and type-test checks
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "flowsema/test_support/analysis_helpers.hpp"

using namespace flowsema;
using flowsema::test_support::TestUnit;

// ============================================================================
// Visibility
// ============================================================================

TEST(SemaMiscChecks, MainShouldBePublic)
{
  TestUnit tu;
  auto * main_fn = tu.b.function("main", nullptr, tu.b.block({}), tu.private_symbol("main"));
  tu.analyze(tu.unit({main_fn}));

  EXPECT_TRUE(tu.reported_at(DiagCode::MainShouldBePublic, main_fn));

  TestUnit ok;
  ok.analyze(ok.unit({ok.function("main", nullptr, {})}));
  EXPECT_TRUE(ok.diags.empty());
}

TEST(SemaMiscChecks, PublicFunctionExposesPrivateType)
{
  TestUnit tu;
  auto & b = tu.b;
  const Symbol * secret_sym = tu.private_symbol("Secret", SymbolKind::Type);
  const Type * secret =
    tu.types.create_record_type("Secret", {}, true, nullptr, secret_sym);

  auto * param = b.variable("s", secret);
  auto * fn = b.function(
    "reveal", tu.types.get_array_type(secret), b.block({b.ret(b.list_lit({}, tu.types.get_array_type(secret)))}),
    tu.public_symbol("reveal"), {param});
  tu.analyze(tu.unit({fn}));

  EXPECT_TRUE(tu.reported_at(DiagCode::AttemptExposeNonPublicSymbol, param));
  EXPECT_TRUE(tu.reported_at(DiagCode::AttemptExposeNonPublicSymbol, fn));
  EXPECT_EQ(tu.first(DiagCode::AttemptExposeNonPublicSymbol)->args, std::vector<std::string>{"Secret"});
}

TEST(SemaMiscChecks, PrivateFunctionMayUsePrivateType)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * secret = tu.types.create_record_type(
    "Secret", {}, true, nullptr, tu.private_symbol("Secret", SymbolKind::Type));
  auto * fn = b.function(
    "helper", tu.types.get_union_type({secret, tu.types.nil_type()}), b.block({}),
    tu.private_symbol("helper"));
  tu.analyze(tu.unit({fn}));

  EXPECT_TRUE(tu.diags.empty());
}

TEST(SemaMiscChecks, PrivateTypeOfAnotherPackageIsNotExposure)
{
  // Referring to it at all is the other package's concern
  TestUnit tu;
  const Type * foreign = tu.types.create_record_type(
    "Foreign", {}, true, nullptr, tu.private_symbol("Foreign", SymbolKind::Type, "other"));
  auto * fn = tu.b.function(
    "f", tu.types.get_union_type({foreign, tu.types.nil_type()}), tu.b.block({}),
    tu.public_symbol("f"));
  tu.analyze(tu.unit({fn}));

  EXPECT_EQ(tu.count(DiagCode::AttemptExposeNonPublicSymbol), 0U);
}

TEST(SemaMiscChecks, PublicRecordFieldExposesPrivateType)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * inner = tu.types.create_record_type(
    "Inner", {}, true, nullptr, tu.private_symbol("Inner", SymbolKind::Type));
  const Type * outer = tu.types.create_record_type(
    "Outer", {{"inner", inner, true}, {"n", tu.types.int_type(), true}}, true, nullptr,
    tu.public_symbol("Outer", SymbolKind::Type));
  auto * def = b.type_def("Outer", outer, outer->symbol);
  tu.analyze(tu.unit({def}));

  EXPECT_TRUE(tu.reported_at(DiagCode::AttemptExposeNonPublicSymbol, def));
  EXPECT_EQ(tu.count(DiagCode::AttemptExposeNonPublicSymbol), 1U);
}

TEST(SemaMiscChecks, PublicVariableExposesPrivateType)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * secret = tu.types.create_record_type(
    "Secret", {}, true, nullptr, tu.private_symbol("Secret", SymbolKind::Type));
  auto * var = b.variable(
    "config", secret, b.record_lit({}, secret), tu.public_symbol("config", SymbolKind::Variable));
  tu.analyze(tu.unit({var}));

  EXPECT_TRUE(tu.reported_at(DiagCode::AttemptExposeNonPublicSymbol, var));
}

TEST(SemaMiscChecks, ReferenceToPrivateSymbolOfAnotherPackage)
{
  TestUnit tu;
  auto & b = tu.b;
  const Symbol * hidden = tu.private_symbol("hidden", SymbolKind::Function, "other");
  const Symbol * shared = tu.public_symbol("shared", SymbolKind::Function, "other");
  const Symbol * local = tu.private_symbol("local", SymbolKind::Variable);

  auto * bad_call = b.call("hidden", {}, tu.types.nil_type(), hidden);
  auto * bad_ref = b.var_ref(
    "limit", tu.types.int_type(), tu.private_symbol("limit", SymbolKind::Variable, "other"));
  tu.analyze_body({
    b.expr_stmt(bad_call),
    b.expr_stmt(b.call("shared", {}, tu.types.nil_type(), shared)),
    b.var_def("n", tu.types.int_type(), bad_ref),
    b.var_def("m", tu.types.int_type(), b.var_ref("local", tu.types.int_type(), local)),
  });

  EXPECT_TRUE(tu.reported_at(DiagCode::AttemptReferNonAccessibleSymbol, bad_call));
  EXPECT_TRUE(tu.reported_at(DiagCode::AttemptReferNonAccessibleSymbol, bad_ref));
  EXPECT_EQ(tu.count(DiagCode::AttemptReferNonAccessibleSymbol), 2U);
}

TEST(SemaMiscChecks, UninitializedVariables)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * pub = b.variable(
    "port", tu.types.int_type(), nullptr, tu.public_symbol("port", SymbolKind::Variable));
  auto * listener = b.variable(
    "ep", tu.types.int_type(), nullptr,
    tu.symbols.create("ep", SymbolKind::Variable, "demo", static_cast<uint32_t>(SymbolFlag::Listener)));
  auto * priv = b.variable(
    "cache", tu.types.int_type(), nullptr, tu.private_symbol("cache", SymbolKind::Variable));
  tu.analyze(tu.unit({pub, listener, priv}));

  EXPECT_TRUE(tu.reported_at(DiagCode::UninitializedVariable, pub));
  EXPECT_TRUE(tu.reported_at(DiagCode::UninitializedVariable, listener));
  EXPECT_EQ(tu.count(DiagCode::UninitializedVariable), 2U);
  EXPECT_EQ(tu.first(DiagCode::UninitializedVariable)->args, std::vector<std::string>{"port"});
}

TEST(SemaMiscChecks, ClientWithoutRemoteFunction)
{
  TestUnit tu;
  Type * client = tu.types.create_object_type("Http", {});
  client->client = true;
  Type * full = tu.types.create_object_type("Grpc", {});
  full->client = true;
  full->remote_methods.push_back("call");

  auto * bad = tu.b.type_def("Http", client);
  tu.analyze(tu.unit({bad, tu.b.type_def("Grpc", full)}));

  EXPECT_TRUE(tu.reported_at(DiagCode::ClientHasNoRemoteFunction, bad));
  EXPECT_EQ(tu.diags.size(), 1U);
}

TEST(SemaMiscChecks, MethodsOfTypeDefinitionAreAnalysed)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * method = b.function("size", tu.types.int_type(), b.block({}), tu.private_symbol("size"));
  Type * obj = tu.types.create_object_type("Bag", {});
  tu.analyze(tu.unit({b.type_def("Bag", obj, nullptr, {method})}));

  EXPECT_TRUE(tu.reported_at(DiagCode::MustReturn, method));
}

// ============================================================================
// Literals and Invocations
// ============================================================================

TEST(SemaMiscChecks, DuplicateRecordKeys)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  const Type * rec = tu.types.create_record_type("R", {{"a", int_t, true}}, true, nullptr);
  const Type * map = tu.types.get_map_type(int_t);

  auto * dup_field = b.record_field("a", b.int_lit(2));
  auto * dup_entry = b.record_field(b.string_lit("k"), b.int_lit(2));
  tu.analyze_body({
    b.var_def("r", rec, b.record_lit({b.record_field("a", b.int_lit(1)), dup_field}, rec)),
    b.var_def("m", map, b.record_lit({b.record_field("k", b.int_lit(1)), dup_entry}, map)),
  });

  ASSERT_EQ(tu.count(DiagCode::DuplicateKeyInRecordLiteral), 2U);
  EXPECT_TRUE(tu.reported_at(DiagCode::DuplicateKeyInRecordLiteral, dup_field));
  EXPECT_TRUE(tu.reported_at(DiagCode::DuplicateKeyInRecordLiteral, dup_entry));
  EXPECT_EQ(tu.diags.all()[0].args, (std::vector<std::string>{"record", "a"}));
  EXPECT_EQ(tu.diags.all()[1].args, (std::vector<std::string>{"map", "k"}));
}

TEST(SemaMiscChecks, DuplicateNamedArgs)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * dup = b.named_arg("timeout", b.int_lit(2));
  tu.analyze_body({b.expr_stmt(b.call(
    "connect", {b.named_arg("timeout", b.int_lit(1)), b.named_arg("retries", b.int_lit(3)), dup},
    tu.types.nil_type()))});

  ASSERT_TRUE(tu.reported_at(DiagCode::DuplicateNamedArgs, dup));
  EXPECT_EQ(tu.count(DiagCode::DuplicateNamedArgs), 1U);
}

TEST(SemaMiscChecks, ConstantIndexOutOfRange)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  const Type * sealed = tu.types.get_array_type(int_t, 3);
  const Type * open = tu.types.get_array_type(int_t);

  auto * too_big = b.int_lit(3);
  auto * negative = b.unary(UnaryOp::Neg, b.int_lit(1), int_t);
  tu.analyze_body({
    b.var_def("a", int_t, b.index_access(b.var_ref("xs", sealed), b.int_lit(2), int_t)),
    b.var_def("b", int_t, b.index_access(b.var_ref("xs", sealed), too_big, int_t)),
    b.var_def("c", int_t, b.index_access(b.var_ref("xs", sealed), negative, int_t)),
    b.var_def("d", int_t, b.index_access(b.var_ref("ys", open), b.int_lit(100), int_t)),
    b.var_def("e", int_t, b.index_access(b.var_ref("xs", sealed), b.var_ref("i", int_t), int_t)),
  });

  EXPECT_EQ(tu.count(DiagCode::ArrayIndexOutOfRange), 2U);
  ASSERT_TRUE(tu.reported_at(DiagCode::ArrayIndexOutOfRange, too_big));
  EXPECT_TRUE(tu.reported_at(DiagCode::ArrayIndexOutOfRange, negative));
  EXPECT_EQ(tu.first(DiagCode::ArrayIndexOutOfRange)->args, (std::vector<std::string>{"3", "3"}));
}

TEST(SemaMiscChecks, DeprecatedCall)
{
  TestUnit tu;
  auto & b = tu.b;
  const Symbol * old = tu.symbols.create(
    "legacy", SymbolKind::Function, "demo", SymbolFlag::Public | SymbolFlag::Deprecated);
  auto * call = b.call("legacy", {}, tu.types.nil_type(), old);
  EXPECT_TRUE(tu.analyze_body({b.expr_stmt(call)}));

  ASSERT_TRUE(tu.reported_at(DiagCode::DeprecatedFunctionUsage, call));
  EXPECT_EQ(tu.first(DiagCode::DeprecatedFunctionUsage)->severity, Severity::Warning);
  EXPECT_FALSE(tu.diags.has_errors());
}

TEST(SemaMiscChecks, RemoteActionPosition)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * client_t = tu.types.create_object_type("Http", {});
  const Type * string_t = tu.types.string_type();
  auto * nested = b.action_call(b.var_ref("c", client_t), "get", {}, string_t);
  tu.analyze_body(
    {
      b.var_def("a", string_t, b.action_call(b.var_ref("c", client_t), "get", {}, string_t)),
      b.expr_stmt(b.check(b.action_call(b.var_ref("c", client_t), "post", {}, tu.types.get_union_type({tu.types.nil_type(), tu.types.error_type()})), tu.types.nil_type())),
      b.var_def("n", tu.types.int_type(), b.call("len", {nested}, tu.types.int_type())),
      b.ret(b.action_call(b.var_ref("c", client_t), "get", {}, string_t)),
    },
    tu.types.get_union_type({string_t, tu.types.error_type()}));

  ASSERT_EQ(tu.count(DiagCode::InvalidActionInvocationAsExpr), 1U);
  EXPECT_TRUE(tu.reported_at(DiagCode::InvalidActionInvocationAsExpr, nested));
  EXPECT_EQ(
    tu.first(DiagCode::InvalidActionInvocationAsExpr)->args,
    std::vector<std::string>{"a remote action invocation"});
}

TEST(SemaMiscChecks, NilValuedExpressionStatement)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * nil = tu.types.nil_type();
  auto * useless = b.expr_stmt(b.var_ref("unit", nil));
  tu.analyze_body({useless, b.expr_stmt(b.call("log", {}, nil))});

  ASSERT_TRUE(tu.reported_at(DiagCode::InvalidExpressionStatement, useless));
  EXPECT_EQ(tu.diags.size(), 1U);
}

// ============================================================================
// check and Type Tests
// ============================================================================

TEST(SemaMiscChecks, CheckWithoutErrorReturn)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  const Type * fallible = tu.types.get_union_type({int_t, tu.types.error_type()});
  auto * check = b.check(b.call("parse", {}, fallible), int_t);
  tu.analyze_body({b.ret(check)}, int_t);

  ASSERT_TRUE(tu.reported_at(DiagCode::CheckedExprNoErrorReturn, check));
  EXPECT_EQ(tu.first(DiagCode::CheckedExprNoErrorReturn)->args, std::vector<std::string>{"int"});
}

TEST(SemaMiscChecks, CheckWithErrorReturnAndCheckpanic)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  const Type * fallible = tu.types.get_union_type({int_t, tu.types.error_type()});
  tu.analyze_body(
    {
      b.var_def("a", int_t, b.check(b.call("parse", {}, fallible), int_t)),
      b.var_def("b", int_t, b.check(b.call("parse", {}, fallible), int_t, true)),
      b.ret(b.int_lit(0)),
    },
    fallible);

  EXPECT_TRUE(tu.diags.empty());

  TestUnit strict;
  auto & sb = strict.b;
  strict.analyze_body(
    {sb.var_def(
      "b", int_t,
      sb.check(sb.call("parse", {}, strict.types.get_union_type({int_t, strict.types.error_type()})), int_t, true))});
  EXPECT_TRUE(strict.diags.empty());
}

TEST(SemaMiscChecks, TypeTests)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  const Type * string_t = tu.types.string_type();
  const Type * either = tu.types.get_union_type({int_t, string_t});
  const Type * boolean = tu.types.boolean_type();

  auto * always = b.type_test(b.var_ref("n", int_t), either);
  auto * never = b.type_test(b.var_ref("n", int_t), string_t);
  auto * useful = b.type_test(b.var_ref("v", either), int_t);
  auto * unresolved = b.type_test(b.var_ref("bad", tu.types.semantic_error_type()), int_t);
  tu.analyze_body({
    b.var_def("a", boolean, always),
    b.var_def("b", boolean, never),
    b.var_def("c", boolean, useful),
    b.var_def("d", boolean, unresolved),
  });

  EXPECT_TRUE(tu.reported_at(DiagCode::UnnecessaryCondition, always));
  EXPECT_TRUE(tu.reported_at(DiagCode::IncompatibleTypeCheck, never));
  EXPECT_EQ(tu.first(DiagCode::IncompatibleTypeCheck)->args, (std::vector<std::string>{"int", "string"}));
  EXPECT_EQ(tu.diags.size(), 2U);
}

// ============================================================================
// Package Level
// ============================================================================

TEST(SemaMiscChecks, WorkerActionInPackageInitializer)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * receive = b.receive("w1", tu.types.int_type());
  auto * var = b.variable("x", tu.types.int_type(), receive, tu.private_symbol("x", SymbolKind::Variable));
  tu.analyze(tu.unit({var}));

  EXPECT_TRUE(tu.reported_at(DiagCode::InvalidWorkerReceivePosition, receive));
}

TEST(SemaMiscChecks, ReturnsClean)
{
  TestUnit tu;
  auto & b = tu.b;
  EXPECT_TRUE(tu.analyze_body({b.ret(b.int_lit(1))}, tu.types.int_type()));
  EXPECT_FALSE(tu.analyze_body({}, tu.types.int_type()));
}
