// tests/sema/test_match_analyzer.cpp - Unit tests for match clause reachability and exhaustiveness
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "flowsema/sema/analysis/match_analyzer.hpp"
#include "flowsema/sema/types/type_utils.hpp"
#include "flowsema/test_support/analysis_helpers.hpp"

using namespace flowsema;
using flowsema::test_support::TestUnit;

// ============================================================================
// Helper Functions
// ============================================================================

struct Analyzed
{
  MatchClauseGroup group;
  MatchAnalysisResult result;
};

static Analyzed run(MatchStmt * match)
{
  Analyzed out;
  out.group = MatchClauseGroup::from(*match);
  out.result = MatchPatternAnalyzer().analyze(match->expr->resolvedType, out.group, match->elseType);
  return out;
}

static std::vector<std::string> args_of(const DiagnosticBag & diags, DiagCode code)
{
  std::vector<std::string> out;
  for (const auto & d : diags) {
    if (d.kind == code) out.insert(out.end(), d.args.begin(), d.args.end());
  }
  return out;
}

static BlockStmt * empty_body(TestUnit & tu) { return tu.b.block({}); }

// ============================================================================
// Literal Clauses
// ============================================================================

TEST(SemaMatch, LiteralsWithBareIdentifierAreExhaustive)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * t = tu.types.get_union_type({tu.types.int_type(), tu.types.string_type()});
  auto * other = b.static_clause(b.var_ref("other", t), empty_body(tu));
  auto * m = b.match(
    b.var_ref("v", t), {
                         b.static_clause(b.int_lit(5), empty_body(tu)),
                         b.static_clause(b.string_lit("x"), empty_body(tu)),
                         other,
                       });

  auto [group, result] = run(m);

  EXPECT_TRUE(result.exhaustive);
  EXPECT_FALSE(result.alwaysMatches);
  EXPECT_TRUE(result.diagnostics.empty());
  ASSERT_EQ(group.staticClauses.size(), 3U);
  EXPECT_FALSE(group.staticClauses[0].isLastPattern);
  EXPECT_FALSE(group.staticClauses[1].isLastPattern);
  EXPECT_TRUE(group.staticClauses[2].isLastPattern);
  EXPECT_EQ(group.staticClauses[2].matchedDirect.size(), 2U);
}

TEST(SemaMatch, LiteralsAloneLeaveMemberTypesUncovered)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * t = tu.types.get_union_type({tu.types.int_type(), tu.types.string_type()});
  auto * m = b.match(
    b.var_ref("v", t), {
                         b.static_clause(b.int_lit(5), empty_body(tu)),
                         b.static_clause(b.string_lit("x"), empty_body(tu)),
                       });

  auto [group, result] = run(m);

  EXPECT_FALSE(result.exhaustive);
  EXPECT_EQ(result.diagnostics.count(DiagCode::NoMatchingPattern), 2U);
  EXPECT_EQ(args_of(result.diagnostics, DiagCode::NoMatchingPattern), (std::vector<std::string>{"int", "string"}));
  for (const auto & d : result.diagnostics) {
    EXPECT_EQ(d.primary_range(), m->get_range());
  }
  EXPECT_EQ(result.uncovered.size(), 2U);
}

TEST(SemaMatch, BooleanLiteralsComplete)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * m = b.match(
    b.var_ref("flag", tu.types.boolean_type()), {
                                                  b.static_clause(b.bool_lit(false), empty_body(tu)),
                                                  b.static_clause(b.bool_lit(true), empty_body(tu)),
                                                });

  auto [group, result] = run(m);

  EXPECT_TRUE(result.exhaustive);
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(SemaMatch, FiniteTypeByEnumeration)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * color = tu.types.create_finite_type(
    "Color", {LiteralValue::make_string("red"), LiteralValue::make_string("green")});

  auto * partial = b.match(
    b.var_ref("c", color), {b.static_clause(b.string_lit("red"), empty_body(tu))});
  auto * full = b.match(
    b.var_ref("c", color), {
                             b.static_clause(b.string_lit("red"), empty_body(tu)),
                             b.static_clause(b.string_lit("green"), empty_body(tu)),
                           });

  EXPECT_FALSE(run(partial).result.exhaustive);
  EXPECT_TRUE(run(full).result.exhaustive);
}

TEST(SemaMatch, DuplicateLiteralIsUnreachable)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * dup = b.static_clause(b.unary(UnaryOp::Neg, b.int_lit(1), tu.types.int_type()), empty_body(tu));
  auto * m = b.match(
    b.var_ref("n", tu.types.int_type()),
    {
      b.static_clause(b.unary(UnaryOp::Neg, b.int_lit(1), tu.types.int_type()), empty_body(tu)),
      dup,
      b.static_clause(b.wildcard(), empty_body(tu)),
    });

  auto [group, result] = run(m);

  ASSERT_EQ(result.diagnostics.count(DiagCode::UnreachableMatchPattern), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].primary_range(), dup->get_range());
  EXPECT_FALSE(group.staticClauses[1].reachable);
  EXPECT_TRUE(group.staticClauses[2].isLastPattern);
  EXPECT_TRUE(result.exhaustive);
}

TEST(SemaMatch, ClauseAfterDefaultIsUnreachable)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * late = b.static_clause(b.int_lit(3), empty_body(tu));
  auto * m = b.match(
    b.var_ref("n", tu.types.int_type()),
    {b.static_clause(b.var_ref("x", tu.types.int_type()), empty_body(tu)), late});

  auto [group, result] = run(m);

  EXPECT_EQ(result.diagnostics.count(DiagCode::UnreachableMatchPattern), 1U);
  EXPECT_FALSE(group.staticClauses[1].reachable);
  // One surviving catch-all
  EXPECT_TRUE(result.alwaysMatches);
  EXPECT_EQ(result.diagnostics.count(DiagCode::PatternAlwaysMatches), 1U);
}

TEST(SemaMatch, PatternOfWrongType)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * pattern = b.string_lit("x");
  auto * m = b.match(
    b.var_ref("n", tu.types.int_type()),
    {b.static_clause(pattern, empty_body(tu)), b.static_clause(b.wildcard(), empty_body(tu))});

  auto [group, result] = run(m);

  ASSERT_EQ(result.diagnostics.count(DiagCode::UnmatchedPattern), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].primary_range(), pattern->get_range());
  EXPECT_EQ(result.diagnostics.all()[0].args, std::vector<std::string>{"int"});
  EXPECT_FALSE(group.staticClauses[0].reachable);
}

TEST(SemaMatch, ElseTypeCoversRemainder)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * t = tu.types.get_union_type({tu.types.int_type(), tu.types.string_type()});
  const Type * int_t = tu.types.int_type();
  auto * m = b.match(
    b.var_ref("v", t),
    {b.structured_clause(
      b.var_binding("i", t), empty_body(tu), b.type_test(b.var_ref("i", t), int_t))},
    tu.types.string_type());
  auto * partial = b.match(
    b.var_ref("v", t), {b.static_clause(b.int_lit(1), empty_body(tu))}, tu.types.int_type());

  EXPECT_TRUE(run(m).result.exhaustive);

  auto [group, result] = run(partial);
  EXPECT_FALSE(result.exhaustive);
  EXPECT_EQ(args_of(result.diagnostics, DiagCode::NoMatchingPattern), std::vector<std::string>{"string"});
}

TEST(SemaMatch, ListPatternOnAnydataIsIndirect)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * list_t = tu.types.get_array_type(tu.types.int_type());
  auto * m = b.match(
    b.var_ref("d", tu.types.anydata_type()),
    {b.static_clause(b.list_lit({b.int_lit(1), b.int_lit(2)}, list_t), empty_body(tu))});

  auto [group, result] = run(m);

  EXPECT_FALSE(result.exhaustive);
  EXPECT_EQ(result.diagnostics.count(DiagCode::NoMatchingPattern), 0U);
  EXPECT_EQ(group.staticClauses[0].matchedIndirect.size(), 1U);
}

TEST(SemaMatch, ErrorScrutineeIsSkipped)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * m = b.match(
    b.var_ref("bad", tu.types.semantic_error_type()),
    {b.static_clause(b.int_lit(1), empty_body(tu))});

  auto [group, result] = run(m);

  EXPECT_TRUE(result.diagnostics.empty());
}

// ============================================================================
// Binding Clauses
// ============================================================================

TEST(SemaMatch, SecondBareBindingIsUnreachable)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  auto * first = b.structured_clause(b.var_binding("x", int_t), empty_body(tu));
  auto * second = b.structured_clause(b.var_binding("y", int_t), empty_body(tu));
  auto * m = b.match(b.var_ref("n", int_t), {first, second});

  auto [group, result] = run(m);

  ASSERT_EQ(result.diagnostics.count(DiagCode::UnreachableMatchPattern), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].primary_range(), second->get_range());
  EXPECT_TRUE(group.structuredClauses[0].isLastPattern);
  EXPECT_FALSE(group.structuredClauses[1].reachable);
  EXPECT_TRUE(result.exhaustive);
  EXPECT_EQ(result.diagnostics.count(DiagCode::PatternAlwaysMatches), 1U);
}

TEST(SemaMatch, TupleBindingOnTuple)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * pair = tu.types.get_tuple_type({tu.types.int_type(), tu.types.string_type()});
  auto * m = b.match(
    b.var_ref("p", pair),
    {b.structured_clause(
      b.tuple_binding({b.var_binding("a", tu.types.int_type()), b.var_binding("s", tu.types.string_type())}, pair),
      empty_body(tu))});

  auto [group, result] = run(m);

  EXPECT_TRUE(result.exhaustive);
  EXPECT_TRUE(result.alwaysMatches);
  // A destructuring pattern is not a default clause
  EXPECT_FALSE(group.structuredClauses[0].isLastPattern);
}

TEST(SemaMatch, TupleBindingOfWrongArity)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * pair = tu.types.get_tuple_type({tu.types.int_type(), tu.types.int_type()});
  auto * pattern = b.tuple_binding({b.var_binding("a", tu.types.int_type())}, pair);
  auto * m = b.match(b.var_ref("p", pair), {b.structured_clause(pattern, empty_body(tu))});

  auto [group, result] = run(m);

  EXPECT_EQ(result.diagnostics.count(DiagCode::UnmatchedPattern), 1U);
  EXPECT_FALSE(result.exhaustive);
}

TEST(SemaMatch, TypeGuardSplitsUnion)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  const Type * t = tu.types.get_union_type({int_t, tu.types.string_type()});

  auto * guarded = b.structured_clause(
    b.var_binding("v", t), empty_body(tu), b.type_test(b.var_ref("v", t), int_t));
  auto * m = b.match(b.var_ref("x", t), {guarded});

  auto [group, result] = run(m);

  EXPECT_FALSE(result.exhaustive);
  EXPECT_EQ(args_of(result.diagnostics, DiagCode::NoMatchingPattern), std::vector<std::string>{"string"});
  ASSERT_EQ(group.structuredClauses[0].matchedDirect.size(), 1U);
  EXPECT_EQ(group.structuredClauses[0].matchedDirect[0], int_t);
  EXPECT_FALSE(group.structuredClauses[0].is_default());
}

TEST(SemaMatch, GuardedClauseAddingNothing)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  const Type * t = tu.types.get_union_type({int_t, tu.types.string_type()});

  auto * again = b.structured_clause(
    b.var_binding("w", t), empty_body(tu), b.type_test(b.var_ref("w", t), int_t));
  auto * m = b.match(
    b.var_ref("x", t),
    {
      b.structured_clause(b.var_binding("v", t), empty_body(tu), b.type_test(b.var_ref("v", t), int_t)),
      again,
      b.structured_clause(b.var_binding("rest", t), empty_body(tu)),
    });

  auto [group, result] = run(m);

  ASSERT_EQ(result.diagnostics.count(DiagCode::UnreachableMatchPattern), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].primary_range(), again->get_range());
  EXPECT_TRUE(result.exhaustive);
  EXPECT_TRUE(group.structuredClauses[2].isLastPattern);
}

TEST(SemaMatch, RepeatedComparisonGuardIsUnreachable)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  const Type * bool_t = tu.types.boolean_type();
  auto positive = [&](int64_t bound) {
    return b.binary(b.var_ref("x", int_t), BinaryOp::Gt, b.int_lit(bound), bool_t);
  };

  auto * first = b.structured_clause(b.var_binding("x", int_t), empty_body(tu), positive(0));
  auto * repeated = b.structured_clause(b.var_binding("x", int_t), empty_body(tu), positive(0));
  auto * other = b.structured_clause(b.var_binding("x", int_t), empty_body(tu), positive(1));
  auto * m = b.match(
    b.var_ref("n", int_t),
    {first, repeated, other, b.structured_clause(b.var_binding("rest", int_t), empty_body(tu))});

  auto [group, result] = run(m);

  ASSERT_EQ(result.diagnostics.count(DiagCode::UnreachableMatchPattern), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].primary_range(), repeated->get_range());
  EXPECT_FALSE(group.structuredClauses[1].reachable);
  EXPECT_TRUE(group.structuredClauses[2].reachable);
  EXPECT_TRUE(result.exhaustive);
}

TEST(SemaMatch, ClosedRecordBindingOnOpenRecord)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  const Type * open = tu.types.create_record_type(
    "Point", {{"x", int_t, true}, {"y", int_t, true}}, false, tu.types.anydata_type());

  auto * closed = b.record_binding(
    {b.binding_field("x", b.var_binding("x", int_t)), b.binding_field("y", b.var_binding("y", int_t))},
    open, true);
  auto * m = b.match(b.var_ref("p", open), {b.structured_clause(closed, empty_body(tu))});

  auto [group, result] = run(m);

  // Extra fields of the open record escape the closed pattern
  EXPECT_FALSE(result.exhaustive);
  EXPECT_EQ(args_of(result.diagnostics, DiagCode::NoMatchingPattern), std::vector<std::string>{"Point"});
}

TEST(SemaMatch, DefaultInBothGroups)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  auto * late = b.structured_clause(b.var_binding("y", int_t), empty_body(tu));
  auto * m = b.match(
    b.var_ref("n", int_t), {b.static_clause(b.var_ref("x", int_t), empty_body(tu)), late});

  auto [group, result] = run(m);

  ASSERT_EQ(result.diagnostics.count(DiagCode::DuplicateDefaultPattern), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].primary_range(), late->get_range());
  EXPECT_FALSE(group.structuredClauses[0].reachable);
  EXPECT_TRUE(group.staticClauses[0].isLastPattern);
}

TEST(SemaMatch, SubsumptionOfStaticPatterns)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * list_t = tu.types.get_array_type(tu.types.int_type());

  auto * any_pair = b.list_lit({b.wildcard(), b.wildcard()}, list_t);
  auto * one_two = b.list_lit({b.int_lit(1), b.int_lit(2)}, list_t);
  auto * one = b.list_lit({b.int_lit(1)}, list_t);

  EXPECT_TRUE(MatchPatternAnalyzer::subsumes(any_pair, one_two));
  EXPECT_FALSE(MatchPatternAnalyzer::subsumes(one_two, any_pair));
  EXPECT_FALSE(MatchPatternAnalyzer::subsumes(any_pair, one));
  EXPECT_TRUE(MatchPatternAnalyzer::subsumes(b.wildcard(), one));
}

TEST(SemaMatch, CoverageOfSealedArray)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  auto * pattern = b.list_lit({b.wildcard(), b.wildcard()}, tu.types.get_array_type(int_t));

  EXPECT_EQ(MatchPatternAnalyzer::cover(pattern, tu.types.get_array_type(int_t, 2)), PatternCoverage::Full);
  EXPECT_EQ(MatchPatternAnalyzer::cover(pattern, tu.types.get_array_type(int_t)), PatternCoverage::Partial);
  EXPECT_EQ(MatchPatternAnalyzer::cover(pattern, tu.types.get_array_type(int_t, 3)), PatternCoverage::None);
  EXPECT_EQ(MatchPatternAnalyzer::cover(pattern, tu.types.json_type()), PatternCoverage::Indirect);
}

// ============================================================================
// Through the Analyzer
// ============================================================================

TEST(SemaMatch, AnalyzerAnnotatesClauses)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  auto * first = b.structured_clause(b.var_binding("x", int_t), b.block({b.ret(b.int_lit(1))}));
  auto * second = b.structured_clause(b.var_binding("y", int_t), b.block({b.ret(b.int_lit(2))}));
  tu.analyze_body({b.match(b.var_ref("n", int_t), {first, second})}, int_t);

  EXPECT_TRUE(first->isLastPattern);
  EXPECT_TRUE(first->isReachable);
  EXPECT_FALSE(second->isReachable);
  EXPECT_EQ(tu.count(DiagCode::UnreachableMatchPattern), 1U);
  EXPECT_EQ(tu.count(DiagCode::PatternAlwaysMatches), 1U);
  EXPECT_EQ(tu.count(DiagCode::MustReturn), 0U);
  EXPECT_EQ(tu.first(DiagCode::PatternAlwaysMatches)->severity, Severity::Warning);
}

TEST(SemaMatch, GuardIsAnalysed)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * int_t = tu.types.int_type();
  const Type * sealed = tu.types.get_array_type(int_t, 1);
  auto * index = b.int_lit(4);
  auto * guard = b.binary(
    b.index_access(b.var_ref("xs", sealed), index, int_t), BinaryOp::Eq, b.int_lit(0),
    tu.types.boolean_type());
  tu.analyze_body({b.match(
    b.var_ref("n", int_t), {
                             b.structured_clause(b.var_binding("x", int_t), b.block({}), guard),
                             b.static_clause(b.wildcard(), b.block({})),
                           })});

  EXPECT_TRUE(tu.reported_at(DiagCode::ArrayIndexOutOfRange, index));
}
