// tests/sema/test_transactions.cpp - Transaction nesting and control flow through transactions
//
#include <gtest/gtest.h>

#include "flowsema/test_support/analysis_helpers.hpp"

using namespace flowsema;
using flowsema::test_support::TestUnit;

TEST(SemaTransactions, NestedTransactionReportedOnce)
{
  TestUnit tu;
  auto & b = tu.b;
  tu.analyze_body({b.transaction(b.block({b.transaction(b.block({}))}))});

  EXPECT_EQ(tu.count(DiagCode::NestedTransactionsInvalid), 1U);
  EXPECT_EQ(tu.diags.size(), 1U);
}

TEST(SemaTransactions, EachNestedLevelReportedAtItsOwnTransaction)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * innermost = b.transaction(b.block({}));
  auto * middle = b.transaction(b.block({innermost}));
  tu.analyze_body({b.transaction(b.block({middle}))});

  EXPECT_EQ(tu.count(DiagCode::NestedTransactionsInvalid), 2U);
  EXPECT_TRUE(tu.reported_at(DiagCode::NestedTransactionsInvalid, middle));
  EXPECT_TRUE(tu.reported_at(DiagCode::NestedTransactionsInvalid, innermost));
}

TEST(SemaTransactions, BreakWithoutLoop)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * brk = b.break_stmt();
  tu.analyze_body({b.transaction(b.block({brk}))});

  EXPECT_TRUE(tu.reported_at(DiagCode::BreakContinueCrossesTransaction, brk));
  EXPECT_EQ(tu.diags.size(), 1U);
}

TEST(SemaTransactions, LoopInsideTransactionPermitsBreak)
{
  TestUnit tu;
  auto & b = tu.b;
  tu.analyze_body({b.transaction(b.block({
    b.while_stmt(b.var_ref("c", tu.types.boolean_type()), b.block({b.break_stmt()})),
  }))});

  EXPECT_EQ(tu.count(DiagCode::BreakContinueCrossesTransaction), 0U);
  EXPECT_EQ(tu.count(DiagCode::LoopExitOutsideLoop), 0U);
  EXPECT_TRUE(tu.diags.empty());
}

TEST(SemaTransactions, ReturnInsideTransaction)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * ret = b.ret(b.int_lit(1));
  tu.analyze_body({b.transaction(b.block({ret}))}, tu.types.int_type());

  EXPECT_TRUE(tu.reported_at(DiagCode::ReturnCrossesTransaction, ret));
  // The illegal return does not make the body return
  EXPECT_EQ(tu.count(DiagCode::MustReturn), 1U);
}

TEST(SemaTransactions, PanicInBodyWithoutHandlersReturns)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * tx = b.transaction(b.block({b.panic_stmt(b.var_ref("e", tu.types.error_type()))}));
  auto * dead = b.expr_stmt(b.call("log", {}, tu.types.nil_type()));
  tu.analyze_body({tx, dead}, tu.types.int_type());

  EXPECT_EQ(tu.count(DiagCode::MustReturn), 0U);
  EXPECT_TRUE(tu.reported_at(DiagCode::UnreachableCode, dead));
}

TEST(SemaTransactions, HandlersKeepBodyFromReturning)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * tx = b.transaction(
    b.block({b.panic_stmt(b.var_ref("e", tu.types.error_type()))}), nullptr, nullptr,
    b.block({}));
  tu.analyze_body({tx}, tu.types.int_type());

  EXPECT_EQ(tu.count(DiagCode::MustReturn), 1U);
}

TEST(SemaTransactions, RetryCountIsAnalysed)
{
  TestUnit tu;
  auto & b = tu.b;
  const Type * sealed = tu.types.get_array_type(tu.types.int_type(), 2);
  auto * index = b.int_lit(5);
  auto * tx = b.transaction(b.block({}));
  tx->retryCount = b.index_access(b.var_ref("counts", sealed), index, tu.types.int_type());
  tu.analyze_body({tx});

  EXPECT_TRUE(tu.reported_at(DiagCode::ArrayIndexOutOfRange, index));
}

TEST(SemaTransactions, SiblingTransactionsAreIndependent)
{
  TestUnit tu;
  auto & b = tu.b;
  tu.analyze_body({
    b.transaction(b.block({b.abort_stmt()})),
    b.transaction(b.block({b.retry_stmt()}), b.block({})),
  });

  EXPECT_TRUE(tu.diags.empty());
}

TEST(SemaTransactions, LockBodyIsAnalysed)
{
  TestUnit tu;
  auto & b = tu.b;
  auto * brk = b.break_stmt();
  tu.analyze_body({b.lock(b.block({brk}))});

  EXPECT_TRUE(tu.reported_at(DiagCode::LoopExitOutsideLoop, brk));
}
