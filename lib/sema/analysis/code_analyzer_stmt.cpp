// flowsema/sema/analysis/code_analyzer_stmt.cpp - Statement traversal

#include <cassert>
#include <string>
#include <utility>

#include "flowsema/basic/casting.hpp"
#include "flowsema/sema/analysis/code_analyzer.hpp"
#include "flowsema/sema/analysis/match_analyzer.hpp"
#include "flowsema/sema/types/type_utils.hpp"

namespace flowsema
{

void CodeAnalyzer::analyze_block(BlockStmt * block, AnalysisContext & ctx)
{
  if (!block) return;

  ++ctx.blockDepth;
  for (Stmt * stmt : block->stmts) {
    analyze_stmt(stmt, ctx);
  }
  --ctx.blockDepth;
  ctx.reachability.leave_block();
}

void CodeAnalyzer::analyze_stmt(Stmt * stmt, AnalysisContext & ctx)
{
  if (!stmt) return;

  ctx.reachability.before_statement(stmt->get_range());

  switch (stmt->kind) {
    case NodeKind::Block:
      analyze_block(cast<BlockStmt>(stmt), ctx);
      return;

    case NodeKind::VarDef: {
      VariableDecl * var = cast<VarDefStmt>(stmt)->var;
      if (var && var->init) analyze_expr(var->init, ctx, OperandPosition::Statement);
      return;
    }

    case NodeKind::Assignment: {
      auto * assign = cast<AssignmentStmt>(stmt);
      analyze_expr(assign->target, ctx);
      analyze_expr(assign->value, ctx, OperandPosition::Statement);
      return;
    }

    case NodeKind::Destructure: {
      auto * destructure = cast<DestructureStmt>(stmt);
      analyze_expr(destructure->target, ctx);
      analyze_expr(destructure->value, ctx, OperandPosition::Statement);
      return;
    }

    case NodeKind::ExprStmt:
      analyze_expr_stmt(cast<ExprStmt>(stmt), ctx);
      return;

    case NodeKind::Return:
      analyze_return(cast<ReturnStmt>(stmt), ctx);
      return;

    case NodeKind::If:
      analyze_if(cast<IfStmt>(stmt), ctx);
      return;

    case NodeKind::While: {
      auto * loop = cast<WhileStmt>(stmt);
      analyze_loop(loop->condition, loop->body, ctx);
      return;
    }

    case NodeKind::Foreach: {
      auto * loop = cast<ForeachStmt>(stmt);
      analyze_loop(loop->collection, loop->body, ctx);
      return;
    }

    case NodeKind::Break:
      ctx.exits.check_break_or_continue(stmt->get_range(), "break");
      ctx.reachability.mark_terminated();
      return;

    case NodeKind::Continue:
      ctx.exits.check_break_or_continue(stmt->get_range(), "continue");
      ctx.reachability.mark_terminated();
      return;

    case NodeKind::Panic:
      analyze_expr(cast<PanicStmt>(stmt)->value, ctx);
      ctx.reachability.mark_returned();
      return;

    case NodeKind::Abort:
      ctx.exits.check_abort_or_retry(stmt->get_range(), "abort");
      ctx.reachability.mark_terminated();
      return;

    case NodeKind::Retry:
      ctx.exits.check_abort_or_retry(stmt->get_range(), "retry");
      ctx.reachability.mark_terminated();
      return;

    case NodeKind::Transaction:
      analyze_transaction(cast<TransactionStmt>(stmt), ctx);
      return;

    case NodeKind::Lock:
      analyze_block(cast<LockStmt>(stmt)->body, ctx);
      return;

    case NodeKind::Match:
      analyze_match(cast<MatchStmt>(stmt), ctx);
      return;

    case NodeKind::WorkerSend:
      analyze_worker_send(cast<WorkerSendStmt>(stmt), ctx);
      return;

    case NodeKind::WorkerDecl:
      analyze_worker(cast<WorkerDeclStmt>(stmt)->worker, ctx);
      return;

    case NodeKind::ForkJoin:
      for (WorkerDeclStmt * decl : cast<ForkJoinStmt>(stmt)->workers) {
        analyze_worker(decl->worker, ctx);
      }
      return;

    case NodeKind::Forever:
      ctx.reachability.mark_terminated();
      return;

      // Every other kind is not a statement
#define AST_NODE(Class, Kind, Snake)
#define AST_NODE_STMT(Class, Kind, Snake)
#define AST_NODE_EXPR(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_DECL(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_SUPPORT(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_TOP(Class, Kind, Snake) case NodeKind::Kind:
#include "flowsema/ast/ast_nodes.def"
      break;
  }
  assert(false && "analyze_stmt on a non-statement node");
}

// ============================================================================
// Control Flow
// ============================================================================

void CodeAnalyzer::analyze_if(IfStmt * stmt, AnalysisContext & ctx)
{
  analyze_expr(stmt->condition, ctx);

  const auto before = ctx.reachability.snapshot();
  analyze_block(stmt->thenBlock, ctx);
  const bool then_returns = ctx.reachability.returns();
  ctx.reachability.restore(before);

  bool else_returns = false;
  if (stmt->elseBranch) {
    analyze_stmt(stmt->elseBranch, ctx);
    else_returns = ctx.reachability.returns();
    ctx.reachability.restore(before);
  }

  ctx.reachability.set_returns(before.returns || (then_returns && else_returns));
}

void CodeAnalyzer::analyze_loop(Expr * head, BlockStmt * body, AnalysisContext & ctx)
{
  analyze_expr(head, ctx);

  // The body may run zero times: a loop never counts as returning
  const auto before = ctx.reachability.snapshot();
  ctx.exits.enter_loop();
  analyze_block(body, ctx);
  ctx.exits.leave_loop();
  ctx.reachability.restore(before);
}

void CodeAnalyzer::analyze_transaction(TransactionStmt * stmt, AnalysisContext & ctx)
{
  if (!ctx.exits.check_transaction_placement(stmt->get_range(), ctx.handler)) return;

  analyze_expr(stmt->retryCount, ctx);

  const auto before = ctx.reachability.snapshot();
  ctx.exits.enter_transaction(stmt->get_range());
  analyze_block(stmt->body, ctx);
  const bool body_returns = ctx.reachability.returns();
  ctx.exits.leave_transaction();

  // Handlers run after the transaction scope has been left
  const std::pair<BlockStmt *, TransactionHandler> handlers[] = {
    {stmt->onRetry, TransactionHandler::OnRetry},
    {stmt->onAborted, TransactionHandler::Aborted},
    {stmt->onCommitted, TransactionHandler::Committed},
  };
  bool has_handlers = false;
  for (const auto & [block, handler] : handlers) {
    if (!block) continue;
    has_handlers = true;
    ctx.reachability.restore(before);
    ctx.handler = handler;
    analyze_block(block, ctx);
  }
  ctx.handler = TransactionHandler::None;

  ctx.reachability.restore(before);
  ctx.reachability.set_returns(before.returns || (body_returns && !has_handlers));
}

void CodeAnalyzer::analyze_match(MatchStmt * stmt, AnalysisContext & ctx)
{
  analyze_expr(stmt->expr, ctx);

  const Type * scrutinee = stmt->expr ? stmt->expr->resolvedType : nullptr;
  MatchClauseGroup group = MatchClauseGroup::from(*stmt);
  MatchAnalysisResult result = MatchPatternAnalyzer().analyze(scrutinee, group, stmt->elseType);
  diags_->merge(std::move(result.diagnostics));

  for (const auto * list : {&group.staticClauses, &group.structuredClauses}) {
    for (const auto & info : *list) {
      info.clause->isLastPattern = info.isLastPattern;
      info.clause->isReachable = info.reachable;
    }
  }

  const auto before = ctx.reachability.snapshot();
  bool all_return = !stmt->clauses.empty();
  for (MatchClause * clause : stmt->clauses) {
    ctx.reachability.restore(before);
    if (auto * structured = dyn_cast<StructuredMatchClause>(clause)) {
      analyze_expr(structured->guard, ctx);
    }
    analyze_block(clause->body, ctx);
    if (clause->isReachable) all_return = all_return && ctx.reachability.returns();
  }
  ctx.reachability.restore(before);

  const bool exhaustive = result.exhaustive || is_semantic_error(scrutinee);
  ctx.reachability.set_returns(before.returns || (exhaustive && all_return));
}

// ============================================================================
// Simple Statements
// ============================================================================

void CodeAnalyzer::analyze_return(ReturnStmt * stmt, AnalysisContext & ctx)
{
  analyze_expr(stmt->value, ctx, OperandPosition::Return);

  const bool legal = ctx.exits.check_return(stmt->get_range());
  ctx.add_return_type(stmt->value ? stmt->value->resolvedType : types_.nil_type());
  if (legal) ctx.reachability.mark_returned();
}

void CodeAnalyzer::analyze_expr_stmt(ExprStmt * stmt, AnalysisContext & ctx)
{
  analyze_expr(stmt->expr, ctx, OperandPosition::Statement);

  const Expr * expr = stmt->expr;
  while (expr) {
    if (const auto * check = dyn_cast<CheckExpr>(expr)) {
      expr = check->expr;
    } else if (const auto * trap = dyn_cast<TrapExpr>(expr)) {
      expr = trap->expr;
    } else {
      break;
    }
  }
  if (!expr) return;

  switch (expr->kind) {
    case NodeKind::Invocation:
    case NodeKind::Wait:
    case NodeKind::WorkerReceive:
    case NodeKind::WorkerSyncSend:
    case NodeKind::WorkerFlush:
      return;
    default:
      break;
  }

  // Non-nil values are rejected by the type checker already
  if (expr->resolvedType && expr->resolvedType->is_nil()) {
    diags_->report(
      DiagCode::InvalidExpressionStatement, stmt->get_range(), {to_string(expr->resolvedType)});
  }
}

void CodeAnalyzer::analyze_worker_send(WorkerSendStmt * stmt, AnalysisContext & ctx)
{
  analyze_expr(stmt->expr, ctx);

  const Type * value = stmt->expr ? stmt->expr->resolvedType : nullptr;
  if (is_semantic_error(value)) {
    ctx.workers->current_machine().erroneous = true;
    return;
  }
  check_sendable(stmt->expr);
  if (!check_worker_action(stmt->workerName, stmt->get_range(), true, ctx)) return;

  stmt->pairedType = ctx.with_accumulated_errors(types_, value);

  WorkerAction action;
  action.kind = WorkerActionKind::Send;
  action.peer = stmt->workerName;
  action.type = stmt->pairedType;
  action.range = stmt->get_range();
  action.node = stmt;
  ctx.workers->current_machine().actions.push_back(action);
}

}  // namespace flowsema
