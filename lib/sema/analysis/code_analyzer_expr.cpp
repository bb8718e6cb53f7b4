// flowsema/sema/analysis/code_analyzer_expr.cpp - Expression traversal and worker actions

#include <algorithm>
#include <cassert>
#include <optional>
#include <string>
#include <vector>

#include "flowsema/basic/casting.hpp"
#include "flowsema/sema/analysis/code_analyzer.hpp"
#include "flowsema/sema/symbol.hpp"
#include "flowsema/sema/types/type_utils.hpp"

namespace flowsema
{

namespace
{

/// Constant integer index: 3 or -1.
std::optional<int64_t> constant_index(const Expr * index)
{
  if (const auto * lit = dyn_cast<LiteralExpr>(index)) {
    if (lit->value.kind() == LiteralKind::Int) return lit->value.as_int();
    return std::nullopt;
  }
  if (const auto * un = dyn_cast<UnaryExpr>(index)) {
    if (un->op != UnaryOp::Neg) return std::nullopt;
    if (auto v = constant_index(un->operand)) return -*v;
  }
  return std::nullopt;
}

}  // namespace

void CodeAnalyzer::analyze_expr(Expr * expr, AnalysisContext & ctx, OperandPosition pos)
{
  if (!expr) return;

  switch (expr->kind) {
    case NodeKind::Literal:
      return;

    case NodeKind::VarRef: {
      const auto * ref = cast<VarRefExpr>(expr);
      check_access(ref->resolvedSymbol, ref->name, ref->get_range());
      return;
    }

    case NodeKind::FieldAccess:
      analyze_expr(cast<FieldAccessExpr>(expr)->base, ctx);
      return;

    case NodeKind::IndexAccess:
      analyze_index_access(cast<IndexAccessExpr>(expr), ctx);
      return;

    case NodeKind::Invocation:
      analyze_invocation(cast<InvocationExpr>(expr), ctx, pos);
      return;

    case NodeKind::NamedArg:
      analyze_expr(cast<NamedArgExpr>(expr)->value, ctx);
      return;

    case NodeKind::RecordLiteral:
      analyze_record_literal(cast<RecordLiteralExpr>(expr), ctx);
      return;

    case NodeKind::ListLiteral:
      for (Expr * element : cast<ListLiteralExpr>(expr)->elements) {
        analyze_expr(element, ctx);
      }
      return;

    case NodeKind::Binary: {
      auto * bin = cast<BinaryExpr>(expr);
      analyze_expr(bin->lhs, ctx);
      analyze_expr(bin->rhs, ctx);
      return;
    }

    case NodeKind::Unary:
      analyze_expr(cast<UnaryExpr>(expr)->operand, ctx);
      return;

    case NodeKind::Ternary: {
      auto * ternary = cast<TernaryExpr>(expr);
      analyze_expr(ternary->condition, ctx);
      analyze_expr(ternary->thenExpr, ctx);
      analyze_expr(ternary->elseExpr, ctx);
      return;
    }

    case NodeKind::TypeTest:
      analyze_type_test(cast<TypeTestExpr>(expr), ctx);
      return;

    case NodeKind::Check:
      analyze_check(cast<CheckExpr>(expr), ctx, pos);
      return;

    case NodeKind::Trap:
      // check/trap keep the operand position of what they wrap
      analyze_expr(cast<TrapExpr>(expr)->expr, ctx, pos);
      return;

    case NodeKind::Wait:
      analyze_expr(cast<WaitExpr>(expr)->expr, ctx);
      return;

    case NodeKind::Lambda:
      analyze_invokable(cast<LambdaExpr>(expr)->function);
      return;

    case NodeKind::WorkerSyncSend:
      analyze_sync_send(cast<WorkerSyncSendExpr>(expr), ctx, pos);
      return;

    case NodeKind::WorkerReceive:
      analyze_receive(cast<WorkerReceiveExpr>(expr), ctx, pos);
      return;

    case NodeKind::WorkerFlush:
      analyze_flush(cast<WorkerFlushExpr>(expr), ctx);
      return;

      // Every other kind is not an expression
#define AST_NODE(Class, Kind, Snake)
#define AST_NODE_EXPR(Class, Kind, Snake)
#define AST_NODE_STMT(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_DECL(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_SUPPORT(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_TOP(Class, Kind, Snake) case NodeKind::Kind:
#include "flowsema/ast/ast_nodes.def"
      break;
  }
  assert(false && "analyze_expr on a non-expression node");
}

// ============================================================================
// Misc. Expression Checks
// ============================================================================

void CodeAnalyzer::analyze_invocation(
  InvocationExpr * call, AnalysisContext & ctx, OperandPosition pos)
{
  if (call->isActionInvocation) {
    check_action_position("a remote action invocation", call->get_range(), pos, true);
  }

  analyze_expr(call->receiver, ctx);

  std::vector<std::string_view> named;
  for (Expr * arg : call->args) {
    if (const auto * na = dyn_cast<NamedArgExpr>(arg)) {
      if (std::find(named.begin(), named.end(), na->name) != named.end()) {
        diags_->report(DiagCode::DuplicateNamedArgs, na->get_range(), {std::string(na->name)});
      } else {
        named.push_back(na->name);
      }
    }
    analyze_expr(arg, ctx);
  }

  const Symbol * sym = call->resolvedSymbol;
  check_access(sym, call->name, call->get_range());
  if (sym && sym->is_deprecated()) {
    diags_->report(DiagCode::DeprecatedFunctionUsage, call->get_range(), {std::string(call->name)});
  }
}

void CodeAnalyzer::analyze_record_literal(RecordLiteralExpr * lit, AnalysisContext & ctx)
{
  const Type * type = lit->resolvedType;
  const bool is_map = type && type->kind == TypeKind::Map;

  std::vector<std::string_view> keys;
  for (RecordField * field : lit->fields) {
    std::optional<std::string_view> key;
    if (!field->key.empty()) {
      key = field->key;
    } else if (const auto * k = dyn_cast<LiteralExpr>(field->keyExpr)) {
      if (k->value.kind() == LiteralKind::String) key = k->value.as_string();
    }

    if (key) {
      if (std::find(keys.begin(), keys.end(), *key) != keys.end()) {
        diags_->report(
          DiagCode::DuplicateKeyInRecordLiteral, field->get_range(),
          {is_map ? "map" : "record", std::string(*key)});
      } else {
        keys.push_back(*key);
      }
    }

    analyze_expr(field->keyExpr, ctx);
    analyze_expr(field->value, ctx);
  }
}

void CodeAnalyzer::analyze_index_access(IndexAccessExpr * access, AnalysisContext & ctx)
{
  analyze_expr(access->base, ctx);
  analyze_expr(access->index, ctx);

  const Type * type = access->base ? access->base->resolvedType : nullptr;
  if (is_semantic_error(type) || !type->is_sealed_array()) return;

  const auto index = constant_index(access->index);
  if (index && (*index < 0 || *index >= type->size)) {
    diags_->report(
      DiagCode::ArrayIndexOutOfRange, get_range(access->index),
      {std::to_string(*index), std::to_string(type->size)});
  }
}

void CodeAnalyzer::analyze_type_test(TypeTestExpr * test, AnalysisContext & ctx)
{
  analyze_expr(test->expr, ctx);

  const Type * source = test->expr ? test->expr->resolvedType : nullptr;
  const Type * target = test->testedType;
  if (is_semantic_error(source) || is_semantic_error(target)) return;

  if (is_assignable(target, source)) {
    diags_->report(DiagCode::UnnecessaryCondition, test->get_range(), {to_string(target)});
  } else if (!types_intersect(source, target)) {
    diags_->report(
      DiagCode::IncompatibleTypeCheck, test->get_range(), {to_string(source), to_string(target)});
  }
}

void CodeAnalyzer::analyze_check(CheckExpr * check, AnalysisContext & ctx, OperandPosition pos)
{
  analyze_expr(check->expr, ctx, pos);

  // checkpanic never returns; package-level initialisers have no return type
  if (check->isPanic || !ctx.invokable) return;

  const Type * ret =
    ctx.invokable->returnType ? ctx.invokable->returnType : types_.nil_type();
  if (is_semantic_error(ret)) return;

  if (!has_error_member(ret)) {
    diags_->report(DiagCode::CheckedExprNoErrorReturn, check->get_range(), {to_string(ret)});
    return;
  }

  // A failing check returns the error from the enclosing body
  for (const Type * member : member_types(ret)) {
    if (member->is_error()) ctx.add_return_type(member);
  }
}

// ============================================================================
// Worker Actions
// ============================================================================

void CodeAnalyzer::analyze_sync_send(
  WorkerSyncSendExpr * send, AnalysisContext & ctx, OperandPosition pos)
{
  analyze_expr(send->expr, ctx);
  check_action_position("a worker sync send", send->get_range(), pos, false);

  const Type * value = send->expr ? send->expr->resolvedType : nullptr;
  if (is_semantic_error(value)) {
    ctx.workers->current_machine().erroneous = true;
    return;
  }
  check_sendable(send->expr);
  if (!check_worker_action(send->workerName, send->get_range(), true, ctx)) return;

  WorkerAction action;
  action.kind = WorkerActionKind::SyncSend;
  action.peer = send->workerName;
  action.type = value;
  action.errorType = send->resolvedType;
  action.range = send->get_range();
  action.node = send;
  ctx.workers->current_machine().actions.push_back(action);
}

void CodeAnalyzer::analyze_receive(
  WorkerReceiveExpr * receive, AnalysisContext & ctx, OperandPosition pos)
{
  check_action_position("a worker receive", receive->get_range(), pos, false);

  if (is_semantic_error(receive->resolvedType)) {
    ctx.workers->current_machine().erroneous = true;
    return;
  }
  if (!check_worker_action(receive->workerName, receive->get_range(), false, ctx)) return;

  receive->matchingSendsError = ctx.with_accumulated_errors(types_, types_.nil_type());

  WorkerAction action;
  action.kind = WorkerActionKind::Receive;
  action.peer = receive->workerName;
  action.type = receive->resolvedType;
  action.errorType = receive->matchingSendsError;
  action.range = receive->get_range();
  action.node = receive;
  ctx.workers->current_machine().actions.push_back(action);
}

void CodeAnalyzer::analyze_flush(WorkerFlushExpr * flush, AnalysisContext & ctx)
{
  const SourceRange range = flush->get_range();

  if (!flush->is_flush_all() && !ctx.workers->has_worker(flush->workerName)) {
    diags_->report(DiagCode::UndefinedWorker, range, {std::string(flush->workerName)});
    return;
  }

  if (!ctx.workers->current_machine().has_send_to(flush->workerName)) {
    const std::string reason =
      flush->is_flush_all()
        ? std::string("no worker send precedes it")
        : "no send to worker '" + std::string(flush->workerName) + "' precedes it";
    diags_->report(DiagCode::InvalidWorkerFlush, range, {reason});
  }
}

bool CodeAnalyzer::check_worker_action(
  std::string_view peer, SourceRange range, bool is_send, AnalysisContext & ctx)
{
  WorkerMachine & machine = ctx.workers->current_machine();

  if (!ctx.at_top_level()) {
    diags_->report(
      is_send ? DiagCode::InvalidWorkerSendPosition : DiagCode::InvalidWorkerReceivePosition,
      range);
    machine.erroneous = true;
    return false;
  }

  if (!ctx.workers->has_worker(peer)) {
    diags_->report(DiagCode::UndefinedWorker, range, {std::string(peer)});
    machine.erroneous = true;
    return false;
  }

  if (ctx.has_non_error_return()) {
    diags_->report(
      is_send ? DiagCode::WorkerSendAfterReturn : DiagCode::WorkerReceiveAfterReturn, range);
  }
  return true;
}

void CodeAnalyzer::check_sendable(const Expr * value)
{
  const Type * type = value ? value->resolvedType : nullptr;
  if (!is_semantic_error(type) && !is_anydata(type)) {
    diags_->report(DiagCode::InvalidTypeForSend, get_range(value), {to_string(type)});
  }
}

void CodeAnalyzer::check_action_position(
  std::string_view what, SourceRange range, OperandPosition pos, bool allow_return)
{
  if (pos == OperandPosition::Statement) return;
  if (allow_return && pos == OperandPosition::Return) return;
  diags_->report(DiagCode::InvalidActionInvocationAsExpr, range, {std::string(what)});
}

}  // namespace flowsema
