// flowsema/sema/analysis/exit_legality.cpp - Exit statement legality

#include "flowsema/sema/analysis/exit_legality.hpp"

#include <cassert>
#include <string>

namespace flowsema
{

std::string_view to_string(ExitScopeKind kind) noexcept
{
  switch (kind) {
    case ExitScopeKind::Function:
      return "function";
    case ExitScopeKind::Loop:
      return "loop";
    case ExitScopeKind::Transaction:
      return "transaction";
  }
  return "";
}

std::string_view to_string(TransactionHandler handler) noexcept
{
  switch (handler) {
    case TransactionHandler::None:
      return "";
    case TransactionHandler::OnRetry:
      return "onretry";
    case TransactionHandler::Aborted:
      return "aborted";
    case TransactionHandler::Committed:
      return "committed";
  }
  return "";
}

// ============================================================================
// Scope Management
// ============================================================================

void ExitLegalityGuard::enter_function()
{
  scopes_.push_back(ExitScope{ExitScopeKind::Function, true});
}

void ExitLegalityGuard::leave_function() { pop(ExitScopeKind::Function); }

void ExitLegalityGuard::enter_loop()
{
  ++loopDepth_;
  scopes_.push_back(ExitScope{ExitScopeKind::Loop, true});
}

void ExitLegalityGuard::leave_loop()
{
  assert(loopDepth_ > 0 && "loop depth underflow");
  --loopDepth_;
  pop(ExitScopeKind::Loop);
}

bool ExitLegalityGuard::enter_transaction(SourceRange range)
{
  ++transactionDepth_;
  scopes_.push_back(ExitScope{ExitScopeKind::Transaction, false});
  if (transactionDepth_ > 1) {
    if (diags_) diags_->report(DiagCode::NestedTransactionsInvalid, range);
    return false;
  }
  return true;
}

void ExitLegalityGuard::leave_transaction()
{
  assert(transactionDepth_ > 0 && "transaction depth underflow");
  --transactionDepth_;
  pop(ExitScopeKind::Transaction);
}

bool ExitLegalityGuard::check_transaction_placement(
  SourceRange range, TransactionHandler handler)
{
  if (handler == TransactionHandler::None) return true;
  if (diags_) {
    diags_->report(DiagCode::TransactionInsideHandler, range, {std::string(to_string(handler))});
  }
  return false;
}

// ============================================================================
// Exit Checks
// ============================================================================

bool ExitLegalityGuard::check_break_or_continue(SourceRange range, std::string_view keyword)
{
  const ExitScope * scope = nearest(ExitScopeKind::Loop, ExitScopeKind::Transaction);
  if (scope && scope->exit_permitted) return true;

  if (diags_) {
    // A transaction between the statement and the loop takes precedence
    const DiagCode code = scope ? DiagCode::BreakContinueCrossesTransaction
                                : DiagCode::LoopExitOutsideLoop;
    diags_->report(code, range, {std::string(keyword)});
  }
  return false;
}

bool ExitLegalityGuard::check_return(SourceRange range)
{
  const ExitScope * scope = nearest(ExitScopeKind::Function, ExitScopeKind::Transaction);
  if (!scope || scope->exit_permitted) return true;

  if (diags_) diags_->report(DiagCode::ReturnCrossesTransaction, range);
  return false;
}

bool ExitLegalityGuard::check_abort_or_retry(SourceRange range, std::string_view keyword)
{
  if (transactionDepth_ > 0) return true;

  if (diags_) {
    diags_->report(DiagCode::AbortRetryOutsideTransaction, range, {std::string(keyword)});
  }
  return false;
}

// ============================================================================
// Helpers
// ============================================================================

const ExitScope * ExitLegalityGuard::nearest(ExitScopeKind a, ExitScopeKind b) const noexcept
{
  for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
    if (it->kind == a || it->kind == b) return &*it;
  }
  return nullptr;
}

void ExitLegalityGuard::pop(ExitScopeKind expected)
{
  assert(!scopes_.empty() && "exit scope stack underflow");
  assert(scopes_.back().kind == expected && "unbalanced exit scope");
  (void)expected;
  scopes_.pop_back();
}

}  // namespace flowsema
