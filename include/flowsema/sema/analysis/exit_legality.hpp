// flowsema/sema/analysis/exit_legality.hpp - Legality of break/continue/return/abort/retry
//
// Tracks the lexical boundaries (function body, loop, transaction) around
// the statement being analysed and decides whether an exit statement may
// cross them. Usable on its own, without a full traversal.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "flowsema/basic/diagnostic.hpp"

namespace flowsema
{

// ============================================================================
// Exit Scopes
// ============================================================================

enum class ExitScopeKind : uint8_t {
  Function,
  Loop,
  Transaction,
};

[[nodiscard]] std::string_view to_string(ExitScopeKind kind) noexcept;

/**
 * One lexical boundary on the exit-legality stack.
 *
 * `exit_permitted` answers "may the exit statement this scope governs leave
 * through here": a Function scope permits `return`, a Loop scope permits
 * `break`/`continue`, a Transaction scope permits neither.
 */
struct ExitScope
{
  ExitScopeKind kind = ExitScopeKind::Function;
  bool exit_permitted = true;
};

/// Handler body of a transaction the traversal is currently inside.
enum class TransactionHandler : uint8_t {
  None,
  OnRetry,
  Aborted,
  Committed,
};

/// Keyword of the handler: "onretry", "aborted", "committed".
[[nodiscard]] std::string_view to_string(TransactionHandler handler) noexcept;

// ============================================================================
// Exit-Legality Guard
// ============================================================================

/**
 * Exit-legality checker for one invokable body.
 *
 * ## Usage
 * ```cpp
 * ExitLegalityGuard guard(&diags);
 * guard.enter_function();
 * guard.enter_transaction(tx->get_range());
 * guard.check_break_or_continue(brk->get_range(), "break");  // crosses the transaction
 * guard.leave_transaction();
 * guard.leave_function();
 * ```
 */
class ExitLegalityGuard
{
public:
  /**
   * @param diags DiagnosticBag for error reporting (nullptr for silent mode)
   */
  explicit ExitLegalityGuard(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  // ===========================================================================
  // Scope Management
  // ===========================================================================

  /// Push a scope that permits `return`. One per invokable body.
  void enter_function();
  void leave_function();

  /// Push a scope that permits `break` and `continue`.
  void enter_loop();
  void leave_loop();

  /**
   * Open a transaction scope.
   *
   * The scope blocks `break`, `continue` and `return` from reaching any
   * enclosing loop or function scope.
   *
   * @param range Range of the transaction statement, used for the report
   * @return false when another transaction is already open; the
   *         NestedTransactionsInvalid error has then been reported at
   *         `range`, but the scope is still pushed so the body can be
   *         analysed
   */
  bool enter_transaction(SourceRange range);
  void leave_transaction();

  /**
   * Reject a transaction written directly inside a handler body of
   * another transaction.
   *
   * @return false if TransactionInsideHandler was reported
   */
  bool check_transaction_placement(SourceRange range, TransactionHandler handler);

  // ===========================================================================
  // Exit Checks
  // ===========================================================================

  /**
   * Check a `break` or `continue` against the nearest loop or transaction
   * scope.
   *
   * @param range Range of the statement
   * @param keyword "break" or "continue", passed as the diagnostic argument
   * @return true if legal; otherwise BreakContinueCrossesTransaction when a
   *         transaction is nearer than any loop, else LoopExitOutsideLoop
   *
   * Example:
   * @code
   *   guard.enter_transaction(tx);
   *   guard.enter_loop();
   *   guard.check_break_or_continue(r, "break");  // true: the loop is nearer
   *   guard.leave_loop();
   *   guard.check_break_or_continue(r, "break");  // false: crosses the transaction
   * @endcode
   */
  bool check_break_or_continue(SourceRange range, std::string_view keyword);

  /**
   * Check a `return` against the nearest function or transaction scope.
   *
   * @return false (ReturnCrossesTransaction reported) when a transaction
   *         is nearer than the function body
   */
  bool check_return(SourceRange range);

  /**
   * Check an `abort` or `retry`.
   *
   * @param keyword "abort" or "retry", passed as the diagnostic argument
   * @return false (AbortRetryOutsideTransaction reported) when no
   *         transaction is open; handler bodies are outside their
   *         transaction
   */
  bool check_abort_or_retry(SourceRange range, std::string_view keyword);

  // ===========================================================================
  // State
  // ===========================================================================

  [[nodiscard]] uint32_t loop_depth() const noexcept { return loopDepth_; }
  [[nodiscard]] uint32_t transaction_depth() const noexcept { return transactionDepth_; }
  [[nodiscard]] const std::vector<ExitScope> & scopes() const noexcept { return scopes_; }

private:
  /// Innermost scope of kind `a` or `b`, or nullptr.
  [[nodiscard]] const ExitScope * nearest(ExitScopeKind a, ExitScopeKind b) const noexcept;

  void pop(ExitScopeKind expected);

  DiagnosticBag * diags_;
  std::vector<ExitScope> scopes_;
  uint32_t loopDepth_ = 0;
  uint32_t transactionDepth_ = 0;
};

}  // namespace flowsema
