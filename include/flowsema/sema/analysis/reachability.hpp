// flowsema/sema/analysis/reachability.hpp - Statement reachability and mandatory return
//
// Tracks, for one invokable body, whether the statement about to be
// analysed can execute and whether the body is guaranteed to return.
//
#pragma once

#include "flowsema/ast/ast_enums.hpp"
#include "flowsema/basic/diagnostic.hpp"

namespace flowsema
{

struct Type;

/**
 * Reachability state of one invokable body.
 *
 * Two flags make a statement unreachable:
 * - `returns`: every path so far ended in `return` or `panic`
 * - `terminated`: the enclosing block was left by `break`, `continue`,
 *   `abort`, `retry` or `forever`; cleared when that block ends
 *
 * Only the first statement of an unreachable run is reported.
 *
 * Branching constructs save a Snapshot before each branch, restore it
 * afterwards and combine the branch results with set_returns().
 */
class ReachabilityTracker
{
public:
  struct Snapshot
  {
    bool returns = false;
    bool terminated = false;
    bool reported = false;
  };

  /**
   * @param diags DiagnosticBag for error reporting (nullptr for silent mode)
   */
  explicit ReachabilityTracker(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /**
   * Called before each statement.
   *
   * @return true if the statement can execute; otherwise UnreachableCode
   *         is reported unless it already was for this run
   */
  bool before_statement(SourceRange range);

  /// `return` or `panic`: nothing after this point executes, and the body returned.
  void mark_returned() noexcept { returns_ = true; }

  /// Control leaves the enclosing block without returning.
  void mark_terminated() noexcept { terminated_ = true; }

  /// End of a block: a `break`/`continue` inside it no longer hides siblings.
  void leave_block() noexcept;

  [[nodiscard]] bool returns() const noexcept { return returns_; }
  void set_returns(bool value) noexcept { returns_ = value; }

  [[nodiscard]] bool is_reachable() const noexcept { return !returns_ && !terminated_; }

  [[nodiscard]] Snapshot snapshot() const noexcept { return {returns_, terminated_, reported_}; }
  void restore(const Snapshot & s) noexcept;

  /**
   * End of an invokable body: report MustReturn when the return type
   * cannot hold nil and the body does not definitely return.
   *
   * @param range Position of the invokable
   * @param return_type Declared return type (nullptr means nil)
   * @param kind Used in the message ("this function must return a result")
   * @return true if no diagnostic was raised
   */
  bool check_must_return(SourceRange range, const Type * return_type, InvokableKind kind);

private:
  DiagnosticBag * diags_;
  bool returns_ = false;
  bool terminated_ = false;
  bool reported_ = false;
};

}  // namespace flowsema
