// flowsema/sema/analysis/analysis_context.hpp - Traversal state of one invokable body
//
// One AnalysisContext exists per function, lambda or worker body being
// analysed. It is threaded by reference through the recursive traversal
// and dies with the body; nested bodies get a fresh one.
//
#pragma once

#include <cstdint>
#include <vector>

#include "flowsema/ast/ast_enums.hpp"
#include "flowsema/sema/analysis/exit_legality.hpp"
#include "flowsema/sema/analysis/reachability.hpp"
#include "flowsema/sema/analysis/worker_actions.hpp"

namespace flowsema
{

class FunctionDecl;
class TypeContext;
struct Type;

/**
 * Per-body traversal state: exit scopes, reachability, accumulated return
 * types and the worker machines the body records its actions into.
 *
 * Example:
 * @code
 *   WorkerActionSystem system;
 *   AnalysisContext ctx(&diags, fn, fn->invokable, &system);
 *   ctx.exits.enter_function();
 *   // ... analyse fn->body with ctx ...
 *   ctx.exits.leave_function();
 * @endcode
 */
struct AnalysisContext
{
  /**
   * @param diags Sink shared by the exit guard and the reachability
   *              tracker (nullptr for silent mode)
   * @param fn Invokable whose body is analysed (nullptr at package level)
   * @param kind Function, lambda or worker; selects MustReturn wording
   * @param system Worker machines of the enclosing invokable, or nullptr
   *               where worker actions are not legal
   */
  AnalysisContext(
    DiagnosticBag * diags, FunctionDecl * fn, InvokableKind kind, WorkerActionSystem * system)
  : exits(diags), reachability(diags), invokable(fn), invokableKind(kind), workers(system)
  {
  }

  AnalysisContext(const AnalysisContext &) = delete;
  AnalysisContext & operator=(const AnalysisContext &) = delete;

  ExitLegalityGuard exits;
  ReachabilityTracker reachability;

  /// Types this body may have returned so far, flattened, first-seen order
  std::vector<const Type *> accumulatedReturnTypes;

  FunctionDecl * invokable = nullptr;  ///< null at package level
  InvokableKind invokableKind = InvokableKind::Function;

  /// Machines of the enclosing invokable (shared with its worker bodies)
  WorkerActionSystem * workers = nullptr;

  /// Blocks entered inside this body; 1 for the body's top-level statements
  uint32_t blockDepth = 0;

  /// Handler body of a transaction the traversal is in
  TransactionHandler handler = TransactionHandler::None;

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] uint32_t loop_depth() const noexcept { return exits.loop_depth(); }
  [[nodiscard]] uint32_t transaction_depth() const noexcept { return exits.transaction_depth(); }
  [[nodiscard]] bool statement_reachable() const noexcept { return reachability.is_reachable(); }
  [[nodiscard]] bool in_worker() const noexcept { return invokableKind == InvokableKind::Worker; }

  /// Statement directly in the body, outside any nested block or handler?
  [[nodiscard]] bool at_top_level() const noexcept
  {
    return blockDepth == 1 && handler == TransactionHandler::None;
  }

  // ===========================================================================
  // Return Types
  // ===========================================================================

  /**
   * Record a possible return of `type`.
   *
   * Union members are added one by one, duplicates are skipped and an
   * error sentinel type is ignored.
   *
   * @param type Type of the returned value, of a `check` operand's error
   *             part, or of a failing worker action
   */
  void add_return_type(const Type * type);

  /// Has a non-error value possibly been returned already?
  [[nodiscard]] bool has_non_error_return() const;

  /// Error members of the accumulated return types, first-seen order.
  [[nodiscard]] std::vector<const Type *> accumulated_errors() const;

  /**
   * Union of the accumulated error members and `type`.
   *
   * @param types Interning context for the resulting union
   * @param type Value type to append (nullptr appends nothing)
   * @return `type` itself when no error has been accumulated
   *
   * Example:
   * @code
   *   ctx.add_return_type(err_t);
   *   ctx.with_accumulated_errors(types, int_t);  // error|int
   * @endcode
   */
  [[nodiscard]] const Type * with_accumulated_errors(TypeContext & types, const Type * type) const;
};

}  // namespace flowsema
