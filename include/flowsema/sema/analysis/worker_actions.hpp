// flowsema/sema/analysis/worker_actions.hpp - Worker action machines and interaction validation
//
// Every worker body of one invokable (the implicit default worker, named
// workers and fork-join workers) is recorded as a sequence of send and
// receive actions. WorkerInteractionValidator then pairs sends with
// receives in a deterministic fixpoint and reports protocols that can
// never complete.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "flowsema/basic/diagnostic.hpp"

namespace flowsema
{

class AstNode;
class FunctionDecl;
struct Type;

/// Name of the implicit worker formed by the invokable's own body.
inline constexpr std::string_view k_default_worker = "default";

// ============================================================================
// Actions
// ============================================================================

enum class WorkerActionKind : uint8_t {
  Send,      ///< expr -> w
  SyncSend,  ///< expr ->> w
  Receive,   ///< <- w
};

/**
 * One send or receive in program order.
 *
 * `peer` is the target of a send and the source of a receive. `type` is
 * the transmitted type: for Send it already includes the error returns
 * accumulated at the send site, for Receive it is the expected type.
 * `errorType` is the error union the action can observe: the sync send's
 * own result type, or the receive's matching-sends error (errors | nil).
 */
struct WorkerAction
{
  WorkerActionKind kind = WorkerActionKind::Send;
  std::string_view peer;
  const Type * type = nullptr;
  const Type * errorType = nullptr;
  SourceRange range;

  /// Node receiving back-annotations on pairing
  AstNode * node = nullptr;

  [[nodiscard]] bool is_send() const noexcept { return kind != WorkerActionKind::Receive; }
};

/// Rendering used in diagnostics: "int -> w2", "int ->> w2", "<- w1".
[[nodiscard]] std::string to_string(const WorkerAction & action);

// ============================================================================
// Machines
// ============================================================================

/// Action sequence of one worker body with a cursor over it.
struct WorkerMachine
{
  std::string_view id;
  SourceRange position;
  FunctionDecl * decl = nullptr;  ///< body owning the machine

  std::vector<WorkerAction> actions;
  size_t cursor = 0;

  /// An action was rejected; the system skips pairing
  bool erroneous = false;

  /// Channels "from->to" this machine took part in, first-pairing order
  std::vector<std::string> channels;

  [[nodiscard]] bool finished() const noexcept { return cursor >= actions.size(); }
  [[nodiscard]] const WorkerAction * current() const noexcept
  {
    return finished() ? nullptr : &actions[cursor];
  }

  /// Any send recorded so far to `target` (or to anyone, when empty)?
  [[nodiscard]] bool has_send_to(std::string_view target) const noexcept;

  void add_channel(const std::string & channel);
};

/**
 * Machines of one enclosing invokable.
 *
 * Machines are kept in declaration order; the default worker is always
 * first. Bodies nest during traversal (a named worker is visited while
 * the default worker is still open), so open machines form a stack.
 */
class WorkerActionSystem
{
public:
  /// Register a worker name declared in the invokable (pre-scan).
  void declare_worker(std::string_view name);

  /**
   * Is `name` a valid peer from the machine currently open?
   * "default" names the enclosing body and is valid from named workers.
   */
  [[nodiscard]] bool has_worker(std::string_view name) const;

  /// Open a machine for a body entered by the traversal.
  WorkerMachine & begin_machine(std::string_view id, SourceRange position, FunctionDecl * decl);

  /// Close the innermost open machine.
  void end_machine();

  [[nodiscard]] WorkerMachine & current_machine();
  [[nodiscard]] bool has_open_machine() const noexcept { return !open_.empty(); }

  [[nodiscard]] WorkerMachine * find(std::string_view id);

  [[nodiscard]] std::vector<WorkerMachine> & machines() noexcept { return machines_; }
  [[nodiscard]] const std::vector<WorkerMachine> & machines() const noexcept { return machines_; }

  /// Did any machine record a rejected action?
  [[nodiscard]] bool has_errors() const noexcept;

  /// Any machine with at least one action?
  [[nodiscard]] bool has_actions() const noexcept;

private:
  std::vector<WorkerMachine> machines_;
  std::vector<size_t> open_;
  std::vector<std::string_view> declared_;
};

// ============================================================================
// Validation
// ============================================================================

/**
 * Pairs sends with receives across the machines of one system.
 *
 * ## Algorithm
 * 1. Scan the unfinished machines in declaration order; a machine whose
 *    current action is a send to T pairs with T when T's current action
 *    is a receive from it. Types are checked, cursors advance and the
 *    channel is recorded on both machines.
 * 2. Repeat until a scan makes no progress.
 * 3. Unfinished machines left over mean the protocol can never complete:
 *    one InvalidWorkerInteraction at the first-declared machine.
 *
 * A system containing an erroneous machine is not simulated.
 */
class WorkerInteractionValidator
{
public:
  /**
   * @param system Consumed: cursors, channels and back-annotations are updated
   * @return Diagnostics of the simulation, in the order found
   */
  [[nodiscard]] static DiagnosticBag validate(WorkerActionSystem & system);

private:
  static void pair(
    WorkerMachine & sender, WorkerMachine & receiver, const WorkerAction & send,
    const WorkerAction & receive, DiagnosticBag & diags);
};

}  // namespace flowsema
