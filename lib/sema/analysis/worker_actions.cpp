// flowsema/sema/analysis/worker_actions.cpp - Worker action machines and interaction validation

#include "flowsema/sema/analysis/worker_actions.hpp"

#include <algorithm>
#include <cassert>
#include <utility>

#include "flowsema/ast/ast.hpp"
#include "flowsema/sema/types/type_utils.hpp"

namespace flowsema
{

std::string to_string(const WorkerAction & action)
{
  switch (action.kind) {
    case WorkerActionKind::Send:
      return to_string(action.type) + " -> " + std::string(action.peer);
    case WorkerActionKind::SyncSend:
      return to_string(action.type) + " ->> " + std::string(action.peer);
    case WorkerActionKind::Receive:
      return "<- " + std::string(action.peer);
  }
  return "";
}

// ============================================================================
// WorkerMachine
// ============================================================================

bool WorkerMachine::has_send_to(std::string_view target) const noexcept
{
  return std::any_of(actions.begin(), actions.end(), [&](const WorkerAction & a) {
    return a.is_send() && (target.empty() || a.peer == target);
  });
}

void WorkerMachine::add_channel(const std::string & channel)
{
  if (std::find(channels.begin(), channels.end(), channel) == channels.end()) {
    channels.push_back(channel);
  }
}

// ============================================================================
// WorkerActionSystem
// ============================================================================

void WorkerActionSystem::declare_worker(std::string_view name)
{
  if (std::find(declared_.begin(), declared_.end(), name) == declared_.end()) {
    declared_.push_back(name);
  }
}

bool WorkerActionSystem::has_worker(std::string_view name) const
{
  if (name == k_default_worker) {
    return !open_.empty() && machines_[open_.back()].id != k_default_worker;
  }
  return std::find(declared_.begin(), declared_.end(), name) != declared_.end();
}

WorkerMachine & WorkerActionSystem::begin_machine(
  std::string_view id, SourceRange position, FunctionDecl * decl)
{
  WorkerMachine machine;
  machine.id = id;
  machine.position = position;
  machine.decl = decl;
  machines_.push_back(std::move(machine));
  open_.push_back(machines_.size() - 1);
  return machines_.back();
}

void WorkerActionSystem::end_machine()
{
  assert(!open_.empty() && "no open worker machine");
  open_.pop_back();
}

WorkerMachine & WorkerActionSystem::current_machine()
{
  assert(!open_.empty() && "no open worker machine");
  return machines_[open_.back()];
}

WorkerMachine * WorkerActionSystem::find(std::string_view id)
{
  for (auto & m : machines_) {
    if (m.id == id) return &m;
  }
  return nullptr;
}

bool WorkerActionSystem::has_errors() const noexcept
{
  return std::any_of(
    machines_.begin(), machines_.end(), [](const WorkerMachine & m) { return m.erroneous; });
}

bool WorkerActionSystem::has_actions() const noexcept
{
  return std::any_of(machines_.begin(), machines_.end(), [](const WorkerMachine & m) {
    return !m.actions.empty();
  });
}

// ============================================================================
// WorkerInteractionValidator
// ============================================================================

DiagnosticBag WorkerInteractionValidator::validate(WorkerActionSystem & system)
{
  DiagnosticBag diags;
  auto & machines = system.machines();
  if (machines.empty() || system.has_errors()) return diags;

  bool progress = true;
  while (progress) {
    progress = false;
    for (auto & sender : machines) {
      const WorkerAction * send = sender.current();
      if (!send || !send->is_send()) continue;

      WorkerMachine * receiver = system.find(send->peer);
      if (!receiver || receiver == &sender) continue;

      const WorkerAction * receive = receiver->current();
      if (!receive || receive->kind != WorkerActionKind::Receive) continue;
      if (receive->peer != sender.id) continue;

      pair(sender, *receiver, *send, *receive, diags);
      ++sender.cursor;
      ++receiver->cursor;
      progress = true;
    }
  }

  std::string pending;
  for (const auto & m : machines) {
    if (m.finished()) continue;
    if (!pending.empty()) pending += "; ";
    pending += std::string(m.id) + ": " + to_string(*m.current());
  }
  if (!pending.empty()) {
    diags.report(DiagCode::InvalidWorkerInteraction, machines.front().position, {pending});
  }
  return diags;
}

void WorkerInteractionValidator::pair(
  WorkerMachine & sender, WorkerMachine & receiver, const WorkerAction & send,
  const WorkerAction & receive, DiagnosticBag & diags)
{
  if (!is_assignable(receive.type, send.type)) {
    diags.report(
      DiagCode::IncompatibleTypes, receive.range, {to_string(receive.type), to_string(send.type)});
  }

  if (send.kind == WorkerActionKind::SyncSend) {
    // The sync send observes the receiver's error returns as its own result
    if (
      send.errorType && receive.errorType && !is_assignable(send.errorType, receive.errorType)) {
      diags.report(
        DiagCode::IncompatibleTypes, send.range,
        {to_string(send.errorType), to_string(receive.errorType)});
    }
    if (auto * node = dyn_cast<WorkerSyncSendExpr>(send.node)) {
      node->pairedType = receive.type;
    }
  }

  const std::string channel = std::string(sender.id) + "->" + std::string(receiver.id);
  sender.add_channel(channel);
  receiver.add_channel(channel);
}

}  // namespace flowsema
