// flowsema/sema/analysis/reachability.cpp - Statement reachability and mandatory return

#include "flowsema/sema/analysis/reachability.hpp"

#include <string>

#include "flowsema/sema/types/type_utils.hpp"

namespace flowsema
{

bool ReachabilityTracker::before_statement(SourceRange range)
{
  if (is_reachable()) {
    reported_ = false;
    return true;
  }

  if (!reported_) {
    if (diags_) diags_->report(DiagCode::UnreachableCode, range);
    reported_ = true;
  }
  return false;
}

void ReachabilityTracker::leave_block() noexcept
{
  terminated_ = false;
  if (!returns_) reported_ = false;
}

void ReachabilityTracker::restore(const Snapshot & s) noexcept
{
  returns_ = s.returns;
  terminated_ = s.terminated;
  reported_ = s.reported;
}

bool ReachabilityTracker::check_must_return(
  SourceRange range, const Type * return_type, InvokableKind kind)
{
  if (returns_ || return_type == nullptr || is_semantic_error(return_type)) return true;

  // An implicit `return;` yields nil
  if (return_type->is_nil()) return true;
  for (const Type * member : member_types(return_type)) {
    if (member->is_nil()) return true;
  }

  if (diags_) diags_->report(DiagCode::MustReturn, range, {std::string(to_string(kind))});
  return false;
}

}  // namespace flowsema
