// flowsema/sema/analysis/analysis_context.cpp - Traversal state of one invokable body

#include "flowsema/sema/analysis/analysis_context.hpp"

#include <algorithm>

#include "flowsema/sema/types/type.hpp"
#include "flowsema/sema/types/type_utils.hpp"

namespace flowsema
{

void AnalysisContext::add_return_type(const Type * type)
{
  if (is_semantic_error(type)) return;
  for (const Type * member : member_types(type)) {
    auto & seen = accumulatedReturnTypes;
    if (std::find(seen.begin(), seen.end(), member) == seen.end()) {
      seen.push_back(member);
    }
  }
}

bool AnalysisContext::has_non_error_return() const
{
  return std::any_of(
    accumulatedReturnTypes.begin(), accumulatedReturnTypes.end(),
    [](const Type * t) { return !t->is_error(); });
}

std::vector<const Type *> AnalysisContext::accumulated_errors() const
{
  std::vector<const Type *> out;
  for (const Type * t : accumulatedReturnTypes) {
    if (t->is_error()) out.push_back(t);
  }
  return out;
}

const Type * AnalysisContext::with_accumulated_errors(TypeContext & types, const Type * type) const
{
  std::vector<const Type *> members = accumulated_errors();
  if (members.empty()) return type;
  if (type) members.push_back(type);
  return types.get_union_type(members);
}

}  // namespace flowsema
