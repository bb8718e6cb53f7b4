// flowsema/sema/analysis/match_analyzer.cpp - Match clause reachability and exhaustiveness

#include "flowsema/sema/analysis/match_analyzer.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "flowsema/basic/casting.hpp"
#include "flowsema/sema/types/type.hpp"
#include "flowsema/sema/types/type_utils.hpp"

namespace flowsema
{

namespace
{

bool is_top_like(const Type * t)
{
  return t->kind == TypeKind::Any || t->kind == TypeKind::AnyData || t->kind == TypeKind::Json;
}

PatternCoverage weaken(PatternCoverage c) noexcept
{
  return c == PatternCoverage::Full ? PatternCoverage::Partial : c;
}

bool contains(const std::vector<const Type *> & types, const Type * t)
{
  return std::find(types.begin(), types.end(), t) != types.end();
}

/// Value of a literal pattern, including negated numeric literals.
std::optional<LiteralValue> literal_of(const Expr * e)
{
  if (const auto * lit = dyn_cast<LiteralExpr>(e)) {
    return lit->value;
  }
  if (const auto * un = dyn_cast<UnaryExpr>(e)) {
    const auto * lit = dyn_cast<LiteralExpr>(un->operand);
    if (!lit || un->op != UnaryOp::Neg) return std::nullopt;
    switch (lit->value.kind()) {
      case LiteralKind::Int:
        return LiteralValue::make_int(-lit->value.as_int());
      case LiteralKind::Float:
        return LiteralValue::make_float(-lit->value.as_float());
      case LiteralKind::Decimal:
        return LiteralValue::make_float(-lit->value.as_float(), true);
      default:
        return std::nullopt;
    }
  }
  return std::nullopt;
}

/// Key of a mapping pattern field: identifier or string literal.
std::optional<std::string_view> field_key(const RecordField * f)
{
  if (!f->key.empty()) return f->key;
  if (const auto * lit = dyn_cast<LiteralExpr>(f->keyExpr)) {
    if (lit->value.kind() == LiteralKind::String) return lit->value.as_string();
  }
  return std::nullopt;
}

PatternCoverage cover_literal(const LiteralValue & value, const Type * t)
{
  if (is_top_like(t)) return PatternCoverage::Indirect;
  if (!accepts_literal(t, value)) return PatternCoverage::None;

  if (t->is_nil()) return PatternCoverage::Full;
  if (t->kind == TypeKind::Finite && t->values.size() == 1) return PatternCoverage::Full;
  return PatternCoverage::Partial;
}

/// Every value of an enumerable type (boolean, finite), or nullopt.
std::optional<std::vector<LiteralValue>> enumerate_values(const Type * t)
{
  if (t->kind == TypeKind::Boolean) {
    return std::vector<LiteralValue>{LiteralValue::make_bool(true), LiteralValue::make_bool(false)};
  }
  if (t->kind == TypeKind::Finite) return t->values;
  return std::nullopt;
}

/// Field type a mapping pattern key reads from a record type (nullptr: key cannot exist).
const Type * record_field_type(const Type * record, std::string_view key, bool & declared)
{
  const TypeField * field = record->find_field(key);
  declared = field != nullptr;
  if (field) return field->type;
  return record->sealed ? nullptr : record->element;
}

PatternCoverage cover_binding(const BindingPattern * pattern, const Type * t);

template <typename Children, typename CoverFn>
PatternCoverage cover_sequence(const Children & children, const Type * t, CoverFn cover_child)
{
  if (is_top_like(t)) return PatternCoverage::Indirect;

  const size_t n = children.size();
  PatternCoverage acc = PatternCoverage::Full;
  if (t->kind == TypeKind::Tuple) {
    if (t->members.size() != n) return PatternCoverage::None;
    for (size_t i = 0; i < n; ++i) {
      acc = std::min(acc, cover_child(children[i], t->members[i]));
    }
    return acc;
  }
  if (t->kind == TypeKind::Array) {
    if (t->size >= 0 && static_cast<size_t>(t->size) != n) return PatternCoverage::None;
    for (size_t i = 0; i < n; ++i) {
      acc = std::min(acc, cover_child(children[i], t->element));
    }
    // An open array may have any length
    return t->size >= 0 ? acc : weaken(acc);
  }
  return PatternCoverage::None;
}

PatternCoverage cover_binding(const BindingPattern * pattern, const Type * t)
{
  if (is_semantic_error(t)) return PatternCoverage::Full;

  switch (pattern->kind) {
    case NodeKind::VarBinding:
      return PatternCoverage::Full;

    case NodeKind::TupleBinding:
      return cover_sequence(
        cast<TupleBindingPattern>(pattern)->members, t,
        [](const BindingPattern * p, const Type * m) { return cover_binding(p, m); });

    case NodeKind::RecordBinding: {
      const auto * rec = cast<RecordBindingPattern>(pattern);
      if (is_top_like(t)) return PatternCoverage::Indirect;

      PatternCoverage acc = PatternCoverage::Full;
      if (t->kind == TypeKind::Map) {
        for (const auto * f : rec->fields) {
          acc = std::min(acc, cover_binding(f->pattern, t->element));
        }
        return weaken(acc);
      }
      if (t->kind != TypeKind::Record) return PatternCoverage::None;

      for (const auto * f : rec->fields) {
        bool declared = false;
        const Type * ft = record_field_type(t, f->key, declared);
        if (!ft) return PatternCoverage::None;
        const PatternCoverage c = cover_binding(f->pattern, ft);
        acc = std::min(acc, declared ? c : weaken(c));
      }
      if (rec->isClosed) {
        for (const auto & tf : t->fields) {
          const bool bound = std::any_of(
            rec->fields.begin(), rec->fields.end(),
            [&](const RecordBindingField * f) { return f->key == tf.name; });
          if (!bound) return PatternCoverage::None;
        }
        if (!t->sealed) acc = weaken(acc);
      }
      return acc;
    }

    default:
      return PatternCoverage::None;
  }
}

PatternCoverage apply_guard(
  const BindingPattern * pattern, const Expr * guard, const Type * t, PatternCoverage c)
{
  if (!guard || c == PatternCoverage::None) return c;

  const auto * test = dyn_cast<TypeTestExpr>(guard);
  const auto * ref = test ? dyn_cast<VarRefExpr>(test->expr) : nullptr;
  const auto * var = dyn_cast<VarBindingPattern>(pattern);
  if (test && ref && var && ref->name == var->name && !is_semantic_error(test->testedType)) {
    if (is_assignable(test->testedType, t)) return c;
    if (types_intersect(test->testedType, t)) return std::min(c, PatternCoverage::Partial);
    return PatternCoverage::None;
  }
  return std::min(c, PatternCoverage::Partial);
}

bool binding_subsumes(const BindingPattern * earlier, const BindingPattern * later)
{
  if (isa<VarBindingPattern>(earlier)) return true;

  if (const auto * a = dyn_cast<TupleBindingPattern>(earlier)) {
    const auto * b = dyn_cast<TupleBindingPattern>(later);
    if (!b || a->members.size() != b->members.size()) return false;
    for (size_t i = 0; i < a->members.size(); ++i) {
      if (!binding_subsumes(a->members[i], b->members[i])) return false;
    }
    return true;
  }

  if (const auto * a = dyn_cast<RecordBindingPattern>(earlier)) {
    const auto * b = dyn_cast<RecordBindingPattern>(later);
    if (!b) return false;
    if (a->isClosed && (!b->isClosed || a->fields.size() != b->fields.size())) return false;
    for (const auto * af : a->fields) {
      const auto it = std::find_if(b->fields.begin(), b->fields.end(), [&](const auto * bf) {
        return bf->key == af->key;
      });
      if (it == b->fields.end() || !binding_subsumes(af->pattern, (*it)->pattern)) return false;
    }
    return true;
  }
  return false;
}

bool same_expr(const Expr * a, const Expr * b);

bool same_exprs(gsl::span<Expr *> a, gsl::span<Expr *> b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!same_expr(a[i], b[i])) return false;
  }
  return true;
}

/// Structural equality of two side-effect free expressions. Expressions that
/// may act (worker interactions, wait, check, trap, lambdas) never compare
/// equal.
bool same_expr(const Expr * a, const Expr * b)
{
  if (!a || !b) return a == b;
  if (a->kind != b->kind) return false;

  switch (a->kind) {
    case NodeKind::Literal:
      return cast<LiteralExpr>(a)->value == cast<LiteralExpr>(b)->value;
    case NodeKind::VarRef:
      return cast<VarRefExpr>(a)->name == cast<VarRefExpr>(b)->name;
    case NodeKind::FieldAccess: {
      const auto * x = cast<FieldAccessExpr>(a);
      const auto * y = cast<FieldAccessExpr>(b);
      return x->field == y->field && same_expr(x->base, y->base);
    }
    case NodeKind::IndexAccess: {
      const auto * x = cast<IndexAccessExpr>(a);
      const auto * y = cast<IndexAccessExpr>(b);
      return same_expr(x->base, y->base) && same_expr(x->index, y->index);
    }
    case NodeKind::Invocation: {
      const auto * x = cast<InvocationExpr>(a);
      const auto * y = cast<InvocationExpr>(b);
      return !x->isActionInvocation && !y->isActionInvocation && x->name == y->name &&
             x->resolvedSymbol == y->resolvedSymbol && same_expr(x->receiver, y->receiver) &&
             same_exprs(x->args, y->args);
    }
    case NodeKind::NamedArg: {
      const auto * x = cast<NamedArgExpr>(a);
      const auto * y = cast<NamedArgExpr>(b);
      return x->name == y->name && same_expr(x->value, y->value);
    }
    case NodeKind::RecordLiteral: {
      const auto * x = cast<RecordLiteralExpr>(a);
      const auto * y = cast<RecordLiteralExpr>(b);
      if (x->fields.size() != y->fields.size()) return false;
      for (size_t i = 0; i < x->fields.size(); ++i) {
        const RecordField * fx = x->fields[i];
        const RecordField * fy = y->fields[i];
        if (fx->key != fy->key || !same_expr(fx->keyExpr, fy->keyExpr) ||
            !same_expr(fx->value, fy->value)) {
          return false;
        }
      }
      return true;
    }
    case NodeKind::ListLiteral:
      return same_exprs(cast<ListLiteralExpr>(a)->elements, cast<ListLiteralExpr>(b)->elements);
    case NodeKind::Binary: {
      const auto * x = cast<BinaryExpr>(a);
      const auto * y = cast<BinaryExpr>(b);
      return x->op == y->op && same_expr(x->lhs, y->lhs) && same_expr(x->rhs, y->rhs);
    }
    case NodeKind::Unary: {
      const auto * x = cast<UnaryExpr>(a);
      const auto * y = cast<UnaryExpr>(b);
      return x->op == y->op && same_expr(x->operand, y->operand);
    }
    case NodeKind::Ternary: {
      const auto * x = cast<TernaryExpr>(a);
      const auto * y = cast<TernaryExpr>(b);
      return same_expr(x->condition, y->condition) && same_expr(x->thenExpr, y->thenExpr) &&
             same_expr(x->elseExpr, y->elseExpr);
    }
    case NodeKind::TypeTest: {
      const auto * x = cast<TypeTestExpr>(a);
      const auto * y = cast<TypeTestExpr>(b);
      return is_same_type(x->testedType, y->testedType) && same_expr(x->expr, y->expr);
    }
    default:
      return false;
  }
}

/// Guard of `earlier` accepts everything the guard of `later` accepts.
bool guard_subsumes(const Expr * earlier, const Expr * later)
{
  if (!earlier) return true;
  if (!later) return false;

  const auto * a = dyn_cast<TypeTestExpr>(earlier);
  const auto * b = dyn_cast<TypeTestExpr>(later);
  if (a && b) {
    const auto * ra = dyn_cast<VarRefExpr>(a->expr);
    const auto * rb = dyn_cast<VarRefExpr>(b->expr);
    return ra && rb && ra->name == rb->name && is_same_type(a->testedType, b->testedType);
  }
  return same_expr(earlier, later);
}

PatternCoverage clause_coverage(const MatchClauseInfo & info, const Type * t)
{
  if (const auto * s = dyn_cast<StaticMatchClause>(info.clause)) {
    return MatchPatternAnalyzer::cover(s->pattern, t);
  }
  const auto * s = cast<StructuredMatchClause>(info.clause);
  return MatchPatternAnalyzer::cover(s->pattern, s->guard, t);
}

bool clause_subsumes(const MatchClauseInfo & earlier, const MatchClauseInfo & later)
{
  const auto * a = dyn_cast<StaticMatchClause>(earlier.clause);
  const auto * b = dyn_cast<StaticMatchClause>(later.clause);
  if (a && b) return MatchPatternAnalyzer::subsumes(a->pattern, b->pattern);

  const auto * sa = dyn_cast<StructuredMatchClause>(earlier.clause);
  const auto * sb = dyn_cast<StructuredMatchClause>(later.clause);
  return sa && sb && MatchPatternAnalyzer::subsumes(*sa, *sb);
}

void drop_subsumed(std::vector<MatchClauseInfo> & clauses, DiagnosticBag & diags)
{
  for (size_t j = 0; j < clauses.size(); ++j) {
    if (!clauses[j].reachable) continue;
    for (size_t i = 0; i < j; ++i) {
      if (clauses[i].reachable && clause_subsumes(clauses[i], clauses[j])) {
        diags.report(DiagCode::UnreachableMatchPattern, clauses[j].clause->get_range());
        clauses[j].reachable = false;
        break;
      }
    }
  }
}

MatchClauseInfo * last_default(std::vector<MatchClauseInfo> & clauses)
{
  for (auto it = clauses.rbegin(); it != clauses.rend(); ++it) {
    if (it->reachable && it->is_default()) return &*it;
  }
  return nullptr;
}

SourceRange pattern_range(const MatchClause * clause)
{
  if (const auto * s = dyn_cast<StaticMatchClause>(clause)) return get_range(s->pattern);
  return get_range(cast<StructuredMatchClause>(clause)->pattern);
}

}  // namespace

// ============================================================================
// MatchClauseInfo / MatchClauseGroup
// ============================================================================

bool MatchClauseInfo::is_default() const noexcept
{
  if (const auto * s = dyn_cast<StaticMatchClause>(clause)) {
    return isa<VarRefExpr>(s->pattern);
  }
  const auto * s = cast<StructuredMatchClause>(clause);
  return isa<VarBindingPattern>(s->pattern) && s->guard == nullptr;
}

MatchClauseGroup MatchClauseGroup::from(const MatchStmt & match)
{
  MatchClauseGroup group;
  group.range = match.get_range();
  for (size_t i = 0; i < match.clauses.size(); ++i) {
    MatchClauseInfo info;
    info.clause = match.clauses[i];
    info.index = i;
    if (isa<StaticMatchClause>(info.clause)) {
      group.staticClauses.push_back(std::move(info));
    } else {
      group.structuredClauses.push_back(std::move(info));
    }
  }
  return group;
}

// ============================================================================
// Coverage and Subsumption
// ============================================================================

PatternCoverage MatchPatternAnalyzer::cover(const Expr * pattern, const Type * type)
{
  if (is_semantic_error(type)) return PatternCoverage::Full;

  if (isa<VarRefExpr>(pattern)) return PatternCoverage::Full;

  if (auto value = literal_of(pattern)) return cover_literal(*value, type);

  if (const auto * list = dyn_cast<ListLiteralExpr>(pattern)) {
    return cover_sequence(list->elements, type, [](const Expr * p, const Type * m) {
      return MatchPatternAnalyzer::cover(p, m);
    });
  }

  if (const auto * rec = dyn_cast<RecordLiteralExpr>(pattern)) {
    if (is_top_like(type)) return PatternCoverage::Indirect;

    PatternCoverage acc = PatternCoverage::Full;
    if (type->kind == TypeKind::Map) {
      for (const auto * f : rec->fields) {
        acc = std::min(acc, cover(f->value, type->element));
      }
      return weaken(acc);
    }
    if (type->kind != TypeKind::Record) return PatternCoverage::None;

    for (const auto * f : rec->fields) {
      const auto key = field_key(f);
      if (!key) {
        acc = std::min(acc, PatternCoverage::Partial);
        continue;
      }
      bool declared = false;
      const Type * ft = record_field_type(type, *key, declared);
      if (!ft) return PatternCoverage::None;
      const PatternCoverage c = cover(f->value, ft);
      acc = std::min(acc, declared ? c : weaken(c));
    }
    return acc;
  }

  // Constant expression: matches one value of its own type
  if (is_semantic_error(pattern->resolvedType)) return PatternCoverage::Partial;
  return types_intersect(type, pattern->resolvedType) ? PatternCoverage::Partial
                                                      : PatternCoverage::None;
}

PatternCoverage MatchPatternAnalyzer::cover(
  const BindingPattern * pattern, const Expr * guard, const Type * type)
{
  return apply_guard(pattern, guard, type, cover_binding(pattern, type));
}

bool MatchPatternAnalyzer::subsumes(const Expr * earlier, const Expr * later)
{
  if (isa<VarRefExpr>(earlier)) return true;

  const auto a = literal_of(earlier);
  const auto b = literal_of(later);
  if (a || b) return a && b && *a == *b;

  if (const auto * la = dyn_cast<ListLiteralExpr>(earlier)) {
    const auto * lb = dyn_cast<ListLiteralExpr>(later);
    if (!lb || la->elements.size() != lb->elements.size()) return false;
    for (size_t i = 0; i < la->elements.size(); ++i) {
      if (!subsumes(la->elements[i], lb->elements[i])) return false;
    }
    return true;
  }

  if (const auto * ra = dyn_cast<RecordLiteralExpr>(earlier)) {
    const auto * rb = dyn_cast<RecordLiteralExpr>(later);
    if (!rb) return false;
    for (const auto * fa : ra->fields) {
      const auto key = field_key(fa);
      if (!key) return false;
      const auto it = std::find_if(rb->fields.begin(), rb->fields.end(), [&](const auto * fb) {
        return field_key(fb) == key;
      });
      if (it == rb->fields.end() || !subsumes(fa->value, (*it)->value)) return false;
    }
    return true;
  }
  return false;
}

bool MatchPatternAnalyzer::subsumes(
  const StructuredMatchClause & earlier, const StructuredMatchClause & later)
{
  return binding_subsumes(earlier.pattern, later.pattern) &&
         guard_subsumes(earlier.guard, later.guard);
}

// ============================================================================
// Analysis
// ============================================================================

MatchAnalysisResult MatchPatternAnalyzer::analyze(
  const Type * scrutinee, MatchClauseGroup & group, const Type * else_type) const
{
  MatchAnalysisResult result;
  auto & diags = result.diagnostics;

  std::vector<MatchClauseInfo *> ordered;
  for (auto & c : group.staticClauses) ordered.push_back(&c);
  for (auto & c : group.structuredClauses) ordered.push_back(&c);
  std::sort(ordered.begin(), ordered.end(), [](const auto * a, const auto * b) {
    return a->index < b->index;
  });
  for (auto * c : ordered) {
    c->matchedDirect.clear();
    c->matchedIndirect.clear();
    c->applicable.clear();
    c->isLastPattern = false;
    c->reachable = true;
  }

  // Already reported upstream
  if (is_semantic_error(scrutinee)) return result;

  const std::vector<const Type *> members = member_types(scrutinee);

  std::vector<std::vector<PatternCoverage>> coverage(ordered.size());
  for (size_t i = 0; i < ordered.size(); ++i) {
    for (const Type * m : members) {
      const PatternCoverage c = clause_coverage(*ordered[i], m);
      coverage[i].push_back(c);
      if (c != PatternCoverage::None) ordered[i]->applicable.push_back(m);
    }
    if (ordered[i]->applicable.empty()) {
      diags.report(
        DiagCode::UnmatchedPattern, pattern_range(ordered[i]->clause), {to_string(scrutinee)});
      ordered[i]->reachable = false;
    }
  }

  drop_subsumed(group.staticClauses, diags);
  drop_subsumed(group.structuredClauses, diags);

  MatchClauseInfo * static_default = last_default(group.staticClauses);
  MatchClauseInfo * structured_default = last_default(group.structuredClauses);
  if (static_default && structured_default) {
    MatchClauseInfo * later =
      static_default->index > structured_default->index ? static_default : structured_default;
    diags.report(DiagCode::DuplicateDefaultPattern, later->clause->get_range());
    later->reachable = false;
  }

  // Walk the survivors in source order, handing each member type to its
  // first full cover
  std::vector<const Type *> covered;
  std::vector<std::vector<LiteralValue>> seen_values(members.size());
  for (size_t i = 0; i < ordered.size(); ++i) {
    MatchClauseInfo & info = *ordered[i];
    if (!info.reachable) continue;

    const bool adds_cases = std::any_of(
      info.applicable.begin(), info.applicable.end(),
      [&](const Type * m) { return !contains(covered, m); });
    if (!adds_cases) {
      diags.report(DiagCode::UnreachableMatchPattern, info.clause->get_range());
      info.reachable = false;
      continue;
    }

    for (size_t k = 0; k < members.size(); ++k) {
      const Type * m = members[k];
      if (contains(covered, m)) continue;

      switch (coverage[i][k]) {
        case PatternCoverage::Full:
          info.matchedDirect.push_back(m);
          covered.push_back(m);
          break;
        case PatternCoverage::Indirect:
          info.matchedIndirect.push_back(m);
          break;
        case PatternCoverage::Partial: {
          // Literal clauses together may enumerate a boolean or finite type
          const auto * s = dyn_cast<StaticMatchClause>(info.clause);
          const auto value = s ? literal_of(s->pattern) : std::nullopt;
          const auto all = enumerate_values(m);
          if (!value || !all) break;
          auto & seen = seen_values[k];
          if (std::find(seen.begin(), seen.end(), *value) == seen.end()) seen.push_back(*value);
          const bool complete = std::all_of(all->begin(), all->end(), [&](const LiteralValue & v) {
            return std::find(seen.begin(), seen.end(), v) != seen.end();
          });
          if (complete) {
            info.matchedDirect.push_back(m);
            covered.push_back(m);
          }
          break;
        }
        case PatternCoverage::None:
          break;
      }
    }
  }

  if (MatchClauseInfo * d = last_default(group.staticClauses)) d->isLastPattern = true;
  if (MatchClauseInfo * d = last_default(group.structuredClauses)) d->isLastPattern = true;

  result.exhaustive = true;
  for (const Type * m : members) {
    if (contains(covered, m)) continue;
    if (else_type && is_assignable(else_type, m)) continue;
    result.exhaustive = false;

    const bool indirect = std::any_of(ordered.begin(), ordered.end(), [&](const auto * c) {
      return c->reachable && contains(c->matchedIndirect, m);
    });
    if (indirect) continue;

    diags.report(DiagCode::NoMatchingPattern, group.range, {to_string(m)});
    result.uncovered.push_back(m);
  }

  std::vector<MatchClauseInfo *> survivors;
  std::copy_if(ordered.begin(), ordered.end(), std::back_inserter(survivors), [](const auto * c) {
    return c->reachable;
  });
  if (
    survivors.size() == 1 && !members.empty() &&
    survivors.front()->matchedDirect.size() == members.size()) {
    diags.report(DiagCode::PatternAlwaysMatches, survivors.front()->clause->get_range());
    result.alwaysMatches = true;
  }

  return result;
}

}  // namespace flowsema
