// flowsema/sema/analysis/match_analyzer.hpp - Match clause reachability and exhaustiveness
//
// Decides, for one match statement, which clauses can fire, which clause
// is the catch-all default and whether the clause set covers every member
// type of the scrutinee.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "flowsema/ast/ast.hpp"
#include "flowsema/basic/diagnostic.hpp"

namespace flowsema
{

struct Type;

// ============================================================================
// Coverage
// ============================================================================

/// How much of a member type one pattern matches. Ordered weakest first.
enum class PatternCoverage : uint8_t {
  None,      ///< no value of the type matches
  Partial,   ///< some values match (a literal, a fixed-length list)
  Indirect,  ///< the type contains values of the pattern's shape (any, json, anydata)
  Full,      ///< every value matches
};

// ============================================================================
// Clause Group
// ============================================================================

/**
 * Analysis record of one clause.
 */
struct MatchClauseInfo
{
  MatchClause * clause = nullptr;
  size_t index = 0;  ///< position in the match statement

  /// Member types this clause is the first full cover of
  std::vector<const Type *> matchedDirect;
  /// Member types containing values of the clause's shape
  std::vector<const Type *> matchedIndirect;
  /// Member types the pattern can match at all
  std::vector<const Type *> applicable;

  bool isLastPattern = false;
  bool reachable = true;

  /// Bare identifier pattern, or variable binding without guard.
  [[nodiscard]] bool is_default() const noexcept;
};

/**
 * Clauses of one match statement split by pattern style.
 * Both lists keep source order.
 */
struct MatchClauseGroup
{
  SourceRange range;  ///< the match statement
  std::vector<MatchClauseInfo> staticClauses;
  std::vector<MatchClauseInfo> structuredClauses;

  /**
   * Build the analysis records for every clause of `match`.
   *
   * @param match Match statement; its clause nodes are referenced, not copied
   * @return Group with `reachable` set and `isLastPattern` cleared on every
   *         record, ready for MatchPatternAnalyzer::analyze
   */
  static MatchClauseGroup from(const MatchStmt & match);

  /// Total number of clauses in both lists.
  [[nodiscard]] size_t size() const noexcept
  {
    return staticClauses.size() + structuredClauses.size();
  }
};

struct MatchAnalysisResult
{
  /// Every member type is covered by a clause or by the else type
  bool exhaustive = false;

  /// A single surviving clause covers every member type
  bool alwaysMatches = false;

  /// Member types reported as NoMatchingPattern
  std::vector<const Type *> uncovered;

  DiagnosticBag diagnostics;
};

// ============================================================================
// Match Pattern Analyzer
// ============================================================================

/**
 * Match pattern analysis for one match statement at a time.
 *
 * ## Algorithm
 * 1. Decompose the scrutinee type into member types.
 * 2. Compute the coverage of every clause over every member type; a
 *    clause that applies to none is UnmatchedPattern.
 * 3. Drop clauses subsumed by an earlier clause of the same group, then
 *    clauses whose every applicable type is already fully covered
 *    (UnreachableMatchPattern).
 * 4. Mark the last default clause of each group; two groups with a
 *    default give DuplicateDefaultPattern.
 * 5. Member types left uncovered (and not taken by the else type) give
 *    NoMatchingPattern.
 * 6. One surviving clause covering everything gives PatternAlwaysMatches.
 *
 * ## Usage
 * ```cpp
 * auto group = MatchClauseGroup::from(*match);
 * MatchAnalysisResult r = MatchPatternAnalyzer().analyze(match->expr->resolvedType, group);
 * ```
 */
class MatchPatternAnalyzer
{
public:
  /**
   * Analyse the clauses of one match statement.
   *
   * Diagnostics go to the returned result, not to a caller bag, so the
   * caller decides whether to merge them.
   *
   * @param scrutinee Resolved type of the matched expression; an error
   *                  type skips the analysis
   * @param group Clause records; `reachable` and `isLastPattern` are
   *              updated in place
   * @param else_type Type left to the implicit else branch, or nullptr
   * @return Exhaustiveness verdict, uncovered member types and diagnostics
   */
  [[nodiscard]] MatchAnalysisResult analyze(
    const Type * scrutinee, MatchClauseGroup & group, const Type * else_type = nullptr) const;

  /**
   * Coverage of `type` by a static pattern.
   *
   * @param pattern Literal, list, record or identifier pattern
   * @param type One member type of the scrutinee
   * @return Full for a bare identifier, Indirect for a shaped pattern over
   *         any/json/anydata, Partial for literals
   *
   * Example:
   * @code
   *   cover(b.int_lit(1), int_t);     // Partial
   *   cover(b.wildcard(), string_t);  // Full
   * @endcode
   */
  [[nodiscard]] static PatternCoverage cover(const Expr * pattern, const Type * type);

  /**
   * Coverage of `type` by a binding pattern with optional guard.
   *
   * A guard `v is T` on the bound variable narrows coverage to T; any
   * other guard caps the result at Partial.
   *
   * @param pattern Variable, tuple or record binding pattern
   * @param guard Clause guard, or nullptr
   * @param type One member type of the scrutinee
   */
  [[nodiscard]] static PatternCoverage cover(
    const BindingPattern * pattern, const Expr * guard, const Type * type);

  /**
   * Does every value matched by `later` also match `earlier`?
   *
   * @return true when `later` can never fire after `earlier`
   */
  [[nodiscard]] static bool subsumes(const Expr * earlier, const Expr * later);

  /**
   * Structured-clause subsumption: the binding of `earlier` subsumes that
   * of `later` and the guard of `earlier` accepts everything the guard of
   * `later` accepts. Guards compare by type identity for two `v is T`
   * tests and structurally otherwise.
   *
   * Example:
   * @code
   *   // var x if x > 0 => ..., var x if x > 0 => ...   -> true
   *   // var x if x > 0 => ..., var x if x > 1 => ...   -> false
   * @endcode
   */
  [[nodiscard]] static bool subsumes(
    const StructuredMatchClause & earlier, const StructuredMatchClause & later);
};

}  // namespace flowsema
