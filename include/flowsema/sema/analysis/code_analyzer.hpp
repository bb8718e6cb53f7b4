// flowsema/sema/analysis/code_analyzer.hpp - Post-type-check semantic validation pass
//
// Walks a typed compilation unit once and enforces reachability,
// exit legality, worker interaction protocols, match pattern rules and
// the visibility/misc checks that need no type inference.
//
// Runs after type checking; the tree is only annotated, never restructured.
//
#pragma once

#include <cstdint>
#include <string_view>

#include "flowsema/ast/ast.hpp"
#include "flowsema/ast/ast_context.hpp"
#include "flowsema/basic/diagnostic.hpp"
#include "flowsema/sema/analysis/analysis_context.hpp"
#include "flowsema/sema/types/type.hpp"

namespace flowsema
{

/**
 * The semantic validation pass.
 *
 * One recursive function per node category switches over NodeKind.
 * Everything a check needs to know about ancestors travels down as an
 * AnalysisContext (per invokable body) or as a parameter; the AST has no
 * parent links.
 *
 * Back-annotations written to the tree:
 * - WorkerSendStmt::pairedType, WorkerSyncSendExpr::pairedType,
 *   WorkerReceiveExpr::matchingSendsError
 * - FunctionDecl::channels
 * - MatchClause::isLastPattern / isReachable
 *
 * ## Usage
 * ```cpp
 * CodeAnalyzer analyzer(ast, types, &diags);
 * bool ok = analyzer.analyze(*unit);
 * ```
 */
class CodeAnalyzer
{
public:
  /**
   * @param ast Arena of the unit (channel lists are allocated here)
   * @param types Type context (worker union types are created here)
   * @param diags DiagnosticBag for error reporting (nullptr for silent mode)
   */
  CodeAnalyzer(AstContext & ast, TypeContext & types, DiagnosticBag * diags = nullptr);

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Analyse every declaration of `unit` in source order.
   *
   * @return true if no error-severity diagnostic was raised by this run
   */
  bool analyze(CompilationUnit & unit);

private:
  /// Where an expression sits relative to its statement.
  enum class OperandPosition : uint8_t {
    Nested,     ///< inside a larger expression
    Statement,  ///< direct operand of a definition, assignment or expression statement
    Return,     ///< direct operand of a return statement
  };

  // ===========================================================================
  // Declarations
  // ===========================================================================

  void analyze_decl(Decl * decl);
  void analyze_function(FunctionDecl * fn);
  void analyze_package_variable(VariableDecl * var);
  void analyze_type_definition(TypeDefinitionDecl * def);

  /// Analyse a function, method or lambda body with its own worker system.
  void analyze_invokable(FunctionDecl * fn);

  /// Analyse a worker body as a machine of the enclosing system.
  void analyze_worker(FunctionDecl * worker, AnalysisContext & parent);

  /// Body of any invokable, in a fresh context.
  void analyze_body(FunctionDecl * fn, AnalysisContext & ctx);

  // ===========================================================================
  // Statements
  // ===========================================================================

  void analyze_stmt(Stmt * stmt, AnalysisContext & ctx);
  void analyze_block(BlockStmt * block, AnalysisContext & ctx);
  void analyze_if(IfStmt * stmt, AnalysisContext & ctx);
  void analyze_loop(Expr * head, BlockStmt * body, AnalysisContext & ctx);
  void analyze_transaction(TransactionStmt * stmt, AnalysisContext & ctx);
  void analyze_match(MatchStmt * stmt, AnalysisContext & ctx);
  void analyze_return(ReturnStmt * stmt, AnalysisContext & ctx);
  void analyze_expr_stmt(ExprStmt * stmt, AnalysisContext & ctx);
  void analyze_worker_send(WorkerSendStmt * stmt, AnalysisContext & ctx);

  // ===========================================================================
  // Expressions
  // ===========================================================================

  void analyze_expr(
    Expr * expr, AnalysisContext & ctx, OperandPosition pos = OperandPosition::Nested);
  void analyze_invocation(InvocationExpr * call, AnalysisContext & ctx, OperandPosition pos);
  void analyze_record_literal(RecordLiteralExpr * lit, AnalysisContext & ctx);
  void analyze_index_access(IndexAccessExpr * access, AnalysisContext & ctx);
  void analyze_type_test(TypeTestExpr * test, AnalysisContext & ctx);
  void analyze_check(CheckExpr * check, AnalysisContext & ctx, OperandPosition pos);
  void analyze_sync_send(WorkerSyncSendExpr * send, AnalysisContext & ctx, OperandPosition pos);
  void analyze_receive(WorkerReceiveExpr * receive, AnalysisContext & ctx, OperandPosition pos);
  void analyze_flush(WorkerFlushExpr * flush, AnalysisContext & ctx);

  // ===========================================================================
  // Helpers
  // ===========================================================================

  /**
   * Position and peer checks shared by sends and receives.
   *
   * @return false if the action was rejected (the machine is then erroneous)
   */
  bool check_worker_action(
    std::string_view peer, SourceRange range, bool is_send, AnalysisContext & ctx);

  /// Report a value sent to a worker that is not pure data.
  void check_sendable(const Expr * value);

  /// Report an action used somewhere other than as a statement operand.
  void check_action_position(
    std::string_view what, SourceRange range, OperandPosition pos, bool allow_return);

  /// Pair the machines of a finished invokable and write channels back.
  void finish_worker_system(WorkerActionSystem & system);

  /// Reference to a symbol of another package must go to a public one.
  void check_access(const Symbol * symbol, std::string_view name, SourceRange range);

  /// A public signature must not mention non-public types of this package.
  void check_exposure(const Type * type, SourceRange range);

  [[nodiscard]] bool is_other_package(const Symbol * symbol) const noexcept;

  AstContext & ast_;
  TypeContext & types_;
  DiagnosticBag silent_;
  DiagnosticBag * diags_;

  std::string_view package_;
};

}  // namespace flowsema
