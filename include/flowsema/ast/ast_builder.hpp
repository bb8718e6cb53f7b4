// flowsema/ast/ast_builder.hpp - Factory for typed AST nodes
//
// Used by the JSON loader and by tests. Every node gets a distinct
// synthetic source range so diagnostics can be matched back to nodes;
// the loader overwrites them with real ranges.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "flowsema/ast/ast.hpp"
#include "flowsema/ast/ast_context.hpp"
#include "flowsema/sema/types/type.hpp"

namespace flowsema
{

// Owns no memory; writes into AstContext and reads TypeContext singletons.
class AstBuilder
{
public:
  AstBuilder(AstContext & ast, TypeContext & types, FileId file = FileId::invalid())
  : ast_(ast), types_(types), file_(file)
  {
  }

  [[nodiscard]] AstContext & ast() noexcept { return ast_; }
  [[nodiscard]] TypeContext & types() noexcept { return types_; }

  // Literals
  LiteralExpr * int_lit(int64_t v);
  LiteralExpr * float_lit(double v);
  LiteralExpr * decimal_lit(double v);
  LiteralExpr * string_lit(std::string_view v);
  LiteralExpr * bool_lit(bool v);
  LiteralExpr * nil_lit();
  LiteralExpr * literal(const LiteralValue & v, const Type * type);

  // Expressions
  VarRefExpr * var_ref(std::string_view name, const Type * type, const Symbol * sym = nullptr);
  /// `_` pattern
  VarRefExpr * wildcard();
  FieldAccessExpr * field_access(Expr * base, std::string_view field, const Type * type);
  IndexAccessExpr * index_access(Expr * base, Expr * index, const Type * type);
  InvocationExpr * call(
    std::string_view name, std::vector<Expr *> args, const Type * type,
    const Symbol * sym = nullptr);
  InvocationExpr * method_call(
    Expr * receiver, std::string_view name, std::vector<Expr *> args, const Type * type,
    const Symbol * sym = nullptr);
  /// Remote action: client->name(args)
  InvocationExpr * action_call(
    Expr * client, std::string_view name, std::vector<Expr *> args, const Type * type,
    const Symbol * sym = nullptr);
  NamedArgExpr * named_arg(std::string_view name, Expr * value);
  RecordField * record_field(std::string_view key, Expr * value);
  RecordField * record_field(Expr * key, Expr * value);
  RecordLiteralExpr * record_lit(std::vector<RecordField *> fields, const Type * type);
  ListLiteralExpr * list_lit(std::vector<Expr *> elements, const Type * type);
  BinaryExpr * binary(Expr * lhs, BinaryOp op, Expr * rhs, const Type * type);
  UnaryExpr * unary(UnaryOp op, Expr * operand, const Type * type);
  TernaryExpr * ternary(Expr * cond, Expr * then_expr, Expr * else_expr, const Type * type);
  TypeTestExpr * type_test(Expr * expr, const Type * tested);
  CheckExpr * check(Expr * expr, const Type * type, bool panic = false);
  TrapExpr * trap(Expr * expr, const Type * type);
  WaitExpr * wait(Expr * expr, const Type * type);
  LambdaExpr * lambda(FunctionDecl * function, const Type * type = nullptr);

  // Worker interactions
  WorkerSyncSendExpr * sync_send(Expr * value, std::string_view worker, const Type * type = nullptr);
  WorkerReceiveExpr * receive(std::string_view worker, const Type * type);
  WorkerFlushExpr * flush(std::string_view worker = {});
  WorkerSendStmt * send(Expr * value, std::string_view worker);
  /// Worker declaration statement wrapping a FunctionDecl of kind Worker
  WorkerDeclStmt * worker(
    std::string_view name, BlockStmt * body, const Type * return_type = nullptr);
  ForkJoinStmt * fork(std::vector<WorkerDeclStmt *> workers);

  // Statements
  BlockStmt * block(std::vector<Stmt *> stmts);
  VarDefStmt * var_def(std::string_view name, const Type * type, Expr * init);
  AssignmentStmt * assign(Expr * target, Expr * value, AssignOp op = AssignOp::Assign);
  DestructureStmt * destructure(DestructureKind kind, Expr * target, Expr * value);
  ExprStmt * expr_stmt(Expr * expr);
  ReturnStmt * ret(Expr * value = nullptr);
  IfStmt * if_stmt(Expr * cond, BlockStmt * then_block, Stmt * else_branch = nullptr);
  WhileStmt * while_stmt(Expr * cond, BlockStmt * body);
  ForeachStmt * foreach_stmt(std::string_view var, Expr * collection, BlockStmt * body);
  BreakStmt * break_stmt();
  ContinueStmt * continue_stmt();
  PanicStmt * panic_stmt(Expr * value);
  AbortStmt * abort_stmt();
  RetryStmt * retry_stmt();
  TransactionStmt * transaction(
    BlockStmt * body, BlockStmt * on_retry = nullptr, BlockStmt * on_aborted = nullptr,
    BlockStmt * on_committed = nullptr);
  LockStmt * lock(BlockStmt * body);
  ForeverStmt * forever();

  // Match
  MatchStmt * match(Expr * expr, std::vector<MatchClause *> clauses, const Type * else_type = nullptr);
  StaticMatchClause * static_clause(Expr * pattern, BlockStmt * body);
  StructuredMatchClause * structured_clause(
    BindingPattern * pattern, BlockStmt * body, Expr * guard = nullptr);
  VarBindingPattern * var_binding(std::string_view name, const Type * type);
  TupleBindingPattern * tuple_binding(std::vector<BindingPattern *> members, const Type * type);
  RecordBindingPattern * record_binding(
    std::vector<RecordBindingField *> fields, const Type * type, bool closed = false,
    std::string_view rest = {});
  RecordBindingField * binding_field(std::string_view key, BindingPattern * pattern);

  // Declarations
  FunctionDecl * function(
    std::string_view name, const Type * return_type, BlockStmt * body,
    const Symbol * sym = nullptr, std::vector<VariableDecl *> params = {});
  /// FunctionDecl of kind Lambda
  FunctionDecl * lambda_function(const Type * return_type, BlockStmt * body);
  VariableDecl * variable(
    std::string_view name, const Type * type, Expr * init = nullptr, const Symbol * sym = nullptr);
  TypeDefinitionDecl * type_def(
    std::string_view name, const Type * type, const Symbol * sym = nullptr,
    std::vector<FunctionDecl *> methods = {});
  CompilationUnit * unit(std::string_view package, std::vector<Decl *> decls);

  /// Fresh synthetic range, distinct from every range handed out before.
  SourceRange next_range() noexcept;

private:
  template <typename T>
  T * typed(T * expr, const Type * type)
  {
    expr->resolvedType = type;
    return expr;
  }

  AstContext & ast_;
  TypeContext & types_;
  FileId file_;
  uint32_t nextOffset_ = 0;
};

}  // namespace flowsema
