// flowsema/ast/ast_builder.cpp - Factory for typed AST nodes
#include "flowsema/ast/ast_builder.hpp"

#include <utility>

namespace flowsema
{

SourceRange AstBuilder::next_range() noexcept
{
  const uint32_t begin = nextOffset_;
  nextOffset_ += 2;
  return SourceRange(begin, begin + 1, file_);
}

// ============================================================================
// Literals
// ============================================================================

LiteralExpr * AstBuilder::literal(const LiteralValue & v, const Type * type)
{
  if (v.kind() == LiteralKind::String) {
    return typed(
      ast_.create<LiteralExpr>(LiteralValue::make_string(ast_.intern(v.as_string())), next_range()),
      type);
  }
  return typed(ast_.create<LiteralExpr>(v, next_range()), type);
}

LiteralExpr * AstBuilder::int_lit(int64_t v)
{
  return literal(LiteralValue::make_int(v), types_.int_type());
}

LiteralExpr * AstBuilder::float_lit(double v)
{
  return literal(LiteralValue::make_float(v), types_.float_type());
}

LiteralExpr * AstBuilder::decimal_lit(double v)
{
  return literal(LiteralValue::make_float(v, true), types_.decimal_type());
}

LiteralExpr * AstBuilder::string_lit(std::string_view v)
{
  return literal(LiteralValue::make_string(v), types_.string_type());
}

LiteralExpr * AstBuilder::bool_lit(bool v)
{
  return literal(LiteralValue::make_bool(v), types_.boolean_type());
}

LiteralExpr * AstBuilder::nil_lit() { return literal(LiteralValue::make_nil(), types_.nil_type()); }

// ============================================================================
// Expressions
// ============================================================================

VarRefExpr * AstBuilder::var_ref(std::string_view name, const Type * type, const Symbol * sym)
{
  auto * ref = ast_.create<VarRefExpr>(ast_.intern(name), next_range());
  ref->resolvedSymbol = sym;
  return typed(ref, type);
}

VarRefExpr * AstBuilder::wildcard() { return var_ref("_", types_.none_type()); }

FieldAccessExpr * AstBuilder::field_access(Expr * base, std::string_view field, const Type * type)
{
  return typed(ast_.create<FieldAccessExpr>(base, ast_.intern(field), next_range()), type);
}

IndexAccessExpr * AstBuilder::index_access(Expr * base, Expr * index, const Type * type)
{
  return typed(ast_.create<IndexAccessExpr>(base, index, next_range()), type);
}

InvocationExpr * AstBuilder::call(
  std::string_view name, std::vector<Expr *> args, const Type * type, const Symbol * sym)
{
  return method_call(nullptr, name, std::move(args), type, sym);
}

InvocationExpr * AstBuilder::method_call(
  Expr * receiver, std::string_view name, std::vector<Expr *> args, const Type * type,
  const Symbol * sym)
{
  auto * inv = ast_.create<InvocationExpr>(ast_.intern(name), next_range());
  inv->receiver = receiver;
  inv->args = ast_.copy_to_arena(args);
  inv->resolvedSymbol = sym;
  return typed(inv, type);
}

InvocationExpr * AstBuilder::action_call(
  Expr * client, std::string_view name, std::vector<Expr *> args, const Type * type,
  const Symbol * sym)
{
  InvocationExpr * inv = method_call(client, name, std::move(args), type, sym);
  inv->isActionInvocation = true;
  return inv;
}

NamedArgExpr * AstBuilder::named_arg(std::string_view name, Expr * value)
{
  return typed(
    ast_.create<NamedArgExpr>(ast_.intern(name), value, next_range()),
    value != nullptr ? value->resolvedType : nullptr);
}

RecordField * AstBuilder::record_field(std::string_view key, Expr * value)
{
  return ast_.create<RecordField>(ast_.intern(key), value, next_range());
}

RecordField * AstBuilder::record_field(Expr * key, Expr * value)
{
  return ast_.create<RecordField>(key, value, next_range());
}

RecordLiteralExpr * AstBuilder::record_lit(std::vector<RecordField *> fields, const Type * type)
{
  auto * lit = ast_.create<RecordLiteralExpr>(next_range());
  lit->fields = ast_.copy_to_arena(fields);
  return typed(lit, type);
}

ListLiteralExpr * AstBuilder::list_lit(std::vector<Expr *> elements, const Type * type)
{
  auto * lit = ast_.create<ListLiteralExpr>(next_range());
  lit->elements = ast_.copy_to_arena(elements);
  return typed(lit, type);
}

BinaryExpr * AstBuilder::binary(Expr * lhs, BinaryOp op, Expr * rhs, const Type * type)
{
  return typed(ast_.create<BinaryExpr>(lhs, op, rhs, next_range()), type);
}

UnaryExpr * AstBuilder::unary(UnaryOp op, Expr * operand, const Type * type)
{
  return typed(ast_.create<UnaryExpr>(op, operand, next_range()), type);
}

TernaryExpr * AstBuilder::ternary(
  Expr * cond, Expr * then_expr, Expr * else_expr, const Type * type)
{
  return typed(ast_.create<TernaryExpr>(cond, then_expr, else_expr, next_range()), type);
}

TypeTestExpr * AstBuilder::type_test(Expr * expr, const Type * tested)
{
  return typed(ast_.create<TypeTestExpr>(expr, tested, next_range()), types_.boolean_type());
}

CheckExpr * AstBuilder::check(Expr * expr, const Type * type, bool panic)
{
  return typed(ast_.create<CheckExpr>(expr, panic, next_range()), type);
}

TrapExpr * AstBuilder::trap(Expr * expr, const Type * type)
{
  return typed(ast_.create<TrapExpr>(expr, next_range()), type);
}

WaitExpr * AstBuilder::wait(Expr * expr, const Type * type)
{
  return typed(ast_.create<WaitExpr>(expr, next_range()), type);
}

LambdaExpr * AstBuilder::lambda(FunctionDecl * function, const Type * type)
{
  return typed(ast_.create<LambdaExpr>(function, next_range()), type);
}

// ============================================================================
// Worker Interactions
// ============================================================================

WorkerSyncSendExpr * AstBuilder::sync_send(Expr * value, std::string_view worker, const Type * type)
{
  // A sync send evaluates to the receiver's error, or nil
  const Type * result = type != nullptr ? type : types_.nil_type();
  return typed(ast_.create<WorkerSyncSendExpr>(value, ast_.intern(worker), next_range()), result);
}

WorkerReceiveExpr * AstBuilder::receive(std::string_view worker, const Type * type)
{
  return typed(ast_.create<WorkerReceiveExpr>(ast_.intern(worker), next_range()), type);
}

WorkerFlushExpr * AstBuilder::flush(std::string_view worker)
{
  const std::string_view name = worker.empty() ? std::string_view{} : ast_.intern(worker);
  return typed(
    ast_.create<WorkerFlushExpr>(name, next_range()),
    types_.get_union_type({types_.error_type(), types_.nil_type()}));
}

WorkerSendStmt * AstBuilder::send(Expr * value, std::string_view worker)
{
  return ast_.create<WorkerSendStmt>(value, ast_.intern(worker), next_range());
}

WorkerDeclStmt * AstBuilder::worker(
  std::string_view name, BlockStmt * body, const Type * return_type)
{
  auto * fn = ast_.create<FunctionDecl>(ast_.intern(name), next_range());
  fn->invokable = InvokableKind::Worker;
  fn->returnType = return_type != nullptr ? return_type : types_.nil_type();
  fn->body = body;
  return ast_.create<WorkerDeclStmt>(fn, next_range());
}

ForkJoinStmt * AstBuilder::fork(std::vector<WorkerDeclStmt *> workers)
{
  auto * stmt = ast_.create<ForkJoinStmt>(next_range());
  stmt->workers = ast_.copy_to_arena(workers);
  return stmt;
}

// ============================================================================
// Statements
// ============================================================================

BlockStmt * AstBuilder::block(std::vector<Stmt *> stmts)
{
  auto * blk = ast_.create<BlockStmt>(next_range());
  blk->stmts = ast_.copy_to_arena(stmts);
  return blk;
}

VarDefStmt * AstBuilder::var_def(std::string_view name, const Type * type, Expr * init)
{
  return ast_.create<VarDefStmt>(variable(name, type, init), next_range());
}

AssignmentStmt * AstBuilder::assign(Expr * target, Expr * value, AssignOp op)
{
  return ast_.create<AssignmentStmt>(target, op, value, next_range());
}

DestructureStmt * AstBuilder::destructure(DestructureKind kind, Expr * target, Expr * value)
{
  return ast_.create<DestructureStmt>(kind, target, value, next_range());
}

ExprStmt * AstBuilder::expr_stmt(Expr * expr) { return ast_.create<ExprStmt>(expr, next_range()); }

ReturnStmt * AstBuilder::ret(Expr * value) { return ast_.create<ReturnStmt>(value, next_range()); }

IfStmt * AstBuilder::if_stmt(Expr * cond, BlockStmt * then_block, Stmt * else_branch)
{
  return ast_.create<IfStmt>(cond, then_block, else_branch, next_range());
}

WhileStmt * AstBuilder::while_stmt(Expr * cond, BlockStmt * body)
{
  return ast_.create<WhileStmt>(cond, body, next_range());
}

ForeachStmt * AstBuilder::foreach_stmt(std::string_view var, Expr * collection, BlockStmt * body)
{
  return ast_.create<ForeachStmt>(ast_.intern(var), collection, body, next_range());
}

BreakStmt * AstBuilder::break_stmt() { return ast_.create<BreakStmt>(next_range()); }

ContinueStmt * AstBuilder::continue_stmt() { return ast_.create<ContinueStmt>(next_range()); }

PanicStmt * AstBuilder::panic_stmt(Expr * value)
{
  return ast_.create<PanicStmt>(value, next_range());
}

AbortStmt * AstBuilder::abort_stmt() { return ast_.create<AbortStmt>(next_range()); }

RetryStmt * AstBuilder::retry_stmt() { return ast_.create<RetryStmt>(next_range()); }

TransactionStmt * AstBuilder::transaction(
  BlockStmt * body, BlockStmt * on_retry, BlockStmt * on_aborted, BlockStmt * on_committed)
{
  auto * tx = ast_.create<TransactionStmt>(body, next_range());
  tx->onRetry = on_retry;
  tx->onAborted = on_aborted;
  tx->onCommitted = on_committed;
  return tx;
}

LockStmt * AstBuilder::lock(BlockStmt * body) { return ast_.create<LockStmt>(body, next_range()); }

ForeverStmt * AstBuilder::forever() { return ast_.create<ForeverStmt>(next_range()); }

// ============================================================================
// Match
// ============================================================================

MatchStmt * AstBuilder::match(
  Expr * expr, std::vector<MatchClause *> clauses, const Type * else_type)
{
  auto * stmt = ast_.create<MatchStmt>(expr, next_range());
  stmt->clauses = ast_.copy_to_arena(clauses);
  stmt->elseType = else_type;
  return stmt;
}

StaticMatchClause * AstBuilder::static_clause(Expr * pattern, BlockStmt * body)
{
  return ast_.create<StaticMatchClause>(pattern, body, next_range());
}

StructuredMatchClause * AstBuilder::structured_clause(
  BindingPattern * pattern, BlockStmt * body, Expr * guard)
{
  return ast_.create<StructuredMatchClause>(pattern, guard, body, next_range());
}

VarBindingPattern * AstBuilder::var_binding(std::string_view name, const Type * type)
{
  auto * pattern = ast_.create<VarBindingPattern>(ast_.intern(name), next_range());
  pattern->resolvedType = type;
  return pattern;
}

TupleBindingPattern * AstBuilder::tuple_binding(
  std::vector<BindingPattern *> members, const Type * type)
{
  auto * pattern = ast_.create<TupleBindingPattern>(next_range());
  pattern->members = ast_.copy_to_arena(members);
  pattern->resolvedType = type;
  return pattern;
}

RecordBindingPattern * AstBuilder::record_binding(
  std::vector<RecordBindingField *> fields, const Type * type, bool closed, std::string_view rest)
{
  auto * pattern = ast_.create<RecordBindingPattern>(next_range());
  pattern->fields = ast_.copy_to_arena(fields);
  pattern->resolvedType = type;
  pattern->isClosed = closed;
  pattern->restName = rest.empty() ? std::string_view{} : ast_.intern(rest);
  return pattern;
}

RecordBindingField * AstBuilder::binding_field(std::string_view key, BindingPattern * pattern)
{
  return ast_.create<RecordBindingField>(ast_.intern(key), pattern, next_range());
}

// ============================================================================
// Declarations
// ============================================================================

FunctionDecl * AstBuilder::function(
  std::string_view name, const Type * return_type, BlockStmt * body, const Symbol * sym,
  std::vector<VariableDecl *> params)
{
  auto * fn = ast_.create<FunctionDecl>(ast_.intern(name), next_range());
  fn->symbol = sym;
  fn->returnType = return_type != nullptr ? return_type : types_.nil_type();
  fn->body = body;
  fn->params = ast_.copy_to_arena(params);
  return fn;
}

FunctionDecl * AstBuilder::lambda_function(const Type * return_type, BlockStmt * body)
{
  FunctionDecl * fn = function("$lambda", return_type, body);
  fn->invokable = InvokableKind::Lambda;
  return fn;
}

VariableDecl * AstBuilder::variable(
  std::string_view name, const Type * type, Expr * init, const Symbol * sym)
{
  auto * var = ast_.create<VariableDecl>(ast_.intern(name), next_range());
  var->declaredType = type;
  var->init = init;
  var->symbol = sym;
  return var;
}

TypeDefinitionDecl * AstBuilder::type_def(
  std::string_view name, const Type * type, const Symbol * sym,
  std::vector<FunctionDecl *> methods)
{
  auto * def = ast_.create<TypeDefinitionDecl>(ast_.intern(name), next_range());
  def->type = type;
  def->symbol = sym;
  def->methods = ast_.copy_to_arena(methods);
  return def;
}

CompilationUnit * AstBuilder::unit(std::string_view package, std::vector<Decl *> decls)
{
  auto * cu = ast_.create<CompilationUnit>(ast_.intern(package), next_range());
  cu->decls = ast_.copy_to_arena(decls);
  return cu;
}

}  // namespace flowsema
