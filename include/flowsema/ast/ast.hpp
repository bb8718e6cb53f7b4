// flowsema/ast/ast.hpp - Typed AST node class definitions
//
// The tree handed to the analyzer is already name-resolved and type-checked:
// every expression carries its resolved type, every declaration its symbol.
// Nodes follow the LLVM/Clang style with classof() for RTTI support.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "flowsema/ast/ast_enums.hpp"
#include "flowsema/basic/casting.hpp"
#include "flowsema/basic/source_manager.hpp"
#include "flowsema/sema/types/literal_value.hpp"

namespace flowsema
{

struct Symbol;
struct Type;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source
 *
 * Nodes are non-copyable and managed by AstContext. There are no parent
 * links: analyses pass whatever they need about ancestors down explicitly.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}

  // Declarations carry their name in the base
  NodeBase(std::string_view name, SourceRange r) : Base(K, name, r) {}
};

/**
 * Base class for expressions.
 */
class Expr : public AstNode
{
public:
  /// Resolved semantic type (SemanticError when the checker already failed)
  const Type * resolvedType = nullptr;

  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  std::string_view name;

  /// Resolved symbol (nullptr when resolution failed)
  const Symbol * symbol = nullptr;

  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  Decl(NodeKind k, std::string_view n, SourceRange r = {}) : AstNode(k, r), name(n) {}
};

class FunctionDecl;
class BlockStmt;

// ============================================================================
// Expression Nodes
// ============================================================================

/// Literal of a simple value type: 5, 1.5, true, "x", ().
class LiteralExpr : public NodeBase<LiteralExpr, Expr, NodeKind::Literal>
{
public:
  LiteralValue value;

  explicit LiteralExpr(LiteralValue v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Variable reference. In a static match pattern it is the catch-all.
class VarRefExpr : public NodeBase<VarRefExpr, Expr, NodeKind::VarRef>
{
public:
  std::string_view name;

  const Symbol * resolvedSymbol = nullptr;

  explicit VarRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Field access: base.name
class FieldAccessExpr : public NodeBase<FieldAccessExpr, Expr, NodeKind::FieldAccess>
{
public:
  Expr * base;
  std::string_view field;

  FieldAccessExpr(Expr * b, std::string_view f, SourceRange r = {})
  : NodeBase(r), base(b), field(f)
  {
  }
};

/// Index access: base[index]
class IndexAccessExpr : public NodeBase<IndexAccessExpr, Expr, NodeKind::IndexAccess>
{
public:
  Expr * base;
  Expr * index;

  IndexAccessExpr(Expr * b, Expr * i, SourceRange r = {}) : NodeBase(r), base(b), index(i) {}
};

/// Function, method or remote action invocation.
class InvocationExpr : public NodeBase<InvocationExpr, Expr, NodeKind::Invocation>
{
public:
  Expr * receiver = nullptr;  ///< null for a plain function call
  std::string_view name;
  gsl::span<Expr *> args;  ///< positional args followed by NamedArgExpr

  const Symbol * resolvedSymbol = nullptr;

  /// Remote action call through a client object: client->name(...)
  bool isActionInvocation = false;

  explicit InvocationExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Named argument: name = value
class NamedArgExpr : public NodeBase<NamedArgExpr, Expr, NodeKind::NamedArg>
{
public:
  std::string_view name;
  Expr * value;

  NamedArgExpr(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v)
  {
  }
};

class RecordField;

/// Mapping constructor: { key: value, "k": value }
class RecordLiteralExpr : public NodeBase<RecordLiteralExpr, Expr, NodeKind::RecordLiteral>
{
public:
  gsl::span<RecordField *> fields;

  explicit RecordLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// List or tuple constructor: [a, b, c]
class ListLiteralExpr : public NodeBase<ListLiteralExpr, Expr, NodeKind::ListLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ListLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// cond ? thenExpr : elseExpr
class TernaryExpr : public NodeBase<TernaryExpr, Expr, NodeKind::Ternary>
{
public:
  Expr * condition;
  Expr * thenExpr;
  Expr * elseExpr;

  TernaryExpr(Expr * c, Expr * t, Expr * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenExpr(t), elseExpr(e)
  {
  }
};

/// Type test: expr is T
class TypeTestExpr : public NodeBase<TypeTestExpr, Expr, NodeKind::TypeTest>
{
public:
  Expr * expr;
  const Type * testedType;

  TypeTestExpr(Expr * e, const Type * t, SourceRange r = {}) : NodeBase(r), expr(e), testedType(t)
  {
  }
};

/// check expr / checkpanic expr
class CheckExpr : public NodeBase<CheckExpr, Expr, NodeKind::Check>
{
public:
  Expr * expr;
  bool isPanic = false;

  explicit CheckExpr(Expr * e, bool panic = false, SourceRange r = {})
  : NodeBase(r), expr(e), isPanic(panic)
  {
  }
};

class TrapExpr : public NodeBase<TrapExpr, Expr, NodeKind::Trap>
{
public:
  Expr * expr;

  explicit TrapExpr(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

class WaitExpr : public NodeBase<WaitExpr, Expr, NodeKind::Wait>
{
public:
  Expr * expr;

  explicit WaitExpr(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/// Anonymous function expression.
class LambdaExpr : public NodeBase<LambdaExpr, Expr, NodeKind::Lambda>
{
public:
  FunctionDecl * function;

  explicit LambdaExpr(FunctionDecl * f, SourceRange r = {}) : NodeBase(r), function(f) {}
};

/// Synchronous send: expr ->> worker
class WorkerSyncSendExpr : public NodeBase<WorkerSyncSendExpr, Expr, NodeKind::WorkerSyncSend>
{
public:
  Expr * expr;
  std::string_view workerName;

  /// Expected type of the paired receive (set by the analyzer)
  const Type * pairedType = nullptr;

  WorkerSyncSendExpr(Expr * e, std::string_view w, SourceRange r = {})
  : NodeBase(r), expr(e), workerName(w)
  {
  }
};

/// Receive: <- worker
class WorkerReceiveExpr : public NodeBase<WorkerReceiveExpr, Expr, NodeKind::WorkerReceive>
{
public:
  std::string_view workerName;

  /// Errors a paired sync send may observe: accumulated errors | nil (set by the analyzer)
  const Type * matchingSendsError = nullptr;

  explicit WorkerReceiveExpr(std::string_view w, SourceRange r = {}) : NodeBase(r), workerName(w)
  {
  }
};

/// flush worker / flush
class WorkerFlushExpr : public NodeBase<WorkerFlushExpr, Expr, NodeKind::WorkerFlush>
{
public:
  std::string_view workerName;  ///< empty: flush every worker

  explicit WorkerFlushExpr(std::string_view w = {}, SourceRange r = {})
  : NodeBase(r), workerName(w)
  {
  }

  [[nodiscard]] bool is_flush_all() const noexcept { return workerName.empty(); }
};

// ============================================================================
// Statement Nodes
// ============================================================================

class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::Block>
{
public:
  gsl::span<Stmt *> stmts;

  explicit BlockStmt(SourceRange r = {}) : NodeBase(r) {}
};

class VariableDecl;

/// Local variable definition.
class VarDefStmt : public NodeBase<VarDefStmt, Stmt, NodeKind::VarDef>
{
public:
  VariableDecl * var;

  explicit VarDefStmt(VariableDecl * v, SourceRange r = {}) : NodeBase(r), var(v) {}
};

class AssignmentStmt : public NodeBase<AssignmentStmt, Stmt, NodeKind::Assignment>
{
public:
  Expr * target;
  AssignOp op;
  Expr * value;

  AssignmentStmt(Expr * t, AssignOp o, Expr * v, SourceRange r = {})
  : NodeBase(r), target(t), op(o), value(v)
  {
  }
};

/// Destructuring assignment: [a, b] = value / {a, b} = value
class DestructureStmt : public NodeBase<DestructureStmt, Stmt, NodeKind::Destructure>
{
public:
  DestructureKind destructure;
  Expr * target;
  Expr * value;

  DestructureStmt(DestructureKind k, Expr * t, Expr * v, SourceRange r = {})
  : NodeBase(r), destructure(k), target(t), value(v)
  {
  }
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::Return>
{
public:
  Expr * value = nullptr;  ///< null for a bare return

  explicit ReturnStmt(Expr * v = nullptr, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::If>
{
public:
  Expr * condition;
  BlockStmt * thenBlock;
  Stmt * elseBranch = nullptr;  ///< BlockStmt, IfStmt (else if) or null

  IfStmt(Expr * c, BlockStmt * t, Stmt * e = nullptr, SourceRange r = {})
  : NodeBase(r), condition(c), thenBlock(t), elseBranch(e)
  {
  }
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::While>
{
public:
  Expr * condition;
  BlockStmt * body;

  WhileStmt(Expr * c, BlockStmt * b, SourceRange r = {}) : NodeBase(r), condition(c), body(b) {}
};

class ForeachStmt : public NodeBase<ForeachStmt, Stmt, NodeKind::Foreach>
{
public:
  std::string_view variable;
  Expr * collection;
  BlockStmt * body;

  ForeachStmt(std::string_view v, Expr * c, BlockStmt * b, SourceRange r = {})
  : NodeBase(r), variable(v), collection(c), body(b)
  {
  }
};

class BreakStmt : public NodeBase<BreakStmt, Stmt, NodeKind::Break>
{
public:
  explicit BreakStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ContinueStmt : public NodeBase<ContinueStmt, Stmt, NodeKind::Continue>
{
public:
  explicit ContinueStmt(SourceRange r = {}) : NodeBase(r) {}
};

class PanicStmt : public NodeBase<PanicStmt, Stmt, NodeKind::Panic>
{
public:
  Expr * value;

  explicit PanicStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class AbortStmt : public NodeBase<AbortStmt, Stmt, NodeKind::Abort>
{
public:
  explicit AbortStmt(SourceRange r = {}) : NodeBase(r) {}
};

class RetryStmt : public NodeBase<RetryStmt, Stmt, NodeKind::Retry>
{
public:
  explicit RetryStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// transaction with retries(n) { body } onretry { } aborted { } committed { }
class TransactionStmt : public NodeBase<TransactionStmt, Stmt, NodeKind::Transaction>
{
public:
  Expr * retryCount = nullptr;
  BlockStmt * body;
  BlockStmt * onRetry = nullptr;
  BlockStmt * onAborted = nullptr;
  BlockStmt * onCommitted = nullptr;

  explicit TransactionStmt(BlockStmt * b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

class LockStmt : public NodeBase<LockStmt, Stmt, NodeKind::Lock>
{
public:
  BlockStmt * body;

  explicit LockStmt(BlockStmt * b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

class MatchClause;

class MatchStmt : public NodeBase<MatchStmt, Stmt, NodeKind::Match>
{
public:
  Expr * expr;
  gsl::span<MatchClause *> clauses;  ///< source order, static and structured mixed

  /// Values of these types fall through to the implicit else (null: none)
  const Type * elseType = nullptr;

  explicit MatchStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/// Asynchronous send: expr -> worker
class WorkerSendStmt : public NodeBase<WorkerSendStmt, Stmt, NodeKind::WorkerSend>
{
public:
  Expr * expr;
  std::string_view workerName;

  /// Accumulated error returns | value type (set by the analyzer)
  const Type * pairedType = nullptr;

  WorkerSendStmt(Expr * e, std::string_view w, SourceRange r = {})
  : NodeBase(r), expr(e), workerName(w)
  {
  }
};

/// Named worker declaration: worker w { ... }
class WorkerDeclStmt : public NodeBase<WorkerDeclStmt, Stmt, NodeKind::WorkerDecl>
{
public:
  FunctionDecl * worker;

  explicit WorkerDeclStmt(FunctionDecl * w, SourceRange r = {}) : NodeBase(r), worker(w) {}
};

/// fork { worker a { } worker b { } }
class ForkJoinStmt : public NodeBase<ForkJoinStmt, Stmt, NodeKind::ForkJoin>
{
public:
  gsl::span<WorkerDeclStmt *> workers;

  explicit ForkJoinStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// Streaming `forever` block; nothing after it in the same block runs.
class ForeverStmt : public NodeBase<ForeverStmt, Stmt, NodeKind::Forever>
{
public:
  explicit ForeverStmt(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// Function, lambda or worker body.
class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::Function>
{
public:
  InvokableKind invokable = InvokableKind::Function;
  gsl::span<VariableDecl *> params;
  const Type * returnType = nullptr;
  BlockStmt * body = nullptr;  ///< null for native and abstract declarations

  /// Worker channels this body takes part in, "a->b" (set by the analyzer)
  gsl::span<std::string_view> channels;

  explicit FunctionDecl(std::string_view n, SourceRange r = {}) : NodeBase(n, r) {}
};

/// Parameter, local or package-level variable.
class VariableDecl : public NodeBase<VariableDecl, Decl, NodeKind::Variable>
{
public:
  const Type * declaredType = nullptr;
  Expr * init = nullptr;

  explicit VariableDecl(std::string_view n, SourceRange r = {}) : NodeBase(n, r) {}
};

/// Named type definition; methods belong to object types.
class TypeDefinitionDecl : public NodeBase<TypeDefinitionDecl, Decl, NodeKind::TypeDefinition>
{
public:
  const Type * type = nullptr;
  gsl::span<FunctionDecl *> methods;

  explicit TypeDefinitionDecl(std::string_view n, SourceRange r = {}) : NodeBase(n, r) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// Field of a record literal. Exactly one of `key` and `keyExpr` is set.
class RecordField : public NodeBase<RecordField, AstNode, NodeKind::RecordField>
{
public:
  std::string_view key;    ///< identifier key
  Expr * keyExpr = nullptr;  ///< literal or computed key
  Expr * value;

  RecordField(std::string_view k, Expr * v, SourceRange r = {}) : NodeBase(r), key(k), value(v) {}

  RecordField(Expr * k, Expr * v, SourceRange r = {}) : NodeBase(r), keyExpr(k), value(v) {}
};

/**
 * Base class for the binding patterns of structured match clauses.
 */
class BindingPattern : public AstNode
{
public:
  /// Type the pattern binds (SemanticError when the checker already failed)
  const Type * resolvedType = nullptr;

  static bool classof(const AstNode * node) { return is_binding_kind(node->kind); }

protected:
  explicit BindingPattern(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class RecordBindingField : public NodeBase<RecordBindingField, AstNode, NodeKind::RecordBindingField>
{
public:
  std::string_view key;
  BindingPattern * pattern;

  RecordBindingField(std::string_view k, BindingPattern * p, SourceRange r = {})
  : NodeBase(r), key(k), pattern(p)
  {
  }
};

/// var x
class VarBindingPattern : public NodeBase<VarBindingPattern, BindingPattern, NodeKind::VarBinding>
{
public:
  std::string_view name;

  explicit VarBindingPattern(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// var [a, b]
class TupleBindingPattern
: public NodeBase<TupleBindingPattern, BindingPattern, NodeKind::TupleBinding>
{
public:
  gsl::span<BindingPattern *> members;

  explicit TupleBindingPattern(SourceRange r = {}) : NodeBase(r) {}
};

/// var {a: x, b: y} or the closed form var {| a: x |}
class RecordBindingPattern
: public NodeBase<RecordBindingPattern, BindingPattern, NodeKind::RecordBinding>
{
public:
  gsl::span<RecordBindingField *> fields;
  bool isClosed = false;
  std::string_view restName;  ///< ...rest, empty when absent

  explicit RecordBindingPattern(SourceRange r = {}) : NodeBase(r) {}
};

/**
 * Base class for match clauses. Analysis results are written back here.
 */
class MatchClause : public AstNode
{
public:
  BlockStmt * body = nullptr;

  /// Catch-all clause that makes the match exhaustive
  bool isLastPattern = false;
  bool isReachable = true;

  static bool classof(const AstNode * node) { return is_clause_kind(node->kind); }

protected:
  explicit MatchClause(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Literal, list, record or identifier pattern: 5 => { }
class StaticMatchClause
: public NodeBase<StaticMatchClause, MatchClause, NodeKind::StaticClause>
{
public:
  Expr * pattern;

  StaticMatchClause(Expr * p, BlockStmt * b, SourceRange r = {}) : NodeBase(r), pattern(p)
  {
    this->body = b;
  }
};

/// Binding pattern with optional guard: var [a, b] if a is int => { }
class StructuredMatchClause
: public NodeBase<StructuredMatchClause, MatchClause, NodeKind::StructuredClause>
{
public:
  BindingPattern * pattern;
  Expr * guard = nullptr;

  StructuredMatchClause(BindingPattern * p, Expr * g, BlockStmt * b, SourceRange r = {})
  : NodeBase(r), pattern(p), guard(g)
  {
    this->body = b;
  }
};

// ============================================================================
// Compilation Unit (Root Node)
// ============================================================================

class CompilationUnit : public NodeBase<CompilationUnit, AstNode, NodeKind::CompilationUnit>
{
public:
  std::string_view package;

  /// Top-level declarations in source order
  gsl::span<Decl *> decls;

  explicit CompilationUnit(std::string_view pkg, SourceRange r = {}) : NodeBase(r), package(pkg) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace flowsema
