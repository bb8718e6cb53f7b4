// flowsema/sema/analysis/code_analyzer.cpp - Entry point, declarations and shared checks

#include "flowsema/sema/analysis/code_analyzer.hpp"

#include <algorithm>
#include <cassert>
#include <string>
#include <vector>

#include "flowsema/basic/casting.hpp"
#include "flowsema/sema/symbol.hpp"
#include "flowsema/sema/types/type_utils.hpp"

namespace flowsema
{

CodeAnalyzer::CodeAnalyzer(AstContext & ast, TypeContext & types, DiagnosticBag * diags)
: ast_(ast), types_(types), diags_(diags ? diags : &silent_)
{
}

bool CodeAnalyzer::analyze(CompilationUnit & unit)
{
  package_ = unit.package;
  const size_t errors_before = diags_->error_count();

  for (Decl * decl : unit.decls) {
    analyze_decl(decl);
  }

  return diags_->error_count() == errors_before;
}

// ============================================================================
// Declarations
// ============================================================================

void CodeAnalyzer::analyze_decl(Decl * decl)
{
  if (!decl) return;

  switch (decl->kind) {
    case NodeKind::Function:
      analyze_function(cast<FunctionDecl>(decl));
      return;
    case NodeKind::Variable:
      analyze_package_variable(cast<VariableDecl>(decl));
      return;
    case NodeKind::TypeDefinition:
      analyze_type_definition(cast<TypeDefinitionDecl>(decl));
      return;

      // Every other kind is not a declaration
#define AST_NODE(Class, Kind, Snake)
#define AST_NODE_DECL(Class, Kind, Snake)
#define AST_NODE_EXPR(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_STMT(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_SUPPORT(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_TOP(Class, Kind, Snake) case NodeKind::Kind:
#include "flowsema/ast/ast_nodes.def"
      break;
  }
  assert(false && "analyze_decl on a non-declaration node");
}

void CodeAnalyzer::analyze_function(FunctionDecl * fn)
{
  const Symbol * sym = fn->symbol;

  if (fn->invokable == InvokableKind::Function && fn->name == "main" && sym && !sym->is_public()) {
    diags_->report(DiagCode::MainShouldBePublic, fn->get_range());
  }

  if (sym && sym->is_public()) {
    for (const VariableDecl * param : fn->params) {
      check_exposure(param->declaredType, param->get_range());
    }
    check_exposure(fn->returnType, fn->get_range());
  }

  analyze_invokable(fn);
}

void CodeAnalyzer::analyze_package_variable(VariableDecl * var)
{
  const Symbol * sym = var->symbol;

  if (!var->init && sym && (sym->is_public() || sym->has(SymbolFlag::Listener))) {
    diags_->report(DiagCode::UninitializedVariable, var->get_range(), {std::string(var->name)});
  }

  if (sym && sym->is_public()) {
    check_exposure(var->declaredType, var->get_range());
  }

  if (var->init) {
    // Package level: no enclosing invokable, so no legal worker position
    WorkerActionSystem system;
    system.begin_machine(k_default_worker, var->get_range(), nullptr);
    AnalysisContext ctx(diags_, nullptr, InvokableKind::Function, &system);
    analyze_expr(var->init, ctx, OperandPosition::Statement);
  }
}

void CodeAnalyzer::analyze_type_definition(TypeDefinitionDecl * def)
{
  const Type * type = def->type;
  const Symbol * sym = def->symbol;

  if (!is_semantic_error(type)) {
    if (sym && sym->is_public()) {
      if (type->kind == TypeKind::Record || type->kind == TypeKind::Object) {
        for (const auto & field : type->fields) {
          check_exposure(field.type, def->get_range());
        }
      } else {
        check_exposure(type, def->get_range());
      }
    }

    if (type->kind == TypeKind::Object && type->client && type->remote_methods.empty()) {
      diags_->report(
        DiagCode::ClientHasNoRemoteFunction, def->get_range(), {std::string(def->name)});
    }
  }

  for (FunctionDecl * method : def->methods) {
    analyze_function(method);
  }
}

// ============================================================================
// Invokable Bodies
// ============================================================================

void CodeAnalyzer::analyze_invokable(FunctionDecl * fn)
{
  if (!fn || !fn->body) return;
  // Native bodies are supplied by the runtime
  if (fn->symbol && fn->symbol->is_native()) return;

  WorkerActionSystem system;
  AnalysisContext ctx(diags_, fn, fn->invokable, &system);
  system.begin_machine(k_default_worker, fn->get_range(), fn);

  // Workers may be addressed before their declaration is reached
  for (const Stmt * stmt : fn->body->stmts) {
    if (const auto * decl = dyn_cast<WorkerDeclStmt>(stmt)) {
      system.declare_worker(decl->worker->name);
    } else if (const auto * fork = dyn_cast<ForkJoinStmt>(stmt)) {
      for (const WorkerDeclStmt * w : fork->workers) {
        system.declare_worker(w->worker->name);
      }
    }
  }

  analyze_body(fn, ctx);
  system.end_machine();
  finish_worker_system(system);
}

void CodeAnalyzer::analyze_worker(FunctionDecl * worker, AnalysisContext & parent)
{
  if (!worker || !worker->body) return;

  AnalysisContext ctx(diags_, worker, InvokableKind::Worker, parent.workers);
  parent.workers->begin_machine(worker->name, worker->get_range(), worker);
  analyze_body(worker, ctx);
  parent.workers->end_machine();
}

void CodeAnalyzer::analyze_body(FunctionDecl * fn, AnalysisContext & ctx)
{
  ctx.exits.enter_function();

  for (VariableDecl * param : fn->params) {
    if (param->init) analyze_expr(param->init, ctx, OperandPosition::Statement);
  }

  analyze_block(fn->body, ctx);
  ctx.reachability.check_must_return(fn->get_range(), fn->returnType, ctx.invokableKind);
  ctx.exits.leave_function();
}

void CodeAnalyzer::finish_worker_system(WorkerActionSystem & system)
{
  if (!system.has_actions()) return;

  diags_->merge(WorkerInteractionValidator::validate(system));

  for (auto & machine : system.machines()) {
    if (!machine.decl || machine.channels.empty()) continue;
    std::vector<std::string_view> names;
    names.reserve(machine.channels.size());
    for (const auto & channel : machine.channels) {
      names.push_back(ast_.intern(channel));
    }
    machine.decl->channels = ast_.copy_to_arena(names);
  }
}

// ============================================================================
// Visibility
// ============================================================================

bool CodeAnalyzer::is_other_package(const Symbol * symbol) const noexcept
{
  return symbol && !symbol->package.empty() && symbol->package != package_;
}

void CodeAnalyzer::check_access(const Symbol * symbol, std::string_view name, SourceRange range)
{
  if (is_other_package(symbol) && !symbol->is_public()) {
    diags_->report(DiagCode::AttemptReferNonAccessibleSymbol, range, {std::string(name)});
  }
}

void CodeAnalyzer::check_exposure(const Type * type, SourceRange range)
{
  std::vector<const Type *> pending{type};
  std::vector<const Type *> visited;

  while (!pending.empty()) {
    const Type * t = pending.back();
    pending.pop_back();
    if (is_semantic_error(t)) continue;
    if (std::find(visited.begin(), visited.end(), t) != visited.end()) continue;
    visited.push_back(t);

    // Named types stop the walk: their own definition is checked separately
    if (t->symbol) {
      if (t->symbol->package == package_ && !t->symbol->is_public()) {
        diags_->report(DiagCode::AttemptExposeNonPublicSymbol, range, {std::string(t->name)});
      }
      continue;
    }

    for (auto it = t->members.rbegin(); it != t->members.rend(); ++it) {
      pending.push_back(*it);
    }
    for (auto it = t->fields.rbegin(); it != t->fields.rend(); ++it) {
      pending.push_back(it->type);
    }
    if (t->element) pending.push_back(t->element);
  }
}

}  // namespace flowsema
