// flowsema/ast/ast_loader.cpp - Typed AST input in JSON form
#include "flowsema/ast/ast_loader.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "flowsema/basic/casting.hpp"

namespace flowsema
{
namespace
{

using nlohmann::json;

/// Malformed input; caught at the API boundary and turned into a diagnostic.
class InputError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

std::optional<NodeKind> parse_node_kind(std::string_view name)
{
#define AST_NODE(Class, Kind, Snake) \
  if (name == #Snake) return NodeKind::Kind;
#include "flowsema/ast/ast_nodes.def"
  return std::nullopt;
}

template <typename E, size_t N>
E parse_op(const json & j, const E (&values)[N], const char * what)
{
  const auto text = j.get<std::string>();
  for (E v : values) {
    if (to_string(v) == text) return v;
  }
  throw InputError(std::string("unknown ") + what + " '" + text + "'");
}

constexpr BinaryOp k_binary_ops[] = {
  BinaryOp::Add,   BinaryOp::Sub,    BinaryOp::Mul, BinaryOp::Div, BinaryOp::Mod, BinaryOp::Eq,
  BinaryOp::Ne,    BinaryOp::Lt,     BinaryOp::Le,  BinaryOp::Gt,  BinaryOp::Ge,  BinaryOp::And,
  BinaryOp::Or,    BinaryOp::BitAnd, BinaryOp::BitOr, BinaryOp::Elvis,
};
constexpr UnaryOp k_unary_ops[] = {UnaryOp::Not, UnaryOp::Neg};
constexpr AssignOp k_assign_ops[] = {
  AssignOp::Assign, AssignOp::AddAssign, AssignOp::SubAssign, AssignOp::MulAssign,
  AssignOp::DivAssign,
};
constexpr DestructureKind k_destructure_kinds[] = {
  DestructureKind::Tuple, DestructureKind::Record, DestructureKind::Error,
};
constexpr InvokableKind k_invokable_kinds[] = {
  InvokableKind::Function, InvokableKind::Lambda, InvokableKind::Worker,
};

/// Member `key` if present and not null.
const json * find(const json & j, const char * key)
{
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return nullptr;
  return &*it;
}

const json & need(const json & j, const char * key)
{
  const json * v = find(j, key);
  if (!v) throw InputError(std::string("missing member '") + key + "'");
  return *v;
}

// ============================================================================
// Loader
// ============================================================================

class Loader
{
public:
  Loader(AstContext & ast, TypeContext & types, SymbolTable & symbols, FileId file)
  : ast_(ast), types_(types), symbols_(symbols), file_(file)
  {
  }

  CompilationUnit * load(const json & doc)
  {
    if (!doc.is_object()) throw InputError("document must be an object");

    if (const json * syms = find(doc, "symbols")) {
      for (const json & s : *syms) load_symbol(s);
    }
    if (const json * table = find(doc, "types")) {
      for (const json & t : *table) load_type_entry(t);
    }

    const std::string package = doc.value("package", std::string());
    std::vector<Decl *> decls;
    if (const json * list = find(doc, "decls")) {
      for (const json & d : *list) decls.push_back(node_as<Decl>(d, "declaration"));
    }

    auto * unit = ast_.create<CompilationUnit>(ast_.intern(package), range_of(doc));
    unit->decls = ast_.copy_to_arena(decls);
    return unit;
  }

private:
  // ===========================================================================
  // Symbols and Types
  // ===========================================================================

  void load_symbol(const json & j)
  {
    const auto id = need(j, "id").get<std::string>();
    const auto kind_name = j.value("kind", std::string("variable"));

    SymbolKind kind = SymbolKind::Variable;
    if (kind_name == "function") {
      kind = SymbolKind::Function;
    } else if (kind_name == "type") {
      kind = SymbolKind::Type;
    } else if (kind_name == "worker") {
      kind = SymbolKind::Worker;
    } else if (kind_name == "package") {
      kind = SymbolKind::Package;
    } else if (kind_name != "variable") {
      throw InputError("unknown symbol kind '" + kind_name + "'");
    }

    uint32_t flags = 0;
    if (const json * list = find(j, "flags")) {
      for (const json & f : *list) flags |= parse_flag(f.get<std::string>());
    }

    symbolIds_[id] = symbols_.create(
      need(j, "name").get<std::string>(), kind, j.value("package", std::string()), flags);
  }

  static uint32_t parse_flag(const std::string & name)
  {
    for (uint32_t bit = 1; bit <= static_cast<uint32_t>(SymbolFlag::Constant); bit <<= 1U) {
      if (to_string(static_cast<SymbolFlag>(bit)) == name) return bit;
    }
    throw InputError("unknown symbol flag '" + name + "'");
  }

  const Symbol * symbol_ref(const json & j, const char * key = "symbol")
  {
    const json * ref = find(j, key);
    if (!ref) return nullptr;
    auto it = symbolIds_.find(ref->get<std::string>());
    if (it == symbolIds_.end()) throw InputError("unknown symbol '" + ref->get<std::string>() + "'");
    return it->second;
  }

  const Type * type_ref(const json & ref)
  {
    const auto name = ref.get<std::string>();
    if (name == "$error") return types_.semantic_error_type();
    if (const Type * builtin = types_.lookup_builtin(name)) return builtin;
    auto it = typeIds_.find(name);
    if (it == typeIds_.end()) throw InputError("unknown type '" + name + "'");
    return it->second;
  }

  /// Optional type member; `fallback` when absent.
  const Type * type_of(const json & j, const char * key, const Type * fallback = nullptr)
  {
    const json * ref = find(j, key);
    return ref ? type_ref(*ref) : fallback;
  }

  std::vector<const Type *> type_list(const json & list)
  {
    std::vector<const Type *> out;
    for (const json & ref : list) out.push_back(type_ref(ref));
    return out;
  }

  std::vector<TypeField> type_fields(const json & j)
  {
    std::vector<TypeField> fields;
    if (const json * list = find(j, "fields")) {
      for (const json & f : *list) {
        TypeField field;
        field.name = types_.intern(need(f, "name").get<std::string>());
        field.type = type_ref(need(f, "type"));
        field.is_public = f.value("public", false);
        fields.push_back(field);
      }
    }
    return fields;
  }

  void load_type_entry(const json & j)
  {
    const auto id = need(j, "id").get<std::string>();
    if (typeIds_.count(id) != 0) throw InputError("duplicate type id '" + id + "'");
    typeIds_[id] = build_type(j);
  }

  const Type * build_type(const json & j)
  {
    const auto kind = need(j, "kind").get<std::string>();
    const auto name = types_.intern(j.value("name", std::string()));
    const Symbol * sym = symbol_ref(j);

    if (kind == "union") return types_.get_union_type(type_list(need(j, "members")));
    if (kind == "tuple") return types_.get_tuple_type(type_list(need(j, "members")));
    if (kind == "array") {
      return types_.get_array_type(type_ref(need(j, "element")), j.value("size", int64_t{-1}));
    }
    if (kind == "map") return types_.get_map_type(type_ref(need(j, "element")));
    if (kind == "future") {
      return types_.get_future_type(type_ref(need(j, "element")), j.value("worker", false));
    }
    if (kind == "typedesc") return types_.get_typedesc_type(type_ref(need(j, "element")));
    if (kind == "stream") return types_.get_stream_type(type_ref(need(j, "element")));

    if (kind == "record") {
      const bool sealed = j.value("sealed", false);
      return types_.create_record_type(
        name, type_fields(j), sealed, sealed ? nullptr : type_of(j, "rest", types_.anydata_type()),
        sym);
    }
    if (kind == "object") {
      Type * object = types_.create_object_type(name, type_fields(j), sym);
      object->client = j.value("client", false);
      if (const json * methods = find(j, "remote_methods")) {
        for (const json & m : *methods) {
          object->remote_methods.push_back(types_.intern(m.get<std::string>()));
        }
      }
      return object;
    }
    if (kind == "error") return types_.create_error_type(name, sym);
    if (kind == "finite") {
      std::vector<LiteralValue> values;
      for (const json & v : need(j, "values")) {
        values.push_back(literal_value(v, [this](std::string_view s) { return types_.intern(s); }));
      }
      return types_.create_finite_type(name, std::move(values), sym);
    }

    throw InputError("unknown type kind '" + kind + "'");
  }

  /// 5, 1.5, true, "x", null, or {"decimal": 1.5}
  template <typename Intern>
  static LiteralValue literal_value(const json & v, Intern intern)
  {
    if (v.is_null()) return LiteralValue::make_nil();
    if (v.is_boolean()) return LiteralValue::make_bool(v.get<bool>());
    if (v.is_number_integer()) return LiteralValue::make_int(v.get<int64_t>());
    if (v.is_number_float()) return LiteralValue::make_float(v.get<double>());
    if (v.is_string()) return LiteralValue::make_string(intern(v.get<std::string>()));
    if (v.is_object() && v.contains("decimal")) {
      return LiteralValue::make_float(v.at("decimal").get<double>(), true);
    }
    throw InputError("invalid literal value " + v.dump());
  }

  // ===========================================================================
  // Nodes
  // ===========================================================================

  SourceRange range_of(const json & j) const
  {
    const json * r = find(j, "range");
    if (!r) return SourceRange{};
    if (!r->is_array() || r->size() != 2) throw InputError("range must be [begin, end]");
    return SourceRange((*r)[0].get<uint32_t>(), (*r)[1].get<uint32_t>(), file_);
  }

  std::string_view text(const json & j, const char * key)
  {
    return ast_.intern(need(j, key).get<std::string>());
  }

  std::string_view optional_text(const json & j, const char * key)
  {
    const json * v = find(j, key);
    return v ? ast_.intern(v->get<std::string>()) : std::string_view{};
  }

  template <typename T>
  T * node_as(const json & j, const char * what)
  {
    AstNode * n = build_node(j);
    auto * out = dyn_cast<T>(n);
    if (!out) {
      throw InputError(std::string("expected ") + what + ", found '" + std::string(to_string(n->kind)) + "'");
    }
    return out;
  }

  /// Optional child node: nullptr when the member is absent.
  template <typename T>
  T * child(const json & j, const char * key, const char * what)
  {
    const json * v = find(j, key);
    return v ? node_as<T>(*v, what) : nullptr;
  }

  template <typename T>
  T * required(const json & j, const char * key, const char * what)
  {
    return node_as<T>(need(j, key), what);
  }

  template <typename T>
  gsl::span<T *> children(const json & j, const char * key, const char * what)
  {
    std::vector<T *> out;
    if (const json * list = find(j, key)) {
      for (const json & item : *list) out.push_back(node_as<T>(item, what));
    }
    return ast_.copy_to_arena(out);
  }

  template <typename T>
  T * typed(T * expr, const json & j)
  {
    expr->resolvedType = type_of(j, "type");
    return expr;
  }

  AstNode * build_node(const json & j)
  {
    if (!j.is_object()) throw InputError("node must be an object");
    const auto name = need(j, "node").get<std::string>();
    const auto kind = parse_node_kind(name);
    if (!kind) throw InputError("unknown node '" + name + "'");

    const SourceRange r = range_of(j);

    switch (*kind) {
      // ----- Expressions -----
      case NodeKind::Literal:
        return typed(
          ast_.create<LiteralExpr>(
            literal_value(need(j, "value"), [this](std::string_view s) { return ast_.intern(s); }),
            r),
          j);
      case NodeKind::VarRef: {
        auto * ref = typed(ast_.create<VarRefExpr>(text(j, "name"), r), j);
        ref->resolvedSymbol = symbol_ref(j);
        return ref;
      }
      case NodeKind::FieldAccess:
        return typed(
          ast_.create<FieldAccessExpr>(required<Expr>(j, "base", "expression"), text(j, "field"), r),
          j);
      case NodeKind::IndexAccess:
        return typed(
          ast_.create<IndexAccessExpr>(
            required<Expr>(j, "base", "expression"), required<Expr>(j, "index", "expression"), r),
          j);
      case NodeKind::Invocation: {
        auto * call = typed(ast_.create<InvocationExpr>(text(j, "name"), r), j);
        call->receiver = child<Expr>(j, "receiver", "expression");
        call->args = children<Expr>(j, "args", "expression");
        call->resolvedSymbol = symbol_ref(j);
        call->isActionInvocation = j.value("action", false);
        return call;
      }
      case NodeKind::NamedArg:
        return typed(
          ast_.create<NamedArgExpr>(text(j, "name"), required<Expr>(j, "value", "expression"), r),
          j);
      case NodeKind::RecordLiteral: {
        auto * lit = typed(ast_.create<RecordLiteralExpr>(r), j);
        lit->fields = children<RecordField>(j, "fields", "record field");
        return lit;
      }
      case NodeKind::ListLiteral: {
        auto * lit = typed(ast_.create<ListLiteralExpr>(r), j);
        lit->elements = children<Expr>(j, "elements", "expression");
        return lit;
      }
      case NodeKind::Binary:
        return typed(
          ast_.create<BinaryExpr>(
            required<Expr>(j, "lhs", "expression"), parse_op(need(j, "op"), k_binary_ops, "operator"),
            required<Expr>(j, "rhs", "expression"), r),
          j);
      case NodeKind::Unary:
        return typed(
          ast_.create<UnaryExpr>(
            parse_op(need(j, "op"), k_unary_ops, "operator"),
            required<Expr>(j, "operand", "expression"), r),
          j);
      case NodeKind::Ternary:
        return typed(
          ast_.create<TernaryExpr>(
            required<Expr>(j, "condition", "expression"), required<Expr>(j, "then", "expression"),
            required<Expr>(j, "else", "expression"), r),
          j);
      case NodeKind::TypeTest: {
        auto * test = ast_.create<TypeTestExpr>(
          required<Expr>(j, "expr", "expression"), type_ref(need(j, "tested")), r);
        test->resolvedType = type_of(j, "type", types_.boolean_type());
        return test;
      }
      case NodeKind::Check:
        return typed(
          ast_.create<CheckExpr>(
            required<Expr>(j, "expr", "expression"), j.value("panic", false), r),
          j);
      case NodeKind::Trap:
        return typed(ast_.create<TrapExpr>(required<Expr>(j, "expr", "expression"), r), j);
      case NodeKind::Wait:
        return typed(ast_.create<WaitExpr>(required<Expr>(j, "expr", "expression"), r), j);
      case NodeKind::Lambda:
        return typed(
          ast_.create<LambdaExpr>(required<FunctionDecl>(j, "function", "function"), r), j);
      case NodeKind::WorkerSyncSend:
        return typed(
          ast_.create<WorkerSyncSendExpr>(
            required<Expr>(j, "expr", "expression"), text(j, "worker"), r),
          j);
      case NodeKind::WorkerReceive:
        return typed(ast_.create<WorkerReceiveExpr>(text(j, "worker"), r), j);
      case NodeKind::WorkerFlush:
        return typed(ast_.create<WorkerFlushExpr>(optional_text(j, "worker"), r), j);

      // ----- Statements -----
      case NodeKind::Block: {
        auto * block = ast_.create<BlockStmt>(r);
        block->stmts = children<Stmt>(j, "stmts", "statement");
        return block;
      }
      case NodeKind::VarDef:
        return ast_.create<VarDefStmt>(required<VariableDecl>(j, "var", "variable"), r);
      case NodeKind::Assignment:
        return ast_.create<AssignmentStmt>(
          required<Expr>(j, "target", "expression"),
          find(j, "op") ? parse_op(need(j, "op"), k_assign_ops, "assignment operator")
                        : AssignOp::Assign,
          required<Expr>(j, "value", "expression"), r);
      case NodeKind::Destructure:
        return ast_.create<DestructureStmt>(
          parse_op(need(j, "kind"), k_destructure_kinds, "destructure kind"),
          required<Expr>(j, "target", "expression"), required<Expr>(j, "value", "expression"), r);
      case NodeKind::ExprStmt:
        return ast_.create<ExprStmt>(required<Expr>(j, "expr", "expression"), r);
      case NodeKind::Return:
        return ast_.create<ReturnStmt>(child<Expr>(j, "value", "expression"), r);
      case NodeKind::If:
        return ast_.create<IfStmt>(
          required<Expr>(j, "condition", "expression"), required<BlockStmt>(j, "then", "block"),
          child<Stmt>(j, "else", "statement"), r);
      case NodeKind::While:
        return ast_.create<WhileStmt>(
          required<Expr>(j, "condition", "expression"), required<BlockStmt>(j, "body", "block"), r);
      case NodeKind::Foreach:
        return ast_.create<ForeachStmt>(
          text(j, "variable"), required<Expr>(j, "collection", "expression"),
          required<BlockStmt>(j, "body", "block"), r);
      case NodeKind::Break:
        return ast_.create<BreakStmt>(r);
      case NodeKind::Continue:
        return ast_.create<ContinueStmt>(r);
      case NodeKind::Panic:
        return ast_.create<PanicStmt>(required<Expr>(j, "value", "expression"), r);
      case NodeKind::Abort:
        return ast_.create<AbortStmt>(r);
      case NodeKind::Retry:
        return ast_.create<RetryStmt>(r);
      case NodeKind::Transaction: {
        auto * tx = ast_.create<TransactionStmt>(required<BlockStmt>(j, "body", "block"), r);
        tx->retryCount = child<Expr>(j, "retries", "expression");
        tx->onRetry = child<BlockStmt>(j, "onretry", "block");
        tx->onAborted = child<BlockStmt>(j, "aborted", "block");
        tx->onCommitted = child<BlockStmt>(j, "committed", "block");
        return tx;
      }
      case NodeKind::Lock:
        return ast_.create<LockStmt>(required<BlockStmt>(j, "body", "block"), r);
      case NodeKind::Match: {
        auto * match = ast_.create<MatchStmt>(required<Expr>(j, "expr", "expression"), r);
        match->clauses = children<MatchClause>(j, "clauses", "match clause");
        match->elseType = type_of(j, "else_type");
        return match;
      }
      case NodeKind::WorkerSend:
        return ast_.create<WorkerSendStmt>(
          required<Expr>(j, "expr", "expression"), text(j, "worker"), r);
      case NodeKind::WorkerDecl: {
        auto * fn = required<FunctionDecl>(j, "worker", "function");
        fn->invokable = InvokableKind::Worker;
        return ast_.create<WorkerDeclStmt>(fn, r);
      }
      case NodeKind::ForkJoin: {
        auto * fork = ast_.create<ForkJoinStmt>(r);
        fork->workers = children<WorkerDeclStmt>(j, "workers", "worker declaration");
        return fork;
      }
      case NodeKind::Forever:
        return ast_.create<ForeverStmt>(r);

      // ----- Declarations -----
      case NodeKind::Function: {
        auto * fn = ast_.create<FunctionDecl>(text(j, "name"), r);
        if (const json * inv = find(j, "invokable")) {
          fn->invokable = parse_op(*inv, k_invokable_kinds, "invokable kind");
        }
        fn->symbol = symbol_ref(j);
        fn->params = children<VariableDecl>(j, "params", "variable");
        fn->returnType = type_of(j, "return_type", types_.nil_type());
        fn->body = child<BlockStmt>(j, "body", "block");
        return fn;
      }
      case NodeKind::Variable: {
        auto * var = ast_.create<VariableDecl>(text(j, "name"), r);
        var->symbol = symbol_ref(j);
        var->declaredType = type_of(j, "type");
        var->init = child<Expr>(j, "init", "expression");
        return var;
      }
      case NodeKind::TypeDefinition: {
        auto * def = ast_.create<TypeDefinitionDecl>(text(j, "name"), r);
        def->symbol = symbol_ref(j);
        def->type = type_of(j, "type");
        def->methods = children<FunctionDecl>(j, "methods", "function");
        return def;
      }

      // ----- Supporting nodes -----
      case NodeKind::RecordField: {
        Expr * value = required<Expr>(j, "value", "expression");
        if (const json * key = find(j, "key")) {
          return ast_.create<RecordField>(ast_.intern(key->get<std::string>()), value, r);
        }
        return ast_.create<RecordField>(required<Expr>(j, "key_expr", "expression"), value, r);
      }
      case NodeKind::RecordBindingField:
        return ast_.create<RecordBindingField>(
          text(j, "key"), required<BindingPattern>(j, "pattern", "binding pattern"), r);
      case NodeKind::VarBinding: {
        auto * binding = ast_.create<VarBindingPattern>(text(j, "name"), r);
        binding->resolvedType = type_of(j, "type");
        return binding;
      }
      case NodeKind::TupleBinding: {
        auto * binding = ast_.create<TupleBindingPattern>(r);
        binding->members = children<BindingPattern>(j, "members", "binding pattern");
        binding->resolvedType = type_of(j, "type");
        return binding;
      }
      case NodeKind::RecordBinding: {
        auto * binding = ast_.create<RecordBindingPattern>(r);
        binding->fields = children<RecordBindingField>(j, "fields", "record binding field");
        binding->isClosed = j.value("closed", false);
        binding->restName = optional_text(j, "rest");
        binding->resolvedType = type_of(j, "type");
        return binding;
      }
      case NodeKind::StaticClause:
        return ast_.create<StaticMatchClause>(
          required<Expr>(j, "pattern", "expression"), required<BlockStmt>(j, "body", "block"), r);
      case NodeKind::StructuredClause:
        return ast_.create<StructuredMatchClause>(
          required<BindingPattern>(j, "pattern", "binding pattern"),
          child<Expr>(j, "guard", "expression"), required<BlockStmt>(j, "body", "block"), r);

      case NodeKind::CompilationUnit:
        break;
    }
    throw InputError("'" + name + "' cannot appear inside a compilation unit");
  }

  AstContext & ast_;
  TypeContext & types_;
  SymbolTable & symbols_;
  FileId file_;

  std::unordered_map<std::string, const Type *> typeIds_;
  std::unordered_map<std::string, const Symbol *> symbolIds_;
};

LoadResult failure(SourceRange range, std::string message)
{
  LoadResult result;
  result.diagnostics.report(DiagCode::InvalidAstInput, range, {std::move(message)});
  return result;
}

}  // namespace

LoadResult load_compilation_unit(
  const nlohmann::json & doc, AstContext & ast, TypeContext & types, SymbolTable & symbols,
  FileId file)
{
  try {
    LoadResult result;
    result.unit = Loader(ast, types, symbols, file).load(doc);
    return result;
  } catch (const InputError & e) {
    return failure(SourceRange(0, 0, file), e.what());
  } catch (const nlohmann::json::exception & e) {
    // Wrong member types surface as nlohmann type_error/out_of_range
    return failure(SourceRange(0, 0, file), e.what());
  }
}

LoadResult load_compilation_unit_file(
  const std::filesystem::path & path, AstContext & ast, TypeContext & types,
  SymbolTable & symbols, SourceRegistry & sources)
{
  namespace fs = std::filesystem;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return failure(SourceRange{}, "cannot open '" + path.string() + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  std::string content = buffer.str();

  json doc;
  try {
    doc = json::parse(content);
  } catch (const json::parse_error & e) {
    const auto offset = static_cast<uint32_t>(e.byte > 0 ? e.byte - 1 : 0);
    const FileId id = sources.register_file(path, std::move(content));
    return failure(SourceRange(offset, offset + 1, id), e.what());
  }

  FileId file = FileId::invalid();
  if (doc.is_object() && doc.contains("source") && doc["source"].is_string()) {
    const fs::path source = path.parent_path() / doc["source"].get<std::string>();
    std::ifstream src(source, std::ios::binary);
    if (src) {
      std::ostringstream text;
      text << src.rdbuf();
      file = sources.register_file(source, text.str());
    } else {
      file = sources.register_file(source, std::string());
    }
  } else {
    file = sources.register_file(path, std::string());
  }

  return load_compilation_unit(doc, ast, types, symbols, file);
}

}  // namespace flowsema
