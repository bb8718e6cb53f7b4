// tests/ast/test_ast_loader.cpp - Unit tests for the typed AST JSON loader
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "flowsema/ast/ast_loader.hpp"
#include "flowsema/basic/casting.hpp"
#include "flowsema/sema/analysis/code_analyzer.hpp"

using namespace flowsema;
using nlohmann::json;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void write_file(const std::filesystem::path & path, const std::string & text)
{
  std::ofstream out(path, std::ios::binary);
  out << text;
}

struct Loaded
{
  AstContext ast;
  TypeContext types;
  SymbolTable symbols;
  LoadResult result;

  explicit Loaded(const std::string & text)
  : result(load_compilation_unit(json::parse(text), ast, types, symbols, FileId{0}))
  {
  }
};

const char * k_main_unit = R"({
  "package": "demo",
  "symbols": [
    {"id": "s1", "name": "main", "kind": "function", "package": "demo", "flags": ["public"]},
    {"id": "s2", "name": "count", "kind": "variable", "package": "demo"}
  ],
  "types": [
    {"id": "t1", "kind": "union", "members": ["int", "error"]},
    {"id": "t2", "kind": "array", "element": "t1", "size": 2}
  ],
  "decls": [
    {"node": "function", "name": "main", "symbol": "s1", "return_type": "t1", "range": [0, 40],
     "body": {"node": "block", "range": [10, 40], "stmts": [
       {"node": "return", "range": [12, 21],
        "value": {"node": "literal", "value": 5, "type": "int", "range": [19, 20]}},
       {"node": "expr_stmt", "range": [24, 30],
        "expr": {"node": "var_ref", "name": "count", "symbol": "s2", "type": "int"}}
     ]}}
  ]
})";

}  // namespace

// ============================================================================
// Successful Loads
// ============================================================================

TEST(AstLoader, LoadsFunctionWithBody)
{
  Loaded loaded(k_main_unit);
  ASSERT_TRUE(loaded.result.success());
  EXPECT_TRUE(loaded.result.diagnostics.empty());

  CompilationUnit * unit = loaded.result.unit;
  EXPECT_EQ(unit->package, "demo");
  ASSERT_EQ(unit->decls.size(), 1U);

  auto * fn = dyn_cast<FunctionDecl>(unit->decls[0]);
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(fn->name, "main");
  ASSERT_NE(fn->symbol, nullptr);
  EXPECT_TRUE(fn->symbol->is_public());
  EXPECT_EQ(to_string(fn->returnType), "int|error");
  EXPECT_EQ(fn->get_range(), SourceRange(0, 40, FileId{0}));

  ASSERT_NE(fn->body, nullptr);
  ASSERT_EQ(fn->body->stmts.size(), 2U);
  auto * ret = dyn_cast<ReturnStmt>(fn->body->stmts[0]);
  ASSERT_NE(ret, nullptr);
  auto * value = dyn_cast<LiteralExpr>(ret->value);
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(value->value, LiteralValue::make_int(5));
  EXPECT_EQ(value->resolvedType, loaded.types.int_type());
}

TEST(AstLoader, TypeTableEntriesReferEarlierEntries)
{
  Loaded loaded(R"({
    "types": [
      {"id": "t1", "kind": "union", "members": ["int", "error"]},
      {"id": "t2", "kind": "array", "element": "t1", "size": 2},
      {"id": "t3", "kind": "record", "name": "Point", "sealed": true,
       "fields": [{"name": "x", "type": "int"}, {"name": "tags", "type": "t2"}]},
      {"id": "t4", "kind": "record", "name": "Bag", "fields": []}
    ],
    "decls": [
      {"node": "variable", "name": "p", "type": "t3"},
      {"node": "variable", "name": "b", "type": "t4"}
    ]
  })");
  ASSERT_TRUE(loaded.result.success());

  auto * p = dyn_cast<VariableDecl>(loaded.result.unit->decls[0]);
  auto * bag = dyn_cast<VariableDecl>(loaded.result.unit->decls[1]);
  ASSERT_NE(p, nullptr);
  ASSERT_NE(bag, nullptr);

  const Type * point = p->declaredType;
  ASSERT_EQ(point->fields.size(), 2U);
  EXPECT_EQ(to_string(point->fields[1].type), "(int|error)[2]");
  EXPECT_TRUE(point->sealed);

  // An open record without a rest type takes anydata
  EXPECT_FALSE(bag->declaredType->sealed);
  EXPECT_EQ(bag->declaredType->element, loaded.types.anydata_type());
}

TEST(AstLoader, DecimalAndNilLiterals)
{
  Loaded loaded(R"({
    "decls": [
      {"node": "variable", "name": "d", "type": "decimal",
       "init": {"node": "literal", "value": {"decimal": 1.5}, "type": "decimal"}},
      {"node": "variable", "name": "n", "type": "()",
       "init": {"node": "literal", "value": null, "type": "()"}}
    ]
  })");
  ASSERT_TRUE(loaded.result.success());

  auto * d = dyn_cast<LiteralExpr>(cast<VariableDecl>(loaded.result.unit->decls[0])->init);
  auto * n = dyn_cast<LiteralExpr>(cast<VariableDecl>(loaded.result.unit->decls[1])->init);
  ASSERT_NE(d, nullptr);
  ASSERT_NE(n, nullptr);
  EXPECT_EQ(d->value.kind(), LiteralKind::Decimal);
  EXPECT_EQ(n->value.kind(), LiteralKind::Nil);
}

TEST(AstLoader, LoadedUnitIsAnalysable)
{
  Loaded loaded(R"({
    "package": "demo",
    "symbols": [{"id": "f", "name": "f", "kind": "function", "package": "demo", "flags": ["public"]}],
    "decls": [
      {"node": "function", "name": "f", "symbol": "f", "return_type": "int", "range": [0, 30],
       "body": {"node": "block", "stmts": [
         {"node": "return", "range": [5, 14],
          "value": {"node": "literal", "value": 1, "type": "int"}},
         {"node": "break", "range": [16, 22]}
       ]}}
    ]
  })");
  ASSERT_TRUE(loaded.result.success());

  DiagnosticBag diags;
  CodeAnalyzer analyzer(loaded.ast, loaded.types, &diags);
  EXPECT_FALSE(analyzer.analyze(*loaded.result.unit));
  EXPECT_EQ(diags.count(DiagCode::UnreachableCode), 1U);
  EXPECT_EQ(diags.count(DiagCode::LoopExitOutsideLoop), 1U);
  EXPECT_EQ(diags.all().front().primary_range(), SourceRange(16, 22, FileId{0}));
}

// ============================================================================
// Malformed Input
// ============================================================================

TEST(AstLoader, UnknownNodeKind)
{
  Loaded loaded(R"({"decls": [{"node": "goto", "label": "x"}]})");
  EXPECT_FALSE(loaded.result.success());
  ASSERT_EQ(loaded.result.diagnostics.size(), 1U);

  const Diagnostic & d = loaded.result.diagnostics.all().front();
  EXPECT_EQ(d.kind, DiagCode::InvalidAstInput);
  EXPECT_NE(d.message.find("unknown node 'goto'"), std::string::npos);
}

TEST(AstLoader, WrongNodeCategory)
{
  Loaded loaded(R"({"decls": [{"node": "break"}]})");
  EXPECT_FALSE(loaded.result.success());
  ASSERT_FALSE(loaded.result.diagnostics.empty());
  EXPECT_NE(
    loaded.result.diagnostics.all().front().message.find("expected declaration"), std::string::npos);
}

TEST(AstLoader, MissingRequiredMember)
{
  Loaded loaded(R"({"decls": [{"node": "function", "body": {"node": "block"}}]})");
  EXPECT_FALSE(loaded.result.success());
  EXPECT_NE(
    loaded.result.diagnostics.all().front().message.find("missing member 'name'"),
    std::string::npos);
}

TEST(AstLoader, UnknownTypeAndSymbolReferences)
{
  Loaded forward(R"({
    "types": [{"id": "t1", "kind": "array", "element": "t2"}, {"id": "t2", "kind": "map", "element": "int"}]
  })");
  EXPECT_FALSE(forward.result.success());
  EXPECT_NE(
    forward.result.diagnostics.all().front().message.find("unknown type 't2'"), std::string::npos);

  Loaded symbol(R"({"decls": [{"node": "variable", "name": "v", "symbol": "nope"}]})");
  EXPECT_FALSE(symbol.result.success());
  EXPECT_NE(
    symbol.result.diagnostics.all().front().message.find("unknown symbol 'nope'"),
    std::string::npos);
}

TEST(AstLoader, UnknownSymbolFlag)
{
  Loaded loaded(R"({"symbols": [{"id": "s", "name": "s", "flags": ["exported"]}]})");
  EXPECT_FALSE(loaded.result.success());
  EXPECT_NE(
    loaded.result.diagnostics.all().front().message.find("unknown symbol flag 'exported'"),
    std::string::npos);
}

TEST(AstLoader, MemberOfWrongJsonType)
{
  Loaded loaded(R"({"decls": [{"node": "variable", "name": 42}]})");
  EXPECT_FALSE(loaded.result.success());
  EXPECT_EQ(loaded.result.diagnostics.all().front().kind, DiagCode::InvalidAstInput);
}

// ============================================================================
// Files
// ============================================================================

TEST(AstLoader, FileWithSourceText)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "flowsema_loader_source");
  write_file(dir.path / "main.bal", "function f() {\n  break;\n}\n");
  write_file(dir.path / "main.json", R"({
    "source": "main.bal",
    "decls": [{"node": "function", "name": "f", "body": {"node": "block", "stmts": [
      {"node": "break", "range": [17, 23]}
    ]}}]
  })");

  AstContext ast;
  TypeContext types;
  SymbolTable symbols;
  SourceRegistry sources;
  LoadResult result = load_compilation_unit_file(dir.path / "main.json", ast, types, symbols, sources);
  ASSERT_TRUE(result.success());

  auto * fn = cast<FunctionDecl>(result.unit->decls[0]);
  const SourceRange brk = fn->body->stmts[0]->get_range();
  EXPECT_EQ(sources.get_slice(brk), "break;");
  EXPECT_EQ(sources.get_line_column(brk.get_begin()).line, 2U);
}

TEST(AstLoader, FileWithSyntaxError)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "flowsema_loader_syntax");
  write_file(dir.path / "broken.json", "{\"decls\": [}");

  AstContext ast;
  TypeContext types;
  SymbolTable symbols;
  SourceRegistry sources;
  LoadResult result =
    load_compilation_unit_file(dir.path / "broken.json", ast, types, symbols, sources);

  EXPECT_FALSE(result.success());
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.all().front().kind, DiagCode::InvalidAstInput);
  EXPECT_TRUE(result.diagnostics.all().front().primary_range().is_valid());
}

TEST(AstLoader, MissingFile)
{
  AstContext ast;
  TypeContext types;
  SymbolTable symbols;
  SourceRegistry sources;
  LoadResult result = load_compilation_unit_file(
    std::filesystem::temp_directory_path() / "flowsema_no_such_file.json", ast, types, symbols,
    sources);

  EXPECT_FALSE(result.success());
  EXPECT_NE(result.diagnostics.all().front().message.find("cannot open"), std::string::npos);
}
