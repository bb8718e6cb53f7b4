// flowsema/test_support/analysis_helpers.hpp - helpers for unit/integration tests
//
// A TestUnit owns everything one analysis run needs (arena, types, symbols,
// diagnostics) plus an AstBuilder writing into it, so a test can build a
// typed tree in a few lines and run the pass over it.
//
#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "flowsema/ast/ast_builder.hpp"
#include "flowsema/ast/ast_context.hpp"
#include "flowsema/basic/diagnostic.hpp"
#include "flowsema/sema/analysis/code_analyzer.hpp"
#include "flowsema/sema/symbol.hpp"
#include "flowsema/sema/types/type.hpp"

namespace flowsema::test_support
{

inline constexpr std::string_view k_test_package = "demo";

class TestUnit
{
public:
  TestUnit() : b(ast, types) {}

  TestUnit(const TestUnit &) = delete;
  TestUnit & operator=(const TestUnit &) = delete;

  AstContext ast;
  TypeContext types;
  SymbolTable symbols;
  AstBuilder b;
  DiagnosticBag diags;

  // ===========================================================================
  // Symbols
  // ===========================================================================

  const Symbol * public_symbol(
    std::string_view name, SymbolKind kind = SymbolKind::Function,
    std::string_view package = k_test_package)
  {
    return symbols.create(name, kind, package, static_cast<uint32_t>(SymbolFlag::Public));
  }

  const Symbol * private_symbol(
    std::string_view name, SymbolKind kind = SymbolKind::Function,
    std::string_view package = k_test_package)
  {
    return symbols.create(name, kind, package, 0);
  }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  /// Public function `name` whose body is `stmts`.
  FunctionDecl * function(
    std::string_view name, const Type * return_type, std::vector<Stmt *> stmts)
  {
    return b.function(name, return_type, b.block(std::move(stmts)), public_symbol(name));
  }

  CompilationUnit * unit(std::vector<Decl *> decls)
  {
    return b.unit(k_test_package, std::move(decls));
  }

  // ===========================================================================
  // Running the Pass
  // ===========================================================================

  /// Analyse `unit`; diagnostics accumulate in `diags`.
  bool analyze(CompilationUnit * unit)
  {
    CodeAnalyzer analyzer(ast, types, &diags);
    return analyzer.analyze(*unit);
  }

  /// Analyse a unit made of a single public function `f`.
  bool analyze_body(std::vector<Stmt *> stmts, const Type * return_type = nullptr)
  {
    last_function = function("f", return_type, std::move(stmts));
    return analyze(unit({last_function}));
  }

  FunctionDecl * last_function = nullptr;

  // ===========================================================================
  // Diagnostic Queries
  // ===========================================================================

  [[nodiscard]] size_t count(DiagCode code) const { return diags.count(code); }

  [[nodiscard]] std::vector<DiagCode> codes() const
  {
    std::vector<DiagCode> out;
    for (const auto & d : diags) out.push_back(d.kind);
    return out;
  }

  [[nodiscard]] const Diagnostic * first(DiagCode code) const
  {
    const auto & all = diags.all();
    auto it = std::find_if(all.begin(), all.end(), [code](const Diagnostic & d) {
      return d.kind == code;
    });
    return it == all.end() ? nullptr : &*it;
  }

  /// Is there a diagnostic of `code` whose primary range is `node`'s range?
  [[nodiscard]] bool reported_at(DiagCode code, const AstNode * node) const
  {
    return std::any_of(diags.begin(), diags.end(), [&](const Diagnostic & d) {
      return d.kind == code && d.primary_range() == node->get_range();
    });
  }
};

}  // namespace flowsema::test_support
