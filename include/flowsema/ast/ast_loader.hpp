// flowsema/ast/ast_loader.hpp - Typed AST input in JSON form
//
// The type checker that precedes this pass hands its output over as a JSON
// document: a type table, a symbol table and the declarations of one
// compilation unit. This loader rebuilds the arena AST from it.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

#include "flowsema/ast/ast.hpp"
#include "flowsema/ast/ast_context.hpp"
#include "flowsema/basic/diagnostic.hpp"
#include "flowsema/basic/source_manager.hpp"
#include "flowsema/sema/symbol.hpp"
#include "flowsema/sema/types/type.hpp"

namespace flowsema
{

/**
 * Result of loading one typed compilation unit.
 */
struct LoadResult
{
  /// Loaded unit (nullptr if loading failed)
  CompilationUnit * unit = nullptr;

  /// InvalidAstInput diagnostics; empty on success
  DiagnosticBag diagnostics;

  [[nodiscard]] bool success() const noexcept { return unit != nullptr; }
};

/**
 * Rebuild a compilation unit from its JSON form.
 *
 * Document layout:
 * ```json
 * {
 *   "package": "demo",
 *   "source": "main.bal",
 *   "symbols": [{"id": "s1", "name": "main", "kind": "function",
 *                "package": "demo", "flags": ["public"]}],
 *   "types": [{"id": "t1", "kind": "union", "members": ["int", "error"]}],
 *   "decls": [{"node": "function", "name": "main", "symbol": "s1", ...}]
 * }
 * ```
 *
 * Type references are builtin names ("int", "()", "$error" for the
 * recovery placeholder) or ids of earlier "types" entries. Every node is an
 * object whose "node" member is its snake_case kind ("return", "if",
 * "worker_send", ...) with an optional "range": [begin, end].
 *
 * @param doc Parsed document
 * @param ast Arena receiving nodes and strings
 * @param types Context receiving the types of the table
 * @param symbols Table receiving the symbols
 * @param file File the ranges refer to
 */
[[nodiscard]] LoadResult load_compilation_unit(
  const nlohmann::json & doc, AstContext & ast, TypeContext & types, SymbolTable & symbols,
  FileId file = FileId::invalid());

/**
 * Read, parse and load a typed AST file.
 *
 * When the document names its "source" file (relative to the JSON file)
 * and that file is readable, it is registered with its content so
 * diagnostics can show source lines; otherwise the JSON file itself is
 * registered without content.
 */
[[nodiscard]] LoadResult load_compilation_unit_file(
  const std::filesystem::path & path, AstContext & ast, TypeContext & types,
  SymbolTable & symbols, SourceRegistry & sources);

}  // namespace flowsema
