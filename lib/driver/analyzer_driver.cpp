// flowsema/driver/analyzer_driver.cpp - Analyzer driver implementation
//
#include "flowsema/driver/analyzer_driver.hpp"

#include <fmt/core.h>

#include <algorithm>

#include "flowsema/ast/ast_context.hpp"
#include "flowsema/ast/ast_loader.hpp"
#include "flowsema/sema/analysis/code_analyzer.hpp"
#include "flowsema/sema/symbol.hpp"
#include "flowsema/sema/types/type.hpp"

namespace flowsema
{

AnalyzeResult AnalyzerDriver::analyze_file(
  const std::filesystem::path & file, const AnalyzeOptions & options)
{
  return analyze_files({file}, AnalyzerConfig{}, options);
}

AnalyzeResult AnalyzerDriver::analyze_files(
  const std::vector<std::filesystem::path> & files, const AnalyzerConfig & policy,
  const AnalyzeOptions & options, const std::string & package)
{
  namespace fs = std::filesystem;

  AnalyzeResult result;

  if (files.empty()) {
    result.diagnostics.report_error(SourceRange{}, "no input files");
    return result;
  }

  for (const auto & file : files) {
    if (!fs::exists(file)) {
      result.diagnostics.report_error(SourceRange{}, "file not found: " + file.string());
      continue;
    }

    if (options.verbose) {
      fmt::print(stderr, "Loading: {}\n", file.string());
    }

    AstContext ast;
    TypeContext types;
    SymbolTable symbols;
    LoadResult loaded = load_compilation_unit_file(file, ast, types, symbols, result.sources);
    if (!loaded.success()) {
      result.diagnostics.merge(std::move(loaded.diagnostics));
      continue;
    }

    CompilationUnit & unit = *loaded.unit;
    if (!package.empty() && unit.package != package) {
      result.diagnostics.report_error(
        SourceRange{}, fmt::format(
                         "{}: unit belongs to package '{}', expected '{}'", file.string(),
                         unit.package, package));
      continue;
    }

    DiagnosticBag unit_diags;
    CodeAnalyzer analyzer(ast, types, &unit_diags);
    const bool clean = analyzer.analyze(unit);
    ++result.units_analyzed;

    if (options.verbose) {
      fmt::print(
        stderr, "Analyzed: {} (package '{}', {} declarations, {} diagnostics{})\n", file.string(),
        unit.package, unit.decls.size(), unit_diags.size(), clean ? "" : ", has errors");
    }

    result.diagnostics.merge(std::move(unit_diags));
  }

  AnalyzerConfig effective = policy;
  effective.warnings_as_errors = policy.warnings_as_errors || options.warnings_as_errors;
  apply_severity_policy(result.diagnostics, effective);

  result.success = !result.diagnostics.has_errors();
  return result;
}

AnalyzeResult AnalyzerDriver::analyze_project(
  const ProjectConfig & config, const AnalyzeOptions & options)
{
  if (config.analyzer.inputs.empty()) {
    AnalyzeResult result;
    result.diagnostics.report_error(SourceRange{}, "no inputs defined in project configuration");
    return result;
  }

  if (options.verbose) {
    fmt::print(
      stderr, "Project root: {} ({} inputs)\n", config.project_root.string(),
      config.analyzer.inputs.size());
  }

  return analyze_files(config.analyzer.inputs, config.analyzer, options, config.package.name);
}

void AnalyzerDriver::apply_severity_policy(DiagnosticBag & diags, const AnalyzerConfig & policy)
{
  auto & all = diags.all_mutable();

  const auto disabled = [&policy](const Diagnostic & d) {
    return std::find(policy.disabled.begin(), policy.disabled.end(), d.kind) !=
           policy.disabled.end();
  };
  all.erase(std::remove_if(all.begin(), all.end(), disabled), all.end());

  for (auto & diag : all) {
    for (const auto & [code, severity] : policy.severity) {
      if (diag.kind == code) diag.severity = severity;
    }
    if (policy.warnings_as_errors && diag.severity == Severity::Warning) {
      diag.severity = Severity::Error;
    }
  }
}

}  // namespace flowsema
