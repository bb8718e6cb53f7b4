// flowsema/driver/analyzer_driver.hpp - Analyzer driver
//
// Single entry point for the load + analyse pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "flowsema/basic/diagnostic.hpp"
#include "flowsema/basic/source_manager.hpp"
#include "flowsema/project/project_config.hpp"

namespace flowsema
{

// ============================================================================
// Analyze Options
// ============================================================================

struct AnalyzeOptions
{
  /// Promote warnings to errors (in addition to the project setting)
  bool warnings_as_errors = false;

  /// Progress lines on stderr
  bool verbose = false;
};

// ============================================================================
// Analyze Result
// ============================================================================

struct AnalyzeResult
{
  /// No error-severity diagnostic after the severity policy was applied
  bool success = false;

  /// Collected diagnostics, unit by unit in input order
  DiagnosticBag diagnostics;

  /// Files the diagnostics point into
  SourceRegistry sources;

  /// Units that loaded and went through the pass
  size_t units_analyzed = 0;
};

// ============================================================================
// AnalyzerDriver
// ============================================================================

/**
 * Loads typed compilation units and runs the semantic validation pass.
 *
 * Each unit gets its own AST arena, type context and symbol table; only
 * diagnostics and source files outlive a unit.
 */
class AnalyzerDriver
{
public:
  /**
   * Analyse a single typed AST file with the default policy.
   */
  [[nodiscard]] static AnalyzeResult analyze_file(
    const std::filesystem::path & file, const AnalyzeOptions & options);

  /**
   * Analyse typed AST files under an explicit policy.
   *
   * @param files Typed AST files
   * @param policy Severity policy (inputs are ignored)
   * @param options Driver options
   * @param package Expected package of every unit; empty accepts any
   */
  [[nodiscard]] static AnalyzeResult analyze_files(
    const std::vector<std::filesystem::path> & files, const AnalyzerConfig & policy,
    const AnalyzeOptions & options, const std::string & package = {});

  /**
   * Analyse the inputs listed by a project configuration.
   */
  [[nodiscard]] static AnalyzeResult analyze_project(
    const ProjectConfig & config, const AnalyzeOptions & options);

  /**
   * Drop disabled codes, apply per-code overrides, then promote warnings
   * when `warnings_as_errors` is set.
   */
  static void apply_severity_policy(DiagnosticBag & diags, const AnalyzerConfig & policy);
};

}  // namespace flowsema
