// flowsema/project/project_config.hpp - Project configuration (flowsema.yaml)
//
// Parses and validates flowsema.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "flowsema/basic/diagnostic.hpp"

namespace flowsema
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class OutputFormat : uint8_t {
  Text,
  Json,
};

enum class ColorMode : uint8_t {
  Auto,
  Always,
  Never,
};

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view text) noexcept;
[[nodiscard]] std::optional<ColorMode> parse_color_mode(std::string_view text) noexcept;

/**
 * Package metadata section.
 */
struct PackageConfig
{
  /// Package whose units are analysed; must match each unit's package when set
  std::string name;
};

/**
 * Analyzer section: inputs and severity policy.
 */
struct AnalyzerConfig
{
  /// Typed AST files to analyse (relative to flowsema.yaml)
  std::vector<std::filesystem::path> inputs;

  /// Promote every warning to an error
  bool warnings_as_errors = false;

  /// Codes whose diagnostics are dropped
  std::vector<DiagCode> disabled;

  /// Per-code severity overrides, applied before warnings_as_errors
  std::vector<std::pair<DiagCode, Severity>> severity;
};

struct OutputConfig
{
  OutputFormat format = OutputFormat::Text;
  ColorMode color = ColorMode::Auto;
};

/**
 * Complete project configuration (flowsema.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  AnalyzerConfig analyzer;
  OutputConfig output;

  /// Directory containing flowsema.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a flowsema.yaml file.
 *
 * @param config_path Path to flowsema.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse flowsema.yaml content that is already in memory.
 *
 * @param text YAML document
 * @param project_root Directory relative input paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to flowsema.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "flowsema.yaml";

}  // namespace flowsema
