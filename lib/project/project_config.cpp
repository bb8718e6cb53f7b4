// flowsema/project/project_config.cpp - Project configuration implementation
//
#include "flowsema/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace flowsema
{

std::optional<OutputFormat> parse_output_format(std::string_view text) noexcept
{
  if (text == "text") return OutputFormat::Text;
  if (text == "json") return OutputFormat::Json;
  return std::nullopt;
}

std::optional<ColorMode> parse_color_mode(std::string_view text) noexcept
{
  if (text == "auto") return ColorMode::Auto;
  if (text == "always") return ColorMode::Always;
  if (text == "never") return ColorMode::Never;
  return std::nullopt;
}

namespace
{

std::optional<DiagCode> code_of(const YAML::Node & node, std::string & error)
{
  const auto id = node.as<std::string>();
  auto code = parse_diag_code(id);
  if (!code) error = "unknown diagnostic code '" + id + "'";
  return code;
}

/// Parse the 'analyzer' section into `out`; returns an error message or "".
std::string parse_analyzer(
  const YAML::Node & node, const std::filesystem::path & root, AnalyzerConfig & out)
{
  if (!node.IsMap()) return "analyzer must be a map";

  if (node["inputs"]) {
    if (!node["inputs"].IsSequence()) return "analyzer.inputs must be a list";
    for (const auto & input : node["inputs"]) {
      out.inputs.push_back(root / input.as<std::string>());
    }
  }

  if (node["warnings_as_errors"]) {
    out.warnings_as_errors = node["warnings_as_errors"].as<bool>();
  }

  if (node["disabled"]) {
    if (!node["disabled"].IsSequence()) return "analyzer.disabled must be a list";
    for (const auto & id : node["disabled"]) {
      std::string error;
      auto code = code_of(id, error);
      if (!code) return "analyzer.disabled: " + error;
      out.disabled.push_back(*code);
    }
  }

  if (node["severity"]) {
    if (!node["severity"].IsMap()) return "analyzer.severity must be a map";
    for (const auto & entry : node["severity"]) {
      std::string error;
      auto code = code_of(entry.first, error);
      if (!code) return "analyzer.severity: " + error;
      const auto level = entry.second.as<std::string>();
      auto severity = parse_severity(level);
      if (!severity) {
        return "analyzer.severity: invalid level '" + level + "' (must be error, warning, info or hint)";
      }
      out.severity.emplace_back(*code, *severity);
    }
  }

  return {};
}

ConfigLoadResult from_yaml(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  // An empty file is a valid, default configuration
  if (root.IsNull()) return ConfigLoadResult::ok(std::move(config));
  if (!root.IsMap()) return ConfigLoadResult::fail("configuration root must be a map");

  try {
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
    }

    if (root["analyzer"]) {
      const std::string error = parse_analyzer(root["analyzer"], project_root, config.analyzer);
      if (!error.empty()) return ConfigLoadResult::fail(error);
    }

    if (root["output"]) {
      const auto & out = root["output"];
      if (out["format"]) {
        const auto value = out["format"].as<std::string>();
        auto format = parse_output_format(value);
        if (!format) {
          return ConfigLoadResult::fail(
            "invalid output.format: '" + value + "' (must be 'text' or 'json')");
        }
        config.output.format = *format;
      }
      if (out["color"]) {
        const auto value = out["color"].as<std::string>();
        auto color = parse_color_mode(value);
        if (!color) {
          return ConfigLoadResult::fail(
            "invalid output.color: '" + value + "' (must be 'auto', 'always' or 'never')");
        }
        config.output.color = *color;
      }
    }
  } catch (const YAML::Exception & e) {
    // Scalar conversion failures (e.g. a map where a string is expected)
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return from_yaml(root, project_root);
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return from_yaml(root, fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace flowsema
