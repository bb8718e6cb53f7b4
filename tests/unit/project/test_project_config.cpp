// tests/project/test_project_config.cpp - flowsema.yaml parsing and discovery
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "flowsema/project/project_config.hpp"

using namespace flowsema;
namespace fs = std::filesystem;

namespace
{

struct TempDir
{
  fs::path path;
  explicit TempDir(fs::path p) : path(std::move(p)) { fs::create_directories(path); }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(ProjectConfig, EmptyDocumentGivesDefaults)
{
  const auto result = parse_project_config("", "/proj");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & cfg = result.config;
  EXPECT_TRUE(cfg.package.name.empty());
  EXPECT_TRUE(cfg.analyzer.inputs.empty());
  EXPECT_FALSE(cfg.analyzer.warnings_as_errors);
  EXPECT_EQ(cfg.output.format, OutputFormat::Text);
  EXPECT_EQ(cfg.output.color, ColorMode::Auto);
  EXPECT_EQ(cfg.project_root, fs::path("/proj"));
}

TEST(ProjectConfig, FullDocument)
{
  const auto result = parse_project_config(
    R"(
package:
  name: demo
analyzer:
  inputs:
    - build/main.json
    - build/util.json
  warnings_as_errors: true
  disabled:
    - unreachable-code
  severity:
    deprecated-function-usage: error
    must-return: warning
output:
  format: json
  color: never
)",
    "/proj");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & cfg = result.config;
  EXPECT_EQ(cfg.package.name, "demo");
  ASSERT_EQ(cfg.analyzer.inputs.size(), 2U);
  EXPECT_EQ(cfg.analyzer.inputs[0], fs::path("/proj/build/main.json"));
  EXPECT_TRUE(cfg.analyzer.warnings_as_errors);
  ASSERT_EQ(cfg.analyzer.disabled.size(), 1U);
  EXPECT_EQ(cfg.analyzer.disabled[0], DiagCode::UnreachableCode);

  ASSERT_EQ(cfg.analyzer.severity.size(), 2U);
  EXPECT_EQ(cfg.analyzer.severity[0].first, DiagCode::DeprecatedFunctionUsage);
  EXPECT_EQ(cfg.analyzer.severity[0].second, Severity::Error);
  EXPECT_EQ(cfg.analyzer.severity[1].first, DiagCode::MustReturn);
  EXPECT_EQ(cfg.analyzer.severity[1].second, Severity::Warning);

  EXPECT_EQ(cfg.output.format, OutputFormat::Json);
  EXPECT_EQ(cfg.output.color, ColorMode::Never);
}

TEST(ProjectConfig, UnknownDiagnosticCode)
{
  const auto disabled = parse_project_config("analyzer:\n  disabled: [no-such-check]\n", "/proj");
  EXPECT_FALSE(disabled.success);
  EXPECT_NE(disabled.error.find("unknown diagnostic code 'no-such-check'"), std::string::npos);

  const auto severity =
    parse_project_config("analyzer:\n  severity:\n    bogus: warning\n", "/proj");
  EXPECT_FALSE(severity.success);
  EXPECT_NE(severity.error.find("analyzer.severity"), std::string::npos);
}

TEST(ProjectConfig, InvalidValues)
{
  const auto level =
    parse_project_config("analyzer:\n  severity:\n    must-return: fatal\n", "/proj");
  EXPECT_FALSE(level.success);
  EXPECT_NE(level.error.find("invalid level 'fatal'"), std::string::npos);

  const auto format = parse_project_config("output:\n  format: xml\n", "/proj");
  EXPECT_FALSE(format.success);
  EXPECT_NE(format.error.find("output.format"), std::string::npos);

  const auto color = parse_project_config("output:\n  color: sometimes\n", "/proj");
  EXPECT_FALSE(color.success);

  const auto werror = parse_project_config("analyzer:\n  warnings_as_errors: maybe\n", "/proj");
  EXPECT_FALSE(werror.success);
  EXPECT_NE(werror.error.find("invalid configuration"), std::string::npos);
}

TEST(ProjectConfig, MalformedStructure)
{
  EXPECT_FALSE(parse_project_config("- just\n- a list\n", "/proj").success);
  EXPECT_FALSE(parse_project_config("analyzer: 3\n", "/proj").success);
  EXPECT_FALSE(parse_project_config("analyzer:\n  inputs: main.json\n", "/proj").success);

  const auto broken = parse_project_config("package: [unclosed\n", "/proj");
  EXPECT_FALSE(broken.success);
  EXPECT_NE(broken.error.find("failed to parse YAML"), std::string::npos);
}

// ============================================================================
// Files
// ============================================================================

TEST(ProjectConfig, LoadResolvesAgainstFileDirectory)
{
  const TempDir dir(fs::temp_directory_path() / "flowsema_config_load");
  {
    std::ofstream out(dir.path / k_project_config_file_name);
    out << "analyzer:\n  inputs: [out/unit.json]\n";
  }

  const auto result = load_project_config(dir.path / k_project_config_file_name);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.project_root, fs::absolute(dir.path));
  ASSERT_EQ(result.config.analyzer.inputs.size(), 1U);
  EXPECT_EQ(result.config.analyzer.inputs[0], fs::absolute(dir.path) / "out/unit.json");
}

TEST(ProjectConfig, LoadMissingFile)
{
  const auto result = load_project_config(fs::temp_directory_path() / "flowsema_missing.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST(ProjectConfig, FindSearchesParents)
{
  const TempDir dir(fs::temp_directory_path() / "flowsema_config_find");
  fs::create_directories(dir.path / "src" / "nested");
  {
    std::ofstream out(dir.path / k_project_config_file_name);
  }

  const auto found = find_project_config(dir.path / "src" / "nested");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename(), fs::path(k_project_config_file_name));
  EXPECT_EQ(fs::canonical(found->parent_path()), fs::canonical(dir.path));
}
