// flowsema/basic/diagnostic.hpp - Diagnostic records, codes and the collecting bag
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "flowsema/basic/source_manager.hpp"

namespace flowsema
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

/**
 * Every diagnostic the analyzer can raise.
 * Generated from diagnostic_codes.def.
 */
enum class DiagCode : uint16_t {
  None,
#define DIAGNOSTIC(Name, Id, Sev, Msg) Name,
#include "flowsema/basic/diagnostic_codes.def"
};

/// Stable kebab-case identifier ("unreachable-code"), empty for DiagCode::None.
[[nodiscard]] std::string_view to_string(DiagCode code) noexcept;

/// Inverse of to_string(DiagCode).
[[nodiscard]] std::optional<DiagCode> parse_diag_code(std::string_view id) noexcept;

[[nodiscard]] Severity default_severity(DiagCode code) noexcept;

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text) noexcept;

/// Render the message template of `code` with `args`.
[[nodiscard]] std::string format_message(DiagCode code, const std::vector<std::string> & args);

enum class LabelStyle {
  Primary,
  Secondary,
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  DiagCode kind = DiagCode::None;
  std::string code;  // stable id of `kind`, e.g. "must-return"
  std::string message;
  std::vector<std::string> args;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;

  [[nodiscard]] bool operator==(const Diagnostic & other) const;
  [[nodiscard]] bool operator!=(const Diagnostic & other) const { return !(*this == other); }
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and adds it to the bag when destroyed.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

  DiagnosticBuilder & with_severity(Severity severity);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  /**
   * Start a coded diagnostic with the code's default severity.
   *
   * @param code What went wrong
   * @param range Primary position
   * @param args Template arguments, kept on the record for tooling
   */
  DiagnosticBuilder report(DiagCode code, SourceRange range, std::vector<std::string> args = {});

  // Free-form starters for messages that have no code (driver, CLI)
  DiagnosticBuilder report_error(SourceRange range, std::string message);
  DiagnosticBuilder report_warning(SourceRange range, std::string message);

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] std::vector<Diagnostic> & all_mutable() { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;
  [[nodiscard]] size_t error_count() const;

  /// Number of diagnostics with the given code.
  [[nodiscard]] size_t count(DiagCode code) const;
  [[nodiscard]] bool contains(DiagCode code) const { return count(code) > 0; }

  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace flowsema
