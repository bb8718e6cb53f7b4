// flowsema/basic/diagnostic.cpp - Diagnostic code table and DiagnosticBag
#include "flowsema/basic/diagnostic.hpp"

#include <fmt/args.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

namespace flowsema
{

namespace
{

struct CodeInfo
{
  DiagCode code;
  std::string_view id;
  Severity severity;
  std::string_view message;
};

constexpr std::array k_code_table = {
  CodeInfo{DiagCode::None, "", Severity::Error, ""},
#define DIAGNOSTIC(Name, Id, Sev, Msg) CodeInfo{DiagCode::Name, Id, Severity::Sev, Msg},
#include "flowsema/basic/diagnostic_codes.def"
};

const CodeInfo & info(DiagCode code) noexcept
{
  const auto index = static_cast<size_t>(code);
  return index < k_code_table.size() ? k_code_table[index] : k_code_table[0];
}

}  // namespace

std::string_view to_string(DiagCode code) noexcept { return info(code).id; }

std::optional<DiagCode> parse_diag_code(std::string_view id) noexcept
{
  const auto it = std::find_if(k_code_table.begin() + 1, k_code_table.end(), [&](const CodeInfo & c) {
    return c.id == id;
  });
  if (it == k_code_table.end()) {
    return std::nullopt;
  }
  return it->code;
}

Severity default_severity(DiagCode code) noexcept { return info(code).severity; }

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "";
}

std::optional<Severity> parse_severity(std::string_view text) noexcept
{
  for (const Severity s : {Severity::Error, Severity::Warning, Severity::Info, Severity::Hint}) {
    if (to_string(s) == text) {
      return s;
    }
  }
  return std::nullopt;
}

std::string format_message(DiagCode code, const std::vector<std::string> & args)
{
  const std::string_view pattern = info(code).message;
  fmt::dynamic_format_arg_store<fmt::format_context> store;
  for (const auto & a : args) {
    store.push_back(a);
  }
  try {
    return fmt::vformat(pattern, store);
  } catch (const fmt::format_error &) {
    // Too few args for the template: keep the raw template readable.
    return std::string(pattern);
  }
}

// ============================================================================
// Diagnostic
// ============================================================================

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  return l != nullptr ? l->range : SourceRange{};
}

bool Diagnostic::operator==(const Diagnostic & other) const
{
  return severity == other.severity && kind == other.kind && message == other.message &&
         args == other.args && primary_range() == other.primary_range();
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  SourceRange range, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  return with_label(range, std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_severity(Severity severity)
{
  diagnostic_.severity = severity;
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  DiagCode code, SourceRange range, std::vector<std::string> args)
{
  Diagnostic d;
  d.kind = code;
  d.severity = default_severity(code);
  d.code = std::string(to_string(code));
  d.message = format_message(code, args);
  d.args = std::move(args);
  d.labels.push_back(Label{range, "", LabelStyle::Primary});
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(SourceRange range, std::string message)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.message = std::move(message);
  d.labels.push_back(Label{range, "", LabelStyle::Primary});
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_warning(SourceRange range, std::string message)
{
  Diagnostic d;
  d.severity = Severity::Warning;
  d.message = std::move(message);
  d.labels.push_back(Label{range, "", LabelStyle::Primary});
  return {*this, std::move(d)};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

bool DiagnosticBag::has_errors() const { return error_count() > 0; }

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

size_t DiagnosticBag::error_count() const
{
  return static_cast<size_t>(
    std::count_if(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
      return d.severity == Severity::Error;
    }));
}

size_t DiagnosticBag::count(DiagCode code) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(), [code](const Diagnostic & d) { return d.kind == code; }));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace flowsema
