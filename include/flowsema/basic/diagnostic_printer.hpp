// flowsema/basic/diagnostic_printer.hpp
//
// Prints analyzer diagnostics in Rust-style format with source context
// when the original source text is available.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "flowsema/basic/diagnostic.hpp"
#include "flowsema/basic/source_manager.hpp"

namespace flowsema
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[unreachable-code]: unreachable code
 *     --> src/main.bal:5:3
 *      |
 *    5 |   io:println("done");
 *      |   ^^^^^^^^^^^^^^^^^^^
 *      |
 *
 * When the registry only knows the file path (typed AST loaded without its
 * source text), the location line falls back to the byte offset.
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic, ordered by primary position (stable).
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

  /// One-line summary: "3 errors, 1 warning".
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace flowsema
