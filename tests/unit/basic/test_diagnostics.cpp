// tests/basic/test_diagnostics.cpp - Diagnostic codes, bag and output formats
//
#include <gtest/gtest.h>

#include <sstream>

#include "flowsema/basic/diagnostic.hpp"
#include "flowsema/basic/diagnostic_json.hpp"
#include "flowsema/basic/diagnostic_printer.hpp"

using namespace flowsema;

// ============================================================================
// Code Table
// ============================================================================

TEST(BasicDiagnostics, CodeIdsRoundTrip)
{
  EXPECT_EQ(to_string(DiagCode::UnreachableCode), "unreachable-code");
  EXPECT_EQ(parse_diag_code("must-return"), DiagCode::MustReturn);
  EXPECT_EQ(parse_diag_code("nested-transactions"), DiagCode::NestedTransactionsInvalid);
  EXPECT_FALSE(parse_diag_code("no-such-check").has_value());
  EXPECT_FALSE(parse_diag_code("").has_value());
}

TEST(BasicDiagnostics, DefaultSeverities)
{
  EXPECT_EQ(default_severity(DiagCode::UnreachableCode), Severity::Error);
  EXPECT_EQ(default_severity(DiagCode::DeprecatedFunctionUsage), Severity::Warning);
  EXPECT_EQ(default_severity(DiagCode::PatternAlwaysMatches), Severity::Warning);

  EXPECT_EQ(parse_severity("warning"), Severity::Warning);
  EXPECT_EQ(parse_severity("hint"), Severity::Hint);
  EXPECT_FALSE(parse_severity("fatal").has_value());
}

TEST(BasicDiagnostics, MessageTemplates)
{
  EXPECT_EQ(format_message(DiagCode::MustReturn, {"function"}), "this function must return a result");
  EXPECT_EQ(format_message(DiagCode::UndefinedWorker, {"w9"}), "undefined worker 'w9'");
  // Missing arguments leave the template as written
  EXPECT_EQ(format_message(DiagCode::MustReturn, {}), "this {0} must return a result");
}

// ============================================================================
// DiagnosticBag
// ============================================================================

TEST(BasicDiagnostics, ReportFillsRecord)
{
  DiagnosticBag bag;
  bag.report(DiagCode::LoopExitOutsideLoop, SourceRange(4, 9), {"break"}).with_help("use a loop");

  ASSERT_EQ(bag.size(), 1U);
  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.kind, DiagCode::LoopExitOutsideLoop);
  EXPECT_EQ(d.code, "loop-exit-outside-loop");
  EXPECT_EQ(d.message, "'break' cannot be used outside of a loop");
  EXPECT_EQ(d.args, std::vector<std::string>{"break"});
  EXPECT_EQ(d.primary_range(), SourceRange(4, 9));
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "use a loop");
}

TEST(BasicDiagnostics, CountsBySeverity)
{
  DiagnosticBag bag;
  bag.report(DiagCode::UnreachableCode, SourceRange(0, 1));
  bag.report(DiagCode::DeprecatedFunctionUsage, SourceRange(2, 3), {"old"});
  bag.report(DiagCode::UnreachableCode, SourceRange(4, 5)).with_severity(Severity::Hint);

  EXPECT_EQ(bag.error_count(), 1U);
  EXPECT_EQ(bag.warnings().size(), 1U);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_EQ(bag.count(DiagCode::UnreachableCode), 2U);
  EXPECT_FALSE(bag.contains(DiagCode::MustReturn));
}

TEST(BasicDiagnostics, MergeKeepsOrder)
{
  DiagnosticBag a;
  a.report(DiagCode::UnreachableCode, SourceRange(0, 1));
  DiagnosticBag b;
  b.report(DiagCode::MustReturn, SourceRange(2, 3), {"function"});

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 2U);
  EXPECT_EQ(a.all()[0].kind, DiagCode::UnreachableCode);
  EXPECT_EQ(a.all()[1].kind, DiagCode::MustReturn);
}

TEST(BasicDiagnostics, EqualityIgnoresLabelsBeyondPrimary)
{
  DiagnosticBag bag;
  bag.report(DiagCode::UnreachableCode, SourceRange(0, 1));
  bag.report(DiagCode::UnreachableCode, SourceRange(0, 1)).with_secondary_label(SourceRange(5, 6), "here");
  bag.report(DiagCode::UnreachableCode, SourceRange(1, 2));

  EXPECT_TRUE(bag.all()[0] == bag.all()[1]);
  EXPECT_TRUE(bag.all()[0] != bag.all()[2]);
}

// ============================================================================
// Source Positions
// ============================================================================

TEST(BasicDiagnostics, LineColumnLookup)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("main.bal", "int x = 1;\nreturn;\n");

  const FullSourceRange r = sources.get_full_range(SourceRange(11, 17, id));
  EXPECT_EQ(r.start_line, 2U);
  EXPECT_EQ(r.start_column, 1U);
  EXPECT_EQ(r.end_column, 7U);
  EXPECT_EQ(sources.get_slice(SourceRange(11, 17, id)), "return");
  EXPECT_EQ(sources.register_file("main.bal", "changed"), id);
  EXPECT_EQ(sources.size(), 1U);
  EXPECT_EQ(sources.get_file(id)->content(), "changed");
  EXPECT_EQ(sources.get_file(id)->line_count(), 1U);
}

// ============================================================================
// JSON Output
// ============================================================================

TEST(BasicDiagnostics, JsonDocument)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("main.bal", "int x = 1;\nreturn;\n");

  DiagnosticBag bag;
  bag.report(DiagCode::UnreachableCode, SourceRange(11, 17, id));
  bag.report(DiagCode::DeprecatedFunctionUsage, SourceRange{}, {"old"});

  const nlohmann::json doc = to_json(bag, sources);
  EXPECT_EQ(doc["errors"], 1);
  EXPECT_EQ(doc["warnings"], 1);
  ASSERT_EQ(doc["diagnostics"].size(), 2U);

  const auto & first = doc["diagnostics"][0];
  EXPECT_EQ(first["code"], "unreachable-code");
  EXPECT_EQ(first["severity"], "error");
  EXPECT_EQ(first["file"], "main.bal");
  EXPECT_EQ(first["range"]["startLine"], 2);
  EXPECT_EQ(first["range"]["startByte"], 11);

  const auto & second = doc["diagnostics"][1];
  EXPECT_TRUE(second["range"].is_null());
  EXPECT_EQ(second["args"][0], "old");
}

TEST(BasicDiagnostics, JsonForUnregisteredFile)
{
  SourceRegistry sources;
  DiagnosticBag bag;
  bag.report(DiagCode::UnreachableCode, SourceRange(3, 8, FileId{0}));

  const nlohmann::json item = to_json(bag.all().front(), sources);
  EXPECT_EQ(item["range"]["startByte"], 3);
  EXPECT_EQ(item["range"]["endByte"], 8);
  EXPECT_EQ(item["range"]["startLine"], 0);
}

// ============================================================================
// Text Output
// ============================================================================

TEST(BasicDiagnostics, PrinterShowsSourceLine)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("main.bal", "int x = 1;\nreturn;\n");
  DiagnosticBag bag;
  bag.report(DiagCode::UnreachableCode, SourceRange(11, 17, id));

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, sources);
  printer.print_summary(bag);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[unreachable-code]: unreachable code"), std::string::npos);
  EXPECT_NE(text.find(":2:1"), std::string::npos);
  EXPECT_NE(text.find("    2 | return;"), std::string::npos);
  EXPECT_NE(text.find("^^^^^^"), std::string::npos);
  EXPECT_NE(text.find("1 error, 0 warnings"), std::string::npos);
}

TEST(BasicDiagnostics, PrinterFallsBackToOffset)
{
  SourceRegistry sources;
  DiagnosticBag bag;
  bag.report(DiagCode::MustReturn, SourceRange(40, 44, FileId{3}), {"function"});

  std::ostringstream out;
  DiagnosticPrinter(out, false).print(bag.all().front(), sources);
  EXPECT_NE(out.str().find("<unknown>@40"), std::string::npos);
}
