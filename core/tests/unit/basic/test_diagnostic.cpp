// tests/unit/basic/test_diagnostic.cpp - Diagnostic bag, source positions and printing
//

#include <gtest/gtest.h>

#include <sstream>

#include "eligian/basic/diagnostic.hpp"
#include "eligian/basic/diagnostic_printer.hpp"

using namespace eligian;

namespace
{

constexpr const char * k_source =
  "timeline \"main\" in \"#app\" using raf {\n"
  "  at 0s..1s selectElement(\".primry\")\n"
  "}\n";

SourceRange range_of(const std::string & text, const std::string & needle)
{
  const auto start = static_cast<uint32_t>(text.find(needle));
  return SourceRange(start, start + static_cast<uint32_t>(needle.size()));
}

}  // namespace

// ============================================================================
// DiagnosticBag
// ============================================================================

TEST(DiagnosticTest, BuilderCommitsOnDestruction)
{
  DiagnosticBag bag;
  bag.report_error(SourceRange(4, 9), "Unknown CSS class: 'x'")
    .with_code("UNKNOWN_CSS_CLASS")
    .with_help("Available classes: a, b");
  bag.report_warning(SourceRange(0, 1), "Timeline 'main' has no events").with_code("EMPTY_TIMELINE");

  ASSERT_EQ(bag.size(), 2u);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_EQ(bag.errors().size(), 1u);

  const Diagnostic & first = bag.all()[0];
  EXPECT_EQ(first.severity, Severity::Error);
  EXPECT_EQ(first.code, "UNKNOWN_CSS_CLASS");
  EXPECT_EQ(first.help_message, "Available classes: a, b");
  EXPECT_EQ(first.primary_range(), SourceRange(4, 9));
}

TEST(DiagnosticTest, MergeKeepsOrderAndFiltersByCode)
{
  DiagnosticBag a;
  a.report_error(SourceRange{}, "first").with_code("A");
  DiagnosticBag b;
  b.report_error(SourceRange{}, "second").with_code("B");
  b.report_error(SourceRange{}, "third").with_code("A");

  a.merge(std::move(b));

  ASSERT_EQ(a.size(), 3u);
  EXPECT_EQ(a.all()[1].message, "second");
  const auto codes_a = a.with_code("A");
  ASSERT_EQ(codes_a.size(), 2u);
  EXPECT_EQ(codes_a[1].message, "third");
  EXPECT_FALSE(a.has_warnings());
}

// ============================================================================
// SourceFile
// ============================================================================

TEST(DiagnosticTest, LocatesOffsetsInText)
{
  const SourceFile file("file:///p/show.eligian", k_source);

  EXPECT_EQ(file.get_line_count(), 4u);
  const auto pos = file.locate(range_of(k_source, "selectElement"));
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->line, 2u);
  EXPECT_EQ(pos->column, 13u);
  EXPECT_EQ(file.get_line(1), "  at 0s..1s selectElement(\".primry\")");

  EXPECT_FALSE(file.locate(SourceRange{}).has_value());
  EXPECT_FALSE(SourceFile("file:///p/show.eligian", "").locate(SourceRange(0, 1)).has_value());
}

// ============================================================================
// DiagnosticPrinter
// ============================================================================

TEST(DiagnosticTest, PrintsSourceContextAndHelp)
{
  const SourceFile file("file:///p/show.eligian", k_source);
  DiagnosticBag bag;
  bag.report_error(range_of(k_source, "\".primry\""), "Unknown CSS class: 'primry'")
    .with_code("UNKNOWN_CSS_CLASS")
    .with_help("Did you mean 'primary'?");

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_all(bag, file);
  const std::string text = out.str();

  EXPECT_NE(text.find("error[UNKNOWN_CSS_CLASS]: Unknown CSS class: 'primry'\n"), std::string::npos)
    << text;
  EXPECT_NE(text.find("  --> show.eligian:2:27\n"), std::string::npos) << text;
  EXPECT_NE(text.find("    2 |   at 0s..1s selectElement(\".primry\")\n"), std::string::npos) << text;
  EXPECT_NE(text.find("^^^^^^^^^"), std::string::npos) << text;
  EXPECT_NE(text.find("   = help: Did you mean 'primary'?\n"), std::string::npos) << text;
  EXPECT_NE(text.find("1 error, 0 warnings\n"), std::string::npos) << text;
}

TEST(DiagnosticTest, PrintsWithoutDocumentText)
{
  DiagnosticBag bag;
  bag.report_warning(SourceRange(0, 4), "Timeline 'main' has no events").with_code("EMPTY_TIMELINE");

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_all(bag, SourceFile("file:///p/show.eligian", ""));
  const std::string text = out.str();

  EXPECT_NE(text.find("warning[EMPTY_TIMELINE]: Timeline 'main' has no events\n"), std::string::npos)
    << text;
  EXPECT_NE(text.find("  --> show.eligian\n"), std::string::npos) << text;
  EXPECT_EQ(text.find(" | "), std::string::npos) << "no source lines without text";
}
