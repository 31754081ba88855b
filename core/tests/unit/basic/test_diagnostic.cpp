// tests/unit/basic/test_diagnostic.cpp - Unit tests for diagnostics and their printer
//

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "gradual/basic/diagnostic.hpp"
#include "gradual/basic/diagnostic_printer.hpp"
#include "gradual/test_support/term_builder.hpp"

using namespace gradual;
using gradual::test_support::TermBuilder;

// ============================================================================
// DiagnosticBag
// ============================================================================

TEST(DiagnosticBagTest, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error(Id{3}, "bad thing", "here");
    builder.with_code("E0001").with_note("first note").with_help("try again");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1u);

  const Diagnostic & d = bag.all()[0];
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E0001");
  EXPECT_EQ(d.message, "bad thing");
  ASSERT_EQ(d.labels.size(), 1u);
  EXPECT_EQ(d.labels[0].message, "here");
  EXPECT_EQ(d.primary_node(), Id{3});
  EXPECT_EQ(d.notes, std::vector<std::string>{"first note"});
  EXPECT_EQ(d.help_message.value_or(""), "try again");
}

TEST(DiagnosticBagTest, SeverityFilters)
{
  DiagnosticBag bag;
  bag.report_error(Id{1}, "e1");
  bag.report_warning(Id{2}, "w1");
  bag.report_error(Id{3}, "e2");

  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_EQ(bag.errors().size(), 2u);
  EXPECT_EQ(bag.warnings().size(), 1u);
  EXPECT_EQ(bag.warnings()[0].message, "w1");
}

TEST(DiagnosticBagTest, Merge)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_error(Id{1}, "a");
  b.report_warning(Id{2}, "b");
  a.merge(std::move(b));
  EXPECT_EQ(a.size(), 2u);
}

TEST(DiagnosticBagTest, CodedReportsTakeSeverityFromCode)
{
  EXPECT_EQ(code_string(DiagCode::InconsistentBranches), "E0004");
  EXPECT_EQ(code_string(DiagCode::UnusedBinding), "W0001");

  DiagnosticBag bag;
  bag.report(DiagCode::InconsistentType, Id{4}, "expected Int, found Bool");
  bag.report(DiagCode::UnusedBinding, Id{2}, "unused variable `x`");

  ASSERT_EQ(bag.size(), 2u);
  EXPECT_EQ(bag.all()[0].code, "E0005");
  EXPECT_EQ(bag.all()[0].severity, Severity::Error);
  EXPECT_EQ(bag.all()[1].code, "W0001");
  EXPECT_EQ(bag.all()[1].severity, Severity::Warning);
  EXPECT_EQ(bag.count(Severity::Warning), 1u);
}

TEST(DiagnosticBagTest, QueriesByCodeAndNode)
{
  DiagnosticBag bag;
  bag.report(DiagCode::UnboundVariable, Id{7}, "unbound variable `a`");
  bag.report(DiagCode::UnboundVariable, Id{3}, "unbound variable `b`");
  bag.report(DiagCode::InvalidFragment, Id{3}, "unrecognized exp `@`");

  EXPECT_EQ(bag.with_code("E0001").size(), 2u);
  EXPECT_TRUE(bag.with_code("E0009").empty());
  EXPECT_EQ(bag.at_node(Id{3}).size(), 2u);

  bag.sort_by_node();
  EXPECT_EQ(bag.all()[0].message, "unbound variable `b`");
  EXPECT_EQ(bag.all()[1].message, "unrecognized exp `@`");
  EXPECT_EQ(bag.all()[2].primary_node(), Id{7});
}

TEST(DiagnosticBagTest, PrimaryLabelFallsBackToFirst)
{
  Diagnostic d;
  EXPECT_EQ(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_node(), Id{});

  d.labels.push_back(Label{Id{5}, "related", LabelStyle::Secondary});
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_node(), Id{5});

  d.labels.push_back(Label{Id{6}, "main", LabelStyle::Primary});
  EXPECT_EQ(d.primary_node(), Id{6});
}

// ============================================================================
// DiagnosticPrinter
// ============================================================================

class DiagnosticPrinterTest : public ::testing::Test
{
protected:
  TermBuilder b;
  std::ostringstream out;
  DiagnosticPrinter printer{out, false};
};

TEST_F(DiagnosticPrinterTest, PrintsSnippetUnderNodeId)
{
  Exp * value = b.boolean(true);
  NodeIndex nodes{{value->rep_id(), value}};

  DiagnosticBag bag;
  bag.report_error(value->rep_id(), "expected Int, found Bool", "inconsistent")
    .with_code("E0005")
    .with_help("change it");
  printer.print(bag.all()[0], nodes);

  const std::string expected =
    "error[E0005]: expected Int, found Bool\n"
    "  --> node #1\n"
    "      |\n"
    "    1 | true\n"
    "      | ^^^^ inconsistent\n"
    "      |\n"
    "   = help: change it\n"
    "\n";
  EXPECT_EQ(out.str(), expected);
}

TEST_F(DiagnosticPrinterTest, SecondaryLabelsUseDashes)
{
  Exp * lhs = b.integer(10);
  Exp * rhs = b.str("x");
  NodeIndex nodes{{lhs->rep_id(), lhs}, {rhs->rep_id(), rhs}};

  DiagnosticBag bag;
  bag.report_warning(lhs->rep_id(), "mismatch").with_secondary_label(rhs->rep_id(), "other");
  printer.print(bag.all()[0], nodes);

  const std::string text = out.str();
  EXPECT_EQ(text.rfind("warning: mismatch\n", 0), 0u);
  EXPECT_NE(text.find("    1 | 10\n      | ^^\n"), std::string::npos);
  EXPECT_NE(text.find("    2 | \"x\"\n      | --- other\n"), std::string::npos);
}

TEST_F(DiagnosticPrinterTest, UnknownNodeBecomesNote)
{
  DiagnosticBag bag;
  bag.report_error(Id{42}, "lost", "somewhere");
  printer.print(bag.all()[0], NodeIndex{});
  EXPECT_NE(out.str().find("   = note: node #42: somewhere\n"), std::string::npos);
}

TEST_F(DiagnosticPrinterTest, PrintAllOrdersByNode)
{
  DiagnosticBag bag;
  bag.report_error(Id{9}, "second");
  bag.report_error(Id{2}, "first");
  printer.print_all(bag, NodeIndex{});

  const std::string text = out.str();
  EXPECT_LT(text.find("first"), text.find("second"));
}

TEST_F(DiagnosticPrinterTest, Summary)
{
  DiagnosticBag bag;
  bag.report_error(Id{1}, "a");
  bag.report_warning(Id{2}, "b");
  bag.report_warning(Id{3}, "c");
  printer.print_summary(bag);
  EXPECT_EQ(out.str(), "1 error, 2 warnings\n");
}

TEST(DiagnosticPrinterColorTest, AlwaysColorsRedirectedOutput)
{
  DiagnosticBag bag;
  bag.report(DiagCode::UnboundVariable, Id{1}, "unbound variable `x`");

  std::ostringstream forced;
  DiagnosticPrinter(forced, ColorOutput::Always).print(bag.all()[0], NodeIndex{});
  EXPECT_NE(forced.str().find("\033["), std::string::npos);

  // A string stream is not a terminal
  std::ostringstream automatic;
  DiagnosticPrinter(automatic, ColorOutput::Auto).print(bag.all()[0], NodeIndex{});
  EXPECT_EQ(automatic.str().find("\033["), std::string::npos);

  std::ostringstream plain;
  DiagnosticPrinter(plain, ColorOutput::Never).print(bag.all()[0], NodeIndex{});
  EXPECT_EQ(plain.str().find("\033["), std::string::npos);
  EXPECT_EQ(plain.str().rfind("error[E0001]: unbound variable `x`\n", 0), 0u);
}

TEST_F(DiagnosticPrinterTest, LongSnippetsAreCut)
{
  std::string long_name(200, 'v');
  Exp * value = b.var(long_name);
  NodeIndex nodes{{value->rep_id(), value}};

  DiagnosticBag bag;
  bag.report_error(value->rep_id(), "long");
  printer.print(bag.all()[0], nodes);
  EXPECT_NE(out.str().find("...\n"), std::string::npos);
  EXPECT_EQ(out.str().find(long_name), std::string::npos);
}
