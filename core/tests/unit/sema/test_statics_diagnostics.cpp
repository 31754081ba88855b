// tests/unit/sema/test_statics_diagnostics.cpp - Unit tests for diagnostics collected from statics
//

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "gradual/basic/diagnostic.hpp"
#include "gradual/sema/session.hpp"
#include "gradual/sema/statics_diagnostics.hpp"
#include "gradual/test_support/term_builder.hpp"

using namespace gradual;
using gradual::test_support::TermBuilder;

class StaticsDiagnosticsTest : public ::testing::Test
{
protected:
  TermBuilder b;
  StaticsSession session;
  std::unique_ptr<InfoMap> map;
  DiagnosticBag diags;

  void collect(const Term * root, CollectOptions options = {})
  {
    map = session.compute_uncached(root);
    collect_diagnostics(*map, diags, options);
  }

  std::vector<std::string> codes() const
  {
    std::vector<std::string> out;
    for (const auto & d : diags) out.push_back(d.code);
    return out;
  }

  bool has_code(const std::string & code) const
  {
    for (const auto & d : diags) {
      if (d.code == code) return true;
    }
    return false;
  }

  const Diagnostic * find(const std::string & code) const
  {
    for (const auto & d : diags) {
      if (d.code == code) return &d;
    }
    return nullptr;
  }
};

TEST_F(StaticsDiagnosticsTest, CleanProgramHasNoDiagnostics)
{
  collect(b.let(b.pvar("x"), b.integer(1), b.bin(BinOp::Plus, b.var("x"), b.integer(2))));
  EXPECT_TRUE(diags.empty());
}

// ============================================================================
// Expression and pattern errors
// ============================================================================

TEST_F(StaticsDiagnosticsTest, UnboundVariable)
{
  Exp * use = b.var("nope");
  collect(use);
  ASSERT_EQ(codes(), std::vector<std::string>{"E0001"});
  EXPECT_EQ(diags.all()[0].message, "unbound variable `nope`");
  EXPECT_EQ(diags.all()[0].primary_node(), use->rep_id());
  EXPECT_EQ(diags.all()[0].severity, Severity::Error);
}

TEST_F(StaticsDiagnosticsTest, UnboundConstructor)
{
  collect(b.ctor("Nope"));
  ASSERT_EQ(codes(), std::vector<std::string>{"E0002"});
  EXPECT_EQ(diags.all()[0].message, "unbound constructor `Nope`");
  EXPECT_TRUE(diags.all()[0].help_message.has_value());
}

TEST_F(StaticsDiagnosticsTest, ApplyingANonFunction)
{
  Exp * callee = b.integer(1);
  collect(b.ap(callee, b.integer(2)));
  ASSERT_EQ(codes(), std::vector<std::string>{"E0003"});
  EXPECT_EQ(diags.all()[0].message, "expected a function, found Int");
  EXPECT_EQ(diags.all()[0].primary_node(), callee->rep_id());
}

TEST_F(StaticsDiagnosticsTest, InconsistentBranchesPointAtEachBranch)
{
  Exp * then_branch = b.integer(1);
  Exp * else_branch = b.str("a");
  Exp * cond = b.if_(b.boolean(true), then_branch, else_branch);
  collect(cond);

  // One diagnostic for the whole conditional, despite its three ids
  ASSERT_EQ(codes(), std::vector<std::string>{"E0004"});
  const Diagnostic & d = diags.all()[0];
  EXPECT_EQ(d.message, "branches have inconsistent types: Int, String");
  EXPECT_EQ(d.primary_node(), cond->rep_id());
  ASSERT_EQ(d.labels.size(), 3u);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(d.labels[1].node, then_branch->rep_id());
  EXPECT_EQ(d.labels[1].message, "has type Int");
  EXPECT_EQ(d.labels[2].node, else_branch->rep_id());
}

TEST_F(StaticsDiagnosticsTest, TypeInconsistent)
{
  Exp * def = b.boolean(true);
  collect(b.let(b.ann(b.pvar("x"), b.t_int()), def, b.var("x")));
  ASSERT_EQ(codes(), std::vector<std::string>{"E0005"});
  EXPECT_EQ(diags.all()[0].message, "expected Int, found Bool");
  EXPECT_EQ(diags.all()[0].primary_node(), def->rep_id());
}

TEST_F(StaticsDiagnosticsTest, PatternErrorsUseTheSameCodes)
{
  Pat * lit = b.pint(1);
  collect(b.match(b.boolean(true), {b.rule(lit, b.integer(0))}));
  ASSERT_EQ(codes(), std::vector<std::string>{"E0005"});
  EXPECT_EQ(diags.all()[0].primary_node(), lit->rep_id());
}

// ============================================================================
// Type-level errors
// ============================================================================

TEST_F(StaticsDiagnosticsTest, UnboundTypeVariable)
{
  collect(b.let(b.ann(b.pvar("x"), b.tvar("Nope")), b.integer(1), b.var("x")));
  ASSERT_TRUE(has_code("E0006"));
  EXPECT_EQ(find("E0006")->message, "unbound type variable `Nope`");
}

TEST_F(StaticsDiagnosticsTest, AliasNameMustBeAVariable)
{
  collect(b.alias(b.tpmulti({b.integer(1)}), b.t_int(), b.integer(1)));
  ASSERT_TRUE(has_code("E0007"));
  EXPECT_EQ(find("E0007")->message, "expected a type name");
}

TEST_F(StaticsDiagnosticsTest, AliasShadowsType)
{
  collect(b.alias(b.tpvar("Int"), b.t_bool(), b.integer(1)));
  ASSERT_EQ(codes(), std::vector<std::string>{"E0008"});
  EXPECT_EQ(diags.all()[0].message, "type alias `Int` shadows an existing type");
}

TEST_F(StaticsDiagnosticsTest, DuplicateConstructor)
{
  VariantTerm * second = b.variant("A");
  collect(b.alias(b.tpvar("T"), b.sum({b.variant("A"), second}), b.ctor("A")));
  ASSERT_EQ(codes(), std::vector<std::string>{"E0009"});
  EXPECT_EQ(diags.all()[0].message, "constructor `A` is defined twice");
  EXPECT_EQ(diags.all()[0].primary_node(), second->rep_id());
}

TEST_F(StaticsDiagnosticsTest, NotAConstructor)
{
  collect(b.alias(b.tpvar("T"), b.sum({b.variant("A"), b.bad_entry(b.t_int())}), b.ctor("A")));
  ASSERT_EQ(codes(), std::vector<std::string>{"E0010"});
  EXPECT_TRUE(diags.all()[0].help_message.has_value());
}

// ============================================================================
// Invalid fragments
// ============================================================================

TEST_F(StaticsDiagnosticsTest, InvalidFragment)
{
  collect(b.bin(BinOp::Plus, b.invalid("@@"), b.integer(1)));
  ASSERT_EQ(codes(), std::vector<std::string>{"E0011"});
  EXPECT_EQ(diags.all()[0].message, "unrecognized exp `@@`");
}

TEST_F(StaticsDiagnosticsTest, WhitespaceFragmentIsSilent)
{
  collect(b.tuple({b.invalid("  "), b.integer(1)}));
  EXPECT_TRUE(diags.empty());
}

// ============================================================================
// Unused bindings
// ============================================================================

TEST_F(StaticsDiagnosticsTest, UnusedBindingWarns)
{
  Pat * x = b.pvar("x");
  collect(b.let(x, b.integer(1), b.integer(2)));
  ASSERT_EQ(codes(), std::vector<std::string>{"W0001"});
  const Diagnostic & d = diags.all()[0];
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.message, "unused variable `x`");
  EXPECT_EQ(d.help_message.value_or(""), "if this is intentional, name it `_x`");
  EXPECT_EQ(d.primary_node(), x->rep_id());
  EXPECT_FALSE(diags.has_errors());
}

TEST_F(StaticsDiagnosticsTest, UnusedWarningsCanBeDisabled)
{
  CollectOptions options;
  options.warn_unused = false;
  collect(b.let(b.pvar("x"), b.integer(1), b.integer(2)), options);
  EXPECT_TRUE(diags.empty());
}

TEST_F(StaticsDiagnosticsTest, UnderscoreNamesAreNotReported)
{
  collect(b.let(b.pvar("_x"), b.integer(1), b.integer(2)));
  EXPECT_TRUE(diags.empty());
}

TEST_F(StaticsDiagnosticsTest, DiagnosticsFollowIdOrder)
{
  // let y = a in b
  collect(b.let(b.pvar("y"), b.var("a"), b.var("b")));
  EXPECT_EQ(codes(), (std::vector<std::string>{"W0001", "E0001", "E0001"}));
  EXPECT_EQ(diags.errors().size(), 2u);
  EXPECT_EQ(diags.warnings().size(), 1u);
}
