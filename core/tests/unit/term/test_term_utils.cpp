// tests/unit/term/test_term_utils.cpp - Unit tests for term traversal, equality and cloning
//

#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "gradual/basic/casting.hpp"
#include "gradual/term/term_context.hpp"
#include "gradual/term/term_utils.hpp"
#include "gradual/test_support/term_builder.hpp"

using namespace gradual;
using gradual::test_support::TermBuilder;

class TermUtilsTest : public ::testing::Test
{
protected:
  TermBuilder b;
};

TEST_F(TermUtilsTest, ChildrenInSourceOrder)
{
  Pat * p = b.pvar("x");
  Exp * def = b.integer(1);
  Exp * body = b.var("x");
  Exp * let = b.let(p, def, body);

  const auto kids = children_of(let);
  ASSERT_EQ(kids.size(), 3u);
  EXPECT_EQ(kids[0], p);
  EXPECT_EQ(kids[1], def);
  EXPECT_EQ(kids[2], body);

  // A nullary variant has no argument child
  EXPECT_TRUE(children_of(b.variant("A")).empty());
  EXPECT_EQ(children_of(b.variant("B", b.t_int())).size(), 1u);
}

TEST_F(TermUtilsTest, CollectIdsIsPreOrderWithEveryId)
{
  // Children take ids 1..3, the let takes 4..6
  Exp * let = b.let(b.pvar("x"), b.integer(1), b.hole());
  const std::vector<Id> ids = collect_ids(let);
  ASSERT_EQ(ids.size(), 6u);
  EXPECT_EQ(ids[0], let->rep_id());
  EXPECT_EQ(ids[1], let->ids[1]);
  EXPECT_EQ(ids[2], let->ids[2]);
  EXPECT_EQ(ids[3], Id{1});
  EXPECT_TRUE(collect_ids(nullptr).empty());
}

TEST_F(TermUtilsTest, CollectIdsCoversAllSorts)
{
  Exp * root = b.alias(
    b.tpvar("T"), b.sum({b.variant("A", b.t_int())}),
    b.match(b.ctor("A"), {b.rule(b.pap(b.pctor("A"), b.wild()), b.integer(0))}));
  EXPECT_EQ(collect_ids(root).size(), static_cast<size_t>(b.peek_id().value - 1));
}

TEST_F(TermUtilsTest, StructuralEquality)
{
  TermBuilder other;
  Exp * a = b.bin(BinOp::Plus, b.integer(1), b.var("y"));
  Exp * c = other.bin(BinOp::Plus, other.integer(1), other.var("y"));
  EXPECT_TRUE(structurally_equal(a, c));
  EXPECT_EQ(structural_hash(a), structural_hash(c));

  TermBuilder third;
  Exp * d = third.bin(BinOp::Minus, third.integer(1), third.var("y"));
  EXPECT_FALSE(structurally_equal(a, d));

  EXPECT_TRUE(structurally_equal(nullptr, nullptr));
  EXPECT_FALSE(structurally_equal(a, nullptr));
}

TEST_F(TermUtilsTest, EqualityRequiresSameIds)
{
  Exp * first = b.integer(7);
  Exp * second = b.integer(7);
  EXPECT_FALSE(structurally_equal(first, second));
}

TEST_F(TermUtilsTest, FloatLiteralsCompareByBits)
{
  const double nan = std::numeric_limits<double>::quiet_NaN();
  Exp * e = b.tuple({b.flt(nan), b.flt(1.5)});
  EXPECT_TRUE(structurally_equal(e, e));

  TermContext ctx;
  const Term * copy = clone_term(e, ctx);
  EXPECT_TRUE(structurally_equal(e, copy));
  EXPECT_EQ(structural_hash(e), structural_hash(copy));

  Pat * p = b.pfloat(nan);
  EXPECT_TRUE(structurally_equal(p, clone_term(p, ctx)));

  // 0.0 and -0.0 are different literals
  TermBuilder left;
  TermBuilder right;
  EXPECT_FALSE(structurally_equal(left.flt(0.0), right.flt(-0.0)));
}

TEST_F(TermUtilsTest, CloneIsIndependentOfSource)
{
  TermContext target;
  Term * copy = nullptr;
  Id root_id;
  {
    TermBuilder source;
    Exp * root = source.fun(source.pvar("x"), source.list({source.str("s"), source.var("x")}));
    root_id = root->rep_id();
    copy = clone_term(root, target);
    EXPECT_NE(copy, root);
    EXPECT_TRUE(structurally_equal(copy, root));
  }
  // The source arena is gone; the clone still reads correctly
  EXPECT_EQ(copy->rep_id(), root_id);
  auto * fun = dyn_cast<FunExp>(copy);
  ASSERT_NE(fun, nullptr);
  auto * pat = dyn_cast<VarPat>(fun->pat);
  ASSERT_NE(pat, nullptr);
  EXPECT_EQ(pat->name, "x");
}

TEST_F(TermUtilsTest, TermSize)
{
  EXPECT_EQ(term_size(nullptr), 0u);
  EXPECT_EQ(term_size(b.integer(1)), 1u);
  EXPECT_EQ(term_size(b.tuple({b.integer(1), b.ap(b.var("f"), b.hole())})), 5u);
}
