// tests/unit/sema/test_statics_pat.cpp - Unit tests for pattern statics
//

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "gradual/basic/casting.hpp"
#include "gradual/sema/info.hpp"
#include "gradual/sema/info_map.hpp"
#include "gradual/sema/session.hpp"
#include "gradual/sema/type_utils.hpp"
#include "gradual/test_support/term_builder.hpp"

using namespace gradual;
using gradual::test_support::TermBuilder;

class StaticsPatTest : public ::testing::Test
{
protected:
  TermBuilder b;
  StaticsSession session;
  std::unique_ptr<InfoMap> map;

  void check(const Term * root) { map = session.compute_uncached(root); }

  std::string pty(const Term * p) const
  {
    return to_string(pat_type_after_fix(*map, p->rep_id()));
  }
  std::string ety(const Term * e) const
  {
    return to_string(exp_type_after_fix(*map, e->rep_id()));
  }

  const InfoPat & info(const Term * p) const { return *cast<InfoPat>(&map->at(p->rep_id())); }

  bool has_error(const Term * t) const { return is_error(*map, t->rep_id()); }
};

TEST_F(StaticsPatTest, VariableTakesTypeOfDefinition)
{
  Pat * x = b.pvar("x");
  check(b.let(x, b.integer(1), b.var("x")));
  EXPECT_EQ(pty(x), "Int");
  EXPECT_TRUE(pat_mode(*map, x->rep_id()).is_ana());
}

TEST_F(StaticsPatTest, TupleDestructuring)
{
  Pat * a = b.pvar("a");
  Pat * s = b.pvar("s");
  Exp * use = b.var("s");
  check(b.let(b.ptuple({a, s}), b.tuple({b.integer(1), b.str("t")}), use));
  EXPECT_EQ(pty(a), "Int");
  EXPECT_EQ(pty(s), "String");
  EXPECT_EQ(ety(use), "String");
  EXPECT_TRUE(is_unused_binding(map->at(a->rep_id())));
  EXPECT_FALSE(is_unused_binding(map->at(s->rep_id())));
}

TEST_F(StaticsPatTest, TupleArityMismatchLeavesComponentsUnknown)
{
  Pat * a = b.pvar("a");
  Pat * tuple = b.ptuple({a, b.pvar("c")});
  Exp * def = b.tuple({b.integer(1), b.integer(2), b.integer(3)});
  check(b.let(tuple, def, b.var("a")));
  // The definition is blamed; the pattern only sees an unknown
  EXPECT_TRUE(has_error(def));
  EXPECT_FALSE(has_error(tuple));
  EXPECT_EQ(pty(a), "?");
}

TEST_F(StaticsPatTest, WildcardTakesExpectedType)
{
  Pat * w = b.wild();
  check(b.let(w, b.integer(1), b.integer(2)));
  EXPECT_EQ(pty(w), "Int");
  EXPECT_FALSE(is_unused_binding(map->at(w->rep_id())));
}

TEST_F(StaticsPatTest, UnderscoreNamesAreNeverUnused)
{
  Pat * x = b.pvar("_x");
  check(b.let(x, b.integer(1), b.integer(2)));
  EXPECT_FALSE(is_unused_binding(map->at(x->rep_id())));

  Pat * y = b.pvar("y");
  check(b.let(y, b.integer(1), b.integer(2)));
  EXPECT_TRUE(is_unused_binding(map->at(y->rep_id())));
}

TEST_F(StaticsPatTest, ShadowedSiblingBindingIsUnused)
{
  // let (x, x) = (1, true) in x
  Pat * first = b.pvar("x");
  Pat * second = b.pvar("x");
  check(b.let(b.ptuple({first, second}), b.tuple({b.integer(1), b.boolean(true)}), b.var("x")));
  EXPECT_TRUE(is_unused_binding(map->at(first->rep_id())));
  EXPECT_FALSE(is_unused_binding(map->at(second->rep_id())));

  // let x :: x = [1] in x
  Pat * head = b.pvar("x");
  Pat * tail = b.pvar("x");
  check(b.let(b.pcons(head, tail), b.list({b.integer(1)}), b.var("x")));
  EXPECT_TRUE(is_unused_binding(map->at(head->rep_id())));
  EXPECT_FALSE(is_unused_binding(map->at(tail->rep_id())));

  // Distinct names keep their own uses
  Pat * a = b.pvar("a");
  Pat * c = b.pvar("c");
  check(b.let(
    b.plist({a, c}), b.list({b.integer(1), b.integer(2)}),
    b.bin(BinOp::Plus, b.var("a"), b.var("c"))));
  EXPECT_FALSE(is_unused_binding(map->at(a->rep_id())));
  EXPECT_FALSE(is_unused_binding(map->at(c->rep_id())));
}

TEST_F(StaticsPatTest, LiteralPatternMismatchIsInHole)
{
  Pat * lit = b.pstr("a");
  check(b.match(b.integer(1), {b.rule(lit, b.integer(0))}));
  EXPECT_TRUE(has_error(lit));
  EXPECT_EQ(info(lit).status.error, ErrorKind::TypeInconsistent);
}

TEST_F(StaticsPatTest, ConsPatternSplitsList)
{
  Pat * h = b.pvar("h");
  Pat * t = b.pvar("t");
  Exp * body = b.var("h");
  Exp * root = b.match(
    b.list({b.integer(1), b.integer(2)}), {b.rule(b.pcons(h, t), body), b.rule(b.wild(), b.integer(0))});
  check(root);
  EXPECT_EQ(pty(h), "Int");
  EXPECT_EQ(pty(t), "[Int]");
  EXPECT_EQ(ety(root), "Int");
}

TEST_F(StaticsPatTest, ListPattern)
{
  Pat * x = b.pvar("x");
  Pat * lst = b.plist({b.pint(1), x});
  check(b.match(b.list({b.integer(4)}), {b.rule(lst, b.var("x"))}));
  EXPECT_EQ(pty(x), "Int");
  EXPECT_EQ(pty(lst), "[Int]");
}

TEST_F(StaticsPatTest, AnnotatedPatternChecksInner)
{
  Pat * inner = b.pvar("x");
  Pat * annotated = b.ann(inner, b.t_string());
  check(b.fun(annotated, b.var("x")));
  EXPECT_EQ(pty(annotated), "String");
  EXPECT_EQ(pty(inner), "String");
}

TEST_F(StaticsPatTest, UnboundConstructorPattern)
{
  Pat * tag = b.pctor("Nope");
  check(b.match(b.integer(1), {b.rule(tag, b.integer(0))}));
  EXPECT_TRUE(has_error(tag));
  EXPECT_EQ(info(tag).status.error, ErrorKind::FreeTag);
}

TEST_F(StaticsPatTest, BuiltinConstructorPattern)
{
  Pat * lt = b.pctor("LT");
  Exp * scrut = b.ap(b.var("compare"), b.tuple({b.integer(1), b.integer(2)}));
  check(b.match(scrut, {b.rule(lt, b.integer(-1)), b.rule(b.wild(), b.integer(1))}));
  EXPECT_FALSE(has_error(lt));
  EXPECT_EQ(pty(lt), "+ EQ + GT + LT");
}

TEST_F(StaticsPatTest, InvalidPatternIsRecorded)
{
  Pat * bad = b.pinvalid("#");
  check(b.fun(bad, b.integer(1)));
  EXPECT_EQ(map->at(bad->rep_id()).get_kind(), InfoKind::Invalid);
  EXPECT_TRUE(has_error(bad));
}

TEST_F(StaticsPatTest, MultiHolePatternIsNotAnError)
{
  Pat * child = b.pvar("q");
  Pat * m = b.pmulti({child, b.integer(3)});
  check(b.fun(m, b.integer(1)));
  EXPECT_FALSE(has_error(m));
  EXPECT_TRUE(map->contains(child->rep_id()));
}

TEST_F(StaticsPatTest, BindingUseTypeJoinsUses)
{
  Pat * x = b.pvar("x");
  check(b.fun(x, b.bin(BinOp::Plus, b.var("x"), b.integer(1))));
  EXPECT_EQ(pty(x), "?");
  EXPECT_EQ(to_string(binding_use_type(*map, x->rep_id())), "Int");
}

TEST_F(StaticsPatTest, BindingUseTypeOfUnusedIsUnknown)
{
  Pat * x = b.pvar("x");
  check(b.fun(x, b.integer(1)));
  EXPECT_TRUE(binding_use_type(*map, x->rep_id())->is_unknown());
}

TEST_F(StaticsPatTest, ConflictingUsesGiveUnknown)
{
  Pat * x = b.pvar("x");
  check(b.fun(
    x, b.seq(b.bin(BinOp::Plus, b.var("x"), b.integer(1)), b.un(UnOp::Not, b.var("x")))));
  EXPECT_EQ(to_string(binding_use_type(*map, x->rep_id())), "?");
}
