// tests/unit/sema/test_statics_alias.cpp - Unit tests for type aliases and sum types
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

class StaticsAliasTest : public ::testing::Test
{
protected:
  TermBuilder b;
  StaticsSession session;
  std::unique_ptr<InfoMap> map;

  void check(const Term * root) { map = session.compute_uncached(root); }

  std::string ty(const Term * e) const
  {
    return to_string(exp_type_after_fix(*map, e->rep_id()));
  }

  bool has_error(const Term * t) const { return is_error(*map, t->rep_id()); }
};

TEST_F(StaticsAliasTest, SumConstructorsAreTypedByAliasName)
{
  Exp * tag = b.ctor("B");
  Exp * call = b.ap(tag, b.integer(1));
  Exp * root = b.alias(b.tpvar("T"), b.sum({b.variant("A"), b.variant("B", b.t_int())}), call);
  check(root);
  EXPECT_EQ(ty(tag), "Int -> T");
  EXPECT_EQ(ty(call), "T");
  // The alias is replaced by its definition outside its scope
  EXPECT_EQ(ty(root), "+ A + B(Int)");
  EXPECT_TRUE(error_ids(*map).empty());
}

TEST_F(StaticsAliasTest, ConstructorsRecordDefinitionAsOrigin)
{
  TypeTerm * def = b.sum({b.variant("A")});
  Exp * body = b.ctor("A");
  check(b.alias(b.tpvar("T"), def, body));
  const CtxEntry * entry = map->at(body->rep_id()).ctx.lookup_constructor("A");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->id, def->rep_id());
}

TEST_F(StaticsAliasTest, AliasOfPrimitiveIsTransparent)
{
  Exp * use = b.var("x");
  Exp * root = b.alias(
    b.tpvar("Flag"), b.t_bool(), b.let(b.ann(b.pvar("x"), b.tvar("Flag")), b.boolean(true), use));
  check(root);
  EXPECT_EQ(ty(use), "Flag");
  EXPECT_EQ(ty(root), "Bool");
  EXPECT_TRUE(error_ids(*map).empty());
}

TEST_F(StaticsAliasTest, AliasDoesNotEscapeThroughFunctions)
{
  Exp * root =
    b.alias(b.tpvar("N"), b.t_int(), b.fun(b.ann(b.pvar("x"), b.tvar("N")), b.var("x")));
  check(root);
  EXPECT_EQ(ty(root), "Int -> Int");
}

TEST_F(StaticsAliasTest, BuiltinAliasResolves)
{
  Exp * use = b.var("u");
  check(b.let(b.ann(b.pvar("u"), b.tvar("Unit")), b.triv(), use));
  EXPECT_EQ(ty(use), "()");
  EXPECT_TRUE(error_ids(*map).empty());
}

TEST_F(StaticsAliasTest, RecursiveSumType)
{
  // type L = + Nil + Cons((Int, L)) in
  //   case Cons((1, Nil)) | Cons((h, _)) => h | Nil => 0 end
  Pat * h = b.pvar("h");
  Exp * value = b.ap(b.ctor("Cons"), b.tuple({b.integer(1), b.ctor("Nil")}));
  Exp * body = b.match(
    value, {b.rule(b.pap(b.pctor("Cons"), b.ptuple({h, b.wild()})), b.var("h")),
            b.rule(b.pctor("Nil"), b.integer(0))});
  TypeTerm * def =
    b.sum({b.variant("Nil"), b.variant("Cons", b.ttuple({b.t_int(), b.tvar("L")}))});
  Exp * root = b.alias(b.tpvar("L"), def, body);
  check(root);

  EXPECT_TRUE(error_ids(*map).empty());
  EXPECT_EQ(ty(value), "L");
  EXPECT_EQ(to_string(pat_type_after_fix(*map, h->rep_id())), "Int");
  EXPECT_EQ(ty(root), "Int");
}

TEST_F(StaticsAliasTest, RecursiveAliasEscapesAsRecType)
{
  Exp * body = b.ctor("Nil");
  TypeTerm * def = b.sum({b.variant("Nil"), b.variant("Next", b.tvar("S"))});
  Exp * root = b.alias(b.tpvar("S"), def, body);
  check(root);
  EXPECT_EQ(ty(root), "rec S. + Next(S) + Nil");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(StaticsAliasTest, AliasCannotShadowBuiltinType)
{
  TPat * name = b.tpvar("Int");
  Exp * body = b.integer(1);
  Exp * root = b.alias(name, b.t_bool(), body);
  check(root);
  EXPECT_TRUE(has_error(name));
  EXPECT_EQ(cast<InfoTPat>(&map->at(name->rep_id()))->error, TPatError::ShadowsType);
  EXPECT_EQ(ty(root), "Int");
}

TEST_F(StaticsAliasTest, AliasCannotShadowAliasInScope)
{
  TPat * inner = b.tpvar("T");
  check(b.alias(b.tpvar("T"), b.t_int(), b.alias(inner, b.t_bool(), b.integer(1))));
  EXPECT_TRUE(has_error(inner));
}

TEST_F(StaticsAliasTest, HoleNameStillChecksDefinition)
{
  TPat * name = b.tphole();
  TypeTerm * free = b.tvar("Nowhere");
  Exp * root = b.alias(name, free, b.integer(1));
  check(root);
  EXPECT_FALSE(has_error(name));
  EXPECT_TRUE(has_error(free));
  EXPECT_EQ(cast<InfoTyp>(&map->at(free->rep_id()))->error, TypError::FreeTypeVariable);
  EXPECT_EQ(ty(root), "Int");
}

TEST_F(StaticsAliasTest, MultiHoleNameIsNotAVariable)
{
  TPat * name = b.tpmulti({b.integer(1)});
  check(b.alias(name, b.t_int(), b.integer(1)));
  EXPECT_EQ(cast<InfoTPat>(&map->at(name->rep_id()))->error, TPatError::NotAVariable);
}

TEST_F(StaticsAliasTest, DuplicateConstructorKeepsFirst)
{
  VariantTerm * first = b.variant("A", b.t_int());
  VariantTerm * second = b.variant("A", b.t_bool());
  Exp * use = b.ap(b.ctor("A"), b.integer(3));
  check(b.alias(b.tpvar("T"), b.sum({first, second}), use));
  EXPECT_FALSE(has_error(first));
  EXPECT_TRUE(has_error(second));
  EXPECT_EQ(cast<InfoTSum>(&map->at(second->rep_id()))->error, VariantError::DuplicateConstructor);
  EXPECT_EQ(ty(use), "T");
}

TEST_F(StaticsAliasTest, TypeInSumPositionIsNotAConstructor)
{
  VariantTerm * bad = b.bad_entry(b.t_int());
  check(b.alias(b.tpvar("T"), b.sum({b.variant("A"), bad}), b.ctor("A")));
  EXPECT_TRUE(has_error(bad));
  EXPECT_EQ(cast<InfoTSum>(&map->at(bad->rep_id()))->error, VariantError::NotAConstructor);
}

TEST_F(StaticsAliasTest, ConstructorOutOfScopeIsFree)
{
  Exp * tag = b.ctor("A");
  check(b.seq(b.alias(b.tpvar("T"), b.sum({b.variant("A")}), b.integer(1)), tag));
  EXPECT_TRUE(has_error(tag));
}
