// tests/unit/sema/test_ctx.cpp - Unit tests for typing contexts, co-contexts and modes
//

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "gradual/sema/builtins.hpp"
#include "gradual/sema/co_ctx.hpp"
#include "gradual/sema/ctx.hpp"
#include "gradual/sema/mode.hpp"
#include "gradual/sema/type_utils.hpp"

using namespace gradual;

// ============================================================================
// Ctx
// ============================================================================

class SemaCtxTest : public ::testing::Test
{
protected:
  TypeContext types;
};

TEST_F(SemaCtxTest, LookupFindsInnermostBinding)
{
  const Ctx outer = Ctx{}.extend_var("x", Id{1}, types.int_type());
  const Ctx inner = outer.extend_var("x", Id{2}, types.bool_type());

  ASSERT_NE(inner.lookup_var("x"), nullptr);
  EXPECT_EQ(inner.lookup_var("x")->id, Id{2});
  EXPECT_EQ(inner.lookup_var("x")->typ, types.bool_type());
  // Extension never modifies the original
  EXPECT_EQ(outer.lookup_var("x")->id, Id{1});
  EXPECT_EQ(outer.size(), 1u);
  EXPECT_EQ(inner.size(), 2u);
}

TEST_F(SemaCtxTest, EntryKindsAreSeparateNamespaces)
{
  const Ctx ctx = Ctx{}
                    .extend_var("A", Id{1}, types.int_type())
                    .extend_constructor("A", Id{2}, types.string_type())
                    .extend_type_var("A", Id{3}, nullptr);

  EXPECT_EQ(ctx.lookup_var("A")->id, Id{1});
  EXPECT_EQ(ctx.lookup_constructor("A")->id, Id{2});
  EXPECT_EQ(ctx.lookup_type_var("A")->id, Id{3});
  EXPECT_TRUE(ctx.lookup_type_var("A")->is_abstract());
  EXPECT_EQ(ctx.lookup_alias("A"), nullptr);
  EXPECT_EQ(ctx.lookup_var("B"), nullptr);
}

TEST_F(SemaCtxTest, AliasLookup)
{
  const Ctx ctx = Ctx{}.extend_type_var("N", Id{1}, types.int_type());
  EXPECT_TRUE(ctx.is_type_var("N"));
  EXPECT_EQ(ctx.lookup_alias("N"), types.int_type());
  EXPECT_FALSE(ctx.is_type_var("M"));
}

TEST_F(SemaCtxTest, ShadowsTypChecksBuiltinsAndTypeVariables)
{
  TypeTable table;
  table.register_builtins(types);
  const Ctx ctx = Ctx{}
                    .extend_type_var("Tree", Id{1}, nullptr)
                    .extend_var("Leaf", Id{2}, types.int_type());

  EXPECT_TRUE(ctx.shadows_typ("Int", table));
  EXPECT_TRUE(ctx.shadows_typ("Unit", table));
  EXPECT_TRUE(ctx.shadows_typ("Tree", table));
  // Variables live in another namespace
  EXPECT_FALSE(ctx.shadows_typ("Leaf", table));
  EXPECT_FALSE(ctx.shadows_typ("Forest", table));
  EXPECT_FALSE(Ctx{}.shadows_typ("Tree", table));
}

TEST_F(SemaCtxTest, AddedSinceListsNewEntriesInnermostFirst)
{
  const Ctx base = Ctx{}.extend_var("a", Id{1}, types.int_type());
  const Ctx grown = base.extend_var("b", Id{2}, types.int_type()).extend_var("c", Id{3}, types.int_type());

  const std::vector<CtxEntry> added = grown.added_since(base);
  ASSERT_EQ(added.size(), 2u);
  EXPECT_EQ(added[0].name, "c");
  EXPECT_EQ(added[1].name, "b");
  EXPECT_TRUE(base.added_since(base).empty());

  const std::vector<CtxEntry> all = grown.entries();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all.back().name, "a");
}

TEST_F(SemaCtxTest, EqualityIsIdentity)
{
  const Ctx a = Ctx{}.extend_var("x", Id{1}, types.int_type());
  const Ctx copy = a;
  const Ctx same_shape = Ctx{}.extend_var("x", Id{1}, types.int_type());
  EXPECT_EQ(a, copy);
  EXPECT_NE(a, same_shape);
}

TEST_F(SemaCtxTest, BuiltinContext)
{
  TypeTable table;
  table.register_builtins(types);
  const Ctx ctx = builtin_ctx(types, table);

  ASSERT_NE(ctx.lookup_var("string_of_int"), nullptr);
  EXPECT_EQ(to_string(ctx.lookup_var("string_of_int")->typ), "Int -> String");
  EXPECT_EQ(ctx.lookup_var("pi")->typ, types.float_type());
  ASSERT_NE(ctx.lookup_constructor("LT"), nullptr);
  EXPECT_EQ(ctx.lookup_constructor("LT")->typ, table.lookup("Ordering"));
  EXPECT_EQ(ctx.lookup_var("nonexistent"), nullptr);
}

// ============================================================================
// CoCtx
// ============================================================================

class SemaCoCtxTest : public ::testing::Test
{
protected:
  TypeContext types;
  Ctx ctx;
};

TEST_F(SemaCoCtxTest, MergeCollectsUsesPerName)
{
  CoCtx uses = CoCtx::singleton("x", Id{1}, Mode::syn());
  uses.merge(CoCtx::singleton("x", Id{2}, Mode::ana(types.int_type())));
  uses.merge(CoCtx::singleton("y", Id{3}, Mode::syn()));

  ASSERT_NE(uses.uses("x"), nullptr);
  EXPECT_EQ(uses.uses("x")->size(), 2u);
  EXPECT_TRUE(uses.mentions("y"));
  EXPECT_FALSE(uses.mentions("z"));
  EXPECT_EQ(uses.names(), (std::vector<std::string_view>{"x", "y"}));
}

TEST_F(SemaCoCtxTest, UnionOfParts)
{
  const CoCtx a = CoCtx::singleton("a", Id{1}, Mode::syn());
  const CoCtx b = CoCtx::singleton("b", Id{2}, Mode::syn());
  const CoCtx u = CoCtx::union_of({&a, &b});
  EXPECT_EQ(u.size(), 2u);
}

TEST_F(SemaCoCtxTest, WithoutDropsBoundVariablesOnly)
{
  CoCtx uses = CoCtx::singleton("x", Id{1}, Mode::syn());
  uses.merge(CoCtx::singleton("T", Id{2}, Mode::syn()));

  const Ctx bound = ctx.extend_var("x", Id{10}, types.int_type()).extend_type_var("T", Id{11}, nullptr);
  const CoCtx rest = uses.without(bound.added_since(ctx));
  EXPECT_FALSE(rest.mentions("x"));
  EXPECT_TRUE(rest.mentions("T"));
}

TEST_F(SemaCoCtxTest, JoinUsesCombinesExpectations)
{
  const std::vector<CoCtxEntry> agree = {
    {Id{1}, Mode::ana(types.get_list_type(types.unknown_type()))},
    {Id{2}, Mode::ana(types.get_list_type(types.int_type()))},
    {Id{3}, Mode::syn()},
  };
  EXPECT_EQ(to_string(join_uses(types, ctx, agree)), "[Int]");

  const std::vector<CoCtxEntry> disagree = {
    {Id{1}, Mode::ana(types.int_type())},
    {Id{2}, Mode::ana(types.bool_type())},
  };
  EXPECT_EQ(join_uses(types, ctx, disagree), types.unknown_type());

  const std::vector<CoCtxEntry> callee = {{Id{1}, Mode::syn_fun()}};
  EXPECT_EQ(to_string(join_uses(types, ctx, callee)), "? -> ?");
}

// ============================================================================
// Mode
// ============================================================================

class SemaModeTest : public ::testing::Test
{
protected:
  TypeContext types;
  Ctx ctx;
};

TEST_F(SemaModeTest, AnaOrSynDegradesOnSynSwitch)
{
  EXPECT_TRUE(Mode::ana_or_syn(types.synswitch_type()).is_syn());
  EXPECT_TRUE(Mode::ana_or_syn(types.unknown_type()).is_ana());
  EXPECT_EQ(Mode::ana(types.int_type()), Mode::ana(types.int_type()));
  EXPECT_NE(Mode::ana(types.int_type()), Mode::syn());
}

TEST_F(SemaModeTest, OfArrowSplitsExpectedType)
{
  const auto [param, body] =
    of_arrow(types, ctx, Mode::ana(types.get_arrow_type(types.int_type(), types.bool_type())));
  EXPECT_EQ(param, Mode::ana(types.int_type()));
  EXPECT_EQ(body, Mode::ana(types.bool_type()));

  const auto [sp, sb] = of_arrow(types, ctx, Mode::syn());
  EXPECT_TRUE(sp.is_syn());
  EXPECT_TRUE(sb.is_syn());
}

TEST_F(SemaModeTest, OfListConcatAlwaysExpectsList)
{
  const Mode syn = of_list_concat(types, ctx, Mode::syn());
  ASSERT_TRUE(syn.is_ana());
  EXPECT_EQ(syn.ana_type()->kind, TypeKind::List);

  const Mode ana = of_list_concat(types, ctx, Mode::ana(types.get_list_type(types.int_type())));
  EXPECT_EQ(ana, Mode::ana(types.get_list_type(types.int_type())));
}

TEST_F(SemaModeTest, OfProdOnArityMismatch)
{
  const auto modes =
    of_prod(types, ctx, Mode::ana(types.get_prod_type({types.int_type()})), 2);
  ASSERT_EQ(modes.size(), 2u);
  EXPECT_EQ(modes[0], Mode::ana(types.unknown_type()));
}

TEST_F(SemaModeTest, TyOfSynFunIsArrowOfSynSwitch)
{
  const Type * t = ty_of(types, Mode::syn_fun());
  EXPECT_EQ(t, types.get_arrow_type(types.synswitch_type(), types.synswitch_type()));
  EXPECT_TRUE(ty_of(types, Mode::syn())->is_synswitch());
}

TEST_F(SemaModeTest, ToString)
{
  EXPECT_EQ(to_string(Mode::syn()), "syn");
  EXPECT_EQ(to_string(Mode::syn_fun()), "syn-fun");
  EXPECT_EQ(to_string(Mode::ana(types.get_list_type(types.int_type()))), "ana [Int]");
}
