// tests/unit/sema/test_session.cpp - Unit tests for the memoized statics session
//

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <thread>
#include <vector>

#include "gradual/sema/info_map.hpp"
#include "gradual/sema/memo_cache.hpp"
#include "gradual/sema/session.hpp"
#include "gradual/sema/type_utils.hpp"
#include "gradual/term/term_utils.hpp"
#include "gradual/test_support/term_builder.hpp"

using namespace gradual;
using gradual::test_support::TermBuilder;

namespace
{

// let inc = fun x -> x + 1 in inc(2)
const Term * build_program(TermBuilder & b)
{
  Exp * def = b.fun(b.pvar("x"), b.bin(BinOp::Plus, b.var("x"), b.integer(1)));
  return b.let(b.pvar("inc"), def, b.ap(b.var("inc"), b.integer(2)));
}

}  // namespace

TEST(SessionTest, StructurallyEqualTermsShareOneMap)
{
  TermBuilder first;
  TermBuilder second;
  const Term * a = build_program(first);
  const Term * c = build_program(second);
  ASSERT_NE(a, c);
  ASSERT_TRUE(structurally_equal(a, c));

  StaticsSession session;
  const auto m1 = session.compute(a);
  const auto m2 = session.compute(c);
  EXPECT_EQ(m1, m2);

  const MemoStats stats = session.cache_stats();
  EXPECT_EQ(stats.hits, 1u);
  EXPECT_EQ(stats.misses, 1u);
  EXPECT_EQ(stats.size, 1u);
}

TEST(SessionTest, CachedResultMatchesFreshTraversal)
{
  TermBuilder b;
  const Term * root = build_program(b);

  StaticsSession session;
  const auto cached = session.compute(root);
  const auto fresh = session.compute_uncached(root);
  EXPECT_TRUE(cached->same_statics(*fresh));
  EXPECT_TRUE(fresh->same_statics(*cached));
  EXPECT_EQ(to_string(exp_type_after_fix(*cached, root->rep_id())), "Int");
}

TEST(SessionTest, ResultDoesNotDependOnCacheState)
{
  TermBuilder b;
  const Term * root = build_program(b);

  StaticsSession warm;
  const auto first = warm.compute(root);
  warm.clear_cache();
  const auto second = warm.compute(root);
  EXPECT_NE(first, second);
  EXPECT_TRUE(first->same_statics(*second));
}

TEST(SessionTest, MapOutlivesCallerTerm)
{
  StaticsSession session;
  std::shared_ptr<const InfoMap> map;
  Id root_id;
  {
    TermBuilder b;
    const Term * root = build_program(b);
    root_id = root->rep_id();
    map = session.compute(root);
  }
  // The builder's arena is gone; the map describes its own clone
  ASSERT_TRUE(map->contains(root_id));
  EXPECT_EQ(map->at(root_id).term->rep_id(), root_id);
  EXPECT_EQ(to_string(exp_type_after_fix(*map, root_id)), "Int");
}

TEST(SessionTest, TermsRecoversEveryNode)
{
  TermBuilder b;
  const Term * root = build_program(b);

  StaticsSession session;
  const auto map = session.compute(root);
  const auto nodes = terms(*map);

  EXPECT_EQ(nodes.size(), collect_ids(root).size());
  for (const Id id : map->ids()) {
    auto it = nodes.find(id);
    ASSERT_NE(it, nodes.end());
    const auto ids = it->second->ids;
    EXPECT_NE(std::find(ids.begin(), ids.end(), id), ids.end());
  }
  EXPECT_EQ(nodes.at(root->rep_id()), map->root());
  EXPECT_NE(nodes.at(root->rep_id()), root);
}

TEST(SessionTest, NaNLiteralHitsTheCache)
{
  TermBuilder b;
  Exp * root = b.bin(
    BinOp::FPlus, b.flt(std::numeric_limits<double>::quiet_NaN()), b.flt(1.0));

  StaticsSession session;
  const auto first = session.compute(root);
  EXPECT_EQ(session.compute(root), first);

  const MemoStats stats = session.cache_stats();
  EXPECT_EQ(stats.hits, 1u);
  EXPECT_EQ(stats.size, 1u);
}

TEST(SessionTest, DifferentIdsAreDifferentKeys)
{
  TermBuilder b;
  Exp * one = b.integer(1);
  Exp * other = b.integer(1);

  StaticsSession session;
  const auto m1 = session.compute(one);
  const auto m2 = session.compute(other);
  EXPECT_NE(m1, m2);
  EXPECT_EQ(session.cache_stats().misses, 2u);
}

TEST(SessionTest, EmptyInitialContext)
{
  TermBuilder b;
  Exp * use = b.var("pi");

  StaticsSession with_builtins;
  EXPECT_FALSE(is_error(*with_builtins.compute(use), use->rep_id()));

  StaticsSession bare(SessionOptions{16, false});
  EXPECT_TRUE(bare.initial_ctx().empty());
  EXPECT_TRUE(is_error(*bare.compute(use), use->rep_id()));
}

TEST(SessionTest, ConcurrentComputeIsSafe)
{
  TermBuilder b;
  const Term * root = build_program(b);
  StaticsSession session;

  std::vector<std::shared_ptr<const InfoMap>> results(4);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i] { results[i] = session.compute(root); });
  }
  for (auto & t : threads) t.join();

  for (const auto & r : results) {
    ASSERT_NE(r, nullptr);
    EXPECT_TRUE(r->same_statics(*results[0]));
  }
  EXPECT_EQ(session.cache_stats().size, 1u);
}

// ============================================================================
// MemoCache
// ============================================================================

TEST(MemoCacheTest, EvictsLeastRecentlyUsed)
{
  TermBuilder b;
  Exp * t1 = b.integer(1);
  Exp * t2 = b.integer(2);
  Exp * t3 = b.integer(3);

  StaticsSession session(SessionOptions{2, true});
  const auto m1 = session.compute(t1);
  (void)session.compute(t2);
  // Touch t1 so t2 becomes the oldest
  EXPECT_EQ(session.compute(t1), m1);
  (void)session.compute(t3);

  MemoStats stats = session.cache_stats();
  EXPECT_EQ(stats.size, 2u);
  EXPECT_EQ(stats.evictions, 1u);

  EXPECT_EQ(session.compute(t1), m1);
  stats = session.cache_stats();
  EXPECT_EQ(stats.hits, 2u);

  (void)session.compute(t2);
  EXPECT_EQ(session.cache_stats().misses, 4u);
}

TEST(MemoCacheTest, LookupConfirmsByStructure)
{
  TermBuilder b;
  b.integer(0);
  Exp * t = b.str("a");
  StaticsSession session;
  auto map = session.compute_uncached(t);

  MemoCache cache(4);
  EXPECT_EQ(cache.lookup(t), nullptr);
  const auto stored = cache.insert(std::shared_ptr<const InfoMap>(std::move(map)));
  EXPECT_EQ(cache.lookup(t), stored);

  TermBuilder other;
  other.integer(0);
  Exp * renamed = other.str("b");
  // Same id, different payload
  ASSERT_EQ(renamed->rep_id(), t->rep_id());
  EXPECT_EQ(cache.lookup(renamed), nullptr);

  cache.clear();
  EXPECT_EQ(cache.stats().size, 0u);
}
