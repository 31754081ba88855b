// tests/unit/sema/test_info_json.cpp - Unit tests for the JSON export of info maps
//

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "gradual/sema/info_json.hpp"
#include "gradual/sema/session.hpp"
#include "gradual/term/term_utils.hpp"
#include "gradual/test_support/term_builder.hpp"

using namespace gradual;
using gradual::test_support::TermBuilder;
using nlohmann::json;

class InfoJsonTest : public ::testing::Test
{
protected:
  TermBuilder b;
  StaticsSession session{SessionOptions{4, false}};
  std::unique_ptr<InfoMap> map;

  json check(const Term * root)
  {
    map = session.compute_uncached(root);
    return to_json(*map);
  }

  static bool contains(const json & array, const std::string & name)
  {
    return std::find(array.begin(), array.end(), json(name)) != array.end();
  }
};

TEST_F(InfoJsonTest, OneEntryPerIdInAscendingOrder)
{
  const Term * root = b.let(b.pvar("x"), b.integer(1), b.var("x"));
  const json j = check(root);

  EXPECT_EQ(j["root"], root->rep_id().value);
  const json & entries = j["entries"];
  ASSERT_EQ(entries.size(), collect_ids(root).size());
  for (size_t i = 1; i < entries.size(); ++i) {
    EXPECT_LT(entries[i - 1]["id"].get<uint64_t>(), entries[i]["id"].get<uint64_t>());
  }
}

TEST_F(InfoJsonTest, ExpressionEntry)
{
  Exp * use = b.var("x");
  check(b.let(b.pvar("x"), b.integer(1), use));
  const json e = to_json(*map, use->rep_id());

  EXPECT_EQ(e["kind"], "exp");
  EXPECT_EQ(e["cls"], "VarExp");
  EXPECT_EQ(e["status"], "ok");
  EXPECT_EQ(e["error"], false);
  EXPECT_EQ(e["mode"], "syn");
  EXPECT_EQ(e["self"], "Int");
  EXPECT_EQ(e["ty"], "Int");
  EXPECT_TRUE(contains(e["ctx"], "x"));
  EXPECT_TRUE(contains(e["uses"], "x"));
}

TEST_F(InfoJsonTest, PatternEntry)
{
  Pat * x = b.pvar("x");
  check(b.let(x, b.integer(1), b.integer(2)));
  const json p = to_json(*map, x->rep_id());

  EXPECT_EQ(p["kind"], "pat");
  EXPECT_EQ(p["cls"], "VarPat");
  EXPECT_EQ(p["binds"], json::array({"x"}));
  EXPECT_EQ(p["unused"], true);
  // Pattern contexts are the context before the binding
  EXPECT_FALSE(contains(p["ctx"], "x"));
}

TEST_F(InfoJsonTest, ErrorEntry)
{
  Exp * def = b.boolean(true);
  check(b.let(b.ann(b.pvar("x"), b.t_int()), def, b.var("x")));
  const json e = to_json(*map, def->rep_id());

  EXPECT_EQ(e["error"], true);
  EXPECT_EQ(e["status"], "expected Int, found Bool");
  EXPECT_EQ(e["mode"], "ana Int");
  EXPECT_EQ(e["self"], "Bool");
  EXPECT_EQ(e["ty"], "?");
}

TEST_F(InfoJsonTest, TypeAndTypePatternEntries)
{
  TPat * name = b.tpvar("T");
  TypeTerm * free = b.tvar("Nope");
  check(b.alias(name, b.t_list(free), b.integer(1)));

  const json tp = to_json(*map, name->rep_id());
  EXPECT_EQ(tp["kind"], "tpat");
  EXPECT_EQ(tp["status"], "ok");

  const json t = to_json(*map, free->rep_id());
  EXPECT_EQ(t["kind"], "typ");
  EXPECT_EQ(t["error"], true);
  EXPECT_EQ(t["status"], "unbound type variable");
}

TEST_F(InfoJsonTest, InvalidEntryKeepsText)
{
  Exp * bad = b.invalid("#!");
  check(bad);
  const json e = to_json(*map, bad->rep_id());
  EXPECT_EQ(e["kind"], "invalid");
  EXPECT_EQ(e["text"], "#!");
  EXPECT_EQ(e["error"], true);
}

TEST_F(InfoJsonTest, HoleFunctionRendersAsUnknownArrow)
{
  Exp * root = b.fun(b.phole(), b.hole());
  check(root);
  const json e = to_json(*map, root->rep_id());
  EXPECT_EQ(e["ty"], "? -> ?");
  EXPECT_EQ(e["self"], "? -> ?");
}
