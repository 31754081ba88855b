// tests/unit/term/test_term_json.cpp - Unit tests for reading and writing JSON term files
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

#include "gradual/basic/casting.hpp"
#include "gradual/term/term_context.hpp"
#include "gradual/term/term_json.hpp"
#include "gradual/term/term_utils.hpp"
#include "gradual/test_support/term_builder.hpp"

using namespace gradual;
using gradual::test_support::TermBuilder;
using nlohmann::json;

class TermJsonTest : public ::testing::Test
{
protected:
  TermContext ctx;

  TermLoadResult load(const char * text) { return term_from_json(json::parse(text), ctx); }
};

TEST_F(TermJsonTest, ReadsLet)
{
  const auto result = load(R"({
    "kind": "LetExp", "ids": [4, 5, 6],
    "pat":  {"kind": "VarPat", "ids": [1], "name": "x"},
    "def":  {"kind": "IntExp", "ids": [2], "value": 1},
    "body": {"kind": "VarExp", "ids": [3], "name": "x"}
  })");
  ASSERT_TRUE(result.success) << result.error;

  const auto * let = dyn_cast<LetExp>(result.term);
  ASSERT_NE(let, nullptr);
  EXPECT_EQ(let->ids.size(), 3u);
  EXPECT_EQ(let->rep_id(), Id{4});
  EXPECT_EQ(cast<IntExp>(let->def)->value, 1);
  EXPECT_EQ(cast<VarExp>(let->body)->name, "x");
}

TEST_F(TermJsonTest, ReadsOperatorsAndOptionalVariantArgument)
{
  const auto result = load(R"({
    "kind": "TyAliasExp", "ids": [1],
    "tpat": {"kind": "VarTPat", "ids": [2], "name": "T"},
    "def":  {"kind": "SumTyp", "ids": [3], "variants": [
              {"kind": "Variant", "ids": [4], "tag": "A"},
              {"kind": "Variant", "ids": [5], "tag": "B", "arg": {"kind": "IntTyp", "ids": [6]}}]},
    "body": {"kind": "BinOpExp", "ids": [7], "op": "+.",
             "lhs": {"kind": "FloatExp", "ids": [8], "value": 1.5},
             "rhs": {"kind": "FloatExp", "ids": [9], "value": 2}}
  })");
  ASSERT_TRUE(result.success) << result.error;

  const auto * alias = cast<TyAliasExp>(result.term);
  const auto * sum = cast<SumTyp>(alias->def);
  ASSERT_EQ(sum->variants.size(), 2u);
  EXPECT_EQ(cast<Variant>(sum->variants[0])->arg, nullptr);
  EXPECT_NE(cast<Variant>(sum->variants[1])->arg, nullptr);
  EXPECT_EQ(cast<BinOpExp>(alias->body)->op, BinOp::FPlus);
}

TEST_F(TermJsonTest, ErrorsNameTheJsonPath)
{
  const auto wrong_sort = load(R"({
    "kind": "LetExp", "ids": [1],
    "pat":  {"kind": "VarPat", "ids": [2], "name": "x"},
    "def":  {"kind": "IntTyp", "ids": [3]},
    "body": {"kind": "VarExp", "ids": [4], "name": "x"}
  })");
  EXPECT_FALSE(wrong_sort.success);
  EXPECT_EQ(wrong_sort.error, "$.def: expected a exp term, found IntTyp");

  const auto in_list = load(R"({"kind": "TupleExp", "ids": [1], "elements": [
    {"kind": "IntExp", "ids": [2], "value": 1},
    {"kind": "Nope", "ids": [3]}]})");
  EXPECT_FALSE(in_list.success);
  EXPECT_EQ(in_list.error, "$.elements[1]: unknown term kind 'Nope'");
}

TEST_F(TermJsonTest, RejectsMalformedFields)
{
  EXPECT_FALSE(load(R"({"kind": "IntExp", "ids": [1]})").success);
  EXPECT_FALSE(load(R"({"kind": "IntExp", "ids": [], "value": 1})").success);
  EXPECT_FALSE(load(R"({"kind": "IntExp", "ids": [0], "value": 1})").success);
  EXPECT_FALSE(load(R"({"kind": "IntExp", "ids": [-1], "value": 1})").success);
  EXPECT_FALSE(load(R"({"kind": "BoolExp", "ids": [1], "value": 1})").success);
  EXPECT_FALSE(load(R"([1, 2])").success);

  const auto bad_op = load(R"({"kind": "UnOpExp", "ids": [1], "op": "~",
    "operand": {"kind": "IntExp", "ids": [2], "value": 1}})");
  EXPECT_FALSE(bad_op.success);
  EXPECT_EQ(bad_op.error, "$: unknown unary operator '~'");

  const auto missing = load(R"({"kind": "VarExp", "ids": [1]})");
  EXPECT_EQ(missing.error, "$: missing field 'name'");
}

TEST_F(TermJsonTest, WriterOutputReadsBack)
{
  TermBuilder b;
  const Term * root = b.alias(
    b.tpvar("L"), b.sum({b.variant("Nil"), b.variant("Cons", b.ttuple({b.t_int(), b.tvar("L")}))}),
    b.match(
      b.list({b.integer(1)}),
      {b.rule(b.pcons(b.pvar("h"), b.wild()), b.un(UnOp::Negate, b.var("h"))),
       b.rule(b.ann(b.phole(), b.t_list(b.thole())), b.multi({b.invalid("%"), b.integer(2)}))}));

  const json j = to_json(root);
  EXPECT_EQ(j["kind"], "TyAliasExp");

  const auto result = term_from_json(j, ctx);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(structurally_equal(result.term, root));
}

TEST_F(TermJsonTest, LoadTermFile)
{
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path() / "gradual_term_json_test";
  fs::create_directories(dir);

  const fs::path good = dir / "good.json";
  {
    std::ofstream out(good);
    out << R"({"kind": "IntExp", "ids": [1], "value": 5})";
  }
  const auto ok = load_term_file(good, ctx);
  ASSERT_TRUE(ok.success) << ok.error;
  EXPECT_EQ(cast<IntExp>(ok.term)->value, 5);

  const fs::path broken = dir / "broken.json";
  {
    std::ofstream out(broken);
    out << "{ not json";
  }
  const auto parse_error = load_term_file(broken, ctx);
  EXPECT_FALSE(parse_error.success);
  EXPECT_EQ(parse_error.error.rfind(broken.string(), 0), 0u);

  const auto missing = load_term_file(dir / "missing.json", ctx);
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("cannot open"), std::string::npos);

  fs::remove_all(dir);
}
