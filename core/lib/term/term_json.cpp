// gradual/term/term_json.cpp - JSON term files
//
#include "gradual/term/term_json.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "gradual/basic/casting.hpp"
#include "gradual/basic/internal_error.hpp"

namespace gradual
{

namespace
{

using nlohmann::json;

// ============================================================================
// Lookup tables
// ============================================================================

const std::unordered_map<std::string_view, TermKind> & kind_table()
{
  static const std::unordered_map<std::string_view, TermKind> table = {
#define TERM_NODE_EXP(Class, Kind, Snake) {#Class, TermKind::Kind},
#define TERM_NODE_RUL(Class, Kind, Snake) {#Class, TermKind::Kind},
#define TERM_NODE_PAT(Class, Kind, Snake) {#Class, TermKind::Kind},
#define TERM_NODE_TYP(Class, Kind, Snake) {#Class, TermKind::Kind},
#define TERM_NODE_TPAT(Class, Kind, Snake) {#Class, TermKind::Kind},
#define TERM_NODE_VARIANT(Class, Kind, Snake) {#Class, TermKind::Kind},
#include "gradual/term/term_nodes.def"
  };
  return table;
}

constexpr BinOp k_last_bin_op = BinOp::SConcat;
constexpr UnOp k_last_un_op = UnOp::Not;

template <typename Op>
bool parse_op(std::string_view text, Op last, Op & out)
{
  for (auto i = 0U; i <= static_cast<unsigned>(last); ++i) {
    const auto op = static_cast<Op>(i);
    if (to_string(op) == text) {
      out = op;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Reader
// ============================================================================

/// Malformed input; caught by term_from_json()
class LoadError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

class TermReader
{
public:
  explicit TermReader(TermContext & ctx) : ctx_(ctx) {}

  Term * read(const json & j, const std::string & path)
  {
    if (!j.is_object()) fail(path, "expected a term object");

    const std::string kind_name = string_field(j, path, "kind");
    auto it = kind_table().find(kind_name);
    if (it == kind_table().end()) fail(path, fmt::format("unknown term kind '{}'", kind_name));

    const auto ids = read_ids(j, path);

    switch (it->second) {
      // === Expressions ===
      case TermKind::InvalidExp:
        return ctx_.create<InvalidExp>(text_field(j, path, "text"), ids);
      case TermKind::EmptyHoleExp:
        return ctx_.create<EmptyHoleExp>(ids);
      case TermKind::MultiHoleExp:
        return ctx_.create<MultiHoleExp>(any_list(j, path, "children"), ids);
      case TermKind::TrivExp:
        return ctx_.create<TrivExp>(ids);
      case TermKind::BoolExp:
        return ctx_.create<BoolExp>(bool_field(j, path), ids);
      case TermKind::IntExp:
        return ctx_.create<IntExp>(int_field(j, path), ids);
      case TermKind::FloatExp:
        return ctx_.create<FloatExp>(float_field(j, path), ids);
      case TermKind::StringExp:
        return ctx_.create<StringExp>(text_field(j, path, "value"), ids);
      case TermKind::ListLitExp:
        return ctx_.create<ListLitExp>(list<Exp>(j, path, "elements", TermSort::Exp), ids);
      case TermKind::ConstructorExp:
        return ctx_.create<ConstructorExp>(text_field(j, path, "tag"), ids);
      case TermKind::FunExp:
        return ctx_.create<FunExp>(pat(j, path, "pat"), exp(j, path, "body"), ids);
      case TermKind::TupleExp:
        return ctx_.create<TupleExp>(list<Exp>(j, path, "elements", TermSort::Exp), ids);
      case TermKind::VarExp:
        return ctx_.create<VarExp>(text_field(j, path, "name"), ids);
      case TermKind::LetExp:
        return ctx_.create<LetExp>(
          pat(j, path, "pat"), exp(j, path, "def"), exp(j, path, "body"), ids);
      case TermKind::TyAliasExp:
        return ctx_.create<TyAliasExp>(
          child<TPat>(j, path, "tpat", TermSort::TPat), typ(j, path, "def"), exp(j, path, "body"),
          ids);
      case TermKind::ApExp:
        return ctx_.create<ApExp>(exp(j, path, "fn"), exp(j, path, "arg"), ids);
      case TermKind::IfExp:
        return ctx_.create<IfExp>(
          exp(j, path, "cond"), exp(j, path, "then"), exp(j, path, "else"), ids);
      case TermKind::SeqExp:
        return ctx_.create<SeqExp>(exp(j, path, "first"), exp(j, path, "second"), ids);
      case TermKind::TestExp:
        return ctx_.create<TestExp>(exp(j, path, "expr"), ids);
      case TermKind::ParensExp:
        return ctx_.create<ParensExp>(exp(j, path, "expr"), ids);
      case TermKind::ConsExp:
        return ctx_.create<ConsExp>(exp(j, path, "head"), exp(j, path, "tail"), ids);
      case TermKind::ListConcatExp:
        return ctx_.create<ListConcatExp>(exp(j, path, "lhs"), exp(j, path, "rhs"), ids);
      case TermKind::UnOpExp: {
        UnOp op{};
        const std::string text = string_field(j, path, "op");
        if (!parse_op(text, k_last_un_op, op)) fail(path, fmt::format("unknown unary operator '{}'", text));
        return ctx_.create<UnOpExp>(op, exp(j, path, "operand"), ids);
      }
      case TermKind::BinOpExp: {
        BinOp op{};
        const std::string text = string_field(j, path, "op");
        if (!parse_op(text, k_last_bin_op, op)) fail(path, fmt::format("unknown binary operator '{}'", text));
        return ctx_.create<BinOpExp>(op, exp(j, path, "lhs"), exp(j, path, "rhs"), ids);
      }
      case TermKind::MatchExp:
        return ctx_.create<MatchExp>(
          exp(j, path, "scrutinee"), list<Rule>(j, path, "rules", TermSort::Rul), ids);

      // === Rules ===
      case TermKind::Rule:
        return ctx_.create<Rule>(pat(j, path, "pat"), exp(j, path, "body"), ids);

      // === Patterns ===
      case TermKind::InvalidPat:
        return ctx_.create<InvalidPat>(text_field(j, path, "text"), ids);
      case TermKind::EmptyHolePat:
        return ctx_.create<EmptyHolePat>(ids);
      case TermKind::MultiHolePat:
        return ctx_.create<MultiHolePat>(any_list(j, path, "children"), ids);
      case TermKind::WildPat:
        return ctx_.create<WildPat>(ids);
      case TermKind::IntPat:
        return ctx_.create<IntPat>(int_field(j, path), ids);
      case TermKind::FloatPat:
        return ctx_.create<FloatPat>(float_field(j, path), ids);
      case TermKind::BoolPat:
        return ctx_.create<BoolPat>(bool_field(j, path), ids);
      case TermKind::StringPat:
        return ctx_.create<StringPat>(text_field(j, path, "value"), ids);
      case TermKind::TrivPat:
        return ctx_.create<TrivPat>(ids);
      case TermKind::ListLitPat:
        return ctx_.create<ListLitPat>(list<Pat>(j, path, "elements", TermSort::Pat), ids);
      case TermKind::ConstructorPat:
        return ctx_.create<ConstructorPat>(text_field(j, path, "tag"), ids);
      case TermKind::ConsPat:
        return ctx_.create<ConsPat>(pat(j, path, "head"), pat(j, path, "tail"), ids);
      case TermKind::VarPat:
        return ctx_.create<VarPat>(text_field(j, path, "name"), ids);
      case TermKind::TuplePat:
        return ctx_.create<TuplePat>(list<Pat>(j, path, "elements", TermSort::Pat), ids);
      case TermKind::ParensPat:
        return ctx_.create<ParensPat>(pat(j, path, "pat"), ids);
      case TermKind::ApPat:
        return ctx_.create<ApPat>(pat(j, path, "fn"), pat(j, path, "arg"), ids);
      case TermKind::TypeAnnPat:
        return ctx_.create<TypeAnnPat>(pat(j, path, "pat"), typ(j, path, "ann"), ids);

      // === Types ===
      case TermKind::InvalidTyp:
        return ctx_.create<InvalidTyp>(text_field(j, path, "text"), ids);
      case TermKind::EmptyHoleTyp:
        return ctx_.create<EmptyHoleTyp>(ids);
      case TermKind::MultiHoleTyp:
        return ctx_.create<MultiHoleTyp>(any_list(j, path, "children"), ids);
      case TermKind::IntTyp:
        return ctx_.create<IntTyp>(ids);
      case TermKind::FloatTyp:
        return ctx_.create<FloatTyp>(ids);
      case TermKind::BoolTyp:
        return ctx_.create<BoolTyp>(ids);
      case TermKind::StringTyp:
        return ctx_.create<StringTyp>(ids);
      case TermKind::ListTyp:
        return ctx_.create<ListTyp>(typ(j, path, "elem"), ids);
      case TermKind::VarTyp:
        return ctx_.create<VarTyp>(text_field(j, path, "name"), ids);
      case TermKind::ArrowTyp:
        return ctx_.create<ArrowTyp>(typ(j, path, "param"), typ(j, path, "result"), ids);
      case TermKind::TupleTyp:
        return ctx_.create<TupleTyp>(list<TypeTerm>(j, path, "elements", TermSort::Typ), ids);
      case TermKind::ParensTyp:
        return ctx_.create<ParensTyp>(typ(j, path, "typ"), ids);
      case TermKind::SumTyp:
        return ctx_.create<SumTyp>(
          list<VariantTerm>(j, path, "variants", TermSort::Variant), ids);

      // === Type patterns ===
      case TermKind::InvalidTPat:
        return ctx_.create<InvalidTPat>(text_field(j, path, "text"), ids);
      case TermKind::EmptyHoleTPat:
        return ctx_.create<EmptyHoleTPat>(ids);
      case TermKind::MultiHoleTPat:
        return ctx_.create<MultiHoleTPat>(any_list(j, path, "children"), ids);
      case TermKind::VarTPat:
        return ctx_.create<VarTPat>(text_field(j, path, "name"), ids);

      // === Sum entries ===
      case TermKind::Variant: {
        TypeTerm * arg = nullptr;
        auto a = j.find("arg");
        if (a != j.end() && !a->is_null()) arg = typ(j, path, "arg");
        return ctx_.create<Variant>(text_field(j, path, "tag"), arg, ids);
      }
      case TermKind::BadVariantEntry:
        return ctx_.create<BadVariantEntry>(typ(j, path, "typ"), ids);
    }
    throw InternalError(fmt::format("term_from_json: unhandled kind '{}'", kind_name));
  }

private:
  [[noreturn]] static void fail(const std::string & path, const std::string & msg)
  {
    throw LoadError(fmt::format("{}: {}", path, msg));
  }

  static const json & field(const json & j, const std::string & path, const char * name)
  {
    auto it = j.find(name);
    if (it == j.end()) fail(path, fmt::format("missing field '{}'", name));
    return *it;
  }

  static std::string string_field(const json & j, const std::string & path, const char * name)
  {
    const json & v = field(j, path, name);
    if (!v.is_string()) fail(path, fmt::format("field '{}' must be a string", name));
    return v.get<std::string>();
  }

  std::string_view text_field(const json & j, const std::string & path, const char * name)
  {
    return ctx_.intern(string_field(j, path, name));
  }

  static bool bool_field(const json & j, const std::string & path)
  {
    const json & v = field(j, path, "value");
    if (!v.is_boolean()) fail(path, "field 'value' must be a boolean");
    return v.get<bool>();
  }

  static int64_t int_field(const json & j, const std::string & path)
  {
    const json & v = field(j, path, "value");
    if (!v.is_number_integer()) fail(path, "field 'value' must be an integer");
    return v.get<int64_t>();
  }

  static double float_field(const json & j, const std::string & path)
  {
    const json & v = field(j, path, "value");
    if (!v.is_number()) fail(path, "field 'value' must be a number");
    return v.get<double>();
  }

  gsl::span<const Id> read_ids(const json & j, const std::string & path)
  {
    const json & v = field(j, path, "ids");
    if (!v.is_array() || v.empty()) fail(path, "field 'ids' must be a non-empty array");
    std::vector<Id> ids;
    ids.reserve(v.size());
    for (const auto & id : v) {
      if (!id.is_number_unsigned() || id.get<uint64_t>() == 0) {
        fail(path, "ids must be positive integers");
      }
      ids.emplace_back(id.get<uint64_t>());
    }
    return ctx_.ids(ids);
  }

  template <typename T>
  T * child(const json & j, const std::string & path, const char * name, TermSort sort)
  {
    const std::string child_path = fmt::format("{}.{}", path, name);
    Term * term = read(field(j, path, name), child_path);
    T * typed = dyn_cast<T>(term);
    if (!typed) {
      fail(
        child_path,
        fmt::format("expected a {} term, found {}", to_string(sort), to_string(term->get_kind())));
    }
    return typed;
  }

  Exp * exp(const json & j, const std::string & path, const char * name)
  {
    return child<Exp>(j, path, name, TermSort::Exp);
  }
  Pat * pat(const json & j, const std::string & path, const char * name)
  {
    return child<Pat>(j, path, name, TermSort::Pat);
  }
  TypeTerm * typ(const json & j, const std::string & path, const char * name)
  {
    return child<TypeTerm>(j, path, name, TermSort::Typ);
  }

  template <typename T>
  gsl::span<T *> list(const json & j, const std::string & path, const char * name, TermSort sort)
  {
    const json & items = field(j, path, name);
    if (!items.is_array()) fail(path, fmt::format("field '{}' must be an array", name));
    std::vector<T *> out;
    out.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
      const std::string item_path = fmt::format("{}.{}[{}]", path, name, i);
      Term * term = read(items[i], item_path);
      T * typed = dyn_cast<T>(term);
      if (!typed) {
        fail(
          item_path,
          fmt::format("expected a {} term, found {}", to_string(sort), to_string(term->get_kind())));
      }
      out.push_back(typed);
    }
    return ctx_.copy_to_arena(out);
  }

  gsl::span<Term *> any_list(const json & j, const std::string & path, const char * name)
  {
    const json & items = field(j, path, name);
    if (!items.is_array()) fail(path, fmt::format("field '{}' must be an array", name));
    std::vector<Term *> out;
    out.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
      out.push_back(read(items[i], fmt::format("{}.{}[{}]", path, name, i)));
    }
    return ctx_.copy_to_arena(out);
  }

  TermContext & ctx_;
};

// ============================================================================
// Writer
// ============================================================================

json ids_json(const Term * term)
{
  json out = json::array();
  for (const Id id : term->ids) {
    out.push_back(id.value);
  }
  return out;
}

template <typename Span>
json list_json(const Span & items)
{
  json out = json::array();
  for (const auto * item : items) {
    out.push_back(to_json(item));
  }
  return out;
}

}  // namespace

TermLoadResult term_from_json(const json & j, TermContext & ctx)
{
  try {
    TermReader reader(ctx);
    return TermLoadResult::ok(reader.read(j, "$"));
  } catch (const LoadError & e) {
    return TermLoadResult::fail(e.what());
  } catch (const json::exception & e) {
    return TermLoadResult::fail(fmt::format("invalid term: {}", e.what()));
  }
}

TermLoadResult load_term_file(const std::filesystem::path & path, TermContext & ctx)
{
  std::ifstream in(path);
  if (!in) {
    return TermLoadResult::fail(fmt::format("cannot open '{}'", path.string()));
  }

  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error & e) {
    return TermLoadResult::fail(fmt::format("{}: {}", path.string(), e.what()));
  }

  TermLoadResult result = term_from_json(doc, ctx);
  if (!result.success) {
    result.error = fmt::format("{}: {}", path.string(), result.error);
  }
  return result;
}

json to_json(const Term * term)
{
  json j = {{"kind", std::string(to_string(term->get_kind()))}, {"ids", ids_json(term)}};

  switch (term->get_kind()) {
    // === Expressions ===
    case TermKind::InvalidExp:
    case TermKind::InvalidPat:
    case TermKind::InvalidTyp:
    case TermKind::InvalidTPat:
      j["text"] = std::string(invalid_text(term));
      break;
    case TermKind::EmptyHoleExp:
    case TermKind::EmptyHolePat:
    case TermKind::EmptyHoleTyp:
    case TermKind::EmptyHoleTPat:
    case TermKind::TrivExp:
    case TermKind::TrivPat:
    case TermKind::WildPat:
    case TermKind::IntTyp:
    case TermKind::FloatTyp:
    case TermKind::BoolTyp:
    case TermKind::StringTyp:
      break;
    case TermKind::MultiHoleExp:
    case TermKind::MultiHolePat:
    case TermKind::MultiHoleTyp:
    case TermKind::MultiHoleTPat:
      j["children"] = list_json(multi_hole_children(term));
      break;
    case TermKind::BoolExp:
      j["value"] = cast<BoolExp>(term)->value;
      break;
    case TermKind::IntExp:
      j["value"] = cast<IntExp>(term)->value;
      break;
    case TermKind::FloatExp:
      j["value"] = cast<FloatExp>(term)->value;
      break;
    case TermKind::StringExp:
      j["value"] = std::string(cast<StringExp>(term)->value);
      break;
    case TermKind::ListLitExp:
      j["elements"] = list_json(cast<ListLitExp>(term)->elements);
      break;
    case TermKind::ConstructorExp:
      j["tag"] = std::string(cast<ConstructorExp>(term)->tag);
      break;
    case TermKind::FunExp: {
      const auto * n = cast<FunExp>(term);
      j["pat"] = to_json(n->pat);
      j["body"] = to_json(n->body);
      break;
    }
    case TermKind::TupleExp:
      j["elements"] = list_json(cast<TupleExp>(term)->elements);
      break;
    case TermKind::VarExp:
      j["name"] = std::string(cast<VarExp>(term)->name);
      break;
    case TermKind::LetExp: {
      const auto * n = cast<LetExp>(term);
      j["pat"] = to_json(n->pat);
      j["def"] = to_json(n->def);
      j["body"] = to_json(n->body);
      break;
    }
    case TermKind::TyAliasExp: {
      const auto * n = cast<TyAliasExp>(term);
      j["tpat"] = to_json(n->tpat);
      j["def"] = to_json(n->def);
      j["body"] = to_json(n->body);
      break;
    }
    case TermKind::ApExp: {
      const auto * n = cast<ApExp>(term);
      j["fn"] = to_json(n->fn);
      j["arg"] = to_json(n->arg);
      break;
    }
    case TermKind::IfExp: {
      const auto * n = cast<IfExp>(term);
      j["cond"] = to_json(n->cond);
      j["then"] = to_json(n->then_branch);
      j["else"] = to_json(n->else_branch);
      break;
    }
    case TermKind::SeqExp: {
      const auto * n = cast<SeqExp>(term);
      j["first"] = to_json(n->first);
      j["second"] = to_json(n->second);
      break;
    }
    case TermKind::TestExp:
      j["expr"] = to_json(cast<TestExp>(term)->expr);
      break;
    case TermKind::ParensExp:
      j["expr"] = to_json(cast<ParensExp>(term)->expr);
      break;
    case TermKind::ConsExp: {
      const auto * n = cast<ConsExp>(term);
      j["head"] = to_json(n->head);
      j["tail"] = to_json(n->tail);
      break;
    }
    case TermKind::ListConcatExp: {
      const auto * n = cast<ListConcatExp>(term);
      j["lhs"] = to_json(n->lhs);
      j["rhs"] = to_json(n->rhs);
      break;
    }
    case TermKind::UnOpExp: {
      const auto * n = cast<UnOpExp>(term);
      j["op"] = std::string(to_string(n->op));
      j["operand"] = to_json(n->operand);
      break;
    }
    case TermKind::BinOpExp: {
      const auto * n = cast<BinOpExp>(term);
      j["op"] = std::string(to_string(n->op));
      j["lhs"] = to_json(n->lhs);
      j["rhs"] = to_json(n->rhs);
      break;
    }
    case TermKind::MatchExp: {
      const auto * n = cast<MatchExp>(term);
      j["scrutinee"] = to_json(n->scrutinee);
      j["rules"] = list_json(n->rules);
      break;
    }
    case TermKind::Rule: {
      const auto * n = cast<Rule>(term);
      j["pat"] = to_json(n->pat);
      j["body"] = to_json(n->body);
      break;
    }

    // === Patterns ===
    case TermKind::IntPat:
      j["value"] = cast<IntPat>(term)->value;
      break;
    case TermKind::FloatPat:
      j["value"] = cast<FloatPat>(term)->value;
      break;
    case TermKind::BoolPat:
      j["value"] = cast<BoolPat>(term)->value;
      break;
    case TermKind::StringPat:
      j["value"] = std::string(cast<StringPat>(term)->value);
      break;
    case TermKind::ListLitPat:
      j["elements"] = list_json(cast<ListLitPat>(term)->elements);
      break;
    case TermKind::ConstructorPat:
      j["tag"] = std::string(cast<ConstructorPat>(term)->tag);
      break;
    case TermKind::ConsPat: {
      const auto * n = cast<ConsPat>(term);
      j["head"] = to_json(n->head);
      j["tail"] = to_json(n->tail);
      break;
    }
    case TermKind::VarPat:
      j["name"] = std::string(cast<VarPat>(term)->name);
      break;
    case TermKind::TuplePat:
      j["elements"] = list_json(cast<TuplePat>(term)->elements);
      break;
    case TermKind::ParensPat:
      j["pat"] = to_json(cast<ParensPat>(term)->pat);
      break;
    case TermKind::ApPat: {
      const auto * n = cast<ApPat>(term);
      j["fn"] = to_json(n->fn);
      j["arg"] = to_json(n->arg);
      break;
    }
    case TermKind::TypeAnnPat: {
      const auto * n = cast<TypeAnnPat>(term);
      j["pat"] = to_json(n->pat);
      j["ann"] = to_json(n->ann);
      break;
    }

    // === Types ===
    case TermKind::ListTyp:
      j["elem"] = to_json(cast<ListTyp>(term)->elem);
      break;
    case TermKind::VarTyp:
      j["name"] = std::string(cast<VarTyp>(term)->name);
      break;
    case TermKind::ArrowTyp: {
      const auto * n = cast<ArrowTyp>(term);
      j["param"] = to_json(n->param);
      j["result"] = to_json(n->result);
      break;
    }
    case TermKind::TupleTyp:
      j["elements"] = list_json(cast<TupleTyp>(term)->elements);
      break;
    case TermKind::ParensTyp:
      j["typ"] = to_json(cast<ParensTyp>(term)->typ);
      break;
    case TermKind::SumTyp:
      j["variants"] = list_json(cast<SumTyp>(term)->variants);
      break;

    // === Type patterns and sum entries ===
    case TermKind::VarTPat:
      j["name"] = std::string(cast<VarTPat>(term)->name);
      break;
    case TermKind::Variant: {
      const auto * n = cast<Variant>(term);
      j["tag"] = std::string(n->tag);
      if (n->arg) j["arg"] = to_json(n->arg);
      break;
    }
    case TermKind::BadVariantEntry:
      j["typ"] = to_json(cast<BadVariantEntry>(term)->typ);
      break;
  }
  return j;
}

}  // namespace gradual
