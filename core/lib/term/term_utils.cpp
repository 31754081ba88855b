// gradual/term/term_utils.cpp - Generic operations over term trees
//
#include "gradual/term/term_utils.hpp"

#include <cstdint>
#include <cstring>
#include <functional>
#include <string_view>

#include "gradual/basic/casting.hpp"

namespace gradual
{

namespace
{

template <typename T>
void push_all(std::vector<const Term *> & out, gsl::span<T * const> items)
{
  for (const auto * item : items) {
    if (item) out.push_back(item);
  }
}

template <typename T>
void push_all(std::vector<const Term *> & out, gsl::span<T *> items)
{
  for (const auto * item : items) {
    if (item) out.push_back(item);
  }
}

void push(std::vector<const Term *> & out, const Term * item)
{
  if (item) out.push_back(item);
}

void hash_combine(size_t & seed, size_t value) noexcept
{
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

// Float literals compare and hash by bit pattern, so a NaN literal equals itself
uint64_t float_bits(double value) noexcept
{
  uint64_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  return bits;
}

// Compares everything except children.
bool payload_equal(const Term * a, const Term * b) noexcept
{
  if (a->get_kind() != b->get_kind()) return false;
  if (a->ids.size() != b->ids.size()) return false;
  for (size_t i = 0; i < a->ids.size(); ++i) {
    if (a->ids[i] != b->ids[i]) return false;
  }

  switch (a->get_kind()) {
    case TermKind::InvalidExp:
    case TermKind::InvalidPat:
    case TermKind::InvalidTyp:
    case TermKind::InvalidTPat:
      return invalid_text(a) == invalid_text(b);
    case TermKind::BoolExp:
      return cast<BoolExp>(a)->value == cast<BoolExp>(b)->value;
    case TermKind::IntExp:
      return cast<IntExp>(a)->value == cast<IntExp>(b)->value;
    case TermKind::FloatExp:
      return float_bits(cast<FloatExp>(a)->value) == float_bits(cast<FloatExp>(b)->value);
    case TermKind::StringExp:
      return cast<StringExp>(a)->value == cast<StringExp>(b)->value;
    case TermKind::ConstructorExp:
      return cast<ConstructorExp>(a)->tag == cast<ConstructorExp>(b)->tag;
    case TermKind::VarExp:
      return cast<VarExp>(a)->name == cast<VarExp>(b)->name;
    case TermKind::UnOpExp:
      return cast<UnOpExp>(a)->op == cast<UnOpExp>(b)->op;
    case TermKind::BinOpExp:
      return cast<BinOpExp>(a)->op == cast<BinOpExp>(b)->op;
    case TermKind::BoolPat:
      return cast<BoolPat>(a)->value == cast<BoolPat>(b)->value;
    case TermKind::IntPat:
      return cast<IntPat>(a)->value == cast<IntPat>(b)->value;
    case TermKind::FloatPat:
      return float_bits(cast<FloatPat>(a)->value) == float_bits(cast<FloatPat>(b)->value);
    case TermKind::StringPat:
      return cast<StringPat>(a)->value == cast<StringPat>(b)->value;
    case TermKind::ConstructorPat:
      return cast<ConstructorPat>(a)->tag == cast<ConstructorPat>(b)->tag;
    case TermKind::VarPat:
      return cast<VarPat>(a)->name == cast<VarPat>(b)->name;
    case TermKind::VarTyp:
      return cast<VarTyp>(a)->name == cast<VarTyp>(b)->name;
    case TermKind::VarTPat:
      return cast<VarTPat>(a)->name == cast<VarTPat>(b)->name;
    case TermKind::Variant: {
      const auto * va = cast<Variant>(a);
      const auto * vb = cast<Variant>(b);
      return va->tag == vb->tag && (va->arg == nullptr) == (vb->arg == nullptr);
    }
    default:
      return true;
  }
}

size_t payload_hash(const Term * t) noexcept
{
  size_t seed = std::hash<int>{}(static_cast<int>(t->get_kind()));
  for (const Id id : t->ids) {
    hash_combine(seed, std::hash<Id>{}(id));
  }

  switch (t->get_kind()) {
    case TermKind::InvalidExp:
    case TermKind::InvalidPat:
    case TermKind::InvalidTyp:
    case TermKind::InvalidTPat:
      hash_combine(seed, std::hash<std::string_view>{}(invalid_text(t)));
      break;
    case TermKind::BoolExp:
      hash_combine(seed, std::hash<bool>{}(cast<BoolExp>(t)->value));
      break;
    case TermKind::IntExp:
      hash_combine(seed, std::hash<int64_t>{}(cast<IntExp>(t)->value));
      break;
    case TermKind::FloatExp:
      hash_combine(seed, std::hash<uint64_t>{}(float_bits(cast<FloatExp>(t)->value)));
      break;
    case TermKind::StringExp:
      hash_combine(seed, std::hash<std::string_view>{}(cast<StringExp>(t)->value));
      break;
    case TermKind::ConstructorExp:
      hash_combine(seed, std::hash<std::string_view>{}(cast<ConstructorExp>(t)->tag));
      break;
    case TermKind::VarExp:
      hash_combine(seed, std::hash<std::string_view>{}(cast<VarExp>(t)->name));
      break;
    case TermKind::UnOpExp:
      hash_combine(seed, static_cast<size_t>(cast<UnOpExp>(t)->op));
      break;
    case TermKind::BinOpExp:
      hash_combine(seed, static_cast<size_t>(cast<BinOpExp>(t)->op));
      break;
    case TermKind::BoolPat:
      hash_combine(seed, std::hash<bool>{}(cast<BoolPat>(t)->value));
      break;
    case TermKind::IntPat:
      hash_combine(seed, std::hash<int64_t>{}(cast<IntPat>(t)->value));
      break;
    case TermKind::FloatPat:
      hash_combine(seed, std::hash<uint64_t>{}(float_bits(cast<FloatPat>(t)->value)));
      break;
    case TermKind::StringPat:
      hash_combine(seed, std::hash<std::string_view>{}(cast<StringPat>(t)->value));
      break;
    case TermKind::ConstructorPat:
      hash_combine(seed, std::hash<std::string_view>{}(cast<ConstructorPat>(t)->tag));
      break;
    case TermKind::VarPat:
      hash_combine(seed, std::hash<std::string_view>{}(cast<VarPat>(t)->name));
      break;
    case TermKind::VarTyp:
      hash_combine(seed, std::hash<std::string_view>{}(cast<VarTyp>(t)->name));
      break;
    case TermKind::VarTPat:
      hash_combine(seed, std::hash<std::string_view>{}(cast<VarTPat>(t)->name));
      break;
    case TermKind::Variant:
      hash_combine(seed, std::hash<std::string_view>{}(cast<Variant>(t)->tag));
      break;
    default:
      break;
  }
  return seed;
}

// ----------------------------------------------------------------------------
// Cloning
// ----------------------------------------------------------------------------

class Cloner
{
public:
  explicit Cloner(TermContext & ctx) : ctx_(ctx) {}

  Term * clone(const Term * t)
  {
    if (!t) return nullptr;
    const auto ids = copy_ids(t->ids);

    switch (t->get_kind()) {
      // Expressions
      case TermKind::InvalidExp:
        return ctx_.create<InvalidExp>(ctx_.intern(cast<InvalidExp>(t)->text), ids);
      case TermKind::EmptyHoleExp:
        return ctx_.create<EmptyHoleExp>(ids);
      case TermKind::MultiHoleExp:
        return ctx_.create<MultiHoleExp>(clone_terms(cast<MultiHoleExp>(t)->children), ids);
      case TermKind::TrivExp:
        return ctx_.create<TrivExp>(ids);
      case TermKind::BoolExp:
        return ctx_.create<BoolExp>(cast<BoolExp>(t)->value, ids);
      case TermKind::IntExp:
        return ctx_.create<IntExp>(cast<IntExp>(t)->value, ids);
      case TermKind::FloatExp:
        return ctx_.create<FloatExp>(cast<FloatExp>(t)->value, ids);
      case TermKind::StringExp:
        return ctx_.create<StringExp>(ctx_.intern(cast<StringExp>(t)->value), ids);
      case TermKind::ListLitExp:
        return ctx_.create<ListLitExp>(clone_all<Exp>(cast<ListLitExp>(t)->elements), ids);
      case TermKind::ConstructorExp:
        return ctx_.create<ConstructorExp>(ctx_.intern(cast<ConstructorExp>(t)->tag), ids);
      case TermKind::FunExp: {
        const auto * n = cast<FunExp>(t);
        return ctx_.create<FunExp>(sub<Pat>(n->pat), sub<Exp>(n->body), ids);
      }
      case TermKind::TupleExp:
        return ctx_.create<TupleExp>(clone_all<Exp>(cast<TupleExp>(t)->elements), ids);
      case TermKind::VarExp:
        return ctx_.create<VarExp>(ctx_.intern(cast<VarExp>(t)->name), ids);
      case TermKind::LetExp: {
        const auto * n = cast<LetExp>(t);
        return ctx_.create<LetExp>(sub<Pat>(n->pat), sub<Exp>(n->def), sub<Exp>(n->body), ids);
      }
      case TermKind::TyAliasExp: {
        const auto * n = cast<TyAliasExp>(t);
        return ctx_.create<TyAliasExp>(
          sub<TPat>(n->tpat), sub<TypeTerm>(n->def), sub<Exp>(n->body), ids);
      }
      case TermKind::ApExp: {
        const auto * n = cast<ApExp>(t);
        return ctx_.create<ApExp>(sub<Exp>(n->fn), sub<Exp>(n->arg), ids);
      }
      case TermKind::IfExp: {
        const auto * n = cast<IfExp>(t);
        return ctx_.create<IfExp>(
          sub<Exp>(n->cond), sub<Exp>(n->then_branch), sub<Exp>(n->else_branch), ids);
      }
      case TermKind::SeqExp: {
        const auto * n = cast<SeqExp>(t);
        return ctx_.create<SeqExp>(sub<Exp>(n->first), sub<Exp>(n->second), ids);
      }
      case TermKind::TestExp:
        return ctx_.create<TestExp>(sub<Exp>(cast<TestExp>(t)->expr), ids);
      case TermKind::ParensExp:
        return ctx_.create<ParensExp>(sub<Exp>(cast<ParensExp>(t)->expr), ids);
      case TermKind::ConsExp: {
        const auto * n = cast<ConsExp>(t);
        return ctx_.create<ConsExp>(sub<Exp>(n->head), sub<Exp>(n->tail), ids);
      }
      case TermKind::ListConcatExp: {
        const auto * n = cast<ListConcatExp>(t);
        return ctx_.create<ListConcatExp>(sub<Exp>(n->lhs), sub<Exp>(n->rhs), ids);
      }
      case TermKind::UnOpExp: {
        const auto * n = cast<UnOpExp>(t);
        return ctx_.create<UnOpExp>(n->op, sub<Exp>(n->operand), ids);
      }
      case TermKind::BinOpExp: {
        const auto * n = cast<BinOpExp>(t);
        return ctx_.create<BinOpExp>(n->op, sub<Exp>(n->lhs), sub<Exp>(n->rhs), ids);
      }
      case TermKind::MatchExp: {
        const auto * n = cast<MatchExp>(t);
        return ctx_.create<MatchExp>(sub<Exp>(n->scrutinee), clone_all<Rule>(n->rules), ids);
      }
      case TermKind::Rule: {
        const auto * n = cast<Rule>(t);
        return ctx_.create<Rule>(sub<Pat>(n->pat), sub<Exp>(n->body), ids);
      }

      // Patterns
      case TermKind::InvalidPat:
        return ctx_.create<InvalidPat>(ctx_.intern(cast<InvalidPat>(t)->text), ids);
      case TermKind::EmptyHolePat:
        return ctx_.create<EmptyHolePat>(ids);
      case TermKind::MultiHolePat:
        return ctx_.create<MultiHolePat>(clone_terms(cast<MultiHolePat>(t)->children), ids);
      case TermKind::WildPat:
        return ctx_.create<WildPat>(ids);
      case TermKind::IntPat:
        return ctx_.create<IntPat>(cast<IntPat>(t)->value, ids);
      case TermKind::FloatPat:
        return ctx_.create<FloatPat>(cast<FloatPat>(t)->value, ids);
      case TermKind::BoolPat:
        return ctx_.create<BoolPat>(cast<BoolPat>(t)->value, ids);
      case TermKind::StringPat:
        return ctx_.create<StringPat>(ctx_.intern(cast<StringPat>(t)->value), ids);
      case TermKind::TrivPat:
        return ctx_.create<TrivPat>(ids);
      case TermKind::ListLitPat:
        return ctx_.create<ListLitPat>(clone_all<Pat>(cast<ListLitPat>(t)->elements), ids);
      case TermKind::ConstructorPat:
        return ctx_.create<ConstructorPat>(ctx_.intern(cast<ConstructorPat>(t)->tag), ids);
      case TermKind::ConsPat: {
        const auto * n = cast<ConsPat>(t);
        return ctx_.create<ConsPat>(sub<Pat>(n->head), sub<Pat>(n->tail), ids);
      }
      case TermKind::VarPat:
        return ctx_.create<VarPat>(ctx_.intern(cast<VarPat>(t)->name), ids);
      case TermKind::TuplePat:
        return ctx_.create<TuplePat>(clone_all<Pat>(cast<TuplePat>(t)->elements), ids);
      case TermKind::ParensPat:
        return ctx_.create<ParensPat>(sub<Pat>(cast<ParensPat>(t)->pat), ids);
      case TermKind::ApPat: {
        const auto * n = cast<ApPat>(t);
        return ctx_.create<ApPat>(sub<Pat>(n->fn), sub<Pat>(n->arg), ids);
      }
      case TermKind::TypeAnnPat: {
        const auto * n = cast<TypeAnnPat>(t);
        return ctx_.create<TypeAnnPat>(sub<Pat>(n->pat), sub<TypeTerm>(n->ann), ids);
      }

      // Types
      case TermKind::InvalidTyp:
        return ctx_.create<InvalidTyp>(ctx_.intern(cast<InvalidTyp>(t)->text), ids);
      case TermKind::EmptyHoleTyp:
        return ctx_.create<EmptyHoleTyp>(ids);
      case TermKind::MultiHoleTyp:
        return ctx_.create<MultiHoleTyp>(clone_terms(cast<MultiHoleTyp>(t)->children), ids);
      case TermKind::IntTyp:
        return ctx_.create<IntTyp>(ids);
      case TermKind::FloatTyp:
        return ctx_.create<FloatTyp>(ids);
      case TermKind::BoolTyp:
        return ctx_.create<BoolTyp>(ids);
      case TermKind::StringTyp:
        return ctx_.create<StringTyp>(ids);
      case TermKind::ListTyp:
        return ctx_.create<ListTyp>(sub<TypeTerm>(cast<ListTyp>(t)->elem), ids);
      case TermKind::VarTyp:
        return ctx_.create<VarTyp>(ctx_.intern(cast<VarTyp>(t)->name), ids);
      case TermKind::ArrowTyp: {
        const auto * n = cast<ArrowTyp>(t);
        return ctx_.create<ArrowTyp>(sub<TypeTerm>(n->param), sub<TypeTerm>(n->result), ids);
      }
      case TermKind::TupleTyp:
        return ctx_.create<TupleTyp>(clone_all<TypeTerm>(cast<TupleTyp>(t)->elements), ids);
      case TermKind::ParensTyp:
        return ctx_.create<ParensTyp>(sub<TypeTerm>(cast<ParensTyp>(t)->typ), ids);
      case TermKind::SumTyp:
        return ctx_.create<SumTyp>(clone_all<VariantTerm>(cast<SumTyp>(t)->variants), ids);

      // Type patterns
      case TermKind::InvalidTPat:
        return ctx_.create<InvalidTPat>(ctx_.intern(cast<InvalidTPat>(t)->text), ids);
      case TermKind::EmptyHoleTPat:
        return ctx_.create<EmptyHoleTPat>(ids);
      case TermKind::MultiHoleTPat:
        return ctx_.create<MultiHoleTPat>(clone_terms(cast<MultiHoleTPat>(t)->children), ids);
      case TermKind::VarTPat:
        return ctx_.create<VarTPat>(ctx_.intern(cast<VarTPat>(t)->name), ids);

      // Variants
      case TermKind::Variant: {
        const auto * n = cast<Variant>(t);
        return ctx_.create<Variant>(ctx_.intern(n->tag), sub<TypeTerm>(n->arg), ids);
      }
      case TermKind::BadVariantEntry:
        return ctx_.create<BadVariantEntry>(sub<TypeTerm>(cast<BadVariantEntry>(t)->typ), ids);
    }
    return nullptr;
  }

private:
  gsl::span<const Id> copy_ids(gsl::span<const Id> ids)
  {
    return ctx_.copy_to_arena(std::vector<Id>(ids.begin(), ids.end()));
  }

  template <typename T>
  T * sub(const Term * t)
  {
    return static_cast<T *>(clone(t));
  }

  template <typename T, typename Src>
  gsl::span<T *> clone_all(gsl::span<Src *> items)
  {
    std::vector<T *> out;
    out.reserve(items.size());
    for (const auto * item : items) {
      out.push_back(sub<T>(item));
    }
    return ctx_.copy_to_arena(out);
  }

  gsl::span<Term *> clone_terms(gsl::span<Term *> items) { return clone_all<Term>(items); }

  TermContext & ctx_;
};

}  // namespace

std::vector<const Term *> children_of(const Term * term)
{
  std::vector<const Term *> out;
  if (!term) return out;

  switch (term->get_kind()) {
    case TermKind::MultiHoleExp:
    case TermKind::MultiHolePat:
    case TermKind::MultiHoleTyp:
    case TermKind::MultiHoleTPat:
      push_all(out, multi_hole_children(term));
      break;
    case TermKind::ListLitExp:
      push_all(out, cast<ListLitExp>(term)->elements);
      break;
    case TermKind::FunExp:
      push(out, cast<FunExp>(term)->pat);
      push(out, cast<FunExp>(term)->body);
      break;
    case TermKind::TupleExp:
      push_all(out, cast<TupleExp>(term)->elements);
      break;
    case TermKind::LetExp: {
      const auto * n = cast<LetExp>(term);
      push(out, n->pat);
      push(out, n->def);
      push(out, n->body);
      break;
    }
    case TermKind::TyAliasExp: {
      const auto * n = cast<TyAliasExp>(term);
      push(out, n->tpat);
      push(out, n->def);
      push(out, n->body);
      break;
    }
    case TermKind::ApExp:
      push(out, cast<ApExp>(term)->fn);
      push(out, cast<ApExp>(term)->arg);
      break;
    case TermKind::IfExp: {
      const auto * n = cast<IfExp>(term);
      push(out, n->cond);
      push(out, n->then_branch);
      push(out, n->else_branch);
      break;
    }
    case TermKind::SeqExp:
      push(out, cast<SeqExp>(term)->first);
      push(out, cast<SeqExp>(term)->second);
      break;
    case TermKind::TestExp:
      push(out, cast<TestExp>(term)->expr);
      break;
    case TermKind::ParensExp:
      push(out, cast<ParensExp>(term)->expr);
      break;
    case TermKind::ConsExp:
      push(out, cast<ConsExp>(term)->head);
      push(out, cast<ConsExp>(term)->tail);
      break;
    case TermKind::ListConcatExp:
      push(out, cast<ListConcatExp>(term)->lhs);
      push(out, cast<ListConcatExp>(term)->rhs);
      break;
    case TermKind::UnOpExp:
      push(out, cast<UnOpExp>(term)->operand);
      break;
    case TermKind::BinOpExp:
      push(out, cast<BinOpExp>(term)->lhs);
      push(out, cast<BinOpExp>(term)->rhs);
      break;
    case TermKind::MatchExp:
      push(out, cast<MatchExp>(term)->scrutinee);
      push_all(out, cast<MatchExp>(term)->rules);
      break;
    case TermKind::Rule:
      push(out, cast<Rule>(term)->pat);
      push(out, cast<Rule>(term)->body);
      break;
    case TermKind::ListLitPat:
      push_all(out, cast<ListLitPat>(term)->elements);
      break;
    case TermKind::ConsPat:
      push(out, cast<ConsPat>(term)->head);
      push(out, cast<ConsPat>(term)->tail);
      break;
    case TermKind::TuplePat:
      push_all(out, cast<TuplePat>(term)->elements);
      break;
    case TermKind::ParensPat:
      push(out, cast<ParensPat>(term)->pat);
      break;
    case TermKind::ApPat:
      push(out, cast<ApPat>(term)->fn);
      push(out, cast<ApPat>(term)->arg);
      break;
    case TermKind::TypeAnnPat:
      push(out, cast<TypeAnnPat>(term)->pat);
      push(out, cast<TypeAnnPat>(term)->ann);
      break;
    case TermKind::ListTyp:
      push(out, cast<ListTyp>(term)->elem);
      break;
    case TermKind::ArrowTyp:
      push(out, cast<ArrowTyp>(term)->param);
      push(out, cast<ArrowTyp>(term)->result);
      break;
    case TermKind::TupleTyp:
      push_all(out, cast<TupleTyp>(term)->elements);
      break;
    case TermKind::ParensTyp:
      push(out, cast<ParensTyp>(term)->typ);
      break;
    case TermKind::SumTyp:
      push_all(out, cast<SumTyp>(term)->variants);
      break;
    case TermKind::Variant:
      push(out, cast<Variant>(term)->arg);
      break;
    case TermKind::BadVariantEntry:
      push(out, cast<BadVariantEntry>(term)->typ);
      break;
    default:
      break;
  }
  return out;
}

std::vector<Id> collect_ids(const Term * root)
{
  std::vector<Id> out;
  if (!root) return out;

  std::vector<const Term *> stack{root};
  while (!stack.empty()) {
    const Term * t = stack.back();
    stack.pop_back();
    out.insert(out.end(), t->ids.begin(), t->ids.end());

    auto kids = children_of(t);
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
      stack.push_back(*it);
    }
  }
  return out;
}

bool structurally_equal(const Term * a, const Term * b) noexcept
{
  if (a == b) return true;
  if (!a || !b) return false;
  if (!payload_equal(a, b)) return false;

  const auto ka = children_of(a);
  const auto kb = children_of(b);
  if (ka.size() != kb.size()) return false;
  for (size_t i = 0; i < ka.size(); ++i) {
    if (!structurally_equal(ka[i], kb[i])) return false;
  }
  return true;
}

size_t structural_hash(const Term * term) noexcept
{
  if (!term) return 0;
  size_t seed = payload_hash(term);
  for (const Term * child : children_of(term)) {
    hash_combine(seed, structural_hash(child));
  }
  return seed;
}

Term * clone_term(const Term * term, TermContext & ctx)
{
  Cloner cloner(ctx);
  return cloner.clone(term);
}

size_t term_size(const Term * term) noexcept
{
  if (!term) return 0;
  size_t n = 1;
  for (const Term * child : children_of(term)) {
    n += term_size(child);
  }
  return n;
}

}  // namespace gradual
