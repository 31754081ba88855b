// gradual/test_support/term_builder.hpp - helpers for unit tests
//
// Builds terms with automatically assigned ids. Multi-token forms get one
// id per keyword token (`let`/`=`/`in`, `if`/`then`/`else`, ...), like the
// terms an editor produces.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

#include "gradual/term/term.hpp"
#include "gradual/term/term_context.hpp"

namespace gradual::test_support
{

class TermBuilder
{
public:
  TermBuilder() = default;

  TermBuilder(const TermBuilder &) = delete;
  TermBuilder & operator=(const TermBuilder &) = delete;

  [[nodiscard]] TermContext & context() noexcept { return ctx_; }

  /// Id the next node will receive
  [[nodiscard]] Id peek_id() const noexcept { return Id{next_id_}; }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  Exp * invalid(std::string_view text) { return ctx_.create<InvalidExp>(ctx_.intern(text), ids(1)); }
  Exp * hole() { return ctx_.create<EmptyHoleExp>(ids(1)); }
  Exp * multi(std::initializer_list<Term *> children)
  {
    return ctx_.create<MultiHoleExp>(arena(children), ids(1));
  }
  Exp * triv() { return ctx_.create<TrivExp>(ids(1)); }
  Exp * boolean(bool v) { return ctx_.create<BoolExp>(v, ids(1)); }
  Exp * integer(int64_t v) { return ctx_.create<IntExp>(v, ids(1)); }
  Exp * flt(double v) { return ctx_.create<FloatExp>(v, ids(1)); }
  Exp * str(std::string_view v) { return ctx_.create<StringExp>(ctx_.intern(v), ids(1)); }
  Exp * list(std::initializer_list<Exp *> elements)
  {
    return ctx_.create<ListLitExp>(arena(elements), ids(1));
  }
  Exp * ctor(std::string_view tag) { return ctx_.create<ConstructorExp>(ctx_.intern(tag), ids(1)); }
  Exp * fun(Pat * p, Exp * body) { return ctx_.create<FunExp>(p, body, ids(2)); }
  Exp * tuple(std::initializer_list<Exp *> elements)
  {
    return ctx_.create<TupleExp>(arena(elements), ids(elements.size() > 1 ? elements.size() - 1 : 1));
  }
  Exp * var(std::string_view name) { return ctx_.create<VarExp>(ctx_.intern(name), ids(1)); }
  Exp * let(Pat * p, Exp * def, Exp * body) { return ctx_.create<LetExp>(p, def, body, ids(3)); }
  Exp * alias(TPat * tp, TypeTerm * def, Exp * body)
  {
    return ctx_.create<TyAliasExp>(tp, def, body, ids(3));
  }
  Exp * ap(Exp * fn, Exp * arg) { return ctx_.create<ApExp>(fn, arg, ids(1)); }
  Exp * if_(Exp * c, Exp * t, Exp * e) { return ctx_.create<IfExp>(c, t, e, ids(3)); }
  Exp * seq(Exp * a, Exp * b) { return ctx_.create<SeqExp>(a, b, ids(1)); }
  Exp * test(Exp * e) { return ctx_.create<TestExp>(e, ids(2)); }
  Exp * parens(Exp * e) { return ctx_.create<ParensExp>(e, ids(1)); }
  Exp * cons(Exp * hd, Exp * tl) { return ctx_.create<ConsExp>(hd, tl, ids(1)); }
  Exp * concat(Exp * l, Exp * r) { return ctx_.create<ListConcatExp>(l, r, ids(1)); }
  Exp * un(UnOp op, Exp * e) { return ctx_.create<UnOpExp>(op, e, ids(1)); }
  Exp * bin(BinOp op, Exp * l, Exp * r) { return ctx_.create<BinOpExp>(op, l, r, ids(1)); }
  Exp * match(Exp * scrut, std::initializer_list<Rule *> rules)
  {
    return ctx_.create<MatchExp>(scrut, arena(rules), ids(2));
  }
  Rule * rule(Pat * p, Exp * body) { return ctx_.create<Rule>(p, body, ids(2)); }

  // ===========================================================================
  // Patterns
  // ===========================================================================

  Pat * pinvalid(std::string_view text)
  {
    return ctx_.create<InvalidPat>(ctx_.intern(text), ids(1));
  }
  Pat * phole() { return ctx_.create<EmptyHolePat>(ids(1)); }
  Pat * pmulti(std::initializer_list<Term *> children)
  {
    return ctx_.create<MultiHolePat>(arena(children), ids(1));
  }
  Pat * wild() { return ctx_.create<WildPat>(ids(1)); }
  Pat * pint(int64_t v) { return ctx_.create<IntPat>(v, ids(1)); }
  Pat * pfloat(double v) { return ctx_.create<FloatPat>(v, ids(1)); }
  Pat * pbool(bool v) { return ctx_.create<BoolPat>(v, ids(1)); }
  Pat * pstr(std::string_view v) { return ctx_.create<StringPat>(ctx_.intern(v), ids(1)); }
  Pat * ptriv() { return ctx_.create<TrivPat>(ids(1)); }
  Pat * plist(std::initializer_list<Pat *> elements)
  {
    return ctx_.create<ListLitPat>(arena(elements), ids(1));
  }
  Pat * pctor(std::string_view tag) { return ctx_.create<ConstructorPat>(ctx_.intern(tag), ids(1)); }
  Pat * pcons(Pat * hd, Pat * tl) { return ctx_.create<ConsPat>(hd, tl, ids(1)); }
  Pat * pvar(std::string_view name) { return ctx_.create<VarPat>(ctx_.intern(name), ids(1)); }
  Pat * ptuple(std::initializer_list<Pat *> elements)
  {
    return ctx_.create<TuplePat>(arena(elements), ids(elements.size() > 1 ? elements.size() - 1 : 1));
  }
  Pat * pparens(Pat * p) { return ctx_.create<ParensPat>(p, ids(1)); }
  Pat * pap(Pat * fn, Pat * arg) { return ctx_.create<ApPat>(fn, arg, ids(1)); }
  Pat * ann(Pat * p, TypeTerm * t) { return ctx_.create<TypeAnnPat>(p, t, ids(1)); }

  // ===========================================================================
  // Types
  // ===========================================================================

  TypeTerm * tinvalid(std::string_view text)
  {
    return ctx_.create<InvalidTyp>(ctx_.intern(text), ids(1));
  }
  TypeTerm * thole() { return ctx_.create<EmptyHoleTyp>(ids(1)); }
  TypeTerm * tmulti(std::initializer_list<Term *> children)
  {
    return ctx_.create<MultiHoleTyp>(arena(children), ids(1));
  }
  TypeTerm * t_int() { return ctx_.create<IntTyp>(ids(1)); }
  TypeTerm * t_float() { return ctx_.create<FloatTyp>(ids(1)); }
  TypeTerm * t_bool() { return ctx_.create<BoolTyp>(ids(1)); }
  TypeTerm * t_string() { return ctx_.create<StringTyp>(ids(1)); }
  TypeTerm * t_list(TypeTerm * elem) { return ctx_.create<ListTyp>(elem, ids(1)); }
  TypeTerm * tvar(std::string_view name) { return ctx_.create<VarTyp>(ctx_.intern(name), ids(1)); }
  TypeTerm * arrow(TypeTerm * param, TypeTerm * result)
  {
    return ctx_.create<ArrowTyp>(param, result, ids(1));
  }
  TypeTerm * ttuple(std::initializer_list<TypeTerm *> elements)
  {
    return ctx_.create<TupleTyp>(arena(elements), ids(1));
  }
  TypeTerm * tparens(TypeTerm * t) { return ctx_.create<ParensTyp>(t, ids(1)); }
  TypeTerm * sum(std::initializer_list<VariantTerm *> variants)
  {
    return ctx_.create<SumTyp>(arena(variants), ids(1));
  }

  // ===========================================================================
  // Type patterns and sum entries
  // ===========================================================================

  TPat * tpinvalid(std::string_view text)
  {
    return ctx_.create<InvalidTPat>(ctx_.intern(text), ids(1));
  }
  TPat * tphole() { return ctx_.create<EmptyHoleTPat>(ids(1)); }
  TPat * tpmulti(std::initializer_list<Term *> children)
  {
    return ctx_.create<MultiHoleTPat>(arena(children), ids(1));
  }
  TPat * tpvar(std::string_view name) { return ctx_.create<VarTPat>(ctx_.intern(name), ids(1)); }

  VariantTerm * variant(std::string_view tag, TypeTerm * arg = nullptr)
  {
    return ctx_.create<Variant>(ctx_.intern(tag), arg, ids(1));
  }
  VariantTerm * bad_entry(TypeTerm * t) { return ctx_.create<BadVariantEntry>(t, ids(1)); }

private:
  gsl::span<const Id> ids(size_t n)
  {
    std::vector<Id> out;
    for (size_t k = 0; k < n; ++k) {
      out.emplace_back(next_id_++);
    }
    return ctx_.ids(out);
  }

  template <typename T>
  gsl::span<T *> arena(std::initializer_list<T *> items)
  {
    return ctx_.copy_to_arena(std::vector<T *>(items));
  }

  TermContext ctx_;
  uint64_t next_id_ = 1;
};

}  // namespace gradual::test_support
