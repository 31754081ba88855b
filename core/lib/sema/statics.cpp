// gradual/sema/statics.cpp - Bidirectional statics traversal
//
#include "gradual/sema/statics.hpp"

#include <memory>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "gradual/basic/casting.hpp"
#include "gradual/basic/internal_error.hpp"
#include "gradual/sema/type_utils.hpp"
#include "gradual/term/term_utils.hpp"

namespace gradual
{

namespace
{

const Pat * skip_parens(const Pat * pat)
{
  while (const auto * parens = dyn_cast<ParensPat>(pat)) {
    pat = parens->pat;
  }
  return pat;
}

const Exp * skip_parens(const Exp * exp)
{
  while (const auto * parens = dyn_cast<ParensExp>(exp)) {
    exp = parens->expr;
  }
  return exp;
}

/// Components of a simultaneous binding: a tuple's elements, else the
/// term itself
std::vector<const Pat *> binding_components(const Pat * pat)
{
  pat = skip_parens(pat);
  if (const auto * tuple = dyn_cast<TuplePat>(pat)) {
    return std::vector<const Pat *>(tuple->elements.begin(), tuple->elements.end());
  }
  return {pat};
}

std::vector<const Exp *> binding_components(const Exp * exp)
{
  exp = skip_parens(exp);
  if (const auto * tuple = dyn_cast<TupleExp>(exp)) {
    std::vector<const Exp *> out;
    for (const Exp * e : tuple->elements) {
      out.push_back(skip_parens(e));
    }
    return out;
  }
  return {exp};
}

/// Variables bound anywhere inside a pattern
void collect_binders(const Term * term, std::vector<CtxEntry> & out)
{
  if (const auto * var = dyn_cast<VarPat>(term)) {
    out.push_back(CtxEntry{EntryKind::Variable, var->name, var->rep_id(), nullptr});
    return;
  }
  for (const Term * child : children_of(term)) {
    collect_binders(child, out);
  }
}

/// Scope uses seen by each element of a pattern sequence. A name rebound
/// by a later element is not a use of an earlier one.
std::vector<CoCtx> element_scopes(const CoCtx & scope, gsl::span<Pat * const> elements)
{
  std::vector<CoCtx> out(elements.size());
  CoCtx cur = scope;
  for (size_t i = elements.size(); i-- > 0;) {
    out[i] = cur;
    std::vector<CtxEntry> bound;
    collect_binders(elements[i], bound);
    if (!bound.empty()) cur = cur.without(bound);
  }
  return out;
}

const Type * operand_type(TypeContext & types, OpCategory category)
{
  switch (category) {
    case OpCategory::Bool:
      return types.bool_type();
    case OpCategory::Int:
      return types.int_type();
    case OpCategory::Float:
      return types.float_type();
    case OpCategory::String:
      return types.string_type();
  }
  return types.unknown_type();
}

}  // namespace

Statics::Statics(TypeContext & types, const TypeTable & type_table, InfoMap & map)
: types_(types), type_table_(type_table), map_(map)
{
}

// ============================================================================
// Entry Points
// ============================================================================

void Statics::check_root(const Ctx & ctx, const Term * root)
{
  if (const auto * exp = dyn_cast<Exp>(root)) {
    check_exp(ctx, Mode::syn(), exp);
    return;
  }
  check_any(ctx, root);
}

void Statics::check_any(const Ctx & ctx, const Term * term)
{
  switch (term->get_sort()) {
    case TermSort::Exp:
      check_exp(ctx, Mode::syn(), cast<Exp>(term));
      return;
    case TermSort::Pat:
      check_pat(ctx, Mode::syn(), cast<Pat>(term), CoCtx{});
      return;
    case TermSort::Typ:
      check_typ(ctx, cast<TypeTerm>(term));
      return;
    case TermSort::TPat:
      check_tpat(ctx, cast<TPat>(term));
      return;
    case TermSort::Variant: {
      std::unordered_set<std::string_view> seen;
      SumEntry entry;
      check_variant(ctx, cast<VariantTerm>(term), seen, entry);
      return;
    }
    case TermSort::Rul:
      check_rule(ctx, Mode::syn(), types_.unknown_type(), cast<Rule>(term));
      return;
  }
}

// ============================================================================
// Expressions
// ============================================================================

ExpResult Statics::check_exp(const Ctx & ctx, const Mode & mode, const Exp * exp)
{
  ++exp_visits_;
  switch (exp->get_kind()) {
    case TermKind::InvalidExp:
      record_invalid(ctx, exp);
      return ExpResult{types_.unknown_type(), CoCtx{}};
    case TermKind::EmptyHoleExp:
      return finish_exp(ctx, mode, exp, Self::just(types_.unknown_type()), CoCtx{});
    case TermKind::MultiHoleExp:
      return exp_multi_hole(ctx, mode, cast<MultiHoleExp>(exp));
    case TermKind::TrivExp:
      return finish_exp(ctx, mode, exp, Self::just(types_.unit_type()), CoCtx{});
    case TermKind::BoolExp:
      return finish_exp(ctx, mode, exp, Self::just(types_.bool_type()), CoCtx{});
    case TermKind::IntExp:
      return finish_exp(ctx, mode, exp, Self::just(types_.int_type()), CoCtx{});
    case TermKind::FloatExp:
      return finish_exp(ctx, mode, exp, Self::just(types_.float_type()), CoCtx{});
    case TermKind::StringExp:
      return finish_exp(ctx, mode, exp, Self::just(types_.string_type()), CoCtx{});
    case TermKind::ListLitExp:
      return exp_list_lit(ctx, mode, cast<ListLitExp>(exp));
    case TermKind::ConstructorExp:
      return exp_constructor(ctx, mode, cast<ConstructorExp>(exp));
    case TermKind::FunExp:
      return exp_fun(ctx, mode, cast<FunExp>(exp));
    case TermKind::TupleExp:
      return exp_tuple(ctx, mode, cast<TupleExp>(exp));
    case TermKind::VarExp:
      return exp_var(ctx, mode, cast<VarExp>(exp));
    case TermKind::LetExp:
      return exp_let(ctx, mode, cast<LetExp>(exp));
    case TermKind::TyAliasExp:
      return exp_ty_alias(ctx, mode, cast<TyAliasExp>(exp));
    case TermKind::ApExp:
      return exp_ap(ctx, mode, cast<ApExp>(exp));
    case TermKind::IfExp:
      return exp_if(ctx, mode, cast<IfExp>(exp));
    case TermKind::SeqExp:
      return exp_seq(ctx, mode, cast<SeqExp>(exp));
    case TermKind::TestExp:
      return exp_test(ctx, mode, cast<TestExp>(exp));
    case TermKind::ParensExp:
      return exp_parens(ctx, mode, cast<ParensExp>(exp));
    case TermKind::ConsExp:
      return exp_cons(ctx, mode, cast<ConsExp>(exp));
    case TermKind::ListConcatExp:
      return exp_list_concat(ctx, mode, cast<ListConcatExp>(exp));
    case TermKind::UnOpExp:
      return exp_un_op(ctx, mode, cast<UnOpExp>(exp));
    case TermKind::BinOpExp:
      return exp_bin_op(ctx, mode, cast<BinOpExp>(exp));
    case TermKind::MatchExp:
      return exp_match(ctx, mode, cast<MatchExp>(exp));
    default:
      break;
  }
  throw InternalError(fmt::format("'{}' is not an expression", to_string(exp->get_kind())));
}

ExpResult Statics::finish_exp(
  const Ctx & ctx, const Mode & mode, const Exp * node, const Self & self, CoCtx co_ctx)
{
  Status status = status_of(types_, ctx, mode, self);
  const Type * ty = fixed_type(types_, mode, status);
  // Only a callee keeps its SynSwitch arrow: it steers the argument mode
  if (!mode.is_syn_fun()) {
    ty = strip_synswitch(types_, ty);
  }
  map_.insert(
    node->ids, std::make_shared<InfoExp>(node, ctx, mode, self, co_ctx, std::move(status), ty));
  return ExpResult{ty, std::move(co_ctx)};
}

ExpResult Statics::exp_multi_hole(const Ctx & ctx, const Mode & mode, const MultiHoleExp * node)
{
  CoCtx co_ctx = check_children(ctx, node->children);
  return finish_exp(ctx, mode, node, Self::multi(), std::move(co_ctx));
}

ExpResult Statics::exp_list_lit(const Ctx & ctx, const Mode & mode, const ListLitExp * node)
{
  if (node->elements.empty()) {
    const Type * empty = types_.get_list_type(types_.unknown_type());
    return finish_exp(ctx, mode, node, Self::just(empty), CoCtx{});
  }

  const Mode elem_mode = of_list(types_, ctx, mode);
  std::vector<JoinSource> sources;
  CoCtx co_ctx;
  for (const Exp * elem : node->elements) {
    const ExpResult r = check_exp(ctx, elem_mode, elem);
    sources.push_back(JoinSource{elem->rep_id(), r.ty});
    co_ctx.merge(r.co_ctx);
  }
  return finish_exp(
    ctx, mode, node, Self::joined(JoinWrap::List, std::move(sources)), std::move(co_ctx));
}

ExpResult Statics::exp_constructor(const Ctx & ctx, const Mode & mode, const ConstructorExp * node)
{
  const CtxEntry * entry = ctx.lookup_constructor(node->tag);
  const Self self = entry ? Self::just(entry->typ) : Self::free(FreeKind::Tag);
  return finish_exp(ctx, mode, node, self, CoCtx{});
}

ExpResult Statics::exp_fun(const Ctx & ctx, const Mode & mode, const FunExp * node)
{
  const auto [param_mode, body_mode] = of_arrow(types_, ctx, mode);

  const PatResult param = check_pat(ctx, param_mode, node->pat, CoCtx{});
  const ExpResult body = check_exp(param.ctx, body_mode, node->body);
  // Second pass over the parameter records the uses in the body
  check_pat(ctx, param_mode, node->pat, body.co_ctx);

  const Type * arrow =
    types_.get_arrow_type(strip_synswitch(types_, param.ty), strip_synswitch(types_, body.ty));
  return finish_exp(
    ctx, mode, node, Self::just(arrow), body.co_ctx.without(param.ctx.added_since(ctx)));
}

ExpResult Statics::exp_tuple(const Ctx & ctx, const Mode & mode, const TupleExp * node)
{
  const std::vector<Mode> modes = of_prod(types_, ctx, mode, node->elements.size());
  std::vector<const Type *> tys;
  CoCtx co_ctx;
  for (size_t i = 0; i < node->elements.size(); ++i) {
    const ExpResult r = check_exp(ctx, modes[i], node->elements[i]);
    tys.push_back(r.ty);
    co_ctx.merge(r.co_ctx);
  }
  return finish_exp(ctx, mode, node, Self::just(types_.get_prod_type(tys)), std::move(co_ctx));
}

ExpResult Statics::exp_var(const Ctx & ctx, const Mode & mode, const VarExp * node)
{
  const CtxEntry * entry = ctx.lookup_var(node->name);
  if (!entry) {
    return finish_exp(ctx, mode, node, Self::free(FreeKind::Variable), CoCtx{});
  }
  return finish_exp(
    ctx, mode, node, Self::just(entry->typ), CoCtx::singleton(node->name, node->rep_id(), mode));
}

/**
 * let p = def in body
 *
 * 1. p is synthesized: its annotations give the expected type of def.
 * 2. def is checked against it, once. A recursive binding sees itself at
 *    the provisional type.
 * 3. p is analyzed against def's type; its bindings scope over body.
 * 4. p is walked once more with the uses in body (and, when recursive,
 *    in def) so that unused bindings can be reported.
 */
ExpResult Statics::exp_let(const Ctx & ctx, const Mode & mode, const LetExp * node)
{
  const PatResult provisional = check_pat(ctx, Mode::syn(), node->pat, CoCtx{});
  const Mode def_mode = Mode::ana_or_syn(provisional.ty);
  const bool recursive = is_recursive_let(ctx, node->pat, node->def, provisional.ty);

  const Ctx & ctx_def = recursive ? provisional.ctx : ctx;
  const ExpResult def = check_exp(ctx_def, def_mode, node->def);

  const Mode bind_mode = Mode::ana(def.ty);
  const PatResult bound = check_pat(ctx, bind_mode, node->pat, CoCtx{});
  ExpResult body = check_exp(bound.ctx, mode, node->body);

  CoCtx scope_uses = body.co_ctx;
  if (recursive) {
    scope_uses.merge(def.co_ctx);
  }
  check_pat(ctx, bind_mode, node->pat, scope_uses);

  CoCtx co_ctx = body.co_ctx.without(bound.ctx.added_since(ctx));
  co_ctx.merge(recursive ? def.co_ctx.without(ctx_def.added_since(ctx)) : def.co_ctx);
  return finish_exp(ctx, mode, node, Self::just(body.ty), std::move(co_ctx));
}

ExpResult Statics::exp_ty_alias(const Ctx & ctx, const Mode & mode, const TyAliasExp * node)
{
  const std::string_view name = check_tpat(ctx, node->tpat);
  if (name.empty()) {
    // Nothing is bound; the definition is still checked for its own errors
    check_typ(ctx, node->def);
    ExpResult body = check_exp(ctx, mode, node->body);
    return finish_exp(ctx, mode, node, Self::just(body.ty), std::move(body.co_ctx));
  }

  const Id origin = node->tpat->rep_id();

  // The definition sees the alias as an abstract type variable; using it
  // makes the alias recursive.
  const Ctx ctx_def = ctx.extend_type_var(name, origin, nullptr);
  const Type * def = normalize(types_, ctx, check_typ(ctx_def, node->def));
  if (is_free_in(name, def)) {
    def = types_.get_rec_type(name, def);
  }

  Ctx ctx_body = ctx.extend_type_var(name, origin, def);
  ctx_body = add_constructors(ctx_body, name, node->def->rep_id(), def);
  ExpResult body = check_exp(ctx_body, mode, node->body);

  // The alias name must not escape its scope
  const Type * escaped = subst(types_, def, name, body.ty);
  return finish_exp(ctx, mode, node, Self::just(escaped), std::move(body.co_ctx));
}

ExpResult Statics::exp_ap(const Ctx & ctx, const Mode & mode, const ApExp * node)
{
  const ExpResult fn = check_exp(ctx, Mode::syn_fun(), node->fn);
  const ArrowParts parts = matched_arrow(types_, ctx, fn.ty);
  const ExpResult arg = check_exp(ctx, Mode::ana_or_syn(parts.param), node->arg);

  CoCtx co_ctx = fn.co_ctx;
  co_ctx.merge(arg.co_ctx);
  return finish_exp(
    ctx, mode, node, Self::just(strip_synswitch(types_, parts.result)), std::move(co_ctx));
}

ExpResult Statics::exp_if(const Ctx & ctx, const Mode & mode, const IfExp * node)
{
  const ExpResult cond = check_exp(ctx, Mode::ana(types_.bool_type()), node->cond);
  const ExpResult then_r = check_exp(ctx, mode, node->then_branch);
  const ExpResult else_r = check_exp(ctx, mode, node->else_branch);

  CoCtx co_ctx = cond.co_ctx;
  co_ctx.merge(then_r.co_ctx);
  co_ctx.merge(else_r.co_ctx);

  std::vector<JoinSource> branches{
    JoinSource{node->then_branch->rep_id(), then_r.ty},
    JoinSource{node->else_branch->rep_id(), else_r.ty},
  };
  return finish_exp(
    ctx, mode, node, Self::joined(JoinWrap::Identity, std::move(branches)), std::move(co_ctx));
}

ExpResult Statics::exp_seq(const Ctx & ctx, const Mode & mode, const SeqExp * node)
{
  const ExpResult first = check_exp(ctx, Mode::syn(), node->first);
  const ExpResult second = check_exp(ctx, mode, node->second);
  CoCtx co_ctx = first.co_ctx;
  co_ctx.merge(second.co_ctx);
  return finish_exp(ctx, mode, node, Self::just(second.ty), std::move(co_ctx));
}

ExpResult Statics::exp_test(const Ctx & ctx, const Mode & mode, const TestExp * node)
{
  ExpResult inner = check_exp(ctx, Mode::ana(types_.bool_type()), node->expr);
  return finish_exp(ctx, mode, node, Self::just(types_.unit_type()), std::move(inner.co_ctx));
}

ExpResult Statics::exp_parens(const Ctx & ctx, const Mode & mode, const ParensExp * node)
{
  ExpResult inner = check_exp(ctx, mode, node->expr);
  return finish_exp(ctx, mode, node, Self::just(inner.ty), std::move(inner.co_ctx));
}

ExpResult Statics::exp_cons(const Ctx & ctx, const Mode & mode, const ConsExp * node)
{
  const ExpResult head = check_exp(ctx, of_cons_hd(types_, ctx, mode), node->head);
  const ExpResult tail = check_exp(ctx, of_cons_tl(types_, head.ty), node->tail);
  CoCtx co_ctx = head.co_ctx;
  co_ctx.merge(tail.co_ctx);
  return finish_exp(
    ctx, mode, node, Self::just(types_.get_list_type(head.ty)), std::move(co_ctx));
}

ExpResult Statics::exp_list_concat(const Ctx & ctx, const Mode & mode, const ListConcatExp * node)
{
  const Mode operand_mode = of_list_concat(types_, ctx, mode);
  const ExpResult lhs = check_exp(ctx, operand_mode, node->lhs);
  const ExpResult rhs = check_exp(ctx, operand_mode, node->rhs);
  CoCtx co_ctx = lhs.co_ctx;
  co_ctx.merge(rhs.co_ctx);

  // Operands join on their element types
  std::vector<JoinSource> sources{
    JoinSource{node->lhs->rep_id(), matched_list(types_, ctx, lhs.ty)},
    JoinSource{node->rhs->rep_id(), matched_list(types_, ctx, rhs.ty)},
  };
  return finish_exp(
    ctx, mode, node, Self::joined(JoinWrap::List, std::move(sources)), std::move(co_ctx));
}

ExpResult Statics::exp_un_op(const Ctx & ctx, const Mode & mode, const UnOpExp * node)
{
  const Type * operand = operand_type(types_, op_category(node->op));
  ExpResult r = check_exp(ctx, Mode::ana(operand), node->operand);
  return finish_exp(ctx, mode, node, Self::just(operand), std::move(r.co_ctx));
}

ExpResult Statics::exp_bin_op(const Ctx & ctx, const Mode & mode, const BinOpExp * node)
{
  const Type * operand = operand_type(types_, op_category(node->op));
  const Type * result = is_comparison(node->op) ? types_.bool_type() : operand;

  const ExpResult lhs = check_exp(ctx, Mode::ana(operand), node->lhs);
  const ExpResult rhs = check_exp(ctx, Mode::ana(operand), node->rhs);
  CoCtx co_ctx = lhs.co_ctx;
  co_ctx.merge(rhs.co_ctx);
  return finish_exp(ctx, mode, node, Self::just(result), std::move(co_ctx));
}

ExpResult Statics::exp_match(const Ctx & ctx, const Mode & mode, const MatchExp * node)
{
  const ExpResult scrut = check_exp(ctx, Mode::syn(), node->scrutinee);
  CoCtx co_ctx = scrut.co_ctx;

  std::vector<JoinSource> branches;
  for (const Rule * rule : node->rules) {
    const ExpResult r = check_rule(ctx, mode, scrut.ty, rule);
    branches.push_back(JoinSource{rule->body->rep_id(), r.ty});
    co_ctx.merge(r.co_ctx);
  }
  return finish_exp(
    ctx, mode, node, Self::joined(JoinWrap::Identity, std::move(branches)), std::move(co_ctx));
}

ExpResult Statics::check_rule(
  const Ctx & ctx, const Mode & mode, const Type * scrut, const Rule * rule)
{
  // Each rule starts from the match's context; rules never see each
  // other's bindings.
  const Mode bind_mode = Mode::ana(scrut);
  const PatResult bound = check_pat(ctx, bind_mode, rule->pat, CoCtx{});
  const ExpResult body = check_exp(bound.ctx, mode, rule->body);
  check_pat(ctx, bind_mode, rule->pat, body.co_ctx);

  map_.insert(rule->ids, std::make_shared<InfoRul>(rule, ctx));
  return ExpResult{body.ty, body.co_ctx.without(bound.ctx.added_since(ctx))};
}

// ============================================================================
// Patterns
// ============================================================================

PatResult Statics::check_pat(
  const Ctx & ctx, const Mode & mode, const Pat * pat, const CoCtx & co_ctx)
{
  switch (pat->get_kind()) {
    case TermKind::InvalidPat:
      record_invalid(ctx, pat);
      return PatResult{types_.unknown_type(), ctx};
    case TermKind::EmptyHolePat:
    case TermKind::WildPat:
      return finish_pat(ctx, mode, pat, Self::just(types_.synswitch_type()), co_ctx, ctx);
    case TermKind::MultiHolePat:
      return pat_multi_hole(ctx, mode, cast<MultiHolePat>(pat), co_ctx);
    case TermKind::IntPat:
      return finish_pat(ctx, mode, pat, Self::just(types_.int_type()), co_ctx, ctx);
    case TermKind::FloatPat:
      return finish_pat(ctx, mode, pat, Self::just(types_.float_type()), co_ctx, ctx);
    case TermKind::BoolPat:
      return finish_pat(ctx, mode, pat, Self::just(types_.bool_type()), co_ctx, ctx);
    case TermKind::StringPat:
      return finish_pat(ctx, mode, pat, Self::just(types_.string_type()), co_ctx, ctx);
    case TermKind::TrivPat:
      return finish_pat(ctx, mode, pat, Self::just(types_.unit_type()), co_ctx, ctx);
    case TermKind::ListLitPat:
      return pat_list_lit(ctx, mode, cast<ListLitPat>(pat), co_ctx);
    case TermKind::ConstructorPat:
      return pat_constructor(ctx, mode, cast<ConstructorPat>(pat), co_ctx);
    case TermKind::ConsPat:
      return pat_cons(ctx, mode, cast<ConsPat>(pat), co_ctx);
    case TermKind::VarPat:
      return pat_var(ctx, mode, cast<VarPat>(pat), co_ctx);
    case TermKind::TuplePat:
      return pat_tuple(ctx, mode, cast<TuplePat>(pat), co_ctx);
    case TermKind::ParensPat:
      return pat_parens(ctx, mode, cast<ParensPat>(pat), co_ctx);
    case TermKind::ApPat:
      return pat_ap(ctx, mode, cast<ApPat>(pat), co_ctx);
    case TermKind::TypeAnnPat:
      return pat_type_ann(ctx, mode, cast<TypeAnnPat>(pat), co_ctx);
    default:
      break;
  }
  throw InternalError(fmt::format("'{}' is not a pattern", to_string(pat->get_kind())));
}

PatResult Statics::finish_pat(
  const Ctx & ctx, const Mode & mode, const Pat * node, const Self & self, const CoCtx & co_ctx,
  const Ctx & ctx_out)
{
  Status status = status_of(types_, ctx, mode, self);
  const Type * ty = fixed_type(types_, mode, status);
  map_.insert(
    node->ids,
    std::make_shared<InfoPat>(node, ctx, mode, self, co_ctx, ctx_out, std::move(status), ty));
  return PatResult{ty, ctx_out};
}

PatResult Statics::pat_multi_hole(
  const Ctx & ctx, const Mode & mode, const MultiHolePat * node, const CoCtx & co_ctx)
{
  check_children(ctx, node->children);
  return finish_pat(ctx, mode, node, Self::multi(), co_ctx, ctx);
}

PatResult Statics::pat_list_lit(
  const Ctx & ctx, const Mode & mode, const ListLitPat * node, const CoCtx & co_ctx)
{
  if (node->elements.empty()) {
    const Type * empty = types_.get_list_type(types_.unknown_type());
    return finish_pat(ctx, mode, node, Self::just(empty), co_ctx, ctx);
  }

  const Mode elem_mode = of_list(types_, ctx, mode);
  const std::vector<CoCtx> scopes = element_scopes(co_ctx, node->elements);
  std::vector<JoinSource> sources;
  Ctx cur = ctx;
  for (size_t i = 0; i < node->elements.size(); ++i) {
    const Pat * elem = node->elements[i];
    PatResult r = check_pat(cur, elem_mode, elem, scopes[i]);
    sources.push_back(JoinSource{elem->rep_id(), r.ty});
    cur = std::move(r.ctx);
  }
  return finish_pat(
    ctx, mode, node, Self::joined(JoinWrap::List, std::move(sources)), co_ctx, cur);
}

PatResult Statics::pat_constructor(
  const Ctx & ctx, const Mode & mode, const ConstructorPat * node, const CoCtx & co_ctx)
{
  const CtxEntry * entry = ctx.lookup_constructor(node->tag);
  const Self self = entry ? Self::just(entry->typ) : Self::free(FreeKind::Tag);
  return finish_pat(ctx, mode, node, self, co_ctx, ctx);
}

PatResult Statics::pat_cons(
  const Ctx & ctx, const Mode & mode, const ConsPat * node, const CoCtx & co_ctx)
{
  std::vector<CtxEntry> tail_binders;
  collect_binders(node->tail, tail_binders);
  const PatResult head =
    check_pat(ctx, of_cons_hd(types_, ctx, mode), node->head, co_ctx.without(tail_binders));
  const PatResult tail = check_pat(head.ctx, of_cons_tl(types_, head.ty), node->tail, co_ctx);
  return finish_pat(
    ctx, mode, node, Self::just(types_.get_list_type(head.ty)), co_ctx, tail.ctx);
}

PatResult Statics::pat_var(
  const Ctx & ctx, const Mode & mode, const VarPat * node, const CoCtx & co_ctx)
{
  // A binding's type comes from its surroundings
  const Self self = Self::just(types_.synswitch_type());
  const Type * ty = typ_after_fix(types_, ctx, mode, self);
  const Ctx ctx_out = ctx.extend_var(node->name, node->rep_id(), strip_synswitch(types_, ty));
  return finish_pat(ctx, mode, node, self, co_ctx, ctx_out);
}

PatResult Statics::pat_tuple(
  const Ctx & ctx, const Mode & mode, const TuplePat * node, const CoCtx & co_ctx)
{
  const std::vector<Mode> modes = of_prod(types_, ctx, mode, node->elements.size());
  const std::vector<CoCtx> scopes = element_scopes(co_ctx, node->elements);
  std::vector<const Type *> tys;
  Ctx cur = ctx;
  for (size_t i = 0; i < node->elements.size(); ++i) {
    PatResult r = check_pat(cur, modes[i], node->elements[i], scopes[i]);
    tys.push_back(r.ty);
    cur = std::move(r.ctx);
  }
  return finish_pat(ctx, mode, node, Self::just(types_.get_prod_type(tys)), co_ctx, cur);
}

PatResult Statics::pat_parens(
  const Ctx & ctx, const Mode & mode, const ParensPat * node, const CoCtx & co_ctx)
{
  const PatResult inner = check_pat(ctx, mode, node->pat, co_ctx);
  return finish_pat(ctx, mode, node, Self::just(inner.ty), co_ctx, inner.ctx);
}

PatResult Statics::pat_ap(const Ctx & ctx, const Mode & mode, const ApPat * node, const CoCtx & co_ctx)
{
  const PatResult fn = check_pat(ctx, of_ap_pat(types_, mode), node->fn, co_ctx);
  const ArrowParts parts = matched_arrow(types_, ctx, fn.ty);
  const PatResult arg = check_pat(fn.ctx, Mode::ana_or_syn(parts.param), node->arg, co_ctx);
  return finish_pat(ctx, mode, node, Self::just(parts.result), co_ctx, arg.ctx);
}

PatResult Statics::pat_type_ann(
  const Ctx & ctx, const Mode & mode, const TypeAnnPat * node, const CoCtx & co_ctx)
{
  const Type * ann = check_typ(ctx, node->ann);
  const PatResult inner = check_pat(ctx, Mode::ana(ann), node->pat, co_ctx);
  return finish_pat(ctx, mode, node, Self::just(ann), co_ctx, inner.ctx);
}

// ============================================================================
// Types
// ============================================================================

const Type * Statics::check_typ(const Ctx & ctx, const TypeTerm * typ)
{
  TypError error = TypError::None;
  const Type * ty = nullptr;

  switch (typ->get_kind()) {
    case TermKind::InvalidTyp:
      record_invalid(ctx, typ);
      return types_.unknown_type();
    case TermKind::EmptyHoleTyp:
      ty = types_.unknown_type();
      break;
    case TermKind::MultiHoleTyp:
      check_children(ctx, cast<MultiHoleTyp>(typ)->children);
      ty = types_.unknown_type();
      break;
    case TermKind::IntTyp:
      ty = types_.int_type();
      break;
    case TermKind::FloatTyp:
      ty = types_.float_type();
      break;
    case TermKind::BoolTyp:
      ty = types_.bool_type();
      break;
    case TermKind::StringTyp:
      ty = types_.string_type();
      break;
    case TermKind::ListTyp:
      ty = types_.get_list_type(check_typ(ctx, cast<ListTyp>(typ)->elem));
      break;
    case TermKind::VarTyp:
      ty = typ_var(ctx, cast<VarTyp>(typ), error);
      break;
    case TermKind::ArrowTyp: {
      const auto * arrow = cast<ArrowTyp>(typ);
      const Type * param = check_typ(ctx, arrow->param);
      ty = types_.get_arrow_type(param, check_typ(ctx, arrow->result));
      break;
    }
    case TermKind::TupleTyp: {
      std::vector<const Type *> elems;
      for (const TypeTerm * elem : cast<TupleTyp>(typ)->elements) {
        elems.push_back(check_typ(ctx, elem));
      }
      ty = types_.get_prod_type(elems);
      break;
    }
    case TermKind::ParensTyp:
      ty = check_typ(ctx, cast<ParensTyp>(typ)->typ);
      break;
    case TermKind::SumTyp:
      ty = typ_sum(ctx, cast<SumTyp>(typ));
      break;
    default:
      throw InternalError(fmt::format("'{}' is not a type", to_string(typ->get_kind())));
  }

  map_.insert(typ->ids, std::make_shared<InfoTyp>(typ, ctx, error, ty));
  return ty;
}

const Type * Statics::typ_var(const Ctx & ctx, const VarTyp * node, TypError & error)
{
  // Built-in names first, then type variables in scope
  if (const Type * builtin = type_table_.lookup(node->name)) {
    return builtin;
  }
  if (ctx.is_type_var(node->name)) {
    return types_.get_var_type(node->name);
  }
  error = TypError::FreeTypeVariable;
  return types_.unknown_type();
}

const Type * Statics::typ_sum(const Ctx & ctx, const SumTyp * node)
{
  std::unordered_set<std::string_view> seen;
  std::vector<SumEntry> entries;
  for (const VariantTerm * variant : node->variants) {
    SumEntry entry;
    if (check_variant(ctx, variant, seen, entry)) {
      entries.push_back(entry);
    }
  }
  return types_.get_sum_type(std::move(entries));
}

bool Statics::check_variant(
  const Ctx & ctx, const VariantTerm * node, std::unordered_set<std::string_view> & seen,
  SumEntry & entry)
{
  if (const auto * bad = dyn_cast<BadVariantEntry>(node)) {
    check_typ(ctx, bad->typ);
    map_.insert(
      node->ids, std::make_shared<InfoTSum>(node, ctx, VariantError::NotAConstructor, nullptr));
    return false;
  }

  const auto * variant = cast<Variant>(node);
  const Type * arg = variant->arg ? check_typ(ctx, variant->arg) : nullptr;
  const bool fresh = seen.insert(variant->tag).second;
  map_.insert(
    node->ids, std::make_shared<InfoTSum>(
                 node, ctx, fresh ? VariantError::None : VariantError::DuplicateConstructor, arg));
  if (!fresh) {
    return false;
  }
  entry = SumEntry{variant->tag, arg};
  return true;
}

// ============================================================================
// Type Patterns
// ============================================================================

std::string_view Statics::check_tpat(const Ctx & ctx, const TPat * tpat)
{
  TPatError error = TPatError::None;
  std::string_view name;

  switch (tpat->get_kind()) {
    case TermKind::InvalidTPat:
      record_invalid(ctx, tpat);
      return {};
    case TermKind::EmptyHoleTPat:
      break;
    case TermKind::MultiHoleTPat:
      check_children(ctx, cast<MultiHoleTPat>(tpat)->children);
      error = TPatError::NotAVariable;
      break;
    case TermKind::VarTPat: {
      const std::string_view candidate = cast<VarTPat>(tpat)->name;
      // Type names are never shadowed
      if (ctx.shadows_typ(candidate, type_table_)) {
        error = TPatError::ShadowsType;
      } else {
        name = candidate;
      }
      break;
    }
    default:
      throw InternalError(fmt::format("'{}' is not a type pattern", to_string(tpat->get_kind())));
  }

  map_.insert(tpat->ids, std::make_shared<InfoTPat>(tpat, ctx, error));
  return name;
}

// ============================================================================
// Helper Methods
// ============================================================================

void Statics::record_invalid(const Ctx & ctx, const Term * node)
{
  map_.insert(node->ids, std::make_shared<InfoInvalid>(node, ctx, invalid_text(node)));
}

CoCtx Statics::check_children(const Ctx & ctx, gsl::span<Term * const> children)
{
  CoCtx co_ctx;
  for (const Term * child : children) {
    if (const auto * exp = dyn_cast<Exp>(child)) {
      co_ctx.merge(check_exp(ctx, Mode::syn(), exp).co_ctx);
    } else {
      check_any(ctx, child);
    }
  }
  return co_ctx;
}

bool Statics::is_recursive_let(
  const Ctx & ctx, const Pat * pat, const Exp * def, const Type * pat_ty)
{
  const std::vector<const Pat *> pats = binding_components(pat);
  const std::vector<const Exp *> defs = binding_components(def);
  if (pats.empty() || pats.size() != defs.size()) {
    return false;
  }

  const std::vector<const Type *> tys = pats.size() == 1
                                          ? std::vector<const Type *>{pat_ty}
                                          : matched_prod(types_, ctx, pat_ty, pats.size());
  for (size_t i = 0; i < pats.size(); ++i) {
    if (!isa<FunExp>(defs[i]) || !is_arrow_compatible(ctx, tys[i])) {
      return false;
    }
  }
  return true;
}

Ctx Statics::add_constructors(
  const Ctx & ctx, std::string_view name, Id origin, const Type * def) const
{
  const Type * sum = weak_head_normalize(ctx, def);
  if (sum->kind == TypeKind::Rec && sum->name == name) {
    sum = sum->lhs;
  }
  if (sum->kind != TypeKind::Sum) {
    return ctx;
  }

  // Constructors are typed by the alias name, which resolves through ctx
  const Type * alias = types_.get_var_type(name);
  Ctx out = ctx;
  for (const SumEntry & v : sum->variants) {
    out = out.extend_constructor(v.tag, origin, v.arg ? types_.get_arrow_type(v.arg, alias) : alias);
  }
  return out;
}

}  // namespace gradual
