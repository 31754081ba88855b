// gradual/term/term.hpp - Term node class definitions
//
// The term tree produced by the editing layer. Nodes follow the LLVM/Clang
// style: an explicit TermKind tag and static classof() for RTTI, no virtual
// dispatch. Nodes are allocated in, and owned by, a TermContext.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "gradual/basic/casting.hpp"
#include "gradual/basic/id.hpp"
#include "gradual/term/term_enums.hpp"

namespace gradual
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all term nodes.
 *
 * Every node has a TermKind and a non-empty list of ids. Multi-token forms
 * (tuples, multi-holes, ...) carry one id per token; the first one is the
 * representative id.
 *
 * Nodes are non-copyable and managed by TermContext.
 */
class Term
{
public:
  const TermKind kind;
  gsl::span<const Id> ids;

  Term(const Term &) = delete;
  Term & operator=(const Term &) = delete;
  Term(Term &&) = delete;
  Term & operator=(Term &&) = delete;

  [[nodiscard]] TermKind get_kind() const noexcept { return kind; }
  [[nodiscard]] TermSort get_sort() const noexcept { return sort_of(kind); }

  /// Representative id (the first id of the node)
  [[nodiscard]] Id rep_id() const noexcept { return ids.empty() ? Id{} : ids[0]; }

protected:
  explicit Term(TermKind k, gsl::span<const Id> i = {}) : kind(k), ids(i) {}
  ~Term() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, TermKind K>
class NodeBase : public Base
{
public:
  static constexpr TermKind kind = K;

  static bool classof(const Term * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(gsl::span<const Id> ids = {}) : Base(K, ids) {}
};

// ============================================================================
// Sort Base Classes
// ============================================================================

/// Base class for expressions.
class Exp : public Term
{
public:
  static bool classof(const Term * node) { return is_exp_kind(node->kind); }

protected:
  explicit Exp(TermKind k, gsl::span<const Id> ids = {}) : Term(k, ids) {}
};

/// Base class for patterns.
class Pat : public Term
{
public:
  static bool classof(const Term * node) { return is_pat_kind(node->kind); }

protected:
  explicit Pat(TermKind k, gsl::span<const Id> ids = {}) : Term(k, ids) {}
};

/// Base class for surface (syntactic) types.
class TypeTerm : public Term
{
public:
  static bool classof(const Term * node) { return is_typ_kind(node->kind); }

protected:
  explicit TypeTerm(TermKind k, gsl::span<const Id> ids = {}) : Term(k, ids) {}
};

/// Base class for type patterns.
class TPat : public Term
{
public:
  static bool classof(const Term * node) { return is_tpat_kind(node->kind); }

protected:
  explicit TPat(TermKind k, gsl::span<const Id> ids = {}) : Term(k, ids) {}
};

/// Base class for sum-type entries.
class VariantTerm : public Term
{
public:
  static bool classof(const Term * node) { return is_variant_kind(node->kind); }

protected:
  explicit VariantTerm(TermKind k, gsl::span<const Id> ids = {}) : Term(k, ids) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Unparseable fragment.
class InvalidExp : public NodeBase<InvalidExp, Exp, TermKind::InvalidExp>
{
public:
  std::string_view text;

  explicit InvalidExp(std::string_view t, gsl::span<const Id> ids = {}) : NodeBase(ids), text(t)
  {
  }
};

class EmptyHoleExp : public NodeBase<EmptyHoleExp, Exp, TermKind::EmptyHoleExp>
{
public:
  explicit EmptyHoleExp(gsl::span<const Id> ids = {}) : NodeBase(ids) {}
};

/// Several sub-parses of any sort that could not be combined.
class MultiHoleExp : public NodeBase<MultiHoleExp, Exp, TermKind::MultiHoleExp>
{
public:
  gsl::span<Term *> children;

  explicit MultiHoleExp(gsl::span<Term *> c, gsl::span<const Id> ids = {})
  : NodeBase(ids), children(c)
  {
  }
};

/// Unit value `()`.
class TrivExp : public NodeBase<TrivExp, Exp, TermKind::TrivExp>
{
public:
  explicit TrivExp(gsl::span<const Id> ids = {}) : NodeBase(ids) {}
};

class BoolExp : public NodeBase<BoolExp, Exp, TermKind::BoolExp>
{
public:
  bool value;

  explicit BoolExp(bool v, gsl::span<const Id> ids = {}) : NodeBase(ids), value(v) {}
};

class IntExp : public NodeBase<IntExp, Exp, TermKind::IntExp>
{
public:
  int64_t value;

  explicit IntExp(int64_t v, gsl::span<const Id> ids = {}) : NodeBase(ids), value(v) {}
};

class FloatExp : public NodeBase<FloatExp, Exp, TermKind::FloatExp>
{
public:
  double value;

  explicit FloatExp(double v, gsl::span<const Id> ids = {}) : NodeBase(ids), value(v) {}
};

class StringExp : public NodeBase<StringExp, Exp, TermKind::StringExp>
{
public:
  std::string_view value;

  explicit StringExp(std::string_view v, gsl::span<const Id> ids = {}) : NodeBase(ids), value(v)
  {
  }
};

/// List literal `[a, b, c]`; the empty list when `elements` is empty.
class ListLitExp : public NodeBase<ListLitExp, Exp, TermKind::ListLitExp>
{
public:
  gsl::span<Exp *> elements;

  explicit ListLitExp(gsl::span<Exp *> e, gsl::span<const Id> ids = {})
  : NodeBase(ids), elements(e)
  {
  }
};

/// Sum-type constructor reference.
class ConstructorExp : public NodeBase<ConstructorExp, Exp, TermKind::ConstructorExp>
{
public:
  std::string_view tag;

  explicit ConstructorExp(std::string_view t, gsl::span<const Id> ids = {})
  : NodeBase(ids), tag(t)
  {
  }
};

/// `fun pat -> body`
class FunExp : public NodeBase<FunExp, Exp, TermKind::FunExp>
{
public:
  Pat * pat;
  Exp * body;

  FunExp(Pat * p, Exp * b, gsl::span<const Id> ids = {}) : NodeBase(ids), pat(p), body(b) {}
};

class TupleExp : public NodeBase<TupleExp, Exp, TermKind::TupleExp>
{
public:
  gsl::span<Exp *> elements;

  explicit TupleExp(gsl::span<Exp *> e, gsl::span<const Id> ids = {})
  : NodeBase(ids), elements(e)
  {
  }
};

class VarExp : public NodeBase<VarExp, Exp, TermKind::VarExp>
{
public:
  std::string_view name;

  explicit VarExp(std::string_view n, gsl::span<const Id> ids = {}) : NodeBase(ids), name(n) {}
};

/// `let pat = def in body`
class LetExp : public NodeBase<LetExp, Exp, TermKind::LetExp>
{
public:
  Pat * pat;
  Exp * def;
  Exp * body;

  LetExp(Pat * p, Exp * d, Exp * b, gsl::span<const Id> ids = {})
  : NodeBase(ids), pat(p), def(d), body(b)
  {
  }
};

/// `type tpat = typ in body`
class TyAliasExp : public NodeBase<TyAliasExp, Exp, TermKind::TyAliasExp>
{
public:
  TPat * tpat;
  TypeTerm * def;
  Exp * body;

  TyAliasExp(TPat * tp, TypeTerm * d, Exp * b, gsl::span<const Id> ids = {})
  : NodeBase(ids), tpat(tp), def(d), body(b)
  {
  }
};

/// Function application `fn(arg)`.
class ApExp : public NodeBase<ApExp, Exp, TermKind::ApExp>
{
public:
  Exp * fn;
  Exp * arg;

  ApExp(Exp * f, Exp * a, gsl::span<const Id> ids = {}) : NodeBase(ids), fn(f), arg(a) {}
};

class IfExp : public NodeBase<IfExp, Exp, TermKind::IfExp>
{
public:
  Exp * cond;
  Exp * then_branch;
  Exp * else_branch;

  IfExp(Exp * c, Exp * t, Exp * e, gsl::span<const Id> ids = {})
  : NodeBase(ids), cond(c), then_branch(t), else_branch(e)
  {
  }
};

/// `first; second`
class SeqExp : public NodeBase<SeqExp, Exp, TermKind::SeqExp>
{
public:
  Exp * first;
  Exp * second;

  SeqExp(Exp * f, Exp * s, gsl::span<const Id> ids = {}) : NodeBase(ids), first(f), second(s) {}
};

/// `test expr end`
class TestExp : public NodeBase<TestExp, Exp, TermKind::TestExp>
{
public:
  Exp * expr;

  explicit TestExp(Exp * e, gsl::span<const Id> ids = {}) : NodeBase(ids), expr(e) {}
};

class ParensExp : public NodeBase<ParensExp, Exp, TermKind::ParensExp>
{
public:
  Exp * expr;

  explicit ParensExp(Exp * e, gsl::span<const Id> ids = {}) : NodeBase(ids), expr(e) {}
};

/// `head :: tail`
class ConsExp : public NodeBase<ConsExp, Exp, TermKind::ConsExp>
{
public:
  Exp * head;
  Exp * tail;

  ConsExp(Exp * h, Exp * t, gsl::span<const Id> ids = {}) : NodeBase(ids), head(h), tail(t) {}
};

/// `lhs @ rhs`
class ListConcatExp : public NodeBase<ListConcatExp, Exp, TermKind::ListConcatExp>
{
public:
  Exp * lhs;
  Exp * rhs;

  ListConcatExp(Exp * l, Exp * r, gsl::span<const Id> ids = {}) : NodeBase(ids), lhs(l), rhs(r)
  {
  }
};

class UnOpExp : public NodeBase<UnOpExp, Exp, TermKind::UnOpExp>
{
public:
  UnOp op;
  Exp * operand;

  UnOpExp(UnOp o, Exp * e, gsl::span<const Id> ids = {}) : NodeBase(ids), op(o), operand(e) {}
};

class BinOpExp : public NodeBase<BinOpExp, Exp, TermKind::BinOpExp>
{
public:
  BinOp op;
  Exp * lhs;
  Exp * rhs;

  BinOpExp(BinOp o, Exp * l, Exp * r, gsl::span<const Id> ids = {})
  : NodeBase(ids), op(o), lhs(l), rhs(r)
  {
  }
};

class Rule;

/// `case scrutinee | rule ... end`
class MatchExp : public NodeBase<MatchExp, Exp, TermKind::MatchExp>
{
public:
  Exp * scrutinee;
  gsl::span<Rule *> rules;

  MatchExp(Exp * s, gsl::span<Rule *> r, gsl::span<const Id> ids = {})
  : NodeBase(ids), scrutinee(s), rules(r)
  {
  }
};

// ============================================================================
// Rule
// ============================================================================

/// `| pat => body`
class Rule : public NodeBase<Rule, Term, TermKind::Rule>
{
public:
  Pat * pat;
  Exp * body;

  Rule(Pat * p, Exp * b, gsl::span<const Id> ids = {}) : NodeBase(ids), pat(p), body(b) {}
};

// ============================================================================
// Pattern Nodes
// ============================================================================

class InvalidPat : public NodeBase<InvalidPat, Pat, TermKind::InvalidPat>
{
public:
  std::string_view text;

  explicit InvalidPat(std::string_view t, gsl::span<const Id> ids = {}) : NodeBase(ids), text(t)
  {
  }
};

class EmptyHolePat : public NodeBase<EmptyHolePat, Pat, TermKind::EmptyHolePat>
{
public:
  explicit EmptyHolePat(gsl::span<const Id> ids = {}) : NodeBase(ids) {}
};

class MultiHolePat : public NodeBase<MultiHolePat, Pat, TermKind::MultiHolePat>
{
public:
  gsl::span<Term *> children;

  explicit MultiHolePat(gsl::span<Term *> c, gsl::span<const Id> ids = {})
  : NodeBase(ids), children(c)
  {
  }
};

/// `_`
class WildPat : public NodeBase<WildPat, Pat, TermKind::WildPat>
{
public:
  explicit WildPat(gsl::span<const Id> ids = {}) : NodeBase(ids) {}
};

class IntPat : public NodeBase<IntPat, Pat, TermKind::IntPat>
{
public:
  int64_t value;

  explicit IntPat(int64_t v, gsl::span<const Id> ids = {}) : NodeBase(ids), value(v) {}
};

class FloatPat : public NodeBase<FloatPat, Pat, TermKind::FloatPat>
{
public:
  double value;

  explicit FloatPat(double v, gsl::span<const Id> ids = {}) : NodeBase(ids), value(v) {}
};

class BoolPat : public NodeBase<BoolPat, Pat, TermKind::BoolPat>
{
public:
  bool value;

  explicit BoolPat(bool v, gsl::span<const Id> ids = {}) : NodeBase(ids), value(v) {}
};

class StringPat : public NodeBase<StringPat, Pat, TermKind::StringPat>
{
public:
  std::string_view value;

  explicit StringPat(std::string_view v, gsl::span<const Id> ids = {}) : NodeBase(ids), value(v)
  {
  }
};

class TrivPat : public NodeBase<TrivPat, Pat, TermKind::TrivPat>
{
public:
  explicit TrivPat(gsl::span<const Id> ids = {}) : NodeBase(ids) {}
};

class ListLitPat : public NodeBase<ListLitPat, Pat, TermKind::ListLitPat>
{
public:
  gsl::span<Pat *> elements;

  explicit ListLitPat(gsl::span<Pat *> e, gsl::span<const Id> ids = {})
  : NodeBase(ids), elements(e)
  {
  }
};

class ConstructorPat : public NodeBase<ConstructorPat, Pat, TermKind::ConstructorPat>
{
public:
  std::string_view tag;

  explicit ConstructorPat(std::string_view t, gsl::span<const Id> ids = {})
  : NodeBase(ids), tag(t)
  {
  }
};

class ConsPat : public NodeBase<ConsPat, Pat, TermKind::ConsPat>
{
public:
  Pat * head;
  Pat * tail;

  ConsPat(Pat * h, Pat * t, gsl::span<const Id> ids = {}) : NodeBase(ids), head(h), tail(t) {}
};

class VarPat : public NodeBase<VarPat, Pat, TermKind::VarPat>
{
public:
  std::string_view name;

  explicit VarPat(std::string_view n, gsl::span<const Id> ids = {}) : NodeBase(ids), name(n) {}
};

class TuplePat : public NodeBase<TuplePat, Pat, TermKind::TuplePat>
{
public:
  gsl::span<Pat *> elements;

  explicit TuplePat(gsl::span<Pat *> e, gsl::span<const Id> ids = {})
  : NodeBase(ids), elements(e)
  {
  }
};

class ParensPat : public NodeBase<ParensPat, Pat, TermKind::ParensPat>
{
public:
  Pat * pat;

  explicit ParensPat(Pat * p, gsl::span<const Id> ids = {}) : NodeBase(ids), pat(p) {}
};

/// Constructor application pattern `Tag(arg)`.
class ApPat : public NodeBase<ApPat, Pat, TermKind::ApPat>
{
public:
  Pat * fn;
  Pat * arg;

  ApPat(Pat * f, Pat * a, gsl::span<const Id> ids = {}) : NodeBase(ids), fn(f), arg(a) {}
};

/// `pat : typ`
class TypeAnnPat : public NodeBase<TypeAnnPat, Pat, TermKind::TypeAnnPat>
{
public:
  Pat * pat;
  TypeTerm * ann;

  TypeAnnPat(Pat * p, TypeTerm * t, gsl::span<const Id> ids = {}) : NodeBase(ids), pat(p), ann(t)
  {
  }
};

// ============================================================================
// Surface Type Nodes
// ============================================================================

class InvalidTyp : public NodeBase<InvalidTyp, TypeTerm, TermKind::InvalidTyp>
{
public:
  std::string_view text;

  explicit InvalidTyp(std::string_view t, gsl::span<const Id> ids = {}) : NodeBase(ids), text(t)
  {
  }
};

class EmptyHoleTyp : public NodeBase<EmptyHoleTyp, TypeTerm, TermKind::EmptyHoleTyp>
{
public:
  explicit EmptyHoleTyp(gsl::span<const Id> ids = {}) : NodeBase(ids) {}
};

class MultiHoleTyp : public NodeBase<MultiHoleTyp, TypeTerm, TermKind::MultiHoleTyp>
{
public:
  gsl::span<Term *> children;

  explicit MultiHoleTyp(gsl::span<Term *> c, gsl::span<const Id> ids = {})
  : NodeBase(ids), children(c)
  {
  }
};

class IntTyp : public NodeBase<IntTyp, TypeTerm, TermKind::IntTyp>
{
public:
  explicit IntTyp(gsl::span<const Id> ids = {}) : NodeBase(ids) {}
};

class FloatTyp : public NodeBase<FloatTyp, TypeTerm, TermKind::FloatTyp>
{
public:
  explicit FloatTyp(gsl::span<const Id> ids = {}) : NodeBase(ids) {}
};

class BoolTyp : public NodeBase<BoolTyp, TypeTerm, TermKind::BoolTyp>
{
public:
  explicit BoolTyp(gsl::span<const Id> ids = {}) : NodeBase(ids) {}
};

class StringTyp : public NodeBase<StringTyp, TypeTerm, TermKind::StringTyp>
{
public:
  explicit StringTyp(gsl::span<const Id> ids = {}) : NodeBase(ids) {}
};

/// `[elem]`
class ListTyp : public NodeBase<ListTyp, TypeTerm, TermKind::ListTyp>
{
public:
  TypeTerm * elem;

  explicit ListTyp(TypeTerm * e, gsl::span<const Id> ids = {}) : NodeBase(ids), elem(e) {}
};

/// Type name reference.
class VarTyp : public NodeBase<VarTyp, TypeTerm, TermKind::VarTyp>
{
public:
  std::string_view name;

  explicit VarTyp(std::string_view n, gsl::span<const Id> ids = {}) : NodeBase(ids), name(n) {}
};

class ArrowTyp : public NodeBase<ArrowTyp, TypeTerm, TermKind::ArrowTyp>
{
public:
  TypeTerm * param;
  TypeTerm * result;

  ArrowTyp(TypeTerm * p, TypeTerm * r, gsl::span<const Id> ids = {})
  : NodeBase(ids), param(p), result(r)
  {
  }
};

/// Tuple type; the unit type when `elements` is empty.
class TupleTyp : public NodeBase<TupleTyp, TypeTerm, TermKind::TupleTyp>
{
public:
  gsl::span<TypeTerm *> elements;

  explicit TupleTyp(gsl::span<TypeTerm *> e, gsl::span<const Id> ids = {})
  : NodeBase(ids), elements(e)
  {
  }
};

class ParensTyp : public NodeBase<ParensTyp, TypeTerm, TermKind::ParensTyp>
{
public:
  TypeTerm * typ;

  explicit ParensTyp(TypeTerm * t, gsl::span<const Id> ids = {}) : NodeBase(ids), typ(t) {}
};

/// `+ A + B(typ) + ...`
class SumTyp : public NodeBase<SumTyp, TypeTerm, TermKind::SumTyp>
{
public:
  gsl::span<VariantTerm *> variants;

  explicit SumTyp(gsl::span<VariantTerm *> v, gsl::span<const Id> ids = {})
  : NodeBase(ids), variants(v)
  {
  }
};

// ============================================================================
// Type Pattern Nodes
// ============================================================================

class InvalidTPat : public NodeBase<InvalidTPat, TPat, TermKind::InvalidTPat>
{
public:
  std::string_view text;

  explicit InvalidTPat(std::string_view t, gsl::span<const Id> ids = {})
  : NodeBase(ids), text(t)
  {
  }
};

class EmptyHoleTPat : public NodeBase<EmptyHoleTPat, TPat, TermKind::EmptyHoleTPat>
{
public:
  explicit EmptyHoleTPat(gsl::span<const Id> ids = {}) : NodeBase(ids) {}
};

class MultiHoleTPat : public NodeBase<MultiHoleTPat, TPat, TermKind::MultiHoleTPat>
{
public:
  gsl::span<Term *> children;

  explicit MultiHoleTPat(gsl::span<Term *> c, gsl::span<const Id> ids = {})
  : NodeBase(ids), children(c)
  {
  }
};

class VarTPat : public NodeBase<VarTPat, TPat, TermKind::VarTPat>
{
public:
  std::string_view name;

  explicit VarTPat(std::string_view n, gsl::span<const Id> ids = {}) : NodeBase(ids), name(n) {}
};

// ============================================================================
// Sum Variant Nodes
// ============================================================================

/// `Tag` or `Tag(arg)`.
class Variant : public NodeBase<Variant, VariantTerm, TermKind::Variant>
{
public:
  std::string_view tag;
  TypeTerm * arg;  ///< nullptr for a nullary constructor

  explicit Variant(std::string_view t, TypeTerm * a = nullptr, gsl::span<const Id> ids = {})
  : NodeBase(ids), tag(t), arg(a)
  {
  }
};

/// A sum entry that is not a constructor (e.g. `+ Int`).
class BadVariantEntry : public NodeBase<BadVariantEntry, VariantTerm, TermKind::BadVariantEntry>
{
public:
  TypeTerm * typ;

  explicit BadVariantEntry(TypeTerm * t, gsl::span<const Id> ids = {}) : NodeBase(ids), typ(t) {}
};

// ============================================================================
// Term helpers
// ============================================================================

/// Invalid nodes made only of whitespace are not reported as errors.
[[nodiscard]] bool is_whitespace_only(std::string_view text) noexcept;

/// Text of an Invalid node of any sort, empty for other nodes.
[[nodiscard]] std::string_view invalid_text(const Term * term) noexcept;

/// True if the node is an Invalid node of any sort.
[[nodiscard]] bool is_invalid(const Term * term) noexcept;

/// Children of a multi-hole of any sort, empty for other nodes.
[[nodiscard]] gsl::span<Term * const> multi_hole_children(const Term * term) noexcept;

}  // namespace gradual
