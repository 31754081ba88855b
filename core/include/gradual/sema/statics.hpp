// gradual/sema/statics.hpp - Bidirectional statics traversal
//
// Total over every term sort: expressions, patterns, types, type patterns,
// sum entries and match rules. Never fails on malformed input; problems
// are recorded in the InfoMap.
//
#pragma once

#include <cstddef>
#include <string_view>
#include <unordered_set>

#include "gradual/sema/builtins.hpp"
#include "gradual/sema/co_ctx.hpp"
#include "gradual/sema/ctx.hpp"
#include "gradual/sema/info.hpp"
#include "gradual/sema/info_map.hpp"
#include "gradual/sema/mode.hpp"
#include "gradual/sema/self.hpp"
#include "gradual/sema/type.hpp"
#include "gradual/term/term.hpp"

namespace gradual
{

/// Result of traversing an expression.
struct ExpResult
{
  const Type * ty;  ///< fixed type
  CoCtx co_ctx;     ///< free variable uses
};

/// Result of traversing a pattern.
struct PatResult
{
  const Type * ty;  ///< fixed type
  Ctx ctx;          ///< context extended with the pattern's bindings
};

/**
 * Statics traversal engine.
 *
 * Walks a term once (re-walking let and lambda patterns once their scope
 * is known) and records one Info per term into the InfoMap.
 *
 * ## Algorithm
 *
 * 1. **Top-down**: each form derives the modes of its children from its
 *    own mode (Mode splitters).
 * 2. **Bottom-up**: each form builds its Self from the fixed types of its
 *    children.
 * 3. **Classification**: status_of(mode, self) decides whether the form
 *    is in a hole; fixed_type() gives the type passed to the parent.
 *
 * ## Usage
 * ```cpp
 * InfoMap map(types, root);
 * Statics statics(types, table, map);
 * statics.check_root(builtin_ctx(types, table), root);
 * ```
 */
class Statics
{
public:
  Statics(TypeContext & types, const TypeTable & type_table, InfoMap & map);

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /// Traverse a root term of any sort; an expression root is synthesized
  void check_root(const Ctx & ctx, const Term * root);

  ExpResult check_exp(const Ctx & ctx, const Mode & mode, const Exp * exp);

  /// Number of check_exp calls so far
  [[nodiscard]] size_t exp_visits() const noexcept { return exp_visits_; }

  /**
   * Traverse a pattern.
   *
   * @param co_ctx Uses in the scope the pattern binds into; recorded for
   *               unused-binding detection
   */
  PatResult check_pat(const Ctx & ctx, const Mode & mode, const Pat * pat, const CoCtx & co_ctx);

  /// Resolve a surface type
  const Type * check_typ(const Ctx & ctx, const TypeTerm * typ);

  /// Traverse a type pattern; returns the name it may bind, empty if none
  std::string_view check_tpat(const Ctx & ctx, const TPat * tpat);

  /// Traverse a term of any sort with default expectations (multi-hole
  /// children, roots that are not expressions)
  void check_any(const Ctx & ctx, const Term * term);

private:
  // ===========================================================================
  // Expressions
  // ===========================================================================

  ExpResult exp_multi_hole(const Ctx & ctx, const Mode & mode, const MultiHoleExp * node);
  ExpResult exp_list_lit(const Ctx & ctx, const Mode & mode, const ListLitExp * node);
  ExpResult exp_constructor(const Ctx & ctx, const Mode & mode, const ConstructorExp * node);
  ExpResult exp_fun(const Ctx & ctx, const Mode & mode, const FunExp * node);
  ExpResult exp_tuple(const Ctx & ctx, const Mode & mode, const TupleExp * node);
  ExpResult exp_var(const Ctx & ctx, const Mode & mode, const VarExp * node);
  ExpResult exp_let(const Ctx & ctx, const Mode & mode, const LetExp * node);
  ExpResult exp_ty_alias(const Ctx & ctx, const Mode & mode, const TyAliasExp * node);
  ExpResult exp_ap(const Ctx & ctx, const Mode & mode, const ApExp * node);
  ExpResult exp_if(const Ctx & ctx, const Mode & mode, const IfExp * node);
  ExpResult exp_seq(const Ctx & ctx, const Mode & mode, const SeqExp * node);
  ExpResult exp_test(const Ctx & ctx, const Mode & mode, const TestExp * node);
  ExpResult exp_parens(const Ctx & ctx, const Mode & mode, const ParensExp * node);
  ExpResult exp_cons(const Ctx & ctx, const Mode & mode, const ConsExp * node);
  ExpResult exp_list_concat(const Ctx & ctx, const Mode & mode, const ListConcatExp * node);
  ExpResult exp_un_op(const Ctx & ctx, const Mode & mode, const UnOpExp * node);
  ExpResult exp_bin_op(const Ctx & ctx, const Mode & mode, const BinOpExp * node);
  ExpResult exp_match(const Ctx & ctx, const Mode & mode, const MatchExp * node);

  /// Traverse a match rule whose pattern is checked against `scrut`
  ExpResult check_rule(const Ctx & ctx, const Mode & mode, const Type * scrut, const Rule * rule);

  /// Classify, record and return the fixed type of an expression
  ExpResult finish_exp(
    const Ctx & ctx, const Mode & mode, const Exp * node, const Self & self, CoCtx co_ctx);

  // ===========================================================================
  // Patterns
  // ===========================================================================

  PatResult pat_multi_hole(
    const Ctx & ctx, const Mode & mode, const MultiHolePat * node, const CoCtx & co_ctx);
  PatResult pat_list_lit(
    const Ctx & ctx, const Mode & mode, const ListLitPat * node, const CoCtx & co_ctx);
  PatResult pat_constructor(
    const Ctx & ctx, const Mode & mode, const ConstructorPat * node, const CoCtx & co_ctx);
  PatResult pat_cons(const Ctx & ctx, const Mode & mode, const ConsPat * node, const CoCtx & co_ctx);
  PatResult pat_var(const Ctx & ctx, const Mode & mode, const VarPat * node, const CoCtx & co_ctx);
  PatResult pat_tuple(
    const Ctx & ctx, const Mode & mode, const TuplePat * node, const CoCtx & co_ctx);
  PatResult pat_parens(
    const Ctx & ctx, const Mode & mode, const ParensPat * node, const CoCtx & co_ctx);
  PatResult pat_ap(const Ctx & ctx, const Mode & mode, const ApPat * node, const CoCtx & co_ctx);
  PatResult pat_type_ann(
    const Ctx & ctx, const Mode & mode, const TypeAnnPat * node, const CoCtx & co_ctx);

  PatResult finish_pat(
    const Ctx & ctx, const Mode & mode, const Pat * node, const Self & self,
    const CoCtx & co_ctx, const Ctx & ctx_out);

  // ===========================================================================
  // Types
  // ===========================================================================

  const Type * typ_var(const Ctx & ctx, const VarTyp * node, TypError & error);
  const Type * typ_sum(const Ctx & ctx, const SumTyp * node);

  /// Traverse one sum entry; returns false if it contributes no constructor
  bool check_variant(
    const Ctx & ctx, const VariantTerm * node, std::unordered_set<std::string_view> & seen,
    SumEntry & entry);

  // ===========================================================================
  // Helper Methods
  // ===========================================================================

  /// Record an Invalid node of any sort
  void record_invalid(const Ctx & ctx, const Term * node);

  /// Multi-hole children of any sort; returns the uses of the expressions
  CoCtx check_children(const Ctx & ctx, gsl::span<Term * const> children);

  /// True if a let binding may refer to itself in its definition
  bool is_recursive_let(const Ctx & ctx, const Pat * pat, const Exp * def, const Type * pat_ty);

  /// Bind the constructors of an alias to a sum type into `ctx`
  Ctx add_constructors(
    const Ctx & ctx, std::string_view name, Id origin, const Type * def) const;

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  TypeContext & types_;
  const TypeTable & type_table_;
  InfoMap & map_;
  size_t exp_visits_ = 0;
};

}  // namespace gradual
