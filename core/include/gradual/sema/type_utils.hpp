// gradual/sema/type_utils.hpp - Type consistency, join and decomposition
//
// Operations on semantic types that the statics engine and its clients
// share. Functions that need to see through type aliases take the
// context the types live in.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "gradual/sema/ctx.hpp"
#include "gradual/sema/type.hpp"

namespace gradual
{

// ============================================================================
// Consistency and Join
// ============================================================================

/**
 * Check if two types are consistent.
 *
 * Unknown is consistent with everything. Aliases bound in `ctx` and
 * recursive types are unfolded as needed; a pair of types met again while
 * unfolding is assumed consistent.
 */
[[nodiscard]] bool consistent(
  TypeContext & types, const Ctx & ctx, const Type * lhs, const Type * rhs);

/**
 * Compute the most specific type consistent with both inputs.
 *
 * A concrete head is preferred over Unknown.
 *
 * @return The joined type, or nullptr if the types are inconsistent
 */
[[nodiscard]] const Type * join(
  TypeContext & types, const Ctx & ctx, const Type * lhs, const Type * rhs);

/**
 * Fold join() over a sequence.
 *
 * @return The joined type, or nullptr if any pair is inconsistent or the
 *         sequence is empty
 */
[[nodiscard]] const Type * join_all(
  TypeContext & types, const Ctx & ctx, const std::vector<const Type *> & tys);

// ============================================================================
// Normalization
// ============================================================================

/// Resolve a chain of aliases at the head of `ty`
[[nodiscard]] const Type * weak_head_normalize(const Ctx & ctx, const Type * ty) noexcept;

/// Resolve aliases at the head and unfold recursive types until the head
/// is a structural constructor (or gives up on a degenerate definition)
[[nodiscard]] const Type * head_normalize(TypeContext & types, const Ctx & ctx, const Type * ty);

/// Replace every alias bound in `ctx` by its definition, throughout `ty`
[[nodiscard]] const Type * normalize(TypeContext & types, const Ctx & ctx, const Type * ty);

/// rec name. body  ==>  body[rec name. body / name]
[[nodiscard]] const Type * unfold_rec(TypeContext & types, const Type * rec);

// ============================================================================
// Decomposition
// ============================================================================

struct ArrowParts
{
  const Type * param;
  const Type * result;
};

/**
 * Split a type into arrow halves.
 *
 * An Unknown splits into two Unknowns of the same provenance. A type that
 * is not an arrow also splits into internal Unknowns, so an ill-typed
 * application still has argument and result types.
 */
[[nodiscard]] ArrowParts matched_arrow(TypeContext & types, const Ctx & ctx, const Type * ty);

/// Element type of a list type; Unknown for anything else
[[nodiscard]] const Type * matched_list(TypeContext & types, const Ctx & ctx, const Type * ty);

/// Component types of an n-ary product; n Unknowns on an arity mismatch
[[nodiscard]] std::vector<const Type *> matched_prod(
  TypeContext & types, const Ctx & ctx, const Type * ty, size_t arity);

/// True if `ty` is an arrow or could become one (Unknown)
[[nodiscard]] bool is_arrow_compatible(const Ctx & ctx, const Type * ty) noexcept;

// ============================================================================
// Variables
// ============================================================================

/// Type variable names occurring free in `ty`, first occurrence order
[[nodiscard]] std::vector<std::string_view> free_vars(const Type * ty);

[[nodiscard]] bool is_free_in(std::string_view name, const Type * ty);

/// Replace free occurrences of the type variable `name` in `ty`
[[nodiscard]] const Type * subst(
  TypeContext & types, const Type * replacement, std::string_view name, const Type * ty);

// ============================================================================
// SynSwitch
// ============================================================================

/// Replace every SynSwitch unknown by an internal unknown
[[nodiscard]] const Type * strip_synswitch(TypeContext & types, const Type * ty);

[[nodiscard]] bool contains_synswitch(const Type * ty) noexcept;

// ============================================================================
// Rendering
// ============================================================================

/**
 * Convert a Type to its string representation.
 *
 * @return e.g. "Int -> [Bool]", "(Int, String)", "+ A + B(Int)", "?"
 */
[[nodiscard]] std::string to_string(const Type * type);

}  // namespace gradual
