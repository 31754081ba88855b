// gradual/term/term_utils.hpp - Generic operations over term trees
//
#pragma once

#include <cstddef>
#include <vector>

#include "gradual/term/term.hpp"
#include "gradual/term/term_context.hpp"

namespace gradual
{

/**
 * Direct children of a node, in source order, across all sorts.
 * Absent optional children (e.g. the argument of a nullary variant) are skipped.
 */
[[nodiscard]] std::vector<const Term *> children_of(const Term * term);

/**
 * All ids reachable from `root`, in pre-order. Multi-id nodes contribute
 * every one of their ids.
 */
[[nodiscard]] std::vector<Id> collect_ids(const Term * root);

/**
 * Structural equality: same kinds, same payloads, same ids, recursively.
 */
[[nodiscard]] bool structurally_equal(const Term * a, const Term * b) noexcept;

/**
 * Hash consistent with structurally_equal().
 */
[[nodiscard]] size_t structural_hash(const Term * term) noexcept;

/**
 * Deep copy of `term` into `ctx`. Strings are re-interned in `ctx`.
 */
[[nodiscard]] Term * clone_term(const Term * term, TermContext & ctx);

/// Number of nodes in the tree rooted at `term`.
[[nodiscard]] size_t term_size(const Term * term) noexcept;

}  // namespace gradual
