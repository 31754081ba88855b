// gradual/sema/session.hpp - Memoized statics entry point
//
#pragma once

#include <cstddef>
#include <memory>

#include "gradual/sema/builtins.hpp"
#include "gradual/sema/ctx.hpp"
#include "gradual/sema/info_map.hpp"
#include "gradual/sema/memo_cache.hpp"
#include "gradual/sema/type.hpp"
#include "gradual/term/term.hpp"

namespace gradual
{

struct SessionOptions
{
  /// Maximum number of cached info maps
  size_t cache_capacity = MemoCache::k_default_capacity;

  /// Start from the built-in context (false: the empty context)
  bool builtins = true;
};

/**
 * Owner of everything a statics computation shares across calls: the
 * type interner, the built-in names and the result cache.
 *
 * Maps returned by compute() stay valid as long as the caller holds them
 * and the session is alive.
 *
 * ## Usage
 * ```cpp
 * StaticsSession session;
 * auto map = session.compute(root);
 * const Type * ty = exp_type_after_fix(*map, root->rep_id());
 * ```
 */
class StaticsSession
{
public:
  explicit StaticsSession(SessionOptions options = {});

  StaticsSession(const StaticsSession &) = delete;
  StaticsSession & operator=(const StaticsSession &) = delete;

  /**
   * Statics of `term`.
   *
   * Structurally equal terms get the same map without a new traversal
   * while it stays cached. The caller keeps ownership of `term`; the map
   * describes a private clone of it.
   */
  [[nodiscard]] std::shared_ptr<const InfoMap> compute(const Term * term);

  /// Traverse `term` in place, bypassing the cache. The map refers to
  /// `term`, which must outlive it.
  [[nodiscard]] std::unique_ptr<InfoMap> compute_uncached(const Term * term);

  [[nodiscard]] TypeContext & types() noexcept { return types_; }
  [[nodiscard]] const TypeTable & type_table() const noexcept { return type_table_; }
  [[nodiscard]] const Ctx & initial_ctx() const noexcept { return initial_ctx_; }
  [[nodiscard]] const SessionOptions & options() const noexcept { return options_; }

  [[nodiscard]] MemoStats cache_stats() const { return cache_.stats(); }
  void clear_cache() { cache_.clear(); }

private:
  SessionOptions options_;
  TypeContext types_;
  TypeTable type_table_;
  Ctx initial_ctx_;
  MemoCache cache_;
};

}  // namespace gradual
