// gradual/sema/memo_cache.hpp - Bounded cache of statics results
//
#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "gradual/sema/info_map.hpp"
#include "gradual/term/term.hpp"

namespace gradual
{

struct MemoStats
{
  size_t hits = 0;
  size_t misses = 0;
  size_t evictions = 0;
  size_t size = 0;
};

/**
 * Least-recently-used cache of info maps keyed by term structure.
 *
 * Each cached map owns a clone of the term it was computed for. A lookup
 * hashes the term looked up, then confirms a bucket hit by structural
 * equality against that clone, so a hash collision never returns a wrong
 * map. All methods are thread-safe.
 */
class MemoCache
{
public:
  static constexpr size_t k_default_capacity = 1000;

  explicit MemoCache(size_t capacity = k_default_capacity);

  MemoCache(const MemoCache &) = delete;
  MemoCache & operator=(const MemoCache &) = delete;

  /// Map computed for a term structurally equal to `term`, or nullptr
  [[nodiscard]] std::shared_ptr<const InfoMap> lookup(const Term * term);

  /**
   * Cache `map` under its root term, evicting the least recently used
   * entry when over capacity.
   *
   * @return The cached map: `map`, or an equal entry another thread
   *         inserted first
   */
  std::shared_ptr<const InfoMap> insert(std::shared_ptr<const InfoMap> map);

  void clear();

  [[nodiscard]] MemoStats stats() const;
  [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
  struct Entry
  {
    size_t hash;
    std::shared_ptr<const InfoMap> map;
  };
  using EntryList = std::list<Entry>;

  EntryList::iterator find_locked(size_t hash, const Term * term);

  mutable std::mutex mutex_;
  const size_t capacity_;
  EntryList entries_;  // most recently used first
  std::unordered_multimap<size_t, EntryList::iterator> index_;
  MemoStats stats_;
};

}  // namespace gradual
