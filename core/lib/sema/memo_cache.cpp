// gradual/sema/memo_cache.cpp - Bounded cache of statics results
//
#include "gradual/sema/memo_cache.hpp"

#include <iterator>
#include <utility>

#include "gradual/term/term_utils.hpp"

namespace gradual
{

MemoCache::MemoCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

MemoCache::EntryList::iterator MemoCache::find_locked(size_t hash, const Term * term)
{
  auto [first, last] = index_.equal_range(hash);
  for (auto it = first; it != last; ++it) {
    if (structurally_equal(it->second->map->root(), term)) {
      return it->second;
    }
  }
  return entries_.end();
}

std::shared_ptr<const InfoMap> MemoCache::lookup(const Term * term)
{
  const size_t hash = structural_hash(term);

  const std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(hash, term);
  if (it == entries_.end()) {
    ++stats_.misses;
    return nullptr;
  }
  ++stats_.hits;
  entries_.splice(entries_.begin(), entries_, it);
  return it->map;
}

std::shared_ptr<const InfoMap> MemoCache::insert(std::shared_ptr<const InfoMap> map)
{
  const size_t hash = structural_hash(map->root());

  const std::lock_guard<std::mutex> lock(mutex_);
  auto existing = find_locked(hash, map->root());
  if (existing != entries_.end()) {
    entries_.splice(entries_.begin(), entries_, existing);
    return existing->map;
  }

  entries_.push_front(Entry{hash, std::move(map)});
  index_.emplace(hash, entries_.begin());

  while (entries_.size() > capacity_) {
    auto victim = std::prev(entries_.end());
    auto [first, last] = index_.equal_range(victim->hash);
    for (auto it = first; it != last; ++it) {
      if (it->second == victim) {
        index_.erase(it);
        break;
      }
    }
    entries_.pop_back();
    ++stats_.evictions;
  }
  return entries_.front().map;
}

void MemoCache::clear()
{
  const std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  index_.clear();
}

MemoStats MemoCache::stats() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  MemoStats out = stats_;
  out.size = entries_.size();
  return out;
}

}  // namespace gradual
