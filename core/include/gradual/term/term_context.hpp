// gradual/term/term_context.hpp - Arena owning one term tree
//
// Term nodes, their id lists, child lists and names all live in a
// std::pmr::monotonic_buffer_resource and die together with the context.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <initializer_list>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include "gradual/basic/id.hpp"

namespace gradual
{

class Term;

/**
 * Arena for the nodes of one term tree.
 *
 *   TermContext ctx;
 *   auto * x = ctx.create<VarExp>(ctx.intern("x"), ctx.ids({Id{1}}));
 *
 * Nothing is freed before the context. Nodes must therefore be trivially
 * destructible; they hold string_view and gsl::span into the arena.
 */
class TermContext
{
public:
  static constexpr size_t k_initial_block = size_t{16} * size_t{1024};

  explicit TermContext(size_t initial_block = k_initial_block)
  : arena_(initial_block), names_(&arena_)
  {
  }

  TermContext(const TermContext &) = delete;
  TermContext & operator=(const TermContext &) = delete;
  TermContext(TermContext &&) = delete;
  TermContext & operator=(TermContext &&) = delete;

  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<Term, T>, "T must be a Term");
    static_assert(
      std::is_trivially_destructible_v<T>, "arena terms are never destroyed; keep T trivial");
    return new (arena_.allocate(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
  }

  /// Arena copy of `s`; equal strings share storage.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (auto it = names_.find(s); it != names_.end()) return *it;

    auto * const data = static_cast<char *>(arena_.allocate(std::max<size_t>(s.size(), 1), 1));
    std::memcpy(data, s.data(), s.size());
    return *names_.emplace(data, s.size()).first;
  }

  /// Arena copy of a node or id list. Empty input gives an empty span.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & items)
  {
    if (items.empty()) return {};
    static_assert(std::is_trivially_destructible_v<T>, "arena arrays are never destroyed");
    auto * const data = static_cast<T *>(arena_.allocate(sizeof(T) * items.size(), alignof(T)));
    std::uninitialized_copy(items.begin(), items.end(), data);
    return {data, items.size()};
  }

  [[nodiscard]] gsl::span<const Id> ids(std::initializer_list<Id> list)
  {
    return copy_to_arena(std::vector<Id>(list));
  }

  [[nodiscard]] gsl::span<const Id> ids(const std::vector<Id> & list)
  {
    return copy_to_arena(list);
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> names_;
};

}  // namespace gradual
