// gradual/basic/id.hpp - Stable term identifiers
//
// Ids are assigned by the editing layer. A node may carry several ids
// (one per token of a multi-token form); all of them resolve to the same
// statics record.
//
#pragma once

#include <cstdint>
#include <functional>

namespace gradual
{

/**
 * Process-unique identifier of a term node.
 */
struct Id
{
  uint64_t value = 0;

  constexpr Id() = default;
  constexpr explicit Id(uint64_t v) : value(v) {}

  friend constexpr bool operator==(Id a, Id b) noexcept { return a.value == b.value; }
  friend constexpr bool operator!=(Id a, Id b) noexcept { return a.value != b.value; }
  friend constexpr bool operator<(Id a, Id b) noexcept { return a.value < b.value; }
};

}  // namespace gradual

namespace std
{
template <>
struct hash<gradual::Id>
{
  size_t operator()(gradual::Id id) const noexcept { return hash<uint64_t>{}(id.value); }
};
}  // namespace std
