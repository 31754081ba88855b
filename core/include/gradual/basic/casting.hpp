// gradual/basic/casting.hpp - Kind-tag casts for terms and info records
//
// Term nodes and info records carry an explicit kind tag; every concrete
// class exposes `static bool classof(const Base *)`. These helpers dispatch
// on that tag instead of on virtual functions, and keep the constness of
// the argument:
//
//   if (isa<VarPat>(pat)) ...
//   const auto * let = cast<LetExp>(term);     // must be a LetExp
//   if (auto * info = dyn_cast<InfoExp>(rec))   // nullptr otherwise
//
#pragma once

#include <cassert>
#include <type_traits>

namespace gradual
{

namespace detail
{

template <typename To, typename From, typename = void>
struct Classifiable : std::false_type
{
};

template <typename To, typename From>
struct Classifiable<
  To, From, std::void_t<decltype(To::classof(std::declval<const std::remove_cv_t<From> *>()))>>
: std::true_type
{
};

/// `To *` or `const To *`, following the constness of `From`
template <typename To, typename From>
using CastResult = std::conditional_t<std::is_const_v<From>, const To *, To *>;

}  // namespace detail

template <typename To, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  static_assert(detail::Classifiable<To, From>::value, "isa<To>: To has no classof() for From");
  return node != nullptr && To::classof(node);
}

/// Checked downcast; the caller guarantees the kind
template <typename To, typename From>
[[nodiscard]] inline detail::CastResult<To, From> cast(From * node) noexcept
{
  assert(isa<To>(node) && "cast<To>() on a node of another kind");
  return static_cast<detail::CastResult<To, From>>(node);
}

template <typename To, typename From>
[[nodiscard]] inline detail::CastResult<To, From> dyn_cast(From * node) noexcept
{
  if (!isa<To>(node)) return nullptr;
  return static_cast<detail::CastResult<To, From>>(node);
}

}  // namespace gradual
