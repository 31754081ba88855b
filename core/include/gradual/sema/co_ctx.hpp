// gradual/sema/co_ctx.hpp - Free variable uses
//
// The co-context of an expression maps each variable name it uses but
// does not bind to the places it is used, with the mode at each place.
//
#pragma once

#include <cstddef>
#include <map>
#include <string_view>
#include <vector>

#include "gradual/basic/id.hpp"
#include "gradual/sema/ctx.hpp"
#include "gradual/sema/mode.hpp"

namespace gradual
{

struct CoCtxEntry
{
  Id id;
  Mode mode;
};

class CoCtx
{
public:
  CoCtx() = default;

  [[nodiscard]] static CoCtx singleton(std::string_view name, Id id, const Mode & mode);

  /// Add every use of `other` to this co-context
  CoCtx & merge(const CoCtx & other);

  /// Union of several co-contexts
  [[nodiscard]] static CoCtx union_of(const std::vector<const CoCtx *> & parts);

  /// Drop the uses of every variable bound by `bound`
  [[nodiscard]] CoCtx without(const std::vector<CtxEntry> & bound) const;

  /// Uses of `name`; nullptr if it is not used
  [[nodiscard]] const std::vector<CoCtxEntry> * uses(std::string_view name) const;

  [[nodiscard]] bool mentions(std::string_view name) const { return uses(name) != nullptr; }
  [[nodiscard]] bool empty() const noexcept { return uses_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return uses_.size(); }

  /// Used names in ascending order
  [[nodiscard]] std::vector<std::string_view> names() const;

private:
  std::map<std::string_view, std::vector<CoCtxEntry>> uses_;
};

/**
 * Type the uses of a variable expect of it: the join of each use site's
 * expected type. Unknown when the uses disagree or expect nothing.
 */
[[nodiscard]] const Type * join_uses(
  TypeContext & types, const Ctx & ctx, const std::vector<CoCtxEntry> & uses);

}  // namespace gradual
