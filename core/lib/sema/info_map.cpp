// gradual/sema/info_map.cpp - Id-indexed statics table
//
#include "gradual/sema/info_map.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "gradual/basic/casting.hpp"
#include "gradual/basic/internal_error.hpp"
#include "gradual/sema/type_utils.hpp"

namespace gradual
{

void InfoMap::insert(gsl::span<const Id> ids, const std::shared_ptr<const Info> & info)
{
  for (const Id id : ids) {
    entries_[id] = info;
  }
}

const Info * InfoMap::find(Id id) const noexcept
{
  auto it = entries_.find(id);
  return it != entries_.end() ? it->second.get() : nullptr;
}

const Info & InfoMap::at(Id id) const
{
  const Info * info = find(id);
  if (!info) {
    throw InternalError(fmt::format("no statics recorded for node #{}", id.value));
  }
  return *info;
}

std::vector<Id> InfoMap::ids() const
{
  std::vector<Id> out;
  out.reserve(entries_.size());
  for (const auto & [id, info] : entries_) {
    out.push_back(id);
  }
  std::sort(out.begin(), out.end());
  return out;
}

namespace
{

bool same_ctx_shape(const Ctx & a, const Ctx & b)
{
  if (a.size() != b.size()) return false;
  const auto ea = a.entries();
  const auto eb = b.entries();
  for (size_t i = 0; i < ea.size(); ++i) {
    if (
      ea[i].kind != eb[i].kind || ea[i].name != eb[i].name || ea[i].id != eb[i].id ||
      ea[i].typ != eb[i].typ) {
      return false;
    }
  }
  return true;
}

bool same_status(const Status & a, const Status & b)
{
  if (a.in_hole != b.in_hole) return false;
  if (a.in_hole) return a.error == b.error && a.branches == b.branches;
  return a.ok == b.ok && a.syn == b.syn && a.ana == b.ana && a.join == b.join;
}

// Records of two traversals of structurally equal terms: compare content,
// not the term pointers.
bool same_record(const Info & a, const Info & b)
{
  if (a.get_kind() != b.get_kind() || a.cls() != b.cls()) return false;
  if (!same_ctx_shape(a.ctx, b.ctx)) return false;

  switch (a.get_kind()) {
    case InfoKind::Invalid:
      return cast<InfoInvalid>(&a)->text == cast<InfoInvalid>(&b)->text;
    case InfoKind::Exp: {
      const auto * x = cast<InfoExp>(&a);
      const auto * y = cast<InfoExp>(&b);
      return x->mode == y->mode && x->ty == y->ty && same_status(x->status, y->status) &&
             x->co_ctx.names() == y->co_ctx.names();
    }
    case InfoKind::Pat: {
      const auto * x = cast<InfoPat>(&a);
      const auto * y = cast<InfoPat>(&b);
      return x->mode == y->mode && x->ty == y->ty && same_status(x->status, y->status) &&
             same_ctx_shape(x->ctx_out, y->ctx_out);
    }
    case InfoKind::Typ: {
      const auto * x = cast<InfoTyp>(&a);
      const auto * y = cast<InfoTyp>(&b);
      return x->error == y->error && x->ty == y->ty;
    }
    case InfoKind::Rul:
      return true;
    case InfoKind::TPat:
      return cast<InfoTPat>(&a)->error == cast<InfoTPat>(&b)->error;
    case InfoKind::TSum: {
      const auto * x = cast<InfoTSum>(&a);
      const auto * y = cast<InfoTSum>(&b);
      return x->error == y->error && x->arg == y->arg;
    }
  }
  return false;
}

}  // namespace

bool InfoMap::same_statics(const InfoMap & other) const
{
  if (entries_.size() != other.entries_.size()) return false;
  for (const auto & [id, info] : entries_) {
    const Info * theirs = other.find(id);
    if (!theirs || !same_record(*info, *theirs)) return false;
  }
  return true;
}

// ============================================================================
// Queries
// ============================================================================

namespace
{

Mode strip_mode(TypeContext & types, const Mode & mode)
{
  if (!mode.is_ana()) return mode;
  return Mode::ana(strip_synswitch(types, mode.ana_type()));
}

const InfoExp * exp_info(const InfoMap & map, Id id) { return dyn_cast<InfoExp>(&map.at(id)); }

const InfoPat * pat_info(const InfoMap & map, Id id) { return dyn_cast<InfoPat>(&map.at(id)); }

}  // namespace

const Type * exp_type_after_fix(const InfoMap & map, Id id)
{
  TypeContext & types = map.types();
  const InfoExp * info = exp_info(map, id);
  if (!info) return types.unknown_type();
  return strip_synswitch(types, info->ty);
}

const Type * exp_self_type(const InfoMap & map, Id id)
{
  TypeContext & types = map.types();
  const InfoExp * info = exp_info(map, id);
  if (!info) return types.unknown_type();
  return strip_synswitch(types, self_type(types, info->ctx, info->self));
}

Mode exp_mode(const InfoMap & map, Id id)
{
  const InfoExp * info = exp_info(map, id);
  if (!info) return Mode::syn();
  return strip_mode(map.types(), info->mode);
}

const Type * pat_type_after_fix(const InfoMap & map, Id id)
{
  TypeContext & types = map.types();
  const InfoPat * info = pat_info(map, id);
  if (!info) return types.unknown_type();
  return strip_synswitch(types, info->ty);
}

const Type * pat_self_type(const InfoMap & map, Id id)
{
  TypeContext & types = map.types();
  const InfoPat * info = pat_info(map, id);
  if (!info) return types.unknown_type();
  return strip_synswitch(types, self_type(types, info->ctx, info->self));
}

Mode pat_mode(const InfoMap & map, Id id)
{
  const InfoPat * info = pat_info(map, id);
  if (!info) return Mode::syn();
  return strip_mode(map.types(), info->mode);
}

const Type * binding_use_type(const InfoMap & map, Id id)
{
  TypeContext & types = map.types();
  const InfoPat * info = pat_info(map, id);
  const auto * var = info ? dyn_cast<VarPat>(info->term) : nullptr;
  if (!var) return types.unknown_type();
  const auto * uses = info->co_ctx.uses(var->name);
  if (!uses) return types.unknown_type();
  return join_uses(types, info->ctx_out, *uses);
}

std::unordered_map<Id, const Term *> terms(const InfoMap & map)
{
  std::unordered_map<Id, const Term *> out;
  out.reserve(map.size());
  for (const auto & [id, info] : map.entries()) {
    out.emplace(id, info->term);
  }
  return out;
}

bool is_error(const InfoMap & map, Id id) { return is_error(map.at(id)); }

std::vector<Id> error_ids(const InfoMap & map)
{
  std::vector<Id> out;
  for (const Id id : map.ids()) {
    if (is_error(*map.find(id))) out.push_back(id);
  }
  return out;
}

}  // namespace gradual
