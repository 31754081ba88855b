// gradual/sema/co_ctx.cpp - Free variable uses
//
#include "gradual/sema/co_ctx.hpp"

#include "gradual/sema/type_utils.hpp"

namespace gradual
{

CoCtx CoCtx::singleton(std::string_view name, Id id, const Mode & mode)
{
  CoCtx out;
  out.uses_[name].push_back(CoCtxEntry{id, mode});
  return out;
}

CoCtx & CoCtx::merge(const CoCtx & other)
{
  for (const auto & [name, entries] : other.uses_) {
    auto & dst = uses_[name];
    dst.insert(dst.end(), entries.begin(), entries.end());
  }
  return *this;
}

CoCtx CoCtx::union_of(const std::vector<const CoCtx *> & parts)
{
  CoCtx out;
  for (const CoCtx * p : parts) {
    out.merge(*p);
  }
  return out;
}

CoCtx CoCtx::without(const std::vector<CtxEntry> & bound) const
{
  CoCtx out = *this;
  for (const auto & e : bound) {
    if (e.is_variable()) {
      out.uses_.erase(e.name);
    }
  }
  return out;
}

const std::vector<CoCtxEntry> * CoCtx::uses(std::string_view name) const
{
  auto it = uses_.find(name);
  return it != uses_.end() ? &it->second : nullptr;
}

std::vector<std::string_view> CoCtx::names() const
{
  std::vector<std::string_view> out;
  out.reserve(uses_.size());
  for (const auto & entry : uses_) {
    out.push_back(entry.first);
  }
  return out;
}

const Type * join_uses(TypeContext & types, const Ctx & ctx, const std::vector<CoCtxEntry> & uses)
{
  std::vector<const Type *> expected;
  expected.reserve(uses.size());
  for (const auto & use : uses) {
    switch (use.mode.kind()) {
      case Mode::Kind::Ana:
        expected.push_back(use.mode.ana_type());
        break;
      case Mode::Kind::SynFun:
        expected.push_back(types.get_arrow_type(types.unknown_type(), types.unknown_type()));
        break;
      case Mode::Kind::Syn:
        expected.push_back(types.unknown_type());
        break;
    }
  }
  const Type * j = join_all(types, ctx, expected);
  return j ? strip_synswitch(types, j) : types.unknown_type();
}

}  // namespace gradual
