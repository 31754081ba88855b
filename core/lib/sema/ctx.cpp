// gradual/sema/ctx.cpp - Typing context implementation
//
#include "gradual/sema/ctx.hpp"

#include <utility>

#include "gradual/sema/builtins.hpp"

namespace gradual
{

Ctx Ctx::extend(const CtxEntry & entry) const
{
  return Ctx(std::make_shared<const Node>(Node{entry, head_}), size_ + 1);
}

bool Ctx::shadows_typ(std::string_view name, const TypeTable & builtins) const
{
  return builtins.contains(name) || is_type_var(name);
}

const CtxEntry * Ctx::find(EntryKind kind, std::string_view name) const noexcept
{
  for (const Node * n = head_.get(); n != nullptr; n = n->next.get()) {
    if (n->entry.kind == kind && n->entry.name == name) {
      return &n->entry;
    }
  }
  return nullptr;
}

const CtxEntry * Ctx::lookup_var(std::string_view name) const noexcept
{
  return find(EntryKind::Variable, name);
}

const CtxEntry * Ctx::lookup_constructor(std::string_view tag) const noexcept
{
  return find(EntryKind::Constructor, tag);
}

const CtxEntry * Ctx::lookup_type_var(std::string_view name) const noexcept
{
  return find(EntryKind::TypeVar, name);
}

const Type * Ctx::lookup_alias(std::string_view name) const noexcept
{
  const CtxEntry * e = lookup_type_var(name);
  return e != nullptr ? e->typ : nullptr;
}

std::vector<CtxEntry> Ctx::entries() const
{
  std::vector<CtxEntry> out;
  out.reserve(size_);
  for (const Node * n = head_.get(); n != nullptr; n = n->next.get()) {
    out.push_back(n->entry);
  }
  return out;
}

std::vector<CtxEntry> Ctx::added_since(const Ctx & base) const
{
  std::vector<CtxEntry> out;
  const Node * stop = base.head_.get();
  for (const Node * n = head_.get(); n != nullptr && n != stop; n = n->next.get()) {
    out.push_back(n->entry);
  }
  return out;
}

}  // namespace gradual
