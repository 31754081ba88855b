// gradual/sema/self.cpp - Bottom-up self types
//
#include "gradual/sema/self.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "gradual/sema/type_utils.hpp"

namespace gradual
{

std::vector<const Type *> Self::source_types() const
{
  std::vector<const Type *> out;
  out.reserve(sources_.size());
  for (const auto & s : sources_) {
    out.push_back(s.ty);
  }
  return out;
}

const Type * wrap_type(TypeContext & types, JoinWrap wrap, const Type * ty)
{
  return wrap == JoinWrap::List ? types.get_list_type(ty) : ty;
}

const Type * self_type(TypeContext & types, const Ctx & ctx, const Self & self)
{
  switch (self.kind()) {
    case Self::Kind::Just:
      return self.type();
    case Self::Kind::Joined: {
      const Type * j = self.sources().empty()
                         ? types.unknown_type()
                         : join_all(types, ctx, self.source_types());
      return j ? wrap_type(types, self.wrap(), j) : types.unknown_type();
    }
    case Self::Kind::Multi:
    case Self::Kind::Free:
      break;
  }
  return types.unknown_type();
}

std::string_view to_string(FreeKind kind) noexcept
{
  switch (kind) {
    case FreeKind::Variable:
      return "variable";
    case FreeKind::Tag:
      return "constructor";
    case FreeKind::TypeVariable:
      return "type variable";
  }
  return "variable";
}

std::string to_string(const Self & self)
{
  switch (self.kind()) {
    case Self::Kind::Just:
      return to_string(self.type());
    case Self::Kind::Joined: {
      std::vector<std::string> parts;
      for (const auto & s : self.sources()) {
        parts.push_back(fmt::format("#{}: {}", s.id.value, to_string(s.ty)));
      }
      return fmt::format(
        "{}join({})", self.wrap() == JoinWrap::List ? "list " : "", fmt::join(parts, ", "));
    }
    case Self::Kind::Multi:
      return "multi";
    case Self::Kind::Free:
      return fmt::format("free {}", to_string(self.free_kind()));
  }
  return "?";
}

}  // namespace gradual
