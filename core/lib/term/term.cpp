// gradual/term/term.cpp - Term helpers
//
#include "gradual/term/term.hpp"

#include <cctype>

namespace gradual
{

bool is_whitespace_only(std::string_view text) noexcept
{
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

std::string_view invalid_text(const Term * term) noexcept
{
  if (const auto * e = dyn_cast<InvalidExp>(term)) return e->text;
  if (const auto * p = dyn_cast<InvalidPat>(term)) return p->text;
  if (const auto * t = dyn_cast<InvalidTyp>(term)) return t->text;
  if (const auto * tp = dyn_cast<InvalidTPat>(term)) return tp->text;
  return {};
}

bool is_invalid(const Term * term) noexcept
{
  return isa<InvalidExp>(term) || isa<InvalidPat>(term) || isa<InvalidTyp>(term) ||
         isa<InvalidTPat>(term);
}

gsl::span<Term * const> multi_hole_children(const Term * term) noexcept
{
  if (const auto * e = dyn_cast<MultiHoleExp>(term)) return e->children;
  if (const auto * p = dyn_cast<MultiHolePat>(term)) return p->children;
  if (const auto * t = dyn_cast<MultiHoleTyp>(term)) return t->children;
  if (const auto * tp = dyn_cast<MultiHoleTPat>(term)) return tp->children;
  return {};
}

}  // namespace gradual
