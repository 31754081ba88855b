// gradual/sema/mode.cpp - Bidirectional typing modes
//
#include "gradual/sema/mode.hpp"

#include <fmt/format.h>

#include "gradual/sema/type_utils.hpp"

namespace gradual
{

const Type * ty_of(TypeContext & types, const Mode & mode)
{
  switch (mode.kind()) {
    case Mode::Kind::Ana:
      return mode.ana_type();
    case Mode::Kind::SynFun:
      return types.get_arrow_type(types.synswitch_type(), types.synswitch_type());
    case Mode::Kind::Syn:
      break;
  }
  return types.synswitch_type();
}

std::pair<Mode, Mode> of_arrow(TypeContext & types, const Ctx & ctx, const Mode & mode)
{
  if (!mode.is_ana()) {
    return {Mode::syn(), Mode::syn()};
  }
  const ArrowParts parts = matched_arrow(types, ctx, mode.ana_type());
  return {Mode::ana_or_syn(parts.param), Mode::ana_or_syn(parts.result)};
}

Mode of_list(TypeContext & types, const Ctx & ctx, const Mode & mode)
{
  if (!mode.is_ana()) {
    return Mode::syn();
  }
  return Mode::ana_or_syn(matched_list(types, ctx, mode.ana_type()));
}

Mode of_list_concat(TypeContext & types, const Ctx & ctx, const Mode & mode)
{
  if (!mode.is_ana()) {
    return Mode::ana(types.get_list_type(types.synswitch_type()));
  }
  return Mode::ana(types.get_list_type(matched_list(types, ctx, mode.ana_type())));
}

Mode of_cons_hd(TypeContext & types, const Ctx & ctx, const Mode & mode)
{
  return of_list(types, ctx, mode);
}

Mode of_cons_tl(TypeContext & types, const Type * hd)
{
  return Mode::ana(types.get_list_type(hd));
}

std::vector<Mode> of_prod(TypeContext & types, const Ctx & ctx, const Mode & mode, size_t arity)
{
  if (!mode.is_ana()) {
    return std::vector<Mode>(arity, Mode::syn());
  }
  std::vector<Mode> modes;
  modes.reserve(arity);
  for (const Type * t : matched_prod(types, ctx, mode.ana_type(), arity)) {
    modes.push_back(Mode::ana_or_syn(t));
  }
  return modes;
}

Mode of_ap_pat(TypeContext & types, const Mode & mode)
{
  if (!mode.is_ana()) {
    return Mode::syn();
  }
  return Mode::ana(types.get_arrow_type(types.unknown_type(), mode.ana_type()));
}

std::string to_string(const Mode & mode)
{
  switch (mode.kind()) {
    case Mode::Kind::Syn:
      return "syn";
    case Mode::Kind::SynFun:
      return "syn-fun";
    case Mode::Kind::Ana:
      return fmt::format("ana {}", to_string(mode.ana_type()));
  }
  return "syn";
}

}  // namespace gradual
