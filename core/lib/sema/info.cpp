// gradual/sema/info.cpp - Error classification and record queries
//
#include "gradual/sema/info.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "gradual/sema/type_utils.hpp"

namespace gradual
{

namespace
{

Status ok_syn(const Type * syn)
{
  Status s;
  s.ok = OkKind::Syn;
  s.syn = syn;
  return s;
}

Status in_hole(ErrorKind kind)
{
  Status s;
  s.in_hole = true;
  s.error = kind;
  return s;
}

/// Synthesized type under Syn or SynFun
Status synthesized(const Ctx & ctx, const Mode & mode, const Type * syn)
{
  if (mode.is_syn_fun() && !is_arrow_compatible(ctx, syn)) {
    Status s = in_hole(ErrorKind::InconsistentWithArrow);
    s.syn = syn;
    return s;
  }
  return ok_syn(syn);
}

Status analyzed_just(TypeContext & types, const Ctx & ctx, const Type * ana, const Type * syn)
{
  const Type * j = join(types, ctx, ana, syn);
  if (!j) {
    Status s = in_hole(ErrorKind::TypeInconsistent);
    s.syn = syn;
    s.ana = ana;
    return s;
  }
  Status s;
  s.ok = OkKind::AnaConsistent;
  s.ana = ana;
  s.syn = syn;
  s.join = j;
  return s;
}

}  // namespace

// ============================================================================
// Classification
// ============================================================================

Status status_of(TypeContext & types, const Ctx & ctx, const Mode & mode, const Self & self)
{
  switch (self.kind()) {
    case Self::Kind::Free:
      return in_hole(
        self.free_kind() == FreeKind::Tag ? ErrorKind::FreeTag : ErrorKind::FreeVariable);

    case Self::Kind::Multi:
      return ok_syn(types.unknown_type());

    case Self::Kind::Just:
      if (mode.is_ana()) {
        return analyzed_just(types, ctx, mode.ana_type(), self.type());
      }
      return synthesized(ctx, mode, self.type());

    case Self::Kind::Joined: {
      if (self.sources().empty()) {
        const Type * t = wrap_type(types, self.wrap(), types.unknown_type());
        return mode.is_ana() ? analyzed_just(types, ctx, mode.ana_type(), t)
                             : synthesized(ctx, mode, t);
      }

      const Type * branch_join = join_all(types, ctx, self.source_types());
      if (!branch_join) {
        Status s = mode.is_ana() ? Status{} : in_hole(ErrorKind::SynInconsistentBranches);
        if (mode.is_ana()) {
          s.ok = OkKind::AnaInternallyInconsistent;
          s.ana = mode.ana_type();
        }
        s.branches = self.source_types();
        return s;
      }

      const Type * wrapped = wrap_type(types, self.wrap(), branch_join);
      if (!mode.is_ana()) {
        return synthesized(ctx, mode, wrapped);
      }

      const Type * j = join(types, ctx, mode.ana_type(), wrapped);
      Status s;
      s.ana = mode.ana_type();
      s.syn = wrapped;
      if (j) {
        s.ok = OkKind::AnaConsistent;
        s.join = j;
      } else {
        // Each branch was analyzed against the expected type and reports
        // its own inconsistency
        s.ok = OkKind::AnaExternallyInconsistent;
      }
      return s;
    }
  }
  return ok_syn(types.unknown_type());
}

const Type * fixed_type(TypeContext & types, const Mode & mode, const Status & status)
{
  if (status.in_hole) {
    return types.unknown_type();
  }
  switch (status.ok) {
    case OkKind::Syn:
      if (mode.is_syn_fun() && status.syn->is_unknown()) {
        return types.get_arrow_type(types.synswitch_type(), types.synswitch_type());
      }
      return status.syn;
    case OkKind::AnaConsistent:
      return status.join;
    case OkKind::AnaInternallyInconsistent:
    case OkKind::AnaExternallyInconsistent:
      return status.ana;
  }
  return types.unknown_type();
}

const Type * typ_after_fix(TypeContext & types, const Ctx & ctx, const Mode & mode, const Self & self)
{
  return fixed_type(types, mode, status_of(types, ctx, mode, self));
}

std::string describe(const Status & status)
{
  std::vector<std::string> branches;
  for (const Type * t : status.branches) {
    branches.push_back(to_string(t));
  }

  if (!status.in_hole) {
    switch (status.ok) {
      case OkKind::Syn:
      case OkKind::AnaConsistent:
        return "ok";
      case OkKind::AnaInternallyInconsistent:
        return fmt::format("branches have inconsistent types: {}", fmt::join(branches, ", "));
      case OkKind::AnaExternallyInconsistent:
        return fmt::format("expected {}, branches join to {}", to_string(status.ana), to_string(status.syn));
    }
    return "ok";
  }

  switch (status.error) {
    case ErrorKind::FreeVariable:
      return "unbound variable";
    case ErrorKind::FreeTag:
      return "unbound constructor";
    case ErrorKind::InconsistentWithArrow:
      return fmt::format("expected a function, found {}", to_string(status.syn));
    case ErrorKind::SynInconsistentBranches:
      return fmt::format("branches have inconsistent types: {}", fmt::join(branches, ", "));
    case ErrorKind::TypeInconsistent:
      return fmt::format("expected {}, found {}", to_string(status.ana), to_string(status.syn));
  }
  return "error";
}

// ============================================================================
// Record queries
// ============================================================================

bool is_error(const Info & info) noexcept
{
  switch (info.get_kind()) {
    case InfoKind::Invalid:
      return !cast<InfoInvalid>(&info)->is_whitespace();
    case InfoKind::Exp:
      return cast<InfoExp>(&info)->status.in_hole;
    case InfoKind::Pat:
      return cast<InfoPat>(&info)->status.in_hole;
    case InfoKind::Typ:
      return cast<InfoTyp>(&info)->error != TypError::None;
    case InfoKind::Rul:
      return false;
    case InfoKind::TPat:
      return cast<InfoTPat>(&info)->error != TPatError::None;
    case InfoKind::TSum:
      return cast<InfoTSum>(&info)->error != VariantError::None;
  }
  return false;
}

bool is_unused_binding(const Info & info) noexcept
{
  const auto * pat = dyn_cast<InfoPat>(&info);
  if (!pat) return false;
  const auto * var = dyn_cast<VarPat>(pat->term);
  if (!var || var->name.empty() || var->name.front() == '_') return false;
  return !pat->co_ctx.mentions(var->name);
}

std::string_view to_string(InfoKind kind) noexcept
{
  switch (kind) {
    case InfoKind::Invalid:
      return "invalid";
    case InfoKind::Exp:
      return "exp";
    case InfoKind::Pat:
      return "pat";
    case InfoKind::Typ:
      return "typ";
    case InfoKind::Rul:
      return "rul";
    case InfoKind::TPat:
      return "tpat";
    case InfoKind::TSum:
      return "tsum";
  }
  return "invalid";
}

std::string_view to_string(TypError e) noexcept
{
  switch (e) {
    case TypError::None:
      return "ok";
    case TypError::FreeTypeVariable:
      return "unbound type variable";
  }
  return "ok";
}

std::string_view to_string(TPatError e) noexcept
{
  switch (e) {
    case TPatError::None:
      return "ok";
    case TPatError::NotAVariable:
      return "expected a type name";
    case TPatError::ShadowsType:
      return "shadows an existing type";
  }
  return "ok";
}

std::string_view to_string(VariantError e) noexcept
{
  switch (e) {
    case VariantError::None:
      return "ok";
    case VariantError::DuplicateConstructor:
      return "duplicate constructor";
    case VariantError::NotAConstructor:
      return "expected a constructor";
  }
  return "ok";
}

}  // namespace gradual
