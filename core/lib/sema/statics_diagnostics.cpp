// gradual/sema/statics_diagnostics.cpp - Diagnostics from statics results
//
#include "gradual/sema/statics_diagnostics.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <unordered_set>

#include "gradual/basic/casting.hpp"
#include "gradual/sema/type_utils.hpp"

namespace gradual
{

namespace
{

/// Name carried by a variable, constructor or type name node; empty otherwise
std::string_view name_of(const Term * term)
{
  if (const auto * n = dyn_cast<VarExp>(term)) return n->name;
  if (const auto * n = dyn_cast<VarPat>(term)) return n->name;
  if (const auto * n = dyn_cast<ConstructorExp>(term)) return n->tag;
  if (const auto * n = dyn_cast<ConstructorPat>(term)) return n->tag;
  if (const auto * n = dyn_cast<VarTyp>(term)) return n->name;
  if (const auto * n = dyn_cast<VarTPat>(term)) return n->name;
  if (const auto * n = dyn_cast<Variant>(term)) return n->tag;
  return {};
}

void report_status(
  DiagnosticBag & bag, Id id, const Term * term, const Status & status, const Self & self)
{
  switch (status.error) {
    case ErrorKind::FreeVariable:
      bag.report(
        DiagCode::UnboundVariable, id, fmt::format("unbound variable `{}`", name_of(term)),
        "not in scope");
      return;
    case ErrorKind::FreeTag:
      bag
        .report(
          DiagCode::UnboundConstructor, id,
          fmt::format("unbound constructor `{}`", name_of(term)), "not in scope")
        .with_help("constructors are introduced by a sum type alias");
      return;
    case ErrorKind::InconsistentWithArrow:
      bag.report(
        DiagCode::NotAFunction, id,
        fmt::format("expected a function, found {}", to_string(status.syn)), "applied here");
      return;
    case ErrorKind::SynInconsistentBranches: {
      auto builder =
        bag.report(DiagCode::InconsistentBranches, id, describe(status), "branches disagree");
      for (const auto & source : self.sources()) {
        builder.with_secondary_label(source.id, fmt::format("has type {}", to_string(source.ty)));
      }
      return;
    }
    case ErrorKind::TypeInconsistent:
      bag.report(
        DiagCode::InconsistentType, id, describe(status),
        fmt::format("inconsistent with {}", to_string(status.ana)));
      return;
  }
}

void report_record(DiagnosticBag & bag, const Info & info, const CollectOptions & options)
{
  const Term * term = info.term;
  const Id id = term->rep_id();

  switch (info.get_kind()) {
    case InfoKind::Invalid: {
      const auto * inv = cast<InfoInvalid>(&info);
      if (inv->is_whitespace()) return;
      bag.report(
        DiagCode::InvalidFragment, id,
        fmt::format("unrecognized {} `{}`", to_string(term->get_sort()), inv->text));
      return;
    }
    case InfoKind::Exp: {
      const auto * exp = cast<InfoExp>(&info);
      if (exp->status.in_hole) report_status(bag, id, term, exp->status, exp->self);
      return;
    }
    case InfoKind::Pat: {
      const auto * pat = cast<InfoPat>(&info);
      if (pat->status.in_hole) {
        report_status(bag, id, term, pat->status, pat->self);
      } else if (options.warn_unused && is_unused_binding(info)) {
        bag
          .report(
            DiagCode::UnusedBinding, id, fmt::format("unused variable `{}`", name_of(term)),
            "never used")
          .with_help(fmt::format("if this is intentional, name it `_{}`", name_of(term)));
      }
      return;
    }
    case InfoKind::Typ:
      if (cast<InfoTyp>(&info)->error == TypError::FreeTypeVariable) {
        bag.report(
          DiagCode::UnboundTypeVariable, id,
          fmt::format("unbound type variable `{}`", name_of(term)), "not in scope");
      }
      return;
    case InfoKind::TPat:
      switch (cast<InfoTPat>(&info)->error) {
        case TPatError::None:
          return;
        case TPatError::NotAVariable:
          bag.report(DiagCode::NotATypeName, id, "expected a type name", "not a name");
          return;
        case TPatError::ShadowsType:
          bag.report(
            DiagCode::ShadowedType, id,
            fmt::format("type alias `{}` shadows an existing type", name_of(term)),
            "already a type");
          return;
      }
      return;
    case InfoKind::TSum:
      switch (cast<InfoTSum>(&info)->error) {
        case VariantError::None:
          return;
        case VariantError::DuplicateConstructor:
          bag.report(
            DiagCode::DuplicateConstructor, id,
            fmt::format("constructor `{}` is defined twice", name_of(term)), "duplicate");
          return;
        case VariantError::NotAConstructor:
          bag
            .report(
              DiagCode::NotAConstructor, id, "expected a constructor in sum type",
              "not a constructor")
            .with_help("sum entries are written `Tag` or `Tag(type)`");
          return;
      }
      return;
    case InfoKind::Rul:
      return;
  }
}

}  // namespace

void collect_diagnostics(const InfoMap & map, DiagnosticBag & bag, const CollectOptions & options)
{
  std::unordered_set<const Info *> seen;
  for (const Id id : map.ids()) {
    const Info * info = map.find(id);
    if (!seen.insert(info).second) continue;
    report_record(bag, *info, options);
  }
}

}  // namespace gradual
