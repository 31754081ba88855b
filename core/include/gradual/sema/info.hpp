// gradual/sema/info.hpp - Per-term statics records
//
// One Info record is produced for every term. Records follow the same
// LLVM-style RTTI as terms: an InfoKind tag and static classof().
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gradual/basic/casting.hpp"
#include "gradual/sema/co_ctx.hpp"
#include "gradual/sema/ctx.hpp"
#include "gradual/sema/mode.hpp"
#include "gradual/sema/self.hpp"
#include "gradual/sema/type.hpp"
#include "gradual/term/term.hpp"

namespace gradual
{

// ============================================================================
// Error status of expressions and patterns
// ============================================================================

/**
 * Why a term is in a hole.
 */
enum class ErrorKind : uint8_t {
  FreeVariable,             ///< unbound variable
  FreeTag,                  ///< unbound constructor
  InconsistentWithArrow,    ///< callee that cannot be a function
  SynInconsistentBranches,  ///< synthesized branches without a common type
  TypeInconsistent,         ///< synthesized type inconsistent with the expected one
};

/**
 * How a term that is not in a hole got its type.
 */
enum class OkKind : uint8_t {
  Syn,                        ///< synthesized `syn`
  AnaConsistent,              ///< `syn` joined with `ana` to `join`
  AnaInternallyInconsistent,  ///< branches disagree; `ana` wins
  AnaExternallyInconsistent,  ///< branch join `syn` disagrees with `ana`; `ana` wins
};

/**
 * Result of combining a mode with a self type.
 */
struct Status
{
  bool in_hole = false;
  ErrorKind error = ErrorKind::FreeVariable;
  OkKind ok = OkKind::Syn;

  const Type * syn = nullptr;
  const Type * ana = nullptr;
  const Type * join = nullptr;

  /// SynInconsistentBranches / AnaInternallyInconsistent: branch types
  std::vector<const Type *> branches;
};

/**
 * Classify a term from its mode and self type.
 */
[[nodiscard]] Status status_of(
  TypeContext & types, const Ctx & ctx, const Mode & mode, const Self & self);

/**
 * Type a term contributes to its surroundings once its status is known.
 *
 * In-hole terms contribute an internal Unknown. For Ana, an inconsistency
 * that does not put the term in a hole contributes the expected type.
 */
[[nodiscard]] const Type * fixed_type(TypeContext & types, const Mode & mode, const Status & status);

/// status_of() followed by fixed_type()
[[nodiscard]] const Type * typ_after_fix(
  TypeContext & types, const Ctx & ctx, const Mode & mode, const Self & self);

[[nodiscard]] std::string describe(const Status & status);

// ============================================================================
// Error status of types, type patterns and sum entries
// ============================================================================

enum class TypError : uint8_t {
  None,
  FreeTypeVariable,  ///< unbound type name
};

enum class TPatError : uint8_t {
  None,
  NotAVariable,  ///< a multi-hole where a type name was expected
  ShadowsType,   ///< the alias name is already a type name
};

enum class VariantError : uint8_t {
  None,
  DuplicateConstructor,  ///< tag already used in the same sum
  NotAConstructor,       ///< sum entry that is a type, not a constructor
};

// ============================================================================
// Info records
// ============================================================================

enum class InfoKind : uint8_t {
  Invalid,  ///< unparseable fragment of any sort
  Exp,
  Pat,
  Typ,
  Rul,
  TPat,
  TSum,
};

/**
 * Base class for all statics records.
 */
class Info
{
public:
  const InfoKind kind;
  const Term * term;  ///< the term the record describes
  Ctx ctx;            ///< context at the term

  [[nodiscard]] InfoKind get_kind() const noexcept { return kind; }

  /// Syntactic class name of the term, e.g. "FunExp"
  [[nodiscard]] std::string_view cls() const noexcept { return to_string(term->get_kind()); }

protected:
  Info(InfoKind k, const Term * t, Ctx c) : kind(k), term(t), ctx(std::move(c)) {}
  ~Info() = default;
  Info(const Info &) = default;
};

class InfoInvalid : public Info
{
public:
  std::string_view text;

  InfoInvalid(const Term * t, Ctx c, std::string_view text_)
  : Info(InfoKind::Invalid, t, std::move(c)), text(text_)
  {
  }

  [[nodiscard]] bool is_whitespace() const noexcept { return is_whitespace_only(text); }

  static bool classof(const Info * i) { return i->kind == InfoKind::Invalid; }
};

class InfoExp : public Info
{
public:
  Mode mode;
  Self self;
  CoCtx co_ctx;  ///< free variable uses of the expression
  Status status;
  const Type * ty;  ///< fixed type

  InfoExp(
    const Exp * t, Ctx c, Mode m, Self s, CoCtx co, Status st, const Type * fixed)
  : Info(InfoKind::Exp, t, std::move(c)),
    mode(m),
    self(std::move(s)),
    co_ctx(std::move(co)),
    status(std::move(st)),
    ty(fixed)
  {
  }

  static bool classof(const Info * i) { return i->kind == InfoKind::Exp; }
};

class InfoPat : public Info
{
public:
  Mode mode;
  Self self;
  CoCtx co_ctx;  ///< uses in the scope the pattern binds into
  Ctx ctx_out;   ///< context after the pattern's bindings
  Status status;
  const Type * ty;  ///< fixed type

  InfoPat(
    const Pat * t, Ctx c, Mode m, Self s, CoCtx co, Ctx out, Status st, const Type * fixed)
  : Info(InfoKind::Pat, t, std::move(c)),
    mode(m),
    self(std::move(s)),
    co_ctx(std::move(co)),
    ctx_out(std::move(out)),
    status(std::move(st)),
    ty(fixed)
  {
  }

  static bool classof(const Info * i) { return i->kind == InfoKind::Pat; }
};

class InfoTyp : public Info
{
public:
  TypError error;
  const Type * ty;

  InfoTyp(const TypeTerm * t, Ctx c, TypError e, const Type * resolved)
  : Info(InfoKind::Typ, t, std::move(c)), error(e), ty(resolved)
  {
  }

  static bool classof(const Info * i) { return i->kind == InfoKind::Typ; }
};

class InfoRul : public Info
{
public:
  InfoRul(const Rule * t, Ctx c) : Info(InfoKind::Rul, t, std::move(c)) {}

  static bool classof(const Info * i) { return i->kind == InfoKind::Rul; }
};

class InfoTPat : public Info
{
public:
  TPatError error;

  InfoTPat(const TPat * t, Ctx c, TPatError e) : Info(InfoKind::TPat, t, std::move(c)), error(e) {}

  static bool classof(const Info * i) { return i->kind == InfoKind::TPat; }
};

class InfoTSum : public Info
{
public:
  VariantError error;
  const Type * arg;  ///< argument type of a constructor entry, or nullptr

  InfoTSum(const VariantTerm * t, Ctx c, VariantError e, const Type * a)
  : Info(InfoKind::TSum, t, std::move(c)), error(e), arg(a)
  {
  }

  static bool classof(const Info * i) { return i->kind == InfoKind::TSum; }
};

// ============================================================================
// Record queries
// ============================================================================

/**
 * True if the record reports an error. Whitespace-only invalid fragments,
 * multi-holes and unused bindings are not errors.
 */
[[nodiscard]] bool is_error(const Info & info) noexcept;

/**
 * True for a variable pattern whose binding is never used. Names starting
 * with an underscore are exempt.
 */
[[nodiscard]] bool is_unused_binding(const Info & info) noexcept;

[[nodiscard]] std::string_view to_string(InfoKind kind) noexcept;
[[nodiscard]] std::string_view to_string(TypError e) noexcept;
[[nodiscard]] std::string_view to_string(TPatError e) noexcept;
[[nodiscard]] std::string_view to_string(VariantError e) noexcept;

}  // namespace gradual
