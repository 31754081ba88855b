// gradual/term/term_enums.hpp - Term enumeration definitions
//
// Node kinds, sorts and operators of the term language.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace gradual
{

// ============================================================================
// TermKind - Identifies all term node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Kinds are grouped by sort for range-based classof checks.
 * Generated from term_nodes.def.
 */
enum class TermKind : uint8_t {
#define TERM_NODE_EXP(Class, Kind, Snake) Kind,
#include "gradual/term/term_nodes.def"

#define TERM_NODE_RUL(Class, Kind, Snake) Kind,
#include "gradual/term/term_nodes.def"

#define TERM_NODE_PAT(Class, Kind, Snake) Kind,
#include "gradual/term/term_nodes.def"

#define TERM_NODE_TYP(Class, Kind, Snake) Kind,
#include "gradual/term/term_nodes.def"

#define TERM_NODE_TPAT(Class, Kind, Snake) Kind,
#include "gradual/term/term_nodes.def"

#define TERM_NODE_VARIANT(Class, Kind, Snake) Kind,
#include "gradual/term/term_nodes.def"
};

/**
 * Syntactic sort of a term.
 */
enum class TermSort : uint8_t {
  Exp,      ///< expression
  Rul,      ///< match rule
  Pat,      ///< pattern
  Typ,      ///< surface type
  TPat,     ///< type pattern (alias name)
  Variant,  ///< sum-type definition entry
};

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators, grouped by operand category.
 */
enum class BinOp : uint8_t {
  // Bool
  And,  ///< &&
  Or,   ///< ||
  // Int
  Plus,       ///< +
  Minus,      ///< -
  Times,      ///< *
  Power,      ///< **
  Divide,     ///< /
  LessThan,   ///< <
  LessEq,     ///< <=
  Greater,    ///< >
  GreaterEq,  ///< >=
  Equals,     ///< ==
  NotEquals,  ///< !=
  // Float
  FPlus,       ///< +.
  FMinus,      ///< -.
  FTimes,      ///< *.
  FPower,      ///< **.
  FDivide,     ///< /.
  FLessThan,   ///< <.
  FLessEq,     ///< <=.
  FGreater,    ///< >.
  FGreaterEq,  ///< >=.
  FEquals,     ///< ==.
  FNotEquals,  ///< !=.
  // String
  SEquals,  ///< $==
  SConcat,  ///< ++
};

/**
 * Unary operators.
 */
enum class UnOp : uint8_t {
  Negate,  ///< - (Int)
  Not,     ///< ! (Bool)
};

/**
 * Operand category of an operator. Fixes operand and result types.
 */
enum class OpCategory : uint8_t { Bool, Int, Float, String };

[[nodiscard]] constexpr OpCategory op_category(BinOp op) noexcept
{
  switch (op) {
    case BinOp::And:
    case BinOp::Or:
      return OpCategory::Bool;
    case BinOp::Plus:
    case BinOp::Minus:
    case BinOp::Times:
    case BinOp::Power:
    case BinOp::Divide:
    case BinOp::LessThan:
    case BinOp::LessEq:
    case BinOp::Greater:
    case BinOp::GreaterEq:
    case BinOp::Equals:
    case BinOp::NotEquals:
      return OpCategory::Int;
    case BinOp::FPlus:
    case BinOp::FMinus:
    case BinOp::FTimes:
    case BinOp::FPower:
    case BinOp::FDivide:
    case BinOp::FLessThan:
    case BinOp::FLessEq:
    case BinOp::FGreater:
    case BinOp::FGreaterEq:
    case BinOp::FEquals:
    case BinOp::FNotEquals:
      return OpCategory::Float;
    case BinOp::SEquals:
    case BinOp::SConcat:
      return OpCategory::String;
  }
  return OpCategory::Int;
}

[[nodiscard]] constexpr OpCategory op_category(UnOp op) noexcept
{
  return op == UnOp::Not ? OpCategory::Bool : OpCategory::Int;
}

/// Comparison operators yield Bool regardless of their operand category.
[[nodiscard]] constexpr bool is_comparison(BinOp op) noexcept
{
  switch (op) {
    case BinOp::LessThan:
    case BinOp::LessEq:
    case BinOp::Greater:
    case BinOp::GreaterEq:
    case BinOp::Equals:
    case BinOp::NotEquals:
    case BinOp::FLessThan:
    case BinOp::FLessEq:
    case BinOp::FGreater:
    case BinOp::FGreaterEq:
    case BinOp::FEquals:
    case BinOp::FNotEquals:
    case BinOp::SEquals:
      return true;
    default:
      return false;
  }
}

[[nodiscard]] constexpr std::string_view to_string(BinOp op) noexcept
{
  switch (op) {
    case BinOp::And:
      return "&&";
    case BinOp::Or:
      return "||";
    case BinOp::Plus:
      return "+";
    case BinOp::Minus:
      return "-";
    case BinOp::Times:
      return "*";
    case BinOp::Power:
      return "**";
    case BinOp::Divide:
      return "/";
    case BinOp::LessThan:
      return "<";
    case BinOp::LessEq:
      return "<=";
    case BinOp::Greater:
      return ">";
    case BinOp::GreaterEq:
      return ">=";
    case BinOp::Equals:
      return "==";
    case BinOp::NotEquals:
      return "!=";
    case BinOp::FPlus:
      return "+.";
    case BinOp::FMinus:
      return "-.";
    case BinOp::FTimes:
      return "*.";
    case BinOp::FPower:
      return "**.";
    case BinOp::FDivide:
      return "/.";
    case BinOp::FLessThan:
      return "<.";
    case BinOp::FLessEq:
      return "<=.";
    case BinOp::FGreater:
      return ">.";
    case BinOp::FGreaterEq:
      return ">=.";
    case BinOp::FEquals:
      return "==.";
    case BinOp::FNotEquals:
      return "!=.";
    case BinOp::SEquals:
      return "$==";
    case BinOp::SConcat:
      return "++";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnOp op) noexcept
{
  switch (op) {
    case UnOp::Negate:
      return "-";
    case UnOp::Not:
      return "!";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(TermSort sort) noexcept
{
  switch (sort) {
    case TermSort::Exp:
      return "exp";
    case TermSort::Rul:
      return "rule";
    case TermSort::Pat:
      return "pat";
    case TermSort::Typ:
      return "typ";
    case TermSort::TPat:
      return "tpat";
    case TermSort::Variant:
      return "variant";
  }
  return "";
}

/// Class name of a node kind ("LetExp", "VarPat", ...)
[[nodiscard]] constexpr std::string_view to_string(TermKind kind) noexcept
{
  switch (kind) {
#define TERM_NODE_EXP(Class, Kind, Snake) \
  case TermKind::Kind:                    \
    return #Class;
#define TERM_NODE_RUL(Class, Kind, Snake) \
  case TermKind::Kind:                    \
    return #Class;
#define TERM_NODE_PAT(Class, Kind, Snake) \
  case TermKind::Kind:                    \
    return #Class;
#define TERM_NODE_TYP(Class, Kind, Snake) \
  case TermKind::Kind:                    \
    return #Class;
#define TERM_NODE_TPAT(Class, Kind, Snake) \
  case TermKind::Kind:                     \
    return #Class;
#define TERM_NODE_VARIANT(Class, Kind, Snake) \
  case TermKind::Kind:                        \
    return #Class;
#include "gradual/term/term_nodes.def"
  }
  return "";
}

// ============================================================================
// TermKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr TermKind k_first_exp_kind = TermKind::InvalidExp;
inline constexpr TermKind k_last_exp_kind = TermKind::MatchExp;

inline constexpr TermKind k_first_pat_kind = TermKind::InvalidPat;
inline constexpr TermKind k_last_pat_kind = TermKind::TypeAnnPat;

inline constexpr TermKind k_first_typ_kind = TermKind::InvalidTyp;
inline constexpr TermKind k_last_typ_kind = TermKind::SumTyp;

inline constexpr TermKind k_first_tpat_kind = TermKind::InvalidTPat;
inline constexpr TermKind k_last_tpat_kind = TermKind::VarTPat;

inline constexpr TermKind k_first_variant_kind = TermKind::Variant;
inline constexpr TermKind k_last_variant_kind = TermKind::BadVariantEntry;

}  // namespace detail

[[nodiscard]] constexpr bool is_exp_kind(TermKind kind) noexcept
{
  return kind >= detail::k_first_exp_kind && kind <= detail::k_last_exp_kind;
}

[[nodiscard]] constexpr bool is_pat_kind(TermKind kind) noexcept
{
  return kind >= detail::k_first_pat_kind && kind <= detail::k_last_pat_kind;
}

[[nodiscard]] constexpr bool is_typ_kind(TermKind kind) noexcept
{
  return kind >= detail::k_first_typ_kind && kind <= detail::k_last_typ_kind;
}

[[nodiscard]] constexpr bool is_tpat_kind(TermKind kind) noexcept
{
  return kind >= detail::k_first_tpat_kind && kind <= detail::k_last_tpat_kind;
}

[[nodiscard]] constexpr bool is_variant_kind(TermKind kind) noexcept
{
  return kind >= detail::k_first_variant_kind && kind <= detail::k_last_variant_kind;
}

[[nodiscard]] constexpr TermSort sort_of(TermKind kind) noexcept
{
  if (is_exp_kind(kind)) return TermSort::Exp;
  if (is_pat_kind(kind)) return TermSort::Pat;
  if (is_typ_kind(kind)) return TermSort::Typ;
  if (is_tpat_kind(kind)) return TermSort::TPat;
  if (is_variant_kind(kind)) return TermSort::Variant;
  return TermSort::Rul;
}

}  // namespace gradual
