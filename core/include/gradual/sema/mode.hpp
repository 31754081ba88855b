// gradual/sema/mode.hpp - Bidirectional typing modes
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "gradual/sema/ctx.hpp"
#include "gradual/sema/type.hpp"

namespace gradual
{

/**
 * Top-down expectation for a term.
 *
 * - Syn: infer the type
 * - SynFun: infer the type of an application's callee; a callee of
 *   unknown type is treated as an arrow between unknowns
 * - Ana: check against an expected type
 */
class Mode
{
public:
  enum class Kind : uint8_t { Syn, SynFun, Ana };

  [[nodiscard]] static Mode syn() noexcept { return Mode(Kind::Syn, nullptr); }
  [[nodiscard]] static Mode syn_fun() noexcept { return Mode(Kind::SynFun, nullptr); }
  [[nodiscard]] static Mode ana(const Type * expected) noexcept
  {
    return Mode(Kind::Ana, expected);
  }

  /// Ana, except that an expected SynSwitch unknown degrades to Syn
  [[nodiscard]] static Mode ana_or_syn(const Type * expected) noexcept
  {
    return expected->is_synswitch() ? syn() : ana(expected);
  }

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_syn() const noexcept { return kind_ == Kind::Syn; }
  [[nodiscard]] bool is_syn_fun() const noexcept { return kind_ == Kind::SynFun; }
  [[nodiscard]] bool is_ana() const noexcept { return kind_ == Kind::Ana; }

  /// Expected type; only meaningful for Ana
  [[nodiscard]] const Type * ana_type() const noexcept { return ana_; }

  friend bool operator==(const Mode & a, const Mode & b) noexcept
  {
    return a.kind_ == b.kind_ && a.ana_ == b.ana_;
  }
  friend bool operator!=(const Mode & a, const Mode & b) noexcept { return !(a == b); }

private:
  Mode(Kind k, const Type * t) noexcept : kind_(k), ana_(t) {}

  Kind kind_;
  const Type * ana_;
};

// ============================================================================
// Mode splitting
// ============================================================================

/// Type a mode asks for: the expected type, or a SynSwitch unknown
/// (an arrow of them for SynFun)
[[nodiscard]] const Type * ty_of(TypeContext & types, const Mode & mode);

/// Modes for the parameter pattern and body of a function literal
[[nodiscard]] std::pair<Mode, Mode> of_arrow(
  TypeContext & types, const Ctx & ctx, const Mode & mode);

/// Mode for each element of a list
[[nodiscard]] Mode of_list(TypeContext & types, const Ctx & ctx, const Mode & mode);

/// Mode for each operand of a list concatenation; synthesis still
/// requires a list
[[nodiscard]] Mode of_list_concat(TypeContext & types, const Ctx & ctx, const Mode & mode);

/// Mode for the head of a cons
[[nodiscard]] Mode of_cons_hd(TypeContext & types, const Ctx & ctx, const Mode & mode);

/// Mode for the tail of a cons whose head has type `hd`
[[nodiscard]] Mode of_cons_tl(TypeContext & types, const Type * hd);

/// Modes for the components of an n-tuple
[[nodiscard]] std::vector<Mode> of_prod(
  TypeContext & types, const Ctx & ctx, const Mode & mode, size_t arity);

/// Mode for the constructor of a constructor-application pattern: an
/// arrow from an unknown argument to the expected sum
[[nodiscard]] Mode of_ap_pat(TypeContext & types, const Mode & mode);

[[nodiscard]] std::string to_string(const Mode & mode);

}  // namespace gradual
