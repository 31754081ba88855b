// gradual/sema/self.hpp - Bottom-up self types
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gradual/basic/id.hpp"
#include "gradual/sema/ctx.hpp"
#include "gradual/sema/type.hpp"

namespace gradual
{

/**
 * What kind of name was not found.
 */
enum class FreeKind : uint8_t {
  Variable,      ///< unbound term variable
  Tag,           ///< unbound constructor
  TypeVariable,  ///< unbound type name
};

/**
 * How a joined type is re-embedded.
 */
enum class JoinWrap : uint8_t {
  Identity,
  List,  ///< joined element type becomes [t]
};

/// One branch contributing to a joined self type.
struct JoinSource
{
  Id id;
  const Type * ty;
};

/**
 * What a term's type would be judged in isolation.
 *
 * - Just: a definite type
 * - Joined: the join of several branch types, re-embedded by `wrap`
 * - Multi: a multi-hole; never itself in error
 * - Free: an unbound name
 */
class Self
{
public:
  enum class Kind : uint8_t { Just, Joined, Multi, Free };

  [[nodiscard]] static Self just(const Type * ty)
  {
    Self s(Kind::Just);
    s.ty_ = ty;
    return s;
  }

  [[nodiscard]] static Self joined(JoinWrap wrap, std::vector<JoinSource> sources)
  {
    Self s(Kind::Joined);
    s.wrap_ = wrap;
    s.sources_ = std::move(sources);
    return s;
  }

  [[nodiscard]] static Self multi() { return Self(Kind::Multi); }

  [[nodiscard]] static Self free(FreeKind kind)
  {
    Self s(Kind::Free);
    s.free_ = kind;
    return s;
  }

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] const Type * type() const noexcept { return ty_; }
  [[nodiscard]] JoinWrap wrap() const noexcept { return wrap_; }
  [[nodiscard]] const std::vector<JoinSource> & sources() const noexcept { return sources_; }
  [[nodiscard]] FreeKind free_kind() const noexcept { return free_; }

  [[nodiscard]] std::vector<const Type *> source_types() const;

private:
  explicit Self(Kind k) : kind_(k) {}

  Kind kind_;
  const Type * ty_ = nullptr;
  JoinWrap wrap_ = JoinWrap::Identity;
  std::vector<JoinSource> sources_;
  FreeKind free_ = FreeKind::Variable;
};

/// Apply a join wrapper to a type
[[nodiscard]] const Type * wrap_type(TypeContext & types, JoinWrap wrap, const Type * ty);

/**
 * Type of a self in isolation: the definite type, the wrapped join of the
 * branches, or Unknown when there is none.
 */
[[nodiscard]] const Type * self_type(TypeContext & types, const Ctx & ctx, const Self & self);

[[nodiscard]] std::string_view to_string(FreeKind kind) noexcept;
[[nodiscard]] std::string to_string(const Self & self);

}  // namespace gradual
