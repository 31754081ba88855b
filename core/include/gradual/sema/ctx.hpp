// gradual/sema/ctx.hpp - Typing context
//
// The ordered environment of variable, constructor and type-variable
// bindings in scope at a term position.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <string_view>
#include <vector>

#include "gradual/basic/id.hpp"
#include "gradual/sema/type.hpp"

namespace gradual
{

class TypeTable;

// ============================================================================
// Entries
// ============================================================================

/**
 * Kind of context entry.
 */
enum class EntryKind : uint8_t {
  Variable,     ///< term variable bound by a pattern or built in
  Constructor,  ///< sum-type constructor
  TypeVar,      ///< type variable bound by a type alias or built in
};

/**
 * A binding in the context.
 *
 * For Variable and Constructor, `typ` is the bound type. For TypeVar,
 * `typ` is the singleton kind (the aliased type) or nullptr for an
 * abstract type variable.
 */
struct CtxEntry
{
  EntryKind kind;
  std::string_view name;
  Id id;
  const Type * typ = nullptr;

  [[nodiscard]] bool is_variable() const noexcept { return kind == EntryKind::Variable; }
  [[nodiscard]] bool is_constructor() const noexcept { return kind == EntryKind::Constructor; }
  [[nodiscard]] bool is_type_var() const noexcept { return kind == EntryKind::TypeVar; }

  /// True for a type variable without a definition
  [[nodiscard]] bool is_abstract() const noexcept
  {
    return kind == EntryKind::TypeVar && typ == nullptr;
  }
};

// ============================================================================
// Ctx
// ============================================================================

/**
 * Persistent, prepend-only binding list.
 *
 * Extending a context never modifies it: the result shares every existing
 * binding with the original. Lookup returns the innermost binding, so
 * later bindings shadow earlier ones. Copying a Ctx is cheap.
 */
class Ctx
{
public:
  Ctx() = default;

  // ===========================================================================
  // Extension
  // ===========================================================================

  [[nodiscard]] Ctx extend(const CtxEntry & entry) const;

  [[nodiscard]] Ctx extend_var(std::string_view name, Id id, const Type * typ) const
  {
    return extend(CtxEntry{EntryKind::Variable, name, id, typ});
  }

  [[nodiscard]] Ctx extend_constructor(std::string_view name, Id id, const Type * typ) const
  {
    return extend(CtxEntry{EntryKind::Constructor, name, id, typ});
  }

  /// Bind a type variable; `definition` nullptr binds an abstract one
  [[nodiscard]] Ctx extend_type_var(std::string_view name, Id id, const Type * definition) const
  {
    return extend(CtxEntry{EntryKind::TypeVar, name, id, definition});
  }

  // ===========================================================================
  // Lookup
  // ===========================================================================

  [[nodiscard]] const CtxEntry * lookup_var(std::string_view name) const noexcept;
  [[nodiscard]] const CtxEntry * lookup_constructor(std::string_view tag) const noexcept;
  [[nodiscard]] const CtxEntry * lookup_type_var(std::string_view name) const noexcept;

  /// Definition of a type alias in scope, or nullptr
  [[nodiscard]] const Type * lookup_alias(std::string_view name) const noexcept;

  /// True if `name` is bound as a type variable
  [[nodiscard]] bool is_type_var(std::string_view name) const noexcept
  {
    return lookup_type_var(name) != nullptr;
  }

  /// True if binding a type named `name` would hide a built-in type or a
  /// type variable in scope
  [[nodiscard]] bool shadows_typ(std::string_view name, const TypeTable & builtins) const;

  // ===========================================================================
  // Inspection
  // ===========================================================================

  [[nodiscard]] size_t size() const noexcept { return size_; }
  [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

  /// All entries, innermost first
  [[nodiscard]] std::vector<CtxEntry> entries() const;

  /// Entries prepended to `base` to obtain this context, innermost first.
  /// `base` must be a suffix of this context.
  [[nodiscard]] std::vector<CtxEntry> added_since(const Ctx & base) const;

  /// Same binding list (identity, not structure)
  friend bool operator==(const Ctx & a, const Ctx & b) noexcept { return a.head_ == b.head_; }
  friend bool operator!=(const Ctx & a, const Ctx & b) noexcept { return a.head_ != b.head_; }

private:
  struct Node
  {
    CtxEntry entry;
    std::shared_ptr<const Node> next;
  };

  Ctx(std::shared_ptr<const Node> head, size_t size) : head_(std::move(head)), size_(size) {}

  const CtxEntry * find(EntryKind kind, std::string_view name) const noexcept;

  std::shared_ptr<const Node> head_;
  size_t size_ = 0;
};

}  // namespace gradual
