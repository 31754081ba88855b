// gradual/sema/builtins.hpp - Built-in type names and initial context
//
#pragma once

#include <string_view>
#include <unordered_map>

#include "gradual/sema/ctx.hpp"
#include "gradual/sema/type.hpp"

namespace gradual
{

/// Transparent hash functor for string_view heterogeneous lookup
struct TypeTableHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct TypeTableEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/**
 * Built-in type names.
 *
 * Manages:
 * - Primitive type names (Int, Float, Bool, String)
 * - Built-in algebraic types (Ordering)
 * - Built-in aliases (Unit)
 *
 * A surface type name is resolved against this table before the type
 * variables of the context.
 */
class TypeTable
{
public:
  TypeTable() = default;

  /**
   * Register all built-in types and aliases.
   */
  void register_builtins(TypeContext & types);

  /**
   * Look up a type by name, resolving aliases to their canonical types.
   *
   * @return The type, or nullptr if the name is not built in
   */
  [[nodiscard]] const Type * lookup(std::string_view name) const
  {
    auto alias_it = aliases_.find(name);
    if (alias_it != aliases_.end()) {
      name = alias_it->second;
    }
    auto it = types_.find(name);
    return it != types_.end() ? it->second : nullptr;
  }

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name) != nullptr; }

  /// Number of registered types (excluding aliases)
  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  void register_builtin(std::string_view name, const Type * type) { types_.emplace(name, type); }

  void register_alias(std::string_view alias_name, std::string_view canonical_name)
  {
    aliases_.emplace(alias_name, canonical_name);
  }

  std::unordered_map<std::string_view, const Type *, TypeTableHash, TypeTableEqual> types_;
  std::unordered_map<std::string_view, std::string_view, TypeTableHash, TypeTableEqual> aliases_;
};

/**
 * Initial context: built-in helper functions and the constructors of the
 * built-in algebraic types.
 */
[[nodiscard]] Ctx builtin_ctx(TypeContext & types, const TypeTable & table);

}  // namespace gradual
