// gradual/sema/type_utils.cpp - Type consistency, join and decomposition
//
#include "gradual/sema/type_utils.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <set>
#include <utility>

namespace gradual
{

namespace
{

// ============================================================================
// Relation engine
// ============================================================================

/**
 * Consistency and join with a shared assumption set, so that unfolding
 * recursive types terminates.
 */
class TypeRelation
{
public:
  TypeRelation(TypeContext & types, const Ctx & ctx) : types_(types), ctx_(ctx) {}

  bool consistent(const Type * a, const Type * b)
  {
    if (a == b) return true;
    if (a->is_unknown() || b->is_unknown()) return true;

    // Aliases
    if (a->kind == TypeKind::Var && b->kind == TypeKind::Var && a->name == b->name) return true;
    if (const Type * def = alias_of(a)) return assume(a, b) || consistent(def, b);
    if (const Type * def = alias_of(b)) return assume(a, b) || consistent(a, def);

    // Recursive types
    if (a->kind == TypeKind::Rec && b->kind == TypeKind::Rec) {
      if (assume(a, b)) return true;
      return consistent(a->lhs, rename(b, a->name));
    }
    if (a->kind == TypeKind::Rec) return assume(a, b) || consistent(unfold_rec(types_, a), b);
    if (b->kind == TypeKind::Rec) return assume(a, b) || consistent(a, unfold_rec(types_, b));

    if (a->kind != b->kind) return false;

    switch (a->kind) {
      case TypeKind::Int:
      case TypeKind::Float:
      case TypeKind::Bool:
      case TypeKind::String:
        return true;
      case TypeKind::Arrow:
        return consistent(a->lhs, b->lhs) && consistent(a->rhs, b->rhs);
      case TypeKind::List:
        return consistent(a->lhs, b->lhs);
      case TypeKind::Prod:
        if (a->elements.size() != b->elements.size()) return false;
        for (size_t i = 0; i < a->elements.size(); ++i) {
          if (!consistent(a->elements[i], b->elements[i])) return false;
        }
        return true;
      case TypeKind::Sum:
        if (a->variants.size() != b->variants.size()) return false;
        for (size_t i = 0; i < a->variants.size(); ++i) {
          const auto & va = a->variants[i];
          const auto & vb = b->variants[i];
          if (va.tag != vb.tag) return false;
          if ((va.arg == nullptr) != (vb.arg == nullptr)) return false;
          if (va.arg && !consistent(va.arg, vb.arg)) return false;
        }
        return true;
      case TypeKind::Var:
        // Distinct abstract type variables
        return false;
      case TypeKind::Unknown:
      case TypeKind::Rec:
        break;
    }
    return false;
  }

  const Type * join(const Type * a, const Type * b)
  {
    if (a->is_unknown() && b->is_unknown()) {
      return (a->is_synswitch() && b->is_synswitch()) ? types_.synswitch_type()
                                                      : types_.unknown_type();
    }
    if (a->is_unknown()) return b;
    if (b->is_unknown()) return a;
    if (a == b) return a;

    // Aliases: keep the alias name when it is already the most specific
    if (a->kind == TypeKind::Var && b->kind == TypeKind::Var && a->name == b->name) return a;
    if (const Type * def = alias_of(a)) {
      const Type * j = join(def, b);
      return (j == def) ? a : j;
    }
    if (const Type * def = alias_of(b)) {
      const Type * j = join(a, def);
      return (j == def) ? b : j;
    }

    // Recursive types
    if (a->kind == TypeKind::Rec && b->kind == TypeKind::Rec) {
      const Type * body = join(a->lhs, rename(b, a->name));
      return body ? types_.get_rec_type(a->name, body) : nullptr;
    }
    if (a->kind == TypeKind::Rec || b->kind == TypeKind::Rec) {
      const Type * rec = (a->kind == TypeKind::Rec) ? a : b;
      return consistent(a, b) ? rec : nullptr;
    }

    if (a->kind != b->kind) return nullptr;

    switch (a->kind) {
      case TypeKind::Int:
      case TypeKind::Float:
      case TypeKind::Bool:
      case TypeKind::String:
        return a;
      case TypeKind::Arrow: {
        const Type * param = join(a->lhs, b->lhs);
        const Type * result = param ? join(a->rhs, b->rhs) : nullptr;
        return result ? types_.get_arrow_type(param, result) : nullptr;
      }
      case TypeKind::List: {
        const Type * elem = join(a->lhs, b->lhs);
        return elem ? types_.get_list_type(elem) : nullptr;
      }
      case TypeKind::Prod: {
        if (a->elements.size() != b->elements.size()) return nullptr;
        std::vector<const Type *> elems;
        elems.reserve(a->elements.size());
        for (size_t i = 0; i < a->elements.size(); ++i) {
          const Type * e = join(a->elements[i], b->elements[i]);
          if (!e) return nullptr;
          elems.push_back(e);
        }
        return types_.get_prod_type(elems);
      }
      case TypeKind::Sum: {
        if (a->variants.size() != b->variants.size()) return nullptr;
        std::vector<SumEntry> entries;
        entries.reserve(a->variants.size());
        for (size_t i = 0; i < a->variants.size(); ++i) {
          const auto & va = a->variants[i];
          const auto & vb = b->variants[i];
          if (va.tag != vb.tag) return nullptr;
          if ((va.arg == nullptr) != (vb.arg == nullptr)) return nullptr;
          const Type * arg = nullptr;
          if (va.arg) {
            arg = join(va.arg, vb.arg);
            if (!arg) return nullptr;
          }
          entries.push_back(SumEntry{va.tag, arg});
        }
        return types_.get_sum_type(std::move(entries));
      }
      case TypeKind::Var:
        return nullptr;
      case TypeKind::Unknown:
      case TypeKind::Rec:
        break;
    }
    return nullptr;
  }

private:
  const Type * alias_of(const Type * t) const noexcept
  {
    if (t->kind != TypeKind::Var) return nullptr;
    return ctx_.lookup_alias(t->name);
  }

  /// Body of `rec` with its binder renamed to `name`
  const Type * rename(const Type * rec, std::string_view name)
  {
    if (rec->name == name) return rec->lhs;
    return subst(types_, types_.get_var_type(name), rec->name, rec->lhs);
  }

  /// Record the pair; true if it was already assumed
  bool assume(const Type * a, const Type * b)
  {
    return !assumed_.insert({a, b}).second;
  }

  TypeContext & types_;
  const Ctx & ctx_;
  std::set<std::pair<const Type *, const Type *>> assumed_;
};

// ============================================================================
// Structural rebuild helper
// ============================================================================

/**
 * Rebuild `ty` bottom-up, letting `leaf` replace Unknown and Var nodes.
 * `bound` tracks Rec binders in scope.
 */
template <typename Leaf>
const Type * rebuild(
  TypeContext & types, const Type * ty, std::vector<std::string_view> & bound, Leaf && leaf)
{
  switch (ty->kind) {
    case TypeKind::Unknown:
    case TypeKind::Var:
      return leaf(ty, bound);
    case TypeKind::Int:
    case TypeKind::Float:
    case TypeKind::Bool:
    case TypeKind::String:
      return ty;
    case TypeKind::Arrow: {
      const Type * p = rebuild(types, ty->lhs, bound, leaf);
      const Type * r = rebuild(types, ty->rhs, bound, leaf);
      return (p == ty->lhs && r == ty->rhs) ? ty : types.get_arrow_type(p, r);
    }
    case TypeKind::List: {
      const Type * e = rebuild(types, ty->lhs, bound, leaf);
      return (e == ty->lhs) ? ty : types.get_list_type(e);
    }
    case TypeKind::Prod: {
      bool changed = false;
      std::vector<const Type *> elems;
      elems.reserve(ty->elements.size());
      for (const Type * e : ty->elements) {
        elems.push_back(rebuild(types, e, bound, leaf));
        changed = changed || elems.back() != e;
      }
      return changed ? types.get_prod_type(elems) : ty;
    }
    case TypeKind::Sum: {
      bool changed = false;
      std::vector<SumEntry> entries;
      entries.reserve(ty->variants.size());
      for (const auto & v : ty->variants) {
        const Type * arg = v.arg ? rebuild(types, v.arg, bound, leaf) : nullptr;
        changed = changed || arg != v.arg;
        entries.push_back(SumEntry{v.tag, arg});
      }
      return changed ? types.get_sum_type(std::move(entries)) : ty;
    }
    case TypeKind::Rec: {
      bound.push_back(ty->name);
      const Type * body = rebuild(types, ty->lhs, bound, leaf);
      bound.pop_back();
      return (body == ty->lhs) ? ty : types.get_rec_type(ty->name, body);
    }
  }
  return ty;
}

bool is_bound(const std::vector<std::string_view> & bound, std::string_view name)
{
  return std::find(bound.begin(), bound.end(), name) != bound.end();
}

void collect_free_vars(
  const Type * ty, std::vector<std::string_view> & bound, std::vector<std::string_view> & out)
{
  switch (ty->kind) {
    case TypeKind::Var:
      if (!is_bound(bound, ty->name) && !is_bound(out, ty->name)) {
        out.push_back(ty->name);
      }
      break;
    case TypeKind::Arrow:
      collect_free_vars(ty->lhs, bound, out);
      collect_free_vars(ty->rhs, bound, out);
      break;
    case TypeKind::List:
      collect_free_vars(ty->lhs, bound, out);
      break;
    case TypeKind::Prod:
      for (const Type * e : ty->elements) collect_free_vars(e, bound, out);
      break;
    case TypeKind::Sum:
      for (const auto & v : ty->variants) {
        if (v.arg) collect_free_vars(v.arg, bound, out);
      }
      break;
    case TypeKind::Rec:
      bound.push_back(ty->name);
      collect_free_vars(ty->lhs, bound, out);
      bound.pop_back();
      break;
    default:
      break;
  }
}

}  // namespace

// ============================================================================
// Consistency and Join
// ============================================================================

bool consistent(TypeContext & types, const Ctx & ctx, const Type * lhs, const Type * rhs)
{
  TypeRelation rel(types, ctx);
  return rel.consistent(lhs, rhs);
}

const Type * join(TypeContext & types, const Ctx & ctx, const Type * lhs, const Type * rhs)
{
  TypeRelation rel(types, ctx);
  return rel.join(lhs, rhs);
}

const Type * join_all(TypeContext & types, const Ctx & ctx, const std::vector<const Type *> & tys)
{
  if (tys.empty()) return nullptr;

  TypeRelation rel(types, ctx);
  const Type * acc = tys.front();
  for (size_t i = 1; i < tys.size(); ++i) {
    acc = rel.join(acc, tys[i]);
    if (!acc) return nullptr;
  }
  return acc;
}

// ============================================================================
// Normalization
// ============================================================================

const Type * weak_head_normalize(const Ctx & ctx, const Type * ty) noexcept
{
  // Alias definitions are normalized when bound, so chains are short; the
  // hop bound only guards against malformed contexts.
  size_t hops = ctx.size() + 1;
  while (ty->kind == TypeKind::Var && hops-- > 0) {
    const Type * def = ctx.lookup_alias(ty->name);
    if (!def) break;
    ty = def;
  }
  return ty;
}

const Type * head_normalize(TypeContext & types, const Ctx & ctx, const Type * ty)
{
  ty = weak_head_normalize(ctx, ty);
  // rec t. t unfolds to itself; a few rounds settle every other case
  for (int round = 0; round < 8 && ty->kind == TypeKind::Rec; ++round) {
    const Type * next = weak_head_normalize(ctx, unfold_rec(types, ty));
    if (next == ty) break;
    ty = next;
  }
  return ty;
}

const Type * normalize(TypeContext & types, const Ctx & ctx, const Type * ty)
{
  std::vector<std::string_view> bound;
  return rebuild(
    types, ty, bound, [&ctx](const Type * leaf, const std::vector<std::string_view> & b) {
      if (leaf->kind != TypeKind::Var || is_bound(b, leaf->name)) return leaf;
      const Type * def = ctx.lookup_alias(leaf->name);
      return def ? def : leaf;
    });
}

const Type * unfold_rec(TypeContext & types, const Type * rec)
{
  if (rec->kind != TypeKind::Rec) return rec;
  return subst(types, rec, rec->name, rec->lhs);
}

// ============================================================================
// Decomposition
// ============================================================================

ArrowParts matched_arrow(TypeContext & types, const Ctx & ctx, const Type * ty)
{
  ty = head_normalize(types, ctx, ty);
  if (ty->kind == TypeKind::Arrow) {
    return {ty->lhs, ty->rhs};
  }
  if (ty->is_synswitch()) {
    return {types.synswitch_type(), types.synswitch_type()};
  }
  return {types.unknown_type(), types.unknown_type()};
}

const Type * matched_list(TypeContext & types, const Ctx & ctx, const Type * ty)
{
  ty = head_normalize(types, ctx, ty);
  if (ty->kind == TypeKind::List) {
    return ty->lhs;
  }
  if (ty->is_synswitch()) {
    return types.synswitch_type();
  }
  return types.unknown_type();
}

std::vector<const Type *> matched_prod(
  TypeContext & types, const Ctx & ctx, const Type * ty, size_t arity)
{
  ty = head_normalize(types, ctx, ty);
  if (ty->kind == TypeKind::Prod && ty->elements.size() == arity) {
    return {ty->elements.begin(), ty->elements.end()};
  }
  const Type * fill = ty->is_synswitch() ? types.synswitch_type() : types.unknown_type();
  return std::vector<const Type *>(arity, fill);
}

bool is_arrow_compatible(const Ctx & ctx, const Type * ty) noexcept
{
  ty = weak_head_normalize(ctx, ty);
  if (ty->kind == TypeKind::Rec) {
    // rec t. (a -> t) and friends
    ty = ty->lhs;
  }
  return ty->kind == TypeKind::Arrow || ty->is_unknown();
}

// ============================================================================
// Variables
// ============================================================================

std::vector<std::string_view> free_vars(const Type * ty)
{
  std::vector<std::string_view> bound;
  std::vector<std::string_view> out;
  collect_free_vars(ty, bound, out);
  return out;
}

bool is_free_in(std::string_view name, const Type * ty)
{
  const auto vars = free_vars(ty);
  return std::find(vars.begin(), vars.end(), name) != vars.end();
}

const Type * subst(
  TypeContext & types, const Type * replacement, std::string_view name, const Type * ty)
{
  std::vector<std::string_view> bound;
  return rebuild(
    types, ty, bound,
    [replacement, name](const Type * leaf, const std::vector<std::string_view> & b) {
      if (leaf->kind == TypeKind::Var && leaf->name == name && !is_bound(b, name)) {
        return replacement;
      }
      return leaf;
    });
}

// ============================================================================
// SynSwitch
// ============================================================================

const Type * strip_synswitch(TypeContext & types, const Type * ty)
{
  if (!contains_synswitch(ty)) return ty;

  std::vector<std::string_view> bound;
  return rebuild(
    types, ty, bound, [&types](const Type * leaf, const std::vector<std::string_view> &) {
      return leaf->is_synswitch() ? types.unknown_type() : leaf;
    });
}

bool contains_synswitch(const Type * ty) noexcept
{
  switch (ty->kind) {
    case TypeKind::Unknown:
      return ty->is_synswitch();
    case TypeKind::Arrow:
      return contains_synswitch(ty->lhs) || contains_synswitch(ty->rhs);
    case TypeKind::List:
    case TypeKind::Rec:
      return contains_synswitch(ty->lhs);
    case TypeKind::Prod:
      return std::any_of(ty->elements.begin(), ty->elements.end(), [](const Type * e) {
        return contains_synswitch(e);
      });
    case TypeKind::Sum:
      return std::any_of(ty->variants.begin(), ty->variants.end(), [](const SumEntry & v) {
        return v.arg != nullptr && contains_synswitch(v.arg);
      });
    default:
      return false;
  }
}

// ============================================================================
// Rendering
// ============================================================================

namespace
{

/// Types that need parentheses as an arrow parameter or list element
bool needs_parens(const Type * ty)
{
  return ty->kind == TypeKind::Arrow || ty->kind == TypeKind::Sum || ty->kind == TypeKind::Rec;
}

std::string to_string_atom(const Type * ty)
{
  return needs_parens(ty) ? fmt::format("({})", to_string(ty)) : to_string(ty);
}

}  // namespace

std::string to_string(const Type * type)
{
  if (!type) return "<null>";

  switch (type->kind) {
    case TypeKind::Unknown:
      return "?";
    case TypeKind::Int:
      return "Int";
    case TypeKind::Float:
      return "Float";
    case TypeKind::Bool:
      return "Bool";
    case TypeKind::String:
      return "String";
    case TypeKind::Arrow:
      return fmt::format("{} -> {}", to_string_atom(type->lhs), to_string(type->rhs));
    case TypeKind::List:
      return fmt::format("[{}]", to_string(type->lhs));
    case TypeKind::Prod: {
      std::vector<std::string> parts;
      parts.reserve(type->elements.size());
      for (const Type * e : type->elements) parts.push_back(to_string(e));
      return fmt::format("({})", fmt::join(parts, ", "));
    }
    case TypeKind::Sum: {
      std::string out;
      for (const auto & v : type->variants) {
        if (!out.empty()) out += ' ';
        out += v.arg ? fmt::format("+ {}({})", v.tag, to_string(v.arg)) : fmt::format("+ {}", v.tag);
      }
      return out.empty() ? std::string("+") : out;
    }
    case TypeKind::Var:
      return std::string(type->name);
    case TypeKind::Rec:
      return fmt::format("rec {}. {}", type->name, to_string(type->lhs));
  }
  return "?";
}

}  // namespace gradual
