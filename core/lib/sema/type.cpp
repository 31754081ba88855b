// gradual/sema/type.cpp - Type context implementation
//
#include "gradual/sema/type.hpp"

#include <algorithm>
#include <cstring>
#include <functional>

namespace gradual
{

namespace
{

void hash_combine(size_t & seed, size_t value) noexcept
{
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

}  // namespace

// ============================================================================
// Shape hashing (children are already interned: compare by pointer)
// ============================================================================

size_t TypeContext::ShapeHash::operator()(const Type * t) const noexcept
{
  size_t seed = std::hash<int>{}(static_cast<int>(t->kind));
  hash_combine(seed, std::hash<const Type *>{}(t->lhs));
  hash_combine(seed, std::hash<const Type *>{}(t->rhs));
  hash_combine(seed, std::hash<std::string_view>{}(t->name));
  for (const Type * e : t->elements) {
    hash_combine(seed, std::hash<const Type *>{}(e));
  }
  for (const auto & v : t->variants) {
    hash_combine(seed, std::hash<std::string_view>{}(v.tag));
    hash_combine(seed, std::hash<const Type *>{}(v.arg));
  }
  return seed;
}

bool TypeContext::ShapeEqual::operator()(const Type * a, const Type * b) const noexcept
{
  if (a->kind != b->kind || a->lhs != b->lhs || a->rhs != b->rhs || a->name != b->name) {
    return false;
  }
  if (!std::equal(a->elements.begin(), a->elements.end(), b->elements.begin(), b->elements.end())) {
    return false;
  }
  return std::equal(
    a->variants.begin(), a->variants.end(), b->variants.begin(), b->variants.end(),
    [](const SumEntry & x, const SumEntry & y) { return x.tag == y.tag && x.arg == y.arg; });
}

// ============================================================================
// TypeContext Implementation
// ============================================================================

TypeContext::TypeContext()
{
  int_ = Type{TypeKind::Int};
  float_ = Type{TypeKind::Float};
  bool_ = Type{TypeKind::Bool};
  string_ = Type{TypeKind::String};
  unit_ = Type{TypeKind::Prod};

  unknown_ = Type{TypeKind::Unknown};
  synswitch_ = Type{TypeKind::Unknown};
  synswitch_.provenance = TypeProvenance::SynSwitch;
}

const Type * TypeContext::intern_type(const Type & shape)
{
  const std::lock_guard<std::mutex> lock(mutex_);

  auto it = index_.find(&shape);
  if (it != index_.end()) {
    return *it;
  }

  // Create new: component arrays move into the arena
  Type new_type = shape;
  new_type.name = intern_locked(shape.name);
  if (!shape.elements.empty()) {
    auto * mem = static_cast<const Type **>(
      arena_.allocate(sizeof(const Type *) * shape.elements.size(), alignof(const Type *)));
    std::copy(shape.elements.begin(), shape.elements.end(), mem);
    new_type.elements = gsl::span<const Type * const>(mem, shape.elements.size());
  }
  if (!shape.variants.empty()) {
    auto * mem = static_cast<SumEntry *>(
      arena_.allocate(sizeof(SumEntry) * shape.variants.size(), alignof(SumEntry)));
    for (size_t i = 0; i < shape.variants.size(); ++i) {
      new (&mem[i]) SumEntry{intern_locked(shape.variants[i].tag), shape.variants[i].arg};
    }
    new_type.variants = gsl::span<const SumEntry>(mem, shape.variants.size());
  }

  composite_types_.push_back(new_type);
  const Type * stored = &composite_types_.back();
  index_.insert(stored);
  return stored;
}

const Type * TypeContext::get_arrow_type(const Type * param, const Type * result)
{
  Type shape{TypeKind::Arrow};
  shape.lhs = param;
  shape.rhs = result;
  return intern_type(shape);
}

const Type * TypeContext::get_prod_type(const std::vector<const Type *> & elements)
{
  if (elements.empty()) {
    return &unit_;
  }
  Type shape{TypeKind::Prod};
  shape.elements = gsl::span<const Type * const>(elements.data(), elements.size());
  return intern_type(shape);
}

const Type * TypeContext::get_list_type(const Type * element)
{
  Type shape{TypeKind::List};
  shape.lhs = element;
  return intern_type(shape);
}

const Type * TypeContext::get_sum_type(std::vector<SumEntry> variants)
{
  std::stable_sort(variants.begin(), variants.end(), [](const SumEntry & a, const SumEntry & b) {
    return a.tag < b.tag;
  });
  variants.erase(
    std::unique(
      variants.begin(), variants.end(),
      [](const SumEntry & a, const SumEntry & b) { return a.tag == b.tag; }),
    variants.end());

  Type shape{TypeKind::Sum};
  shape.variants = gsl::span<const SumEntry>(variants.data(), variants.size());
  return intern_type(shape);
}

const Type * TypeContext::get_var_type(std::string_view name)
{
  Type shape{TypeKind::Var};
  shape.name = name;
  return intern_type(shape);
}

const Type * TypeContext::get_rec_type(std::string_view name, const Type * body)
{
  Type shape{TypeKind::Rec};
  shape.name = name;
  shape.lhs = body;
  return intern_type(shape);
}

std::string_view TypeContext::intern(std::string_view s)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return intern_locked(s);
}

std::string_view TypeContext::intern_locked(std::string_view s)
{
  if (s.empty()) return {};

  auto it = strings_.find(s);
  if (it != strings_.end()) {
    return *it;
  }

  char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
  std::memcpy(ptr, s.data(), s.size());
  const std::string_view stored(ptr, s.size());
  strings_.insert(stored);
  return stored;
}

size_t TypeContext::composite_count() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return composite_types_.size();
}

}  // namespace gradual
