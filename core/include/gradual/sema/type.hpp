// gradual/sema/type.hpp - Semantic type representation
//
// Represents the semantic types assigned by the statics engine.
// Types are interned by TypeContext: two types are structurally equal
// exactly when their pointers are equal.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <gsl/span>
#include <memory_resource>
#include <mutex>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace gradual
{

// ============================================================================
// Type Kind
// ============================================================================

/**
 * Kind of semantic type.
 */
enum class TypeKind : uint8_t {
  Unknown,  ///< ? - a gap in type information

  // Primitive types
  Int,
  Float,
  Bool,
  String,

  // Composite types
  Arrow,  ///< t1 -> t2
  Prod,   ///< (t1, ..., tn); the unit type when empty
  Sum,    ///< + A + B(t)
  List,   ///< [t]

  // Named types
  Var,  ///< reference to a bound type variable
  Rec,  ///< rec name. t
};

/**
 * Where an unknown type came from.
 */
enum class TypeProvenance : uint8_t {
  Internal,   ///< a genuine gap (a hole, an error, a missing annotation)
  SynSwitch,  ///< marker: switch the position from analysis to synthesis
};

struct Type;

/**
 * One constructor of a sum type.
 */
struct SumEntry
{
  std::string_view tag;
  const Type * arg = nullptr;  ///< nullptr for a nullary constructor
};

// ============================================================================
// Type
// ============================================================================

/**
 * Semantic type representation.
 *
 * Unlike TypeTerm (syntactic representation), Type is the resolved
 * meaning of a surface type after name resolution.
 */
struct Type
{
  TypeKind kind;

  /// For Unknown: provenance
  TypeProvenance provenance = TypeProvenance::Internal;

  /// For Arrow: parameter type. For List: element type. For Rec: body.
  const Type * lhs = nullptr;

  /// For Arrow: result type
  const Type * rhs = nullptr;

  /// For Prod: component types
  gsl::span<const Type * const> elements;

  /// For Sum: constructors, sorted by tag
  gsl::span<const SumEntry> variants;

  /// For Var and Rec: type variable name
  std::string_view name;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_unknown() const noexcept { return kind == TypeKind::Unknown; }

  [[nodiscard]] bool is_synswitch() const noexcept
  {
    return kind == TypeKind::Unknown && provenance == TypeProvenance::SynSwitch;
  }

  [[nodiscard]] bool is_unit() const noexcept
  {
    return kind == TypeKind::Prod && elements.empty();
  }

  [[nodiscard]] bool is_primitive() const noexcept
  {
    return kind == TypeKind::Int || kind == TypeKind::Float || kind == TypeKind::Bool ||
           kind == TypeKind::String;
  }

  /// Constructor entry of a sum type, or nullptr
  [[nodiscard]] const SumEntry * find_variant(std::string_view tag) const noexcept
  {
    for (const auto & v : variants) {
      if (v.tag == tag) return &v;
    }
    return nullptr;
  }
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Type context for interning and managing semantic types.
 *
 * Provides singleton instances for primitive types and creates interned
 * composite types on demand. All methods are safe to call from several
 * threads; the returned pointers stay valid for the lifetime of the
 * context.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Built-in Types (Singletons)
  // ===========================================================================

  [[nodiscard]] const Type * int_type() const noexcept { return &int_; }
  [[nodiscard]] const Type * float_type() const noexcept { return &float_; }
  [[nodiscard]] const Type * bool_type() const noexcept { return &bool_; }
  [[nodiscard]] const Type * string_type() const noexcept { return &string_; }
  [[nodiscard]] const Type * unit_type() const noexcept { return &unit_; }
  [[nodiscard]] const Type * unknown_type() const noexcept { return &unknown_; }
  [[nodiscard]] const Type * synswitch_type() const noexcept { return &synswitch_; }

  [[nodiscard]] const Type * unknown(TypeProvenance p) const noexcept
  {
    return p == TypeProvenance::SynSwitch ? &synswitch_ : &unknown_;
  }

  // ===========================================================================
  // Composite Type Creation (Interned)
  // ===========================================================================

  /// Get arrow type: param -> result
  const Type * get_arrow_type(const Type * param, const Type * result);

  /// Get product type: (t1, ..., tn)
  const Type * get_prod_type(const std::vector<const Type *> & elements);

  /// Get list type: [t]
  const Type * get_list_type(const Type * element);

  /// Get sum type. Entries are sorted by tag; for a repeated tag the
  /// first entry wins.
  const Type * get_sum_type(std::vector<SumEntry> variants);

  /// Get type variable reference
  const Type * get_var_type(std::string_view name);

  /// Get recursive type: rec name. body
  const Type * get_rec_type(std::string_view name, const Type * body);

  // ===========================================================================
  // Strings
  // ===========================================================================

  /// Intern a name so it outlives the term it was read from
  std::string_view intern(std::string_view s);

  [[nodiscard]] size_t composite_count() const;

private:
  struct ShapeHash
  {
    size_t operator()(const Type * t) const noexcept;
  };
  struct ShapeEqual
  {
    bool operator()(const Type * a, const Type * b) const noexcept;
  };

  const Type * intern_type(const Type & shape);
  std::string_view intern_locked(std::string_view s);

  // Built-in type singletons
  Type int_, float_, bool_, string_;
  Type unit_;
  Type unknown_, synswitch_;

  mutable std::mutex mutex_;

  // Arena for composite types and their component arrays
  std::pmr::monotonic_buffer_resource arena_{4096};
  // NOTE: pointers to interned composite types are handed out widely.
  // We must use a container with stable element addresses.
  std::pmr::deque<Type> composite_types_{&arena_};
  std::unordered_set<const Type *, ShapeHash, ShapeEqual> index_;
  std::pmr::unordered_set<std::string_view> strings_{&arena_};
};

}  // namespace gradual
