// gradual/sema/info_map.hpp - Id-indexed statics table
//
// The result of one traversal: every id reachable from the root maps to
// the record of the term carrying it. Multi-id terms share one record.
//
#pragma once

#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

#include <gsl/span>

#include "gradual/basic/id.hpp"
#include "gradual/sema/info.hpp"
#include "gradual/sema/mode.hpp"
#include "gradual/sema/type.hpp"
#include "gradual/term/term.hpp"
#include "gradual/term/term_context.hpp"

namespace gradual
{

/**
 * Id → Info table produced by one statics traversal.
 *
 * The map may own the term it describes (a session clones the caller's
 * term so that a cached map never dangles). Types in the records are
 * interned in a TypeContext that must outlive the map.
 */
class InfoMap
{
public:
  using Storage = std::unordered_map<Id, std::shared_ptr<const Info>>;

  /// Map over a term owned elsewhere
  InfoMap(TypeContext & types, const Term * root) : types_(&types), root_(root) {}

  /// Map owning the term arena `terms`, whose tree is rooted at `root`
  InfoMap(TypeContext & types, std::unique_ptr<TermContext> terms, const Term * root)
  : types_(&types), terms_(std::move(terms)), root_(root)
  {
  }

  InfoMap(const InfoMap &) = delete;
  InfoMap & operator=(const InfoMap &) = delete;

  // ===========================================================================
  // Construction
  // ===========================================================================

  /**
   * Record `info` under every id in `ids`.
   *
   * A term re-traversed with more information (e.g. a let pattern seen
   * again once the body is known) replaces its earlier record.
   */
  void insert(gsl::span<const Id> ids, const std::shared_ptr<const Info> & info);

  // ===========================================================================
  // Lookup
  // ===========================================================================

  /// Record of `id`, or nullptr
  [[nodiscard]] const Info * find(Id id) const noexcept;

  /// Record of `id`; throws InternalError if the id is missing
  [[nodiscard]] const Info & at(Id id) const;

  [[nodiscard]] bool contains(Id id) const noexcept { return entries_.count(id) != 0; }
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  /// All ids in ascending order
  [[nodiscard]] std::vector<Id> ids() const;

  [[nodiscard]] const Storage & entries() const noexcept { return entries_; }

  [[nodiscard]] const Term * root() const noexcept { return root_; }
  [[nodiscard]] TypeContext & types() const noexcept { return *types_; }

  /// Same ids mapped to records of the same content
  [[nodiscard]] bool same_statics(const InfoMap & other) const;

private:
  TypeContext * types_;
  std::unique_ptr<TermContext> terms_;
  const Term * root_;
  Storage entries_;
};

// ============================================================================
// Queries
// ============================================================================
//
// Types and modes returned here never contain a SynSwitch unknown. Asking
// an expression query about a non-expression (or a pattern query about a
// non-pattern) yields an internal Unknown, or Syn for modes.

/// Type an expression contributes to its parent
[[nodiscard]] const Type * exp_type_after_fix(const InfoMap & map, Id id);

/// Type an expression would have in isolation
[[nodiscard]] const Type * exp_self_type(const InfoMap & map, Id id);

[[nodiscard]] Mode exp_mode(const InfoMap & map, Id id);

[[nodiscard]] const Type * pat_type_after_fix(const InfoMap & map, Id id);
[[nodiscard]] const Type * pat_self_type(const InfoMap & map, Id id);
[[nodiscard]] Mode pat_mode(const InfoMap & map, Id id);

/**
 * Type the uses of a variable pattern's binding expect of it (see
 * join_uses). Unknown for other records and for unused bindings.
 */
[[nodiscard]] const Type * binding_use_type(const InfoMap & map, Id id);

/// Term carrying each id
[[nodiscard]] std::unordered_map<Id, const Term *> terms(const InfoMap & map);

/// is_error() of the record of `id`
[[nodiscard]] bool is_error(const InfoMap & map, Id id);

/// Ids whose record is an error, ascending
[[nodiscard]] std::vector<Id> error_ids(const InfoMap & map);

}  // namespace gradual
