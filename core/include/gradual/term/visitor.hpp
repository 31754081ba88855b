// gradual/term/visitor.hpp - CRTP Visitor pattern for term traversal
//
#pragma once

#include <type_traits>

#include "gradual/basic/casting.hpp"
#include "gradual/term/term.hpp"
#include "gradual/term/term_enums.hpp"

namespace gradual
{

namespace detail
{

/// Helper to propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

/**
 * CRTP-based visitor over terms of every sort.
 *
 * The derived class implements visit_<snake_case kind> for the nodes it
 * cares about. Unhandled nodes fall back to the sort-level method
 * (visit_exp, visit_pat, ...) and then to visit_term.
 *
 * @code
 *   class CountVars : public ConstTermVisitor<CountVars, int> {
 *   public:
 *     int visit_var_exp(const VarExp *) { return 1; }
 *     int visit_term(const Term *) { return 0; }
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT Term * or const Term *
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = Term *>
class TermVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  /// Visit a node, dispatching on its kind. A null node yields ReturnType().
  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define TERM_NODE_EXP(Class, Kind, Snake) \
  case TermKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define TERM_NODE_RUL(Class, Kind, Snake) \
  case TermKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define TERM_NODE_PAT(Class, Kind, Snake) \
  case TermKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define TERM_NODE_TYP(Class, Kind, Snake) \
  case TermKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define TERM_NODE_TPAT(Class, Kind, Snake) \
  case TermKind::Kind:                     \
    return get_derived().visit_##Snake(cast<Class>(node));
#define TERM_NODE_VARIANT(Class, Kind, Snake) \
  case TermKind::Kind:                        \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "gradual/term/term_nodes.def"
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default per-kind methods
  // ===========================================================================

#define TERM_NODE_EXP(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_exp(node);                                   \
  }
#define TERM_NODE_RUL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_term(node);                                  \
  }
#define TERM_NODE_PAT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_pat(node);                                   \
  }
#define TERM_NODE_TYP(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_typ(node);                                   \
  }
#define TERM_NODE_TPAT(Class, Kind, Snake)                                  \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_tpat(node);                                  \
  }
#define TERM_NODE_VARIANT(Class, Kind, Snake)                               \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_term(node);                                  \
  }
#include "gradual/term/term_nodes.def"

  // ===========================================================================
  // Sort-level methods
  // ===========================================================================

  ReturnType visit_exp(detail::propagate_const_t<NodePtrT, Exp> node)
  {
    return get_derived().visit_term(node);
  }
  ReturnType visit_pat(detail::propagate_const_t<NodePtrT, Pat> node)
  {
    return get_derived().visit_term(node);
  }
  ReturnType visit_typ(detail::propagate_const_t<NodePtrT, TypeTerm> node)
  {
    return get_derived().visit_term(node);
  }
  ReturnType visit_tpat(detail::propagate_const_t<NodePtrT, TPat> node)
  {
    return get_derived().visit_term(node);
  }

  ReturnType visit_term(NodePtrT /*node*/) { return ReturnType(); }
};

/// Convenience alias for read-only traversal
template <typename Derived, typename ReturnType = void>
using ConstTermVisitor = TermVisitor<Derived, ReturnType, const Term *>;

}  // namespace gradual
