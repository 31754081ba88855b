// gradual/sema/session.cpp - Memoized statics entry point
//
#include "gradual/sema/session.hpp"

#include <utility>

#include "gradual/sema/statics.hpp"
#include "gradual/term/term_context.hpp"
#include "gradual/term/term_utils.hpp"

namespace gradual
{

StaticsSession::StaticsSession(SessionOptions options)
: options_(options), cache_(options.cache_capacity)
{
  type_table_.register_builtins(types_);
  if (options_.builtins) {
    initial_ctx_ = builtin_ctx(types_, type_table_);
  }
}

std::shared_ptr<const InfoMap> StaticsSession::compute(const Term * term)
{
  if (auto cached = cache_.lookup(term)) {
    return cached;
  }

  // The traversal runs outside the cache lock
  auto terms = std::make_unique<TermContext>();
  const Term * root = clone_term(term, *terms);
  auto map = std::make_shared<InfoMap>(types_, std::move(terms), root);
  Statics statics(types_, type_table_, *map);
  statics.check_root(initial_ctx_, root);

  return cache_.insert(std::move(map));
}

std::unique_ptr<InfoMap> StaticsSession::compute_uncached(const Term * term)
{
  auto map = std::make_unique<InfoMap>(types_, term);
  Statics statics(types_, type_table_, *map);
  statics.check_root(initial_ctx_, term);
  return map;
}

}  // namespace gradual
