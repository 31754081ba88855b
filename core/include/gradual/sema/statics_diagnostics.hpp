// gradual/sema/statics_diagnostics.hpp - Diagnostics from statics results
//
#pragma once

#include "gradual/basic/diagnostic.hpp"
#include "gradual/sema/info_map.hpp"

namespace gradual
{

struct CollectOptions
{
  /// Report variable patterns whose binding is never used
  bool warn_unused = true;
};

/**
 * Report the errors recorded in `map` into `bag`.
 *
 * One diagnostic per record (not per id), in ascending id order:
 * - in-hole expressions and patterns (E0001-E0005)
 * - type, type pattern and sum entry errors (E0006-E0010)
 * - invalid fragments, except whitespace-only ones (E0011)
 * - unused bindings as warnings (W0001), when enabled
 */
void collect_diagnostics(const InfoMap & map, DiagnosticBag & bag, const CollectOptions & options = {});

}  // namespace gradual
