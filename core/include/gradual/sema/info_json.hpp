// gradual/sema/info_json.hpp - JSON export of statics results
//
#pragma once

#include <nlohmann/json.hpp>

#include "gradual/sema/info_map.hpp"

namespace gradual
{

/**
 * Serialize an info map.
 *
 * @code
 *   {"root": 1, "entries": [
 *     {"id": 1, "kind": "exp", "cls": "LetExp", "status": "ok", "error": false,
 *      "mode": "syn", "self": "Int", "ty": "Int", "ctx": ["abs", ...]},
 *     ...]}
 * @endcode
 *
 * Entries are ordered by ascending id, so the output does not depend on
 * the traversal order. Types are rendered with to_string().
 */
[[nodiscard]] nlohmann::json to_json(const InfoMap & map);

/// JSON form of one record, as it appears in the "entries" array
[[nodiscard]] nlohmann::json to_json(const InfoMap & map, Id id);

}  // namespace gradual
