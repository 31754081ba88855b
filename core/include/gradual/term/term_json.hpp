// gradual/term/term_json.hpp - JSON term files
//
// The term format read by gstat. Every node is an object with a "kind"
// (the node class name, e.g. "LetExp"), an "ids" array of positive
// integers and the node's fields:
//
//   {"kind": "LetExp", "ids": [1],
//    "pat":  {"kind": "VarPat", "ids": [2], "name": "x"},
//    "def":  {"kind": "IntExp", "ids": [3], "value": 1},
//    "body": {"kind": "VarExp", "ids": [4], "name": "x"}}
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "gradual/term/term.hpp"
#include "gradual/term/term_context.hpp"

namespace gradual
{

/**
 * Result of reading a term.
 */
struct TermLoadResult
{
  /// Root of the loaded term (only valid if success == true)
  const Term * term = nullptr;

  bool success = false;

  /// Error message if loading failed, naming the offending JSON path
  std::string error;

  static TermLoadResult ok(const Term * root)
  {
    TermLoadResult r;
    r.term = root;
    r.success = true;
    return r;
  }

  static TermLoadResult fail(std::string msg)
  {
    TermLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Build a term from its JSON form. Nodes and strings are allocated in `ctx`.
 * A malformed document is reported through the result, never thrown.
 */
[[nodiscard]] TermLoadResult term_from_json(const nlohmann::json & j, TermContext & ctx);

/// Parse and load a JSON term file
[[nodiscard]] TermLoadResult load_term_file(const std::filesystem::path & path, TermContext & ctx);

/// JSON form of a term, accepted back by term_from_json()
[[nodiscard]] nlohmann::json to_json(const Term * term);

}  // namespace gradual
