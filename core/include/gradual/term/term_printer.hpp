// gradual/term/term_printer.hpp - One-line concrete syntax of terms
//
#pragma once

#include <cstddef>
#include <string>

#include "gradual/term/term.hpp"

namespace gradual
{

/**
 * Render a term of any sort on one line, e.g. `let f = fun x -> x + 1 in f(2)`.
 *
 * Parentheses appear only where the tree has a Parens node.
 */
[[nodiscard]] std::string print_term(const Term * term);

/// print_term() cut to at most `max_width` characters, ending in "..." when cut
[[nodiscard]] std::string print_term(const Term * term, size_t max_width);

}  // namespace gradual
