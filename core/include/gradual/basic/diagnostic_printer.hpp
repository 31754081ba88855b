// gradual/basic/diagnostic_printer.hpp
//
// Renders diagnostics in Rust style. Where a compiler shows a source line,
// the printer shows the node id in the gutter and the node printed on one
// line.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <unordered_map>

#include "gradual/basic/diagnostic.hpp"
#include "gradual/basic/id.hpp"
#include "gradual/term/term.hpp"

namespace gradual
{

/// Term carrying each id, used to render labels
using NodeIndex = std::unordered_map<Id, const Term *>;

enum class ColorOutput : uint8_t {
  Auto,    ///< color when the stream is a terminal
  Always,  ///< color even when redirected
  Never,
};

/**
 * Prints diagnostics in Rust-style format:
 *
 *   error[E0005]: expected Int, found Bool
 *     --> node #7
 *         |
 *       7 | true
 *         | ^^^^ inconsistent with Int
 *         |
 *      = help: change the expression or its annotation
 */
class DiagnosticPrinter
{
public:
  /// Longest term rendering shown under a label
  static constexpr size_t k_max_snippet_width = 80;

  /**
   * @param os Output stream (typically std::cerr)
   * @param color When to color output with rang
   */
  DiagnosticPrinter(std::ostream & os, ColorOutput color);

  /// `use_color` false never colors; true colors terminals only
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true)
  : DiagnosticPrinter(os, use_color ? ColorOutput::Auto : ColorOutput::Never)
  {
  }

  /// Print one diagnostic. Labels on nodes missing from `nodes` become notes.
  void print(const Diagnostic & diag, const NodeIndex & nodes);

  /// Print every diagnostic, ordered by primary node id
  void print_all(const DiagnosticBag & diags, const NodeIndex & nodes);

  /// One-line totals, e.g. "2 errors, 1 warning"
  void print_summary(const DiagnosticBag & diags);

private:
  void print_header(const Diagnostic & diag);
  void print_label(const Label & label, const NodeIndex & nodes);
  void print_footer(std::string_view kind, std::string_view message);
  void print_gutter();

  std::ostream & os_;
  bool use_color_;
};

}  // namespace gradual
