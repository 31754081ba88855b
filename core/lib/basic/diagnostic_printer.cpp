// gradual/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// fmt formats, rang colors.
//
#include "gradual/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>

#include "gradual/term/term_printer.hpp"

namespace gradual
{

namespace
{

/// Width of the gutter column holding node ids
constexpr int k_gutter_width = 5;

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, ColorOutput color)
: os_(os), use_color_(color != ColorOutput::Never)
{
  // rang's control mode is process-wide
  switch (color) {
    case ColorOutput::Auto:
      rang::setControlMode(rang::control::Auto);
      break;
    case ColorOutput::Always:
      rang::setControlMode(rang::control::Force);
      break;
    case ColorOutput::Never:
      rang::setControlMode(rang::control::Off);
      break;
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const NodeIndex & nodes)
{
  print_header(diag);

  // --> node #id
  os_ << std::string(k_gutter_width - 3, ' ');
  if (use_color_) os_ << rang::fg::cyan << rang::style::bold;
  os_ << "-->";
  if (use_color_) os_ << rang::style::reset << rang::fg::reset;
  fmt::print(os_, " node #{}\n", diag.primary_node().value);
  print_gutter();

  for (const auto & label : diag.labels) {
    print_label(label, nodes);
  }
  for (const auto & note : diag.notes) {
    print_footer("note", note);
  }
  if (diag.help_message) {
    print_footer("help", *diag.help_message);
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const NodeIndex & nodes)
{
  DiagnosticBag sorted = diags;
  sorted.sort_by_node();
  for (const auto & d : sorted) {
    print(d, nodes);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.count(Severity::Error);
  const size_t warnings = diags.count(Severity::Warning);
  fmt::print(
    os_, "{} error{}, {} warning{}\n", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s");
}

// =============================================================================
// Parts
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const bool is_error = diag.is_error();
  const std::string title =
    diag.code.empty() ? std::string(is_error ? "error" : "warning")
                      : fmt::format("{}[{}]", is_error ? "error" : "warning", diag.code);

  if (use_color_) {
    os_ << rang::style::bold << (is_error ? rang::fg::red : rang::fg::yellow) << title
        << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }
  fmt::print(os_, "{}: {}\n", title, diag.message);
}

void DiagnosticPrinter::print_label(const Label & label, const NodeIndex & nodes)
{
  auto it = nodes.find(label.node);
  if (it == nodes.end() || it->second == nullptr) {
    if (!label.message.empty()) {
      print_footer("note", fmt::format("node #{}: {}", label.node.value, label.message));
    }
    return;
  }

  // Node line: the id in the gutter, then the node on one line
  const std::string snippet = print_term(it->second, k_max_snippet_width);
  if (use_color_) os_ << rang::fg::cyan;
  fmt::print(os_, " {:>{}} ", label.node.value, k_gutter_width - 1);
  if (use_color_) os_ << rang::fg::reset << rang::style::bold;
  os_ << "|";
  if (use_color_) os_ << rang::style::reset;
  fmt::print(os_, " {}\n", snippet);

  // Marker line
  const bool primary = label.style == LabelStyle::Primary;
  std::string marker(std::max<size_t>(snippet.size(), 1), primary ? '^' : '-');
  if (!label.message.empty()) {
    marker += " " + label.message;
  }
  os_ << std::string(k_gutter_width + 1, ' ');
  if (use_color_) os_ << rang::fg::cyan << rang::style::bold;
  os_ << "|";
  if (use_color_) os_ << rang::style::reset << (primary ? rang::fg::red : rang::fg::cyan);
  os_ << " " << marker;
  if (use_color_) os_ << rang::fg::reset;
  os_ << "\n";
}

void DiagnosticPrinter::print_footer(std::string_view kind, std::string_view message)
{
  print_gutter();
  os_ << std::string(k_gutter_width - 2, ' ');
  if (use_color_) os_ << rang::fg::cyan << rang::style::bold;
  os_ << "=";
  if (use_color_) os_ << rang::style::reset << rang::fg::reset;
  fmt::print(os_, " {}: {}\n", kind, message);
}

void DiagnosticPrinter::print_gutter()
{
  os_ << std::string(k_gutter_width + 1, ' ');
  if (use_color_) os_ << rang::fg::cyan << rang::style::bold;
  os_ << "|";
  if (use_color_) os_ << rang::style::reset << rang::fg::reset;
  os_ << "\n";
}

}  // namespace gradual
