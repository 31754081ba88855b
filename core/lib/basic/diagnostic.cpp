// gradual/basic/diagnostic.cpp - Diagnostics attached to term nodes
//
#include "gradual/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace gradual
{

std::string_view code_string(DiagCode code) noexcept
{
  switch (code) {
    case DiagCode::UnboundVariable:
      return "E0001";
    case DiagCode::UnboundConstructor:
      return "E0002";
    case DiagCode::NotAFunction:
      return "E0003";
    case DiagCode::InconsistentBranches:
      return "E0004";
    case DiagCode::InconsistentType:
      return "E0005";
    case DiagCode::UnboundTypeVariable:
      return "E0006";
    case DiagCode::NotATypeName:
      return "E0007";
    case DiagCode::ShadowedType:
      return "E0008";
    case DiagCode::DuplicateConstructor:
      return "E0009";
    case DiagCode::NotAConstructor:
      return "E0010";
    case DiagCode::InvalidFragment:
      return "E0011";
    case DiagCode::UnusedBinding:
      return "W0001";
  }
  return "";
}

Severity severity_of(DiagCode code) noexcept
{
  return code == DiagCode::UnusedBinding ? Severity::Warning : Severity::Error;
}

const Label * Diagnostic::primary_label() const noexcept
{
  auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) return &*it;
  return labels.empty() ? nullptr : &labels.front();
}

Id Diagnostic::primary_node() const noexcept
{
  const Label * l = primary_label();
  return l ? l->node : Id{};
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(&bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(std::exchange(other.bag_, nullptr)), diagnostic_(std::move(other.diagnostic_))
{
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (bag_) bag_->add(std::move(diagnostic_));
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(Id node, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{node, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(Id node, std::string msg)
{
  return with_label(node, std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

namespace
{

Diagnostic at(Severity severity, Id node, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{node, std::move(label_message), LabelStyle::Primary});
  return d;
}

std::vector<Diagnostic> select(const std::vector<Diagnostic> & all, Severity severity)
{
  std::vector<Diagnostic> out;
  std::copy_if(all.begin(), all.end(), std::back_inserter(out), [severity](const Diagnostic & d) {
    return d.severity == severity;
  });
  return out;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report(
  DiagCode code, Id node, std::string message, std::string label_message)
{
  Diagnostic d = at(severity_of(code), node, std::move(message), std::move(label_message));
  d.code = std::string(code_string(code));
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(Id node, std::string message, std::string label_message)
{
  return {*this, at(Severity::Error, node, std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  Id node, std::string message, std::string label_message)
{
  return {*this, at(Severity::Warning, node, std::move(message), std::move(label_message))};
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

std::vector<Diagnostic> DiagnosticBag::errors() const { return select(diagnostics_, Severity::Error); }

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  return select(diagnostics_, Severity::Warning);
}

std::vector<const Diagnostic *> DiagnosticBag::with_code(std::string_view code) const
{
  std::vector<const Diagnostic *> out;
  for (const auto & d : diagnostics_) {
    if (d.code == code) out.push_back(&d);
  }
  return out;
}

std::vector<const Diagnostic *> DiagnosticBag::at_node(Id node) const
{
  std::vector<const Diagnostic *> out;
  for (const auto & d : diagnostics_) {
    if (d.primary_node() == node) out.push_back(&d);
  }
  return out;
}

void DiagnosticBag::sort_by_node()
{
  std::stable_sort(
    diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_node() < b.primary_node();
    });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

}  // namespace gradual
