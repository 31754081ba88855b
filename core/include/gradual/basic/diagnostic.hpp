// gradual/basic/diagnostic.hpp - Diagnostics attached to term nodes
//
// A diagnostic points at term nodes through their ids; there is no source
// text. Statics problems are reported with a DiagCode, which fixes the
// printed code ("E0005") and the severity.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gradual/basic/id.hpp"

namespace gradual
{

enum class Severity : uint8_t {
  Error,
  Warning,
};

/**
 * Problems reported from a statics result.
 */
enum class DiagCode : uint8_t {
  UnboundVariable,       ///< E0001
  UnboundConstructor,    ///< E0002
  NotAFunction,          ///< E0003
  InconsistentBranches,  ///< E0004
  InconsistentType,      ///< E0005
  UnboundTypeVariable,   ///< E0006
  NotATypeName,          ///< E0007
  ShadowedType,          ///< E0008
  DuplicateConstructor,  ///< E0009
  NotAConstructor,       ///< E0010
  InvalidFragment,       ///< E0011
  UnusedBinding,         ///< W0001
};

/// Printed code of a DiagCode, e.g. "E0004"
[[nodiscard]] std::string_view code_string(DiagCode code) noexcept;

/// Warnings for unused bindings, errors otherwise
[[nodiscard]] Severity severity_of(DiagCode code) noexcept;

enum class LabelStyle : uint8_t {
  Primary,    // the node the diagnostic is about
  Secondary,  // a node that explains it
};

struct Label
{
  Id node;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // "E0004"; empty for uncoded diagnostics
  std::string message;
  std::vector<Label> labels;
  std::vector<std::string> notes;
  std::optional<std::string> help_message;

  /// First primary label, else the first label; nullptr without labels
  [[nodiscard]] const Label * primary_label() const noexcept;

  /// Node of primary_label(); a default Id without labels
  [[nodiscard]] Id primary_node() const noexcept;

  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }
};

class DiagnosticBag;

/**
 * Fills in one diagnostic and hands it to its bag when destroyed.
 *
 *   bag.report(DiagCode::InconsistentType, id, "expected Int, found Bool")
 *     .with_help("change the expression or its annotation");
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(DiagnosticBuilder &&) = delete;
  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_label(Id node, std::string msg, LabelStyle style = LabelStyle::Primary);
  DiagnosticBuilder & with_secondary_label(Id node, std::string msg);
  DiagnosticBuilder & with_note(std::string note);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag * bag_;  // null once moved from
  Diagnostic diagnostic_;
};

/**
 * Ordered collection of diagnostics for one statics result.
 */
class DiagnosticBag
{
public:
  /// Coded diagnostic; the severity follows the code
  DiagnosticBuilder report(
    DiagCode code, Id node, std::string message, std::string label_message = "");

  DiagnosticBuilder report_error(Id node, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(Id node, std::string message, std::string label_message = "");

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }
  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) != 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) != 0; }
  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;

  /// Diagnostics carrying `code`, in report order
  [[nodiscard]] std::vector<const Diagnostic *> with_code(std::string_view code) const;

  /// Diagnostics whose primary label is on `node`
  [[nodiscard]] std::vector<const Diagnostic *> at_node(Id node) const;

  /// Stable sort by primary node id
  void sort_by_node();

  void merge(DiagnosticBag && other);

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace gradual
