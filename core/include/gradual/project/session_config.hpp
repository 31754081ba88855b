// gradual/project/session_config.hpp - Session configuration (gstat.yaml)
//
// Parses and validates gstat.yaml configuration files.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "gradual/sema/memo_cache.hpp"
#include "gradual/sema/session.hpp"
#include "gradual/sema/statics_diagnostics.hpp"

namespace gradual
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class OutputFormat : uint8_t {
  Diagnostics,  ///< Rust-style diagnostics
  Json,         ///< the info map as JSON
};

enum class ColorMode : uint8_t { Auto, Always, Never };

/**
 * Memo cache section.
 */
struct CacheConfig
{
  /// Maximum number of cached info maps (> 0)
  size_t capacity = MemoCache::k_default_capacity;
};

/**
 * Output section.
 */
struct OutputConfig
{
  OutputFormat format = OutputFormat::Diagnostics;
  ColorMode color = ColorMode::Auto;
};

/**
 * Statics section.
 */
struct StaticsConfig
{
  /// Start from the built-in context
  bool builtins = true;

  /// Report unused bindings as warnings
  bool warn_unused = true;
};

/**
 * Complete session configuration (gstat.yaml).
 */
struct SessionConfig
{
  CacheConfig cache;
  OutputConfig output;
  StaticsConfig statics;

  /// Directory containing gstat.yaml; empty for the defaults
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Outcome of reading gstat.yaml. On failure `config` holds the defaults and
 * `error` says why.
 */
struct ConfigLoadResult
{
  SessionConfig config;
  bool success = false;
  std::string error;

  static ConfigLoadResult ok(SessionConfig cfg) { return {std::move(cfg), true, {}}; }
  static ConfigLoadResult fail(std::string msg) { return {SessionConfig{}, false, std::move(msg)}; }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/// Read gstat.yaml at `config_path`; config_root becomes its directory

[[nodiscard]] ConfigLoadResult load_session_config(const std::filesystem::path & config_path);

/**
 * Parse a session configuration from YAML text. Missing keys keep their
 * defaults.
 */
[[nodiscard]] ConfigLoadResult parse_session_config(std::string_view yaml_text);

/// Nearest gstat.yaml in `start_dir` (or the directory of a file) or above

[[nodiscard]] std::optional<std::filesystem::path> find_session_config(
  const std::filesystem::path & start_dir);

/// Session options described by a configuration
[[nodiscard]] SessionOptions session_options(const SessionConfig & config);

/// Diagnostic collection options described by a configuration
[[nodiscard]] CollectOptions collect_options(const SessionConfig & config);

inline constexpr const char * k_session_config_file_name = "gstat.yaml";

}  // namespace gradual
