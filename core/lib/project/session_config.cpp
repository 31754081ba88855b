// gradual/project/session_config.cpp - Session configuration implementation
//
#include "gradual/project/session_config.hpp"

#include <yaml-cpp/yaml.h>

namespace gradual
{

namespace
{

/// Fill `config` from a parsed document; returns an error message or empty
std::string parse_root(const YAML::Node & root, SessionConfig & config)
{
  if (!root || root.IsNull()) {
    return {};
  }
  if (!root.IsMap()) {
    return "configuration must be a map";
  }

  if (const auto cache = root["cache"]) {
    if (cache["capacity"]) {
      const auto capacity = cache["capacity"].as<long long>();
      if (capacity <= 0) {
        return "cache.capacity must be greater than 0";
      }
      config.cache.capacity = static_cast<size_t>(capacity);
    }
  }

  if (const auto output = root["output"]) {
    if (output["format"]) {
      const auto format = output["format"].as<std::string>();
      if (format == "diagnostics") {
        config.output.format = OutputFormat::Diagnostics;
      } else if (format == "json") {
        config.output.format = OutputFormat::Json;
      } else {
        return "invalid output.format: '" + format + "' (must be 'diagnostics' or 'json')";
      }
    }

    if (output["color"]) {
      const auto color = output["color"].as<std::string>();
      if (color == "auto") {
        config.output.color = ColorMode::Auto;
      } else if (color == "always") {
        config.output.color = ColorMode::Always;
      } else if (color == "never") {
        config.output.color = ColorMode::Never;
      } else {
        return "invalid output.color: '" + color + "' (must be 'auto', 'always' or 'never')";
      }
    }
  }

  if (const auto statics = root["statics"]) {
    if (statics["builtins"]) {
      config.statics.builtins = statics["builtins"].as<bool>();
    }
    if (statics["warn_unused"]) {
      config.statics.warn_unused = statics["warn_unused"].as<bool>();
    }
  }

  return {};
}

ConfigLoadResult finish(const YAML::Node & root, SessionConfig config)
{
  try {
    const std::string error = parse_root(root, config);
    if (!error.empty()) {
      return ConfigLoadResult::fail(error);
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }
  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_session_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  SessionConfig config;
  config.config_root = fs::absolute(config_path).parent_path();
  return finish(root, std::move(config));
}

ConfigLoadResult parse_session_config(std::string_view yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return finish(root, SessionConfig{});
}

std::optional<std::filesystem::path> find_session_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path dir = fs::absolute(start_dir);
  if (fs::is_regular_file(dir)) dir = dir.parent_path();

  for (;;) {
    if (auto candidate = dir / k_session_config_file_name; fs::exists(candidate)) {
      return candidate;
    }
    if (!dir.has_relative_path()) return std::nullopt;  // filesystem root
    dir = dir.parent_path();
  }
}

SessionOptions session_options(const SessionConfig & config)
{
  SessionOptions options;
  options.cache_capacity = config.cache.capacity;
  options.builtins = config.statics.builtins;
  return options;
}

CollectOptions collect_options(const SessionConfig & config)
{
  CollectOptions options;
  options.warn_unused = config.statics.warn_unused;
  return options;
}

}  // namespace gradual
