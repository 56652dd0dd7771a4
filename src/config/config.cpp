#include "config/config.hpp"
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace gistvault::config {

namespace {

// Copies section.key into target when present; absent keys keep the default
template<typename T>
void read_value(const YAML::Node& root, const std::string& section, const std::string& key,
                T& target) {
  const std::string path = section + "." + key;
  try {
    const YAML::Node block = root[section];
    if (!block) {
      return;
    }
    if (!block.IsMap()) {
      throw ConfigError("Section '" + section + "' must be a mapping");
    }
    const YAML::Node value = block[key];
    if (!value) {
      return;
    }
    target = value.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError("Invalid value for '" + path + "': " + e.msg);
  }
}

} // namespace


//==============================================
// LOADING
//==============================================

AppConfig load_config(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Config: Loading configuration from: " << path;

  if (!std::filesystem::exists(path)) {
    BOOST_LOG_TRIVIAL(error) << "Config: File not found: " << path;
    throw ConfigError("File not found: " + path);
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to parse " << path << ": " << e.what();
    throw ConfigError(std::string("Failed to load YAML config: ") + e.what());
  }
  if (!root.IsMap() && !root.IsNull()) {
    throw ConfigError("Top level of " + path + " must be a mapping");
  }

  AppConfig config;

  read_value(root, "storage", "path", config.storage_path);

  read_value(root, "limits", "max_file_size", config.store.limits.max_file_size);
  read_value(root, "limits", "max_total_size", config.store.limits.max_total_size);
  read_value(root, "limits", "max_file_count", config.store.limits.max_file_count);
  read_value(root, "limits", "max_filename_length", config.store.limits.max_filename_length);
  read_value(root, "limits", "max_language_length", config.store.limits.max_language_length);

  read_value(root, "auth", "pbkdf2_iterations", config.store.auth.pbkdf2_iterations);
  read_value(root, "auth", "salt_length", config.store.auth.salt_length);
  read_value(root, "auth", "min_pin_length", config.store.auth.min_pin_length);
  read_value(root, "auth", "max_pin_length", config.store.auth.max_pin_length);

  read_value(root, "features", "one_time_view", config.store.features.one_time_view);
  read_value(root, "features", "edit_pin", config.store.features.edit_pin);
  read_value(root, "features", "expiry", config.store.features.expiry);
  read_value(root, "features", "version_history", config.store.features.version_history);

  read_value(root, "history", "max_versions", config.store.max_versions);
  read_value(root, "history", "strict_version_check", config.store.strict_version_check);

  read_value(root, "logging", "file", config.logging.log_file);
  read_value(root, "logging", "console", config.logging.console);
  std::string level;
  read_value(root, "logging", "level", level);
  if (!level.empty()) {
    config.logging.level = parse_severity(level);
  }

  validate(config.store);

  BOOST_LOG_TRIVIAL(info) << "Config: Loaded configuration, storage path: " << config.storage_path;
  return config;
}

void validate(const StoreConfig& config) {
  const auto& limits = config.limits;
  if (limits.max_file_size == 0 || limits.max_total_size == 0 || limits.max_file_count == 0) {
    throw ConfigError("Size and count limits must be positive");
  }
  // Container header stores the count in 16 bits and lengths in 8/16/32 bits
  if (limits.max_file_count > 0xFFFF || limits.max_filename_length > 0xFFFF ||
      limits.max_language_length > 0xFF || limits.max_total_size > 0xFFFFFFFFu) {
    throw ConfigError("Limits exceed what the container format can encode");
  }
  if (config.auth.pbkdf2_iterations == 0 || config.auth.salt_length == 0) {
    throw ConfigError("PBKDF2 iterations and salt length must be positive");
  }
  if (config.auth.min_pin_length > config.auth.max_pin_length) {
    throw ConfigError("Minimum PIN length exceeds maximum PIN length");
  }
  if (config.max_versions == 0) {
    throw ConfigError("History must retain at least one version");
  }
  if (config.id_length < 8) {
    throw ConfigError("Gist ids must be at least 8 characters");
  }
}

boost::log::trivial::severity_level parse_severity(const std::string& name) {
  if (name == "trace") return boost::log::trivial::trace;
  if (name == "debug") return boost::log::trivial::debug;
  if (name == "info") return boost::log::trivial::info;
  if (name == "warning") return boost::log::trivial::warning;
  if (name == "error") return boost::log::trivial::error;
  if (name == "fatal") return boost::log::trivial::fatal;
  throw ConfigError("Unknown log level: " + name);
}

} // namespace gistvault::config
