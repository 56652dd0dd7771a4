#ifndef GISTVAULT_CONFIG_HPP
#define GISTVAULT_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <boost/log/trivial.hpp>

namespace gistvault::config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Config error: " + message) {}
};

// Size limits enforced at the boundary
struct Limits {
  std::size_t max_file_size = 500 * 1024;         // 500 KiB per file
  std::size_t max_total_size = 5 * 1024 * 1024;   // 5 MiB per blob
  std::size_t max_file_count = 20;
  std::size_t max_filename_length = 255;          // UTF-8 bytes
  std::size_t max_language_length = 50;           // UTF-8 bytes
};

struct AuthConfig {
  unsigned int pbkdf2_iterations = 100000;
  std::size_t salt_length = 16;
  std::size_t hash_length = 32;
  std::size_t min_pin_length = 4;
  std::size_t max_pin_length = 20;
};

// Optional subsystems, fixed for the lifetime of a store
struct FeatureFlags {
  bool one_time_view = true;
  bool edit_pin = true;
  bool expiry = true;
  bool version_history = true;
};

struct StoreConfig {
  Limits limits;
  AuthConfig auth;
  FeatureFlags features;
  std::size_t max_versions = 50;
  std::size_t id_length = 12;
  // Reject updates whose expected version differs from the stored one
  bool strict_version_check = false;
};

struct LoggingConfig {
  std::string log_file = "gistvault.log";
  boost::log::trivial::severity_level level = boost::log::trivial::info;
  bool console = false;
};

struct AppConfig {
  std::string storage_path = "gistvault_store";
  StoreConfig store;
  LoggingConfig logging;
};

// ---- LOADING ----
// Reads a YAML file of sections; keys that are absent keep their defaults
AppConfig load_config(const std::string& path);
// Throws ConfigError when a value would make the store unusable
void validate(const StoreConfig& config);
// Parses trace|debug|info|warning|error|fatal
boost::log::trivial::severity_level parse_severity(const std::string& name);

} // namespace gistvault::config

#endif // GISTVAULT_CONFIG_HPP
