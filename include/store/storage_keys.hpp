#ifndef GISTVAULT_STORAGE_KEYS_HPP
#define GISTVAULT_STORAGE_KEYS_HPP

#include <string>

// Object store key layout:
//   metadata/<id>.json     gist record
//   blobs/<id>/<token>     one blob per retained version
//   versions/<id>.json     history index
namespace gistvault::store::keys {

static constexpr const char* METADATA_PREFIX = "metadata/";
static constexpr const char* BLOB_PREFIX = "blobs/";
static constexpr const char* VERSIONS_PREFIX = "versions/";
static constexpr const char* JSON_SUFFIX = ".json";

inline std::string metadata_key(const std::string& id) {
  return METADATA_PREFIX + id + JSON_SUFFIX;
}

inline std::string blob_prefix(const std::string& id) {
  return BLOB_PREFIX + id + "/";
}

inline std::string blob_key(const std::string& id, const std::string& token) {
  return blob_prefix(id) + token;
}

inline std::string versions_key(const std::string& id) {
  return VERSIONS_PREFIX + id + JSON_SUFFIX;
}

// Recovers the gist id from a metadata key, empty if the key has another shape
inline std::string id_from_metadata_key(const std::string& key) {
  const std::string prefix(METADATA_PREFIX);
  const std::string suffix(JSON_SUFFIX);
  if (key.size() <= prefix.size() + suffix.size() ||
      key.compare(0, prefix.size(), prefix) != 0 ||
      key.compare(key.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return "";
  }
  return key.substr(prefix.size(), key.size() - prefix.size() - suffix.size());
}

} // namespace gistvault::store::keys

#endif // GISTVAULT_STORAGE_KEYS_HPP
