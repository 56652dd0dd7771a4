#ifndef GISTVAULT_GIST_RECORD_HPP
#define GISTVAULT_GIST_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gistvault {
namespace store {

enum class IndentMode { Tabs, Spaces };
enum class WrapMode { None, Soft, Hard };
enum class Theme { Light, Dark, Auto };

// Editor preferences are plain display hints, overwritable on every update
struct EditorPreferences {
  std::optional<IndentMode> indent_mode;
  std::optional<int> indent_size;
  std::optional<WrapMode> wrap_mode;
  std::optional<Theme> theme;
};

// Client-encrypted description blob, never inspected
struct EncryptedMetadata {
  std::string iv;
  std::string data;
};

// ---- PROTECTION CLASS ----
struct Unprotected {};

struct PinProtection {
  std::string hash;  // base64 PBKDF2 output
  std::string salt;  // base64
};

struct OneTimeView {};

using Protection = std::variant<Unprotected, PinProtection, OneTimeView>;

enum class ProtectionClass { Unprotected, PinProtected, OneTimeView };

struct GistRecord {
  std::string id;
  std::string created_at;
  std::string updated_at;
  std::optional<std::string> expires_at;
  uint64_t version = 1;
  std::string current_version_token;
  uint64_t total_size = 0;
  uint32_t blob_count = 1;
  Protection protection = Unprotected{};
  EncryptedMetadata encrypted_metadata;
  EditorPreferences preferences;

  ProtectionClass protection_class() const;
  bool is_pin_protected() const { return std::holds_alternative<PinProtection>(protection); }
  bool is_one_time_view() const { return std::holds_alternative<OneTimeView>(protection); }
  // Null unless the record is PIN-protected
  const PinProtection* pin() const { return std::get_if<PinProtection>(&protection); }
};

// Fields safe to hand out without proof of authorization
struct PublicGistView {
  std::string id;
  std::string created_at;
  std::string updated_at;
  std::optional<std::string> expires_at;
  uint64_t version = 1;
  std::string current_version_token;
  uint64_t total_size = 0;
  uint32_t blob_count = 1;
  bool one_time_view = false;
  bool has_edit_pin = false;
  EditorPreferences preferences;
};

// ---- PROJECTION ----
PublicGistView to_public_view(const GistRecord& record);


// ---- SERIALIZATION ----
// JSON document stored under metadata/<id>.json
std::string record_to_json(const GistRecord& record);
// Throws core::StorageError on malformed documents
GistRecord record_from_json(const std::string& json);
std::string public_view_to_json(const PublicGistView& view);


// ---- ENUM CONVERSIONS ----
const char* to_string(IndentMode mode);
const char* to_string(WrapMode mode);
const char* to_string(Theme theme);
const char* to_string(ProtectionClass protection);
// Parsers throw core::InvalidInputError on unknown names
IndentMode parse_indent_mode(const std::string& text);
WrapMode parse_wrap_mode(const std::string& text);
Theme parse_theme(const std::string& text);

} // namespace store
} // namespace gistvault

#endif // GISTVAULT_GIST_RECORD_HPP
