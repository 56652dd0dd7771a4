#ifndef GISTVAULT_GIST_STORE_HPP
#define GISTVAULT_GIST_STORE_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "auth/pin_auth.hpp"
#include "config/config.hpp"
#include "history/version_history.hpp"
#include "store/gist_record.hpp"
#include "store/object_store.hpp"
#include "utils/time.hpp"

namespace gistvault::store {

// Everything the client supplies when creating a gist, besides the blob
struct NewGist {
  uint32_t blob_count = 1;
  utils::ExpiryOption expiry = utils::ExpiryOption::Never;
  bool one_time_view = false;
  std::optional<std::string> edit_pin;
  EncryptedMetadata encrypted_metadata;
  EditorPreferences preferences;
};

// Fields an update may change; unset fields keep their stored values
struct GistUpdate {
  std::optional<uint32_t> blob_count;
  std::optional<EncryptedMetadata> encrypted_metadata;
  EditorPreferences preferences;
};

// Secret presented for a delete: the edit PIN or the derived deletion proof
struct Credential {
  std::optional<std::string> pin;
  std::optional<std::string> proof;
};

struct GistView {
  GistRecord record;
  Bytes blob;
};

struct UpdateResult {
  uint64_t version = 0;
  std::string version_token;
  std::string updated_at;
};

struct CleanupReport {
  std::size_t checked = 0;
  std::size_t deleted = 0;
};

class GistStore {
public:
  using IdGenerator = std::function<std::string()>;

  // ---- CONSTRUCTOR ----
  // A null id_generator draws random ids of config.id_length characters
  GistStore(ObjectStore& objects,
            const config::StoreConfig& config = config::StoreConfig{},
            utils::Clock clock = utils::system_now,
            IdGenerator id_generator = nullptr);


  // ---- CORE OPERATIONS ----
  // Validates, writes the blob, then the metadata. Returns the stored record.
  GistRecord create(const NewGist& gist, const Bytes& blob);
  // Metadata and current blob. Throws NotFoundError or GoneError.
  GistView get(const std::string& id);
  GistRecord get_metadata(const std::string& id);
  Bytes get_blob(const std::string& id);
  // PIN-authorized replacement of the blob; version becomes stored + 1
  UpdateResult update(const std::string& id, const GistUpdate& changes, const Bytes& blob,
                      uint64_t expected_version, const std::optional<std::string>& pin);
  // Authorizes against the stored copy of record, then removes metadata,
  // the current blob and all history. Returns true on success.
  bool delete_if_needed(const GistRecord& record, const Credential& credential);


  // ---- HISTORY ----
  // Superseded versions, newest first
  std::vector<history::VersionHistoryEntry> list_versions(const std::string& id);
  // Blob of the current or a retained version
  Bytes get_version(const std::string& id, const std::string& version_token);


  // ---- HOUSEKEEPING ----
  // True when metadata exists, expired or not
  bool exists(const std::string& id);
  // Deletes a one-time-view gist after delivery. Logs and returns false on any failure.
  bool release_one_time_view(const GistRecord& record);
  // Removes every expired gist with its blobs and history
  CleanupReport cleanup_expired();

  bool is_expired(const GistRecord& record) const;
  const config::StoreConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  ObjectStore& objects_;
  config::StoreConfig config_;
  utils::Clock clock_;
  IdGenerator id_generator_;
  auth::PinAuthenticator authenticator_;
  history::VersionHistory history_;


  // ---- RECORD ACCESS ----
  std::optional<GistRecord> load_record(const std::string& id);
  // Throws NotFoundError when absent
  GistRecord require_record(const std::string& id);
  // Throws GoneError when expired
  void require_active(const GistRecord& record) const;
  void save_record(const GistRecord& record);
  Bytes load_blob(const std::string& id, const std::string& version_token);
  // Removes metadata, current blob and history, in that order
  void erase(const GistRecord& record);


  // ---- VALIDATION ----
  void validate_blob(const Bytes& blob) const;
  void validate_blob_count(uint32_t blob_count) const;
  void validate_preferences(const EditorPreferences& preferences) const;


  // ---- GENERATORS ----
  std::string generate_id();
  std::string generate_version_token() const;
};

} // namespace gistvault::store

#endif // GISTVAULT_GIST_STORE_HPP
