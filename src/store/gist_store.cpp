#include "store/gist_store.hpp"
#include "auth/deletion_proof.hpp"
#include "core/gist_error.hpp"
#include "crypto/digest.hpp"
#include "store/storage_keys.hpp"
#include <cstdio>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace gistvault::store {

namespace {

// URL-safe id alphabet, 64 symbols so a random byte masks evenly
const char ID_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-";

const int MAX_ID_ATTEMPTS = 8;

Bytes to_bytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

const config::StoreConfig& validated(const config::StoreConfig& config) {
  config::validate(config);
  return config;
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

GistStore::GistStore(ObjectStore& objects, const config::StoreConfig& config,
                     utils::Clock clock, IdGenerator id_generator)
  : objects_(objects),
    config_(validated(config)),
    clock_(clock ? std::move(clock) : utils::Clock(utils::system_now)),
    id_generator_(std::move(id_generator)),
    authenticator_(config_.auth),
    history_(objects_, config_.max_versions) {
  BOOST_LOG_TRIVIAL(info) << "Gist store: Initialized (history " << config_.max_versions
                          << " versions, strict versioning "
                          << (config_.strict_version_check ? "on" : "off") << ")";
}


//==============================================
// CORE OPERATIONS
//==============================================

GistRecord GistStore::create(const NewGist& gist, const Bytes& blob) {
  // All validation happens before the first write
  validate_blob(blob);
  validate_blob_count(gist.blob_count);
  validate_preferences(gist.preferences);

  const bool wants_pin = gist.edit_pin.has_value();
  if (gist.one_time_view && !config_.features.one_time_view) {
    throw core::InvalidInputError("One-time view gists are disabled");
  }
  if (wants_pin && !config_.features.edit_pin) {
    throw core::InvalidInputError("Edit PINs are disabled");
  }
  if (gist.expiry != utils::ExpiryOption::Never && !config_.features.expiry) {
    throw core::InvalidInputError("Gist expiry is disabled");
  }
  if (gist.one_time_view && wants_pin) {
    throw core::InvalidInputError("A one-time view gist cannot have an edit PIN");
  }
  if (wants_pin) {
    authenticator_.check_strength(*gist.edit_pin);
  }

  GistRecord record;
  record.id = generate_id();
  const utils::TimePoint now = clock_();
  record.created_at = utils::format_iso8601(now);
  record.updated_at = record.created_at;
  if (auto expires = utils::expiry_from(now, gist.expiry)) {
    record.expires_at = utils::format_iso8601(*expires);
  }
  record.version = 1;
  record.current_version_token = generate_version_token();
  record.total_size = blob.size();
  record.blob_count = gist.blob_count;
  record.encrypted_metadata = gist.encrypted_metadata;
  record.preferences = gist.preferences;

  if (gist.one_time_view) {
    record.protection = OneTimeView{};
  } else if (wants_pin) {
    std::string salt = authenticator_.generate_salt();
    std::string hash = authenticator_.hash_pin(*gist.edit_pin, salt);
    record.protection = PinProtection{hash, salt};
  }

  // Blob first; metadata only once the bytes are durable
  objects_.put(keys::blob_key(record.id, record.current_version_token), blob,
               {{"gist_id", record.id}, {"version_token", record.current_version_token}});
  save_record(record);

  BOOST_LOG_TRIVIAL(info) << "Gist store: Created gist " << record.id << " (" << blob.size()
                          << " bytes, " << to_string(record.protection_class()) << ")";
  return record;
}

GistView GistStore::get(const std::string& id) {
  GistRecord record = get_metadata(id);
  Bytes blob = load_blob(id, record.current_version_token);
  return GistView{std::move(record), std::move(blob)};
}

GistRecord GistStore::get_metadata(const std::string& id) {
  GistRecord record = require_record(id);
  require_active(record);
  return record;
}

Bytes GistStore::get_blob(const std::string& id) {
  return get(id).blob;
}

UpdateResult GistStore::update(const std::string& id, const GistUpdate& changes,
                               const Bytes& blob, uint64_t expected_version,
                               const std::optional<std::string>& pin) {
  validate_blob(blob);
  if (changes.blob_count) {
    validate_blob_count(*changes.blob_count);
  }
  validate_preferences(changes.preferences);

  GistRecord record = require_record(id);
  require_active(record);

  if (!record.is_pin_protected() || !config_.features.edit_pin) {
    BOOST_LOG_TRIVIAL(warning) << "Gist store: Update refused for gist " << id
                               << " (" << to_string(record.protection_class()) << ")";
    throw core::ForbiddenError("Gist " + id + " is not editable");
  }

  if (!pin || pin->empty()) {
    throw core::UnauthorizedError("Edit PIN required for gist " + id);
  }
  if (!authenticator_.validate_pin(*pin, record)) {
    BOOST_LOG_TRIVIAL(warning) << "Gist store: Wrong edit PIN for gist " << id;
    throw core::ForbiddenError("Invalid edit PIN for gist " + id);
  }

  if (expected_version != record.version) {
    if (config_.strict_version_check) {
      throw core::ConflictError("Gist " + id + " is at version " +
                                std::to_string(record.version) + ", update expected " +
                                std::to_string(expected_version));
    }
    BOOST_LOG_TRIVIAL(debug) << "Gist store: Update of gist " << id << " expected version "
                             << expected_version << ", stored is " << record.version;
  }

  history::VersionHistoryEntry previous;
  previous.version_token = record.current_version_token;
  previous.created_at = record.updated_at;
  previous.size = record.total_size;
  previous.file_count = record.blob_count;
  previous.edited_with_pin = record.version > 1;

  const std::string token = generate_version_token();
  objects_.put(keys::blob_key(id, token), blob,
               {{"gist_id", id}, {"version_token", token}});

  record.version += 1;
  record.current_version_token = token;
  record.updated_at = utils::format_iso8601(clock_());
  record.total_size = blob.size();
  if (changes.blob_count) {
    record.blob_count = *changes.blob_count;
  }
  if (changes.encrypted_metadata) {
    record.encrypted_metadata = *changes.encrypted_metadata;
  }
  const EditorPreferences& prefs = changes.preferences;
  if (prefs.indent_mode) record.preferences.indent_mode = prefs.indent_mode;
  if (prefs.indent_size) record.preferences.indent_size = prefs.indent_size;
  if (prefs.wrap_mode) record.preferences.wrap_mode = prefs.wrap_mode;
  if (prefs.theme) record.preferences.theme = prefs.theme;

  save_record(record);

  if (config_.features.version_history) {
    history_.record(id, previous);
  } else {
    objects_.remove(keys::blob_key(id, previous.version_token));
  }

  BOOST_LOG_TRIVIAL(info) << "Gist store: Updated gist " << id << " to version " << record.version;
  return UpdateResult{record.version, record.current_version_token, record.updated_at};
}

bool GistStore::delete_if_needed(const GistRecord& record, const Credential& credential) {
  // Authorization runs against the stored copy, never the caller's
  GistRecord stored = require_record(record.id);

  switch (stored.protection_class()) {
    case ProtectionClass::Unprotected:
      BOOST_LOG_TRIVIAL(warning) << "Gist store: Delete refused for unprotected gist " << stored.id;
      throw core::ForbiddenError("Gist " + stored.id + " cannot be deleted");

    case ProtectionClass::OneTimeView:
      require_active(stored);
      if (!credential.proof || credential.proof->empty()) {
        throw core::UnauthorizedError("Deletion proof required for gist " + stored.id);
      }
      if (!auth::validate_deletion_proof(*credential.proof, stored)) {
        throw core::ForbiddenError("Invalid deletion proof for gist " + stored.id);
      }
      break;

    case ProtectionClass::PinProtected:
      require_active(stored);
      if (!credential.pin || credential.pin->empty()) {
        throw core::UnauthorizedError("Edit PIN required for gist " + stored.id);
      }
      if (!authenticator_.validate_pin(*credential.pin, stored)) {
        BOOST_LOG_TRIVIAL(warning) << "Gist store: Wrong edit PIN on delete of gist " << stored.id;
        throw core::ForbiddenError("Invalid edit PIN for gist " + stored.id);
      }
      break;
  }

  erase(stored);
  BOOST_LOG_TRIVIAL(info) << "Gist store: Deleted gist " << stored.id;
  return true;
}


//==============================================
// HISTORY
//==============================================

std::vector<history::VersionHistoryEntry> GistStore::list_versions(const std::string& id) {
  GistRecord record = get_metadata(id);
  return history_.list(record.id);
}

Bytes GistStore::get_version(const std::string& id, const std::string& version_token) {
  GistRecord record = get_metadata(id);
  if (version_token != record.current_version_token && !history_.find(id, version_token)) {
    throw core::NotFoundError("Version " + version_token + " of gist " + id);
  }
  return load_blob(id, version_token);
}


//==============================================
// HOUSEKEEPING
//==============================================

bool GistStore::exists(const std::string& id) {
  return objects_.get(keys::metadata_key(id)).has_value();
}

bool GistStore::release_one_time_view(const GistRecord& record) {
  if (!record.is_one_time_view()) {
    BOOST_LOG_TRIVIAL(warning) << "Gist store: Gist " << record.id << " is not a one-time view";
    return false;
  }

  try {
    Credential credential;
    credential.proof = auth::derive_deletion_proof(record.created_at, record.total_size, record.id);
    return delete_if_needed(record, credential);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Gist store: Failed to release one-time view " << record.id
                               << ": " << e.what();
    return false;
  }
}

CleanupReport GistStore::cleanup_expired() {
  CleanupReport report;
  for (const std::string& key : objects_.list(keys::METADATA_PREFIX)) {
    const std::string id = keys::id_from_metadata_key(key);
    if (id.empty()) {
      continue;
    }
    ++report.checked;

    std::optional<GistRecord> record;
    try {
      record = load_record(id);
    } catch (const core::StorageError& e) {
      BOOST_LOG_TRIVIAL(error) << "Gist store: Skipping unreadable gist " << id << ": " << e.what();
      continue;
    }

    if (record && is_expired(*record)) {
      erase(*record);
      ++report.deleted;
      BOOST_LOG_TRIVIAL(info) << "Gist store: Removed expired gist " << id;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Gist store: Cleanup checked " << report.checked
                          << " gists, removed " << report.deleted;
  return report;
}

bool GistStore::is_expired(const GistRecord& record) const {
  if (!record.expires_at) {
    return false;
  }
  try {
    return utils::parse_iso8601(*record.expires_at) <= clock_();
  } catch (const std::invalid_argument& e) {
    // An unreadable expiry is treated as already passed
    BOOST_LOG_TRIVIAL(warning) << "Gist store: Gist " << record.id << " has malformed expiry: "
                               << e.what();
    return true;
  }
}


//==============================================
// RECORD ACCESS
//==============================================

std::optional<GistRecord> GistStore::load_record(const std::string& id) {
  std::optional<Bytes> data = objects_.get(keys::metadata_key(id));
  if (!data) {
    return std::nullopt;
  }
  return record_from_json(std::string(data->begin(), data->end()));
}

GistRecord GistStore::require_record(const std::string& id) {
  std::optional<GistRecord> record = load_record(id);
  if (!record) {
    throw core::NotFoundError("Gist " + id);
  }
  return *record;
}

void GistStore::require_active(const GistRecord& record) const {
  if (is_expired(record)) {
    throw core::GoneError("Gist " + record.id + " expired at " + record.expires_at.value_or(""));
  }
}

void GistStore::save_record(const GistRecord& record) {
  objects_.put(keys::metadata_key(record.id), to_bytes(record_to_json(record)),
               {{"gist_id", record.id}, {"version", std::to_string(record.version)}});
}

Bytes GistStore::load_blob(const std::string& id, const std::string& version_token) {
  std::optional<Bytes> blob = objects_.get(keys::blob_key(id, version_token));
  if (!blob) {
    BOOST_LOG_TRIVIAL(error) << "Gist store: Blob " << version_token << " of gist " << id
                             << " is missing";
    throw core::StorageError("Blob missing for gist " + id);
  }
  return *blob;
}

void GistStore::erase(const GistRecord& record) {
  objects_.remove(keys::metadata_key(record.id));
  objects_.remove(keys::blob_key(record.id, record.current_version_token));
  history_.purge(record.id);
}


//==============================================
// VALIDATION
//==============================================

void GistStore::validate_blob(const Bytes& blob) const {
  if (blob.empty()) {
    throw core::InvalidInputError("Blob cannot be empty");
  }
  if (blob.size() > config_.limits.max_total_size) {
    throw core::InvalidInputError("Blob too large: " + std::to_string(blob.size()) +
                                  " bytes exceeds limit of " +
                                  std::to_string(config_.limits.max_total_size));
  }
}

void GistStore::validate_blob_count(uint32_t blob_count) const {
  if (blob_count == 0 || blob_count > config_.limits.max_file_count) {
    throw core::InvalidInputError("File count must be between 1 and " +
                                  std::to_string(config_.limits.max_file_count));
  }
}

void GistStore::validate_preferences(const EditorPreferences& preferences) const {
  if (preferences.indent_size) {
    const int size = *preferences.indent_size;
    if (size != 2 && size != 4 && size != 8) {
      throw core::InvalidInputError("Indent size must be 2, 4 or 8");
    }
  }
}


//==============================================
// GENERATORS
//==============================================

std::string GistStore::generate_id() {
  for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
    std::string id;
    if (id_generator_) {
      id = id_generator_();
    } else {
      for (uint8_t byte : crypto::random_bytes(config_.id_length)) {
        id += ID_ALPHABET[byte & 63];
      }
    }
    if (!exists(id)) {
      return id;
    }
    BOOST_LOG_TRIVIAL(debug) << "Gist store: Id collision on attempt " << attempt + 1;
  }
  throw core::StorageError("Could not allocate a unique gist id");
}

std::string GistStore::generate_version_token() const {
  char prefix[24];
  std::snprintf(prefix, sizeof(prefix), "%013llu-",
                static_cast<unsigned long long>(utils::to_unix_millis(clock_())));
  std::vector<uint8_t> suffix = crypto::random_bytes(4);
  return prefix + crypto::hex_encode(suffix.data(), suffix.size());
}

} // namespace gistvault::store
