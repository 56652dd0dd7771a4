// ---- CONTAINER ----
// ContainerCodec Documentation
/*
DOCUMENTATION:
CLASS: ContainerCodec

VARIABLES:
. config::Limits limits_
    - Size and count limits applied on both encode and decode

CONSTANTS:
. MAGIC_NUMBER = 0x47505354 ("GPST")
. FORMAT_VERSION = 1
. HEADER_SIZE = 11
    - magic (4) | version (1) | file count (2) | total content size (4)
    - All integers little-endian

CONSTRUCTOR:
. explicit ContainerCodec(const config::Limits& limits)
    - Stores the limits, defaults to the built-in ones

METHODS:
Public:
  Encoding and Decoding:
  . vector<uint8_t> encode(const vector<File>& files) const
      - Writes the header, then per file: name length (2), name,
        content length (4), content, language length (1), language
      - Throws InvalidInputError for no files, too many files, oversized
        names, languages, contents or total size
  . vector<File> decode(const vector<uint8_t>& data) const
      - Reverses encode
      - Throws InvalidBinaryFormatError on bad magic, unsupported version,
        truncation, trailing bytes or a total size mismatch

  Inspection:
  . void validate(const vector<uint8_t>& data) const
      - Same checks as decode without building File objects
  . static ContainerHeader read_header(const vector<uint8_t>& data)
      - Parses the first HEADER_SIZE bytes only
*/

// ---- AUTH ----
// PinAuthenticator Documentation
/*
DOCUMENTATION:
CLASS: PinAuthenticator

VARIABLES:
. config::AuthConfig config_
    - PBKDF2 iteration count, salt and hash lengths, PIN length bounds

METHODS:
Public:
  Hashing:
  . string hash_pin(const string& pin, const string& salt) const
      - PBKDF2-HMAC-SHA256 over the base64-decoded salt
      - Returns the derived key base64 encoded
      - Throws CryptoError for a salt that is not valid base64
  . string generate_salt() const
      - salt_length random bytes from OpenSSL, base64 encoded

  Validation:
  . bool validate_pin(const string& pin, const GistRecord& record) const
      - False when the record carries no PIN, the pin is empty,
        or the recomputed hash differs (constant-time compare)
      - Never throws
  . void check_strength(const string& pin) const
      - Length within bounds, at least one letter and one digit,
        not on the common PIN list
      - Throws InvalidInputError naming the broken rule
*/

// Deletion proof Documentation
/*
DOCUMENTATION:
FUNCTIONS: deletion_proof.hpp

. string derive_deletion_proof(created_at, total_size, id)
    - Lowercase hex SHA-256 of created_at + decimal total_size + id + "delete"
. bool validate_deletion_proof(candidate, record)
    - Recomputes from the record and compares in constant time
    - Empty candidates never match
*/

// ---- HISTORY ----
// VersionHistory Documentation
/*
DOCUMENTATION:
CLASS: VersionHistory

VARIABLES:
. ObjectStore& objects_
    - Backing store for the index and the retained blobs
. size_t max_versions_
    - Ring capacity per gist

METHODS:
Public:
  Mutation:
  . void record(const string& gist_id, const VersionHistoryEntry& entry)
      - Appends to the gist's ring and saves the index
      - Deletes the blobs of entries pushed out of a full ring, including
        those beyond a lowered cap
  . void purge(const string& gist_id)
      - Deletes every object under blobs/<id>/ and the index itself

  Queries:
  . vector<VersionHistoryEntry> list(const string& gist_id) const
      - Newest first, empty when the gist has no index
  . optional<VersionHistoryEntry> find(gist_id, version_token) const

Private:
  . EntryRing load(const string& gist_id) const
      - Newest max_versions_ entries of the index
  . vector<VersionHistoryEntry> read_index(const string& gist_id) const
      - Every stored entry, oldest first
      - Throws StorageError when the index cannot be parsed
  . void save(const string& gist_id, const EntryRing& entries)
*/

// ---- STORE ----
// FileObjectStore Documentation
/*
DOCUMENTATION:
CLASS: FileObjectStore

VARIABLES:
. std::filesystem::path base_path_
    - Root directory for all objects

CONSTRUCTOR:
. explicit FileObjectStore(const std::string& base_path)
    - Creates the root directory if missing
    - Throws StorageError if it cannot be created

METHODS:
Public:
  Core Storage:
  . void put(key, data, metadata)
      - Writes data and a .meta sidecar (original key + metadata as JSON)
        through a temporary file and rename
  . optional<Bytes> get(key)
  . void remove(key)
      - Deletes object and sidecar, prunes empty hash directories
      - Absent keys are ignored
  . vector<string> list(prefix)
      - Scans sidecars for matching keys, sorted

  Query Operations:
  . bool has(key) const
  . CustomMetadata get_metadata(key) const
  . void clear()

Private:
  Content-Addressed Storage:
  . std::filesystem::path get_path_for_hash(const std::string& hash) const
      - Format: base_path/hash[0:2]/hash[2:4]/hash[4:6]/remaining_hash
  . std::filesystem::path resolve_key_path(const std::string& key) const
      - SHA-256 of the key, so any key maps to a safe path
*/

// GistStore Documentation
/*
DOCUMENTATION:
CLASS: GistStore

VARIABLES:
. ObjectStore& objects_
. config::StoreConfig config_
    - Limits, auth parameters, feature flags, history cap, strict versioning
. utils::Clock clock_
    - Time source for timestamps, expiry and version tokens
. IdGenerator id_generator_
    - Optional id source; random 12 character ids when empty
. auth::PinAuthenticator authenticator_
. history::VersionHistory history_

METHODS:
Public:
  Core Operations:
  . GistRecord create(const NewGist& gist, const Bytes& blob)
      - Validates everything first, then writes blob, then metadata
      - A one-time view gist never carries a PIN
  . GistView get(const std::string& id)
      - NotFoundError when absent, GoneError once expired
  . UpdateResult update(id, changes, blob, expected_version, pin)
      - GoneError once expired, then ForbiddenError unless PIN-protected,
        UnauthorizedError without a PIN, ForbiddenError on a wrong PIN
      - Stored version + 1; ConflictError on mismatch only when strict
      - Previous version moves into history
  . bool delete_if_needed(const GistRecord& record, const Credential& credential)
      - Authorizes against the stored record
      - One-time view needs the deletion proof, PIN-protected the PIN,
        unprotected gists are never deletable

  History:
  . vector<VersionHistoryEntry> list_versions(const std::string& id)
  . Bytes get_version(const std::string& id, const std::string& version_token)

  Housekeeping:
  . bool exists(const std::string& id)
  . bool release_one_time_view(const GistRecord& record)
      - Derives the proof and deletes; logs and returns false on failure
  . CleanupReport cleanup_expired()
      - Erases every expired gist, skips unreadable records
*/
