#ifndef GISTVAULT_VERSION_HISTORY_HPP
#define GISTVAULT_VERSION_HISTORY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <boost/circular_buffer.hpp>
#include "store/object_store.hpp"

namespace gistvault::history {

struct VersionHistoryEntry {
  std::string version_token;
  std::string created_at;
  uint64_t size = 0;
  uint32_t file_count = 1;
  bool edited_with_pin = false;
};

// Per-gist list of superseded versions, capped at max_versions.
// The index lives at versions/<id>.json and each entry's bytes stay
// at blobs/<id>/<token> until the entry is evicted or purged.
class VersionHistory {
public:
  // ---- CONSTRUCTOR ----
  VersionHistory(store::ObjectStore& objects, std::size_t max_versions);


  // ---- MUTATION ----
  // Appends entry; when full, drops the oldest entries and deletes their blobs
  void record(const std::string& gist_id, const VersionHistoryEntry& entry);
  // Deletes every blob under blobs/<id>/ and the index
  void purge(const std::string& gist_id);


  // ---- QUERIES ----
  // Newest first
  std::vector<VersionHistoryEntry> list(const std::string& gist_id) const;
  std::optional<VersionHistoryEntry> find(const std::string& gist_id,
                                          const std::string& version_token) const;

  std::size_t max_versions() const { return max_versions_; }

private:
  using EntryRing = boost::circular_buffer<VersionHistoryEntry>;

  store::ObjectStore& objects_;
  std::size_t max_versions_;

  // ---- INDEX PERSISTENCE ----
  // Oldest first; empty ring when no index exists
  EntryRing load(const std::string& gist_id) const;
  // Every stored entry, ignoring the cap
  std::vector<VersionHistoryEntry> read_index(const std::string& gist_id) const;
  void save(const std::string& gist_id, const EntryRing& entries);
};

} // namespace gistvault::history

#endif // GISTVAULT_VERSION_HISTORY_HPP
