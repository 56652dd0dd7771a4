#include "history/version_history.hpp"
#include "core/gist_error.hpp"
#include "store/storage_keys.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace gistvault::history {

namespace pt = boost::property_tree;

VersionHistory::VersionHistory(store::ObjectStore& objects, std::size_t max_versions)
  : objects_(objects), max_versions_(max_versions) {
  if (max_versions_ == 0) {
    throw core::InvalidInputError("History must retain at least one version");
  }
}


//==============================================
// MUTATION
//==============================================

void VersionHistory::record(const std::string& gist_id, const VersionHistoryEntry& entry) {
  EntryRing entries(max_versions_);
  std::vector<std::string> evicted;

  // Entries beyond a lowered cap are evicted along with the oldest
  for (auto& stored : read_index(gist_id)) {
    if (entries.full()) {
      evicted.push_back(entries.front().version_token);
    }
    entries.push_back(std::move(stored));
  }
  if (entries.full()) {
    evicted.push_back(entries.front().version_token);
  }
  entries.push_back(entry);

  // Index first, so it never names a blob that is already gone
  save(gist_id, entries);

  for (const auto& token : evicted) {
    objects_.remove(store::keys::blob_key(gist_id, token));
    BOOST_LOG_TRIVIAL(debug) << "Version history: Evicted version " << token
                             << " of gist " << gist_id;
  }
  BOOST_LOG_TRIVIAL(debug) << "Version history: Gist " << gist_id << " now retains "
                           << entries.size() << " versions";
}

void VersionHistory::purge(const std::string& gist_id) {
  // Every blob under the gist's prefix, whether the index still names it or not
  const std::vector<std::string> blobs = objects_.list(store::keys::blob_prefix(gist_id));
  for (const auto& key : blobs) {
    objects_.remove(key);
  }
  objects_.remove(store::keys::versions_key(gist_id));
  BOOST_LOG_TRIVIAL(debug) << "Version history: Purged " << blobs.size()
                           << " blobs of gist " << gist_id;
}


//==============================================
// QUERIES
//==============================================

std::vector<VersionHistoryEntry> VersionHistory::list(const std::string& gist_id) const {
  EntryRing entries = load(gist_id);
  return std::vector<VersionHistoryEntry>(entries.rbegin(), entries.rend());
}

std::optional<VersionHistoryEntry> VersionHistory::find(const std::string& gist_id,
                                                        const std::string& version_token) const {
  for (const auto& entry : load(gist_id)) {
    if (entry.version_token == version_token) {
      return entry;
    }
  }
  return std::nullopt;
}


//==============================================
// INDEX PERSISTENCE
//==============================================

VersionHistory::EntryRing VersionHistory::load(const std::string& gist_id) const {
  std::vector<VersionHistoryEntry> stored = read_index(gist_id);
  EntryRing entries(max_versions_);
  // A lowered cap keeps only the newest entries
  for (auto& entry : stored) {
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::vector<VersionHistoryEntry> VersionHistory::read_index(const std::string& gist_id) const {
  std::vector<VersionHistoryEntry> entries;

  std::optional<store::Bytes> data = objects_.get(store::keys::versions_key(gist_id));
  if (!data) {
    return entries;
  }

  try {
    pt::ptree tree;
    std::stringstream ss(std::string(data->begin(), data->end()));
    pt::read_json(ss, tree);

    if (auto list = tree.get_child_optional("entries")) {
      for (const auto& child : *list) {
        const pt::ptree& node = child.second;
        VersionHistoryEntry entry;
        entry.version_token = node.get<std::string>("version_token");
        entry.created_at = node.get<std::string>("created_at");
        entry.size = node.get<uint64_t>("size");
        entry.file_count = node.get<uint32_t>("file_count", 1);
        entry.edited_with_pin = node.get<bool>("edited_with_pin", false);
        entries.push_back(std::move(entry));
      }
    }
  } catch (const pt::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Version history: Corrupt index for gist " << gist_id
                             << ": " << e.what();
    throw core::StorageError("Corrupt version index for " + gist_id + ": " + e.what());
  }
  return entries;
}

void VersionHistory::save(const std::string& gist_id, const EntryRing& entries) {
  pt::ptree list;
  for (const auto& entry : entries) {
    pt::ptree node;
    node.put("version_token", entry.version_token);
    node.put("created_at", entry.created_at);
    node.put("size", entry.size);
    node.put("file_count", entry.file_count);
    node.put("edited_with_pin", entry.edited_with_pin);
    list.push_back(std::make_pair("", node));
  }

  pt::ptree tree;
  tree.put("gist_id", gist_id);
  tree.add_child("entries", list);

  std::stringstream ss;
  pt::write_json(ss, tree, false);
  const std::string json = ss.str();
  objects_.put(store::keys::versions_key(gist_id), store::Bytes(json.begin(), json.end()),
               {{"gist_id", gist_id}});
}

} // namespace gistvault::history
