#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "store/object_store.hpp"

namespace gistvault {
namespace store {

class FileObjectStore : public ObjectStore {
public:

  // ---- CONSTRUCTOR ----
  explicit FileObjectStore(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  void put(const std::string& key, const Bytes& data,
           const CustomMetadata& metadata = {}) override;
  std::optional<Bytes> get(const std::string& key) override;
  void remove(const std::string& key) override;
  std::vector<std::string> list(const std::string& prefix) override;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) const;
  // Custom metadata written with the object, empty if absent
  CustomMetadata get_metadata(const std::string& key) const;
  // Removes every object and recreates the root
  void clear();

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored objects
  std::filesystem::path base_path_;


  // ---- CAS STORAGE SUPPORT ----
  // Creates a directory structure using parts of the key hash:
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  std::filesystem::path resolve_key_path(const std::string& key) const;
  // Sidecar holding the original key and custom metadata
  static std::filesystem::path sidecar_path(const std::filesystem::path& object_path);


  // ---- FILE SUPPORT ----
  // Writes to a temporary sibling and renames it into place
  static void write_atomically(const std::filesystem::path& path, const std::string& data);
  static std::string read_whole_file(const std::filesystem::path& path);
  void check_directory_exists(const std::filesystem::path& path) const;
  // Removes empty hash directories up to the base path
  void prune_empty_directories(std::filesystem::path directory) const;
};

} // namespace store
} // namespace gistvault
