#include "store/file_object_store.hpp"
#include "core/gist_error.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace gistvault {
namespace store {

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

namespace {

const char* const SIDECAR_EXTENSION = ".meta";

std::string encode_sidecar(const std::string& key, const CustomMetadata& metadata) {
  pt::ptree tree;
  tree.put("key", key);
  pt::ptree attributes;
  for (const auto& [name, value] : metadata) {
    // push_back keeps dots in attribute names from being read as paths
    attributes.push_back(std::make_pair(name, pt::ptree(value)));
  }
  tree.add_child("metadata", attributes);

  std::stringstream ss;
  pt::write_json(ss, tree, false);
  return ss.str();
}

void decode_sidecar(const std::string& json, std::string* key, CustomMetadata* metadata) {
  pt::ptree tree;
  std::stringstream ss(json);
  pt::read_json(ss, tree);
  if (key) {
    *key = tree.get<std::string>("key");
  }
  if (metadata) {
    if (auto attributes = tree.get_child_optional("metadata")) {
      for (const auto& [name, child] : *attributes) {
        (*metadata)[name] = child.data();
      }
    }
  }
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

FileObjectStore::FileObjectStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Object store: Initializing with base path: " << base_path;
  try {
    check_directory_exists(base_path_);
  } catch (const fs::filesystem_error& e) {
    throw core::StorageError("Cannot create store directory " + base_path + ": " + e.what());
  }
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void FileObjectStore::put(const std::string& key, const Bytes& data,
                          const CustomMetadata& metadata) {
  BOOST_LOG_TRIVIAL(debug) << "Object store: Storing " << data.size() << " bytes with key: " << key;

  fs::path file_path = resolve_key_path(key);
  try {
    check_directory_exists(file_path.parent_path());
    write_atomically(file_path, std::string(data.begin(), data.end()));
    write_atomically(sidecar_path(file_path), encode_sidecar(key, metadata));
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Failed to store key " << key << ": " << e.what();
    throw core::StorageError("Failed to store " + key + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Object store: Stored key: " << key;
}

std::optional<Bytes> FileObjectStore::get(const std::string& key) {
  fs::path file_path = resolve_key_path(key);

  std::error_code ec;
  if (!fs::exists(file_path, ec)) {
    if (ec) {
      throw core::StorageError("Failed to stat " + key + ": " + ec.message());
    }
    BOOST_LOG_TRIVIAL(debug) << "Object store: Key not found: " << key;
    return std::nullopt;
  }

  std::string content = read_whole_file(file_path);
  BOOST_LOG_TRIVIAL(debug) << "Object store: Retrieved " << content.size()
                           << " bytes for key: " << key;
  return Bytes(content.begin(), content.end());
}

void FileObjectStore::remove(const std::string& key) {
  fs::path file_path = resolve_key_path(key);

  std::error_code ec;
  // Sidecar goes first so list never reports a key whose bytes are gone
  fs::remove(sidecar_path(file_path), ec);
  if (ec) {
    throw core::StorageError("Failed to remove metadata for " + key + ": " + ec.message());
  }
  bool removed = fs::remove(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Failed to remove key " << key << ": " << ec.message();
    throw core::StorageError("Failed to remove " + key + ": " + ec.message());
  }

  if (removed) {
    prune_empty_directories(file_path.parent_path());
    BOOST_LOG_TRIVIAL(debug) << "Object store: Removed key: " << key;
  }
}

std::vector<std::string> FileObjectStore::list(const std::string& prefix) {
  std::vector<std::string> keys;
  try {
    for (const auto& entry : fs::recursive_directory_iterator(base_path_)) {
      if (!entry.is_regular_file() || entry.path().extension() != SIDECAR_EXTENSION) {
        continue;
      }
      std::string key;
      decode_sidecar(read_whole_file(entry.path()), &key, nullptr);
      if (key.compare(0, prefix.size(), prefix) == 0) {
        keys.push_back(std::move(key));
      }
    }
  } catch (const fs::filesystem_error& e) {
    throw core::StorageError("Failed to list " + prefix + ": " + e.what());
  } catch (const pt::ptree_error& e) {
    throw core::StorageError("Corrupt object sidecar while listing " + prefix + ": " + e.what());
  }

  std::sort(keys.begin(), keys.end());
  BOOST_LOG_TRIVIAL(debug) << "Object store: Listed " << keys.size()
                           << " keys with prefix: " << prefix;
  return keys;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool FileObjectStore::has(const std::string& key) const {
  std::error_code ec;
  return fs::exists(resolve_key_path(key), ec);
}

CustomMetadata FileObjectStore::get_metadata(const std::string& key) const {
  CustomMetadata metadata;
  fs::path path = sidecar_path(resolve_key_path(key));
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return metadata;
  }
  try {
    decode_sidecar(read_whole_file(path), nullptr, &metadata);
  } catch (const pt::ptree_error& e) {
    throw core::StorageError("Corrupt object sidecar for " + key + ": " + e.what());
  }
  return metadata;
}

void FileObjectStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Object store: Clearing entire store at: " << base_path_;
  std::error_code ec;
  fs::remove_all(base_path_, ec);
  if (ec) {
    throw core::StorageError("Failed to clear store: " + ec.message());
  }
  check_directory_exists(base_path_);
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

fs::path FileObjectStore::get_path_for_hash(const std::string& hash) const {
  fs::path path = base_path_;
  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }
  path /= hash.substr(6);
  return path;
}

fs::path FileObjectStore::resolve_key_path(const std::string& key) const {
  return get_path_for_hash(crypto::sha256_hex(key));
}

fs::path FileObjectStore::sidecar_path(const fs::path& object_path) {
  fs::path path = object_path;
  path += SIDECAR_EXTENSION;
  return path;
}


//==============================================
// FILE SUPPORT
//==============================================

void FileObjectStore::write_atomically(const fs::path& path, const std::string& data) {
  fs::path temp_path = path;
  temp_path += ".tmp" + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw core::StorageError("Failed to create file: " + temp_path.string());
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
      file.close();
      std::error_code ec;
      fs::remove(temp_path, ec);
      throw core::StorageError("Failed to write file: " + temp_path.string());
    }
  }

  // rename replaces the target atomically on POSIX filesystems
  fs::rename(temp_path, path);
}

std::string FileObjectStore::read_whole_file(const fs::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw core::StorageError("Failed to open file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw core::StorageError("Failed to read file: " + path.string());
  }
  return buffer.str();
}

void FileObjectStore::check_directory_exists(const fs::path& path) const {
  if (!fs::exists(path)) {
    fs::create_directories(path);
  }
}

void FileObjectStore::prune_empty_directories(fs::path directory) const {
  std::error_code ec;
  while (directory != base_path_ && fs::is_empty(directory, ec) && !ec) {
    fs::remove(directory, ec);
    if (ec) {
      break;
    }
    directory = directory.parent_path();
  }
}

} // namespace store
} // namespace gistvault
