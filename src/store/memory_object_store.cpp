#include "store/memory_object_store.hpp"

namespace gistvault::store {

void MemoryObjectStore::put(const std::string& key, const Bytes& data,
                            const CustomMetadata& metadata) {
  std::lock_guard<std::mutex> lock(mutex_);
  objects_[key] = Object{data, metadata};
}

std::optional<Bytes> MemoryObjectStore::get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(key);
  if (it == objects_.end()) {
    return std::nullopt;
  }
  return it->second.data;
}

void MemoryObjectStore::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  objects_.erase(key);
}

std::vector<std::string> MemoryObjectStore::list(const std::string& prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  // std::map keeps keys ordered, so matches are contiguous from lower_bound
  for (auto it = objects_.lower_bound(prefix);
       it != objects_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
    keys.push_back(it->first);
  }
  return keys;
}

std::size_t MemoryObjectStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.size();
}

CustomMetadata MemoryObjectStore::get_metadata(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(key);
  return it == objects_.end() ? CustomMetadata{} : it->second.metadata;
}

} // namespace gistvault::store
