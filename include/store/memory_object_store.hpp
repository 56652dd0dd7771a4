#ifndef GISTVAULT_MEMORY_OBJECT_STORE_HPP
#define GISTVAULT_MEMORY_OBJECT_STORE_HPP

#include <map>
#include <mutex>
#include "store/object_store.hpp"

namespace gistvault::store {

// Process-local object store, used by tests and dry runs
class MemoryObjectStore : public ObjectStore {
public:
  void put(const std::string& key, const Bytes& data,
           const CustomMetadata& metadata = {}) override;
  std::optional<Bytes> get(const std::string& key) override;
  void remove(const std::string& key) override;
  std::vector<std::string> list(const std::string& prefix) override;

  std::size_t size() const;
  CustomMetadata get_metadata(const std::string& key) const;

private:
  struct Object {
    Bytes data;
    CustomMetadata metadata;
  };

  mutable std::mutex mutex_;
  std::map<std::string, Object> objects_;
};

} // namespace gistvault::store

#endif // GISTVAULT_MEMORY_OBJECT_STORE_HPP
