#ifndef GISTVAULT_OBJECT_STORE_HPP
#define GISTVAULT_OBJECT_STORE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gistvault::store {

using Bytes = std::vector<uint8_t>;
// String attributes stored beside an object
using CustomMetadata = std::map<std::string, std::string>;

// Durable key/value byte store the gist core writes through.
// Implementations make every put and remove atomic per key and
// report failures as core::StorageError.
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  // Creates or replaces the object under key
  virtual void put(const std::string& key, const Bytes& data,
                   const CustomMetadata& metadata = {}) = 0;
  // Empty when no object exists under key
  virtual std::optional<Bytes> get(const std::string& key) = 0;
  // Removing an absent key is not an error
  virtual void remove(const std::string& key) = 0;
  // Keys starting with prefix, sorted
  virtual std::vector<std::string> list(const std::string& prefix) = 0;
};

} // namespace gistvault::store

#endif // GISTVAULT_OBJECT_STORE_HPP
