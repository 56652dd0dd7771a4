#ifndef GISTVAULT_CONTAINER_CODEC_HPP
#define GISTVAULT_CONTAINER_CODEC_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "config/config.hpp"

namespace gistvault {
namespace container {

static constexpr uint32_t MAGIC_NUMBER = 0x47505354;  // "GPST"
static constexpr uint8_t FORMAT_VERSION = 1;
static constexpr std::size_t HEADER_SIZE = 11;        // magic + version + count + total size

// One named file inside a container
struct File {
  std::string name;
  std::string content;
  std::optional<std::string> language;

  bool operator==(const File& other) const {
    return name == other.name && content == other.content && language == other.language;
  }
  bool operator!=(const File& other) const { return !(*this == other); }
};

struct ContainerHeader {
  uint32_t magic = 0;
  uint8_t version = 0;
  uint16_t file_count = 0;
  // Sum of all content lengths
  uint32_t total_size = 0;
};

class ContainerCodec {
public:
  // ---- CONSTRUCTOR ----
  explicit ContainerCodec(const config::Limits& limits = config::Limits{});


  // ---- ENCODING AND DECODING ----
  // Packs files into one byte sequence, throws InvalidInputError on limit violations
  std::vector<uint8_t> encode(const std::vector<File>& files) const;
  // Unpacks a container, throws InvalidBinaryFormatError on any corruption
  std::vector<File> decode(const std::vector<uint8_t>& data) const;


  // ---- INSPECTION ----
  // Walks the structure without copying content
  void validate(const std::vector<uint8_t>& data) const;
  // Parses the fixed header only
  static ContainerHeader read_header(const std::vector<uint8_t>& data);

  const config::Limits& limits() const { return limits_; }

private:
  // ---- PARAMETERS ----
  config::Limits limits_;


  // ---- DECODING SUPPORT ----
  // Shared walk behind decode and validate; fills files when non-null
  void parse(const std::vector<uint8_t>& data, std::vector<File>* files) const;
  // Checks header fields against the format constants and limits
  ContainerHeader check_header(const std::vector<uint8_t>& data) const;
};

} // namespace container
} // namespace gistvault

#endif // GISTVAULT_CONTAINER_CODEC_HPP
