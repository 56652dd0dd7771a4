#include "container/container_codec.hpp"
#include "core/gist_error.hpp"
#include "crypto/byte_order.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gistvault {
namespace container {

using crypto::ByteOrder;

namespace {

// Bounds-checked cursor over the container bytes
class Reader {
public:
  explicit Reader(const std::vector<uint8_t>& data) : data_(data) {}

  // Throws unless count more bytes are available
  void require(std::size_t count, const std::string& what) const {
    if (count > data_.size() - offset_) {
      throw core::InvalidBinaryFormatError("Unexpected end of data while reading " + what);
    }
  }

  template<typename T>
  T read_int(const std::string& what) {
    require(sizeof(T), what);
    T value = ByteOrder::read<T>(data_.data() + offset_);
    offset_ += sizeof(T);
    return value;
  }

  uint8_t read_byte(const std::string& what) {
    require(1, what);
    return data_[offset_++];
  }

  std::string read_string(std::size_t length, const std::string& what) {
    require(length, what);
    std::string value(reinterpret_cast<const char*>(data_.data() + offset_), length);
    offset_ += length;
    return value;
  }

  void skip(std::size_t length, const std::string& what) {
    require(length, what);
    offset_ += length;
  }

  std::size_t remaining() const { return data_.size() - offset_; }

private:
  const std::vector<uint8_t>& data_;
  std::size_t offset_ = 0;
};

std::string file_label(std::size_t index) {
  return "file " + std::to_string(index + 1);
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

ContainerCodec::ContainerCodec(const config::Limits& limits) : limits_(limits) {
  BOOST_LOG_TRIVIAL(debug) << "Container codec: Initialized with max " << limits_.max_file_count
                           << " files, " << limits_.max_total_size << " bytes total";
}


//==============================================
// ENCODING AND DECODING
//==============================================

std::vector<uint8_t> ContainerCodec::encode(const std::vector<File>& files) const {
  BOOST_LOG_TRIVIAL(debug) << "Container codec: Encoding " << files.size() << " files";

  if (files.empty()) {
    throw core::InvalidInputError("No files provided for encoding");
  }
  if (files.size() > limits_.max_file_count) {
    throw core::InvalidInputError("Too many files: " + std::to_string(files.size()) +
                                  " exceeds limit of " + std::to_string(limits_.max_file_count));
  }

  // Validate every entry and size the buffer before writing anything
  std::size_t total_content = 0;
  std::size_t encoded_size = HEADER_SIZE;
  for (const auto& file : files) {
    if (file.name.empty()) {
      throw core::InvalidInputError("File name cannot be empty");
    }
    if (file.name.size() > limits_.max_filename_length) {
      throw core::InvalidInputError("Filename too long: " + std::to_string(file.name.size()) +
                                    " bytes exceeds limit of " +
                                    std::to_string(limits_.max_filename_length));
    }
    if (file.content.size() > limits_.max_file_size) {
      throw core::InvalidInputError("File \"" + file.name + "\" too large: " +
                                    std::to_string(file.content.size()) +
                                    " bytes exceeds limit of " +
                                    std::to_string(limits_.max_file_size));
    }
    const std::size_t language_length = file.language ? file.language->size() : 0;
    if (language_length > limits_.max_language_length) {
      throw core::InvalidInputError("Language identifier too long: " +
                                    std::to_string(language_length) + " bytes exceeds limit of " +
                                    std::to_string(limits_.max_language_length));
    }

    total_content += file.content.size();
    encoded_size += sizeof(uint16_t) + file.name.size() + sizeof(uint32_t) +
                    file.content.size() + sizeof(uint8_t) + language_length;
  }

  if (encoded_size > limits_.max_total_size) {
    throw core::InvalidInputError("Total size too large: " + std::to_string(encoded_size) +
                                  " bytes exceeds limit of " +
                                  std::to_string(limits_.max_total_size));
  }

  std::vector<uint8_t> buffer;
  buffer.reserve(encoded_size);

  // Write header
  ByteOrder::append<uint32_t>(buffer, MAGIC_NUMBER);
  buffer.push_back(FORMAT_VERSION);
  ByteOrder::append<uint16_t>(buffer, static_cast<uint16_t>(files.size()));
  ByteOrder::append<uint32_t>(buffer, static_cast<uint32_t>(total_content));

  // Write entries
  for (const auto& file : files) {
    ByteOrder::append<uint16_t>(buffer, static_cast<uint16_t>(file.name.size()));
    buffer.insert(buffer.end(), file.name.begin(), file.name.end());

    ByteOrder::append<uint32_t>(buffer, static_cast<uint32_t>(file.content.size()));
    buffer.insert(buffer.end(), file.content.begin(), file.content.end());

    const std::size_t language_length = file.language ? file.language->size() : 0;
    buffer.push_back(static_cast<uint8_t>(language_length));
    if (language_length > 0) {
      buffer.insert(buffer.end(), file.language->begin(), file.language->end());
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Container codec: Encoded " << files.size() << " files, "
                           << total_content << " content bytes into " << buffer.size() << " bytes";
  return buffer;
}

std::vector<File> ContainerCodec::decode(const std::vector<uint8_t>& data) const {
  std::vector<File> files;
  parse(data, &files);
  BOOST_LOG_TRIVIAL(debug) << "Container codec: Decoded " << files.size() << " files from "
                           << data.size() << " bytes";
  return files;
}


//==============================================
// INSPECTION
//==============================================

void ContainerCodec::validate(const std::vector<uint8_t>& data) const {
  parse(data, nullptr);
}

ContainerHeader ContainerCodec::read_header(const std::vector<uint8_t>& data) {
  if (data.size() < HEADER_SIZE) {
    throw core::InvalidBinaryFormatError("Binary data too small to contain valid header");
  }

  ContainerHeader header;
  header.magic = ByteOrder::read<uint32_t>(data.data());
  header.version = data[4];
  header.file_count = ByteOrder::read<uint16_t>(data.data() + 5);
  header.total_size = ByteOrder::read<uint32_t>(data.data() + 7);
  return header;
}


//==============================================
// DECODING SUPPORT
//==============================================

ContainerHeader ContainerCodec::check_header(const std::vector<uint8_t>& data) const {
  ContainerHeader header = read_header(data);

  if (header.magic != MAGIC_NUMBER) {
    std::stringstream ss;
    ss << "Invalid magic number: expected " << std::hex << MAGIC_NUMBER << ", got " << header.magic;
    throw core::InvalidBinaryFormatError(ss.str());
  }
  if (header.version != FORMAT_VERSION) {
    throw core::InvalidBinaryFormatError("Unsupported version: expected " +
                                         std::to_string(FORMAT_VERSION) + ", got " +
                                         std::to_string(header.version));
  }
  if (header.file_count == 0 || header.file_count > limits_.max_file_count) {
    throw core::InvalidBinaryFormatError("Invalid file count: " +
                                         std::to_string(header.file_count));
  }
  if (header.total_size > limits_.max_total_size) {
    throw core::InvalidBinaryFormatError("Total size too large: " +
                                         std::to_string(header.total_size));
  }
  return header;
}

void ContainerCodec::parse(const std::vector<uint8_t>& data, std::vector<File>* files) const {
  ContainerHeader header = check_header(data);

  Reader reader(data);
  reader.skip(HEADER_SIZE, "header");

  uint64_t decoded_size = 0;
  for (std::size_t i = 0; i < header.file_count; ++i) {
    const std::string label = file_label(i);

    uint16_t name_length = reader.read_int<uint16_t>("filename length for " + label);
    if (name_length == 0 || name_length > limits_.max_filename_length) {
      throw core::InvalidBinaryFormatError("Invalid filename length " +
                                           std::to_string(name_length) + " for " + label);
    }
    std::string name = reader.read_string(name_length, "filename for " + label);

    uint32_t content_length = reader.read_int<uint32_t>("content length for " + label);
    if (content_length > limits_.max_file_size) {
      throw core::InvalidBinaryFormatError("File too large: " + std::to_string(content_length) +
                                           " bytes for " + label);
    }

    File file;
    if (files) {
      file.content = reader.read_string(content_length, "content for " + label);
    } else {
      reader.skip(content_length, "content for " + label);
    }
    decoded_size += content_length;

    uint8_t language_length = reader.read_byte("language length for " + label);
    if (language_length > limits_.max_language_length) {
      throw core::InvalidBinaryFormatError("Language identifier too long for " + label);
    }
    std::string language;
    if (language_length > 0) {
      language = reader.read_string(language_length, "language for " + label);
    }

    if (files) {
      file.name = std::move(name);
      if (!language.empty()) {
        file.language = std::move(language);
      }
      files->push_back(std::move(file));
    }
  }

  // Leftover bytes mean a wrong count or a corrupted buffer
  if (reader.remaining() != 0) {
    throw core::InvalidBinaryFormatError("Extra data after files: " +
                                         std::to_string(reader.remaining()) + " bytes");
  }
  if (decoded_size != header.total_size) {
    throw core::InvalidBinaryFormatError("Size mismatch: decoded " + std::to_string(decoded_size) +
                                         " bytes, expected " + std::to_string(header.total_size));
  }
}

} // namespace container
} // namespace gistvault
