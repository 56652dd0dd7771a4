#ifndef GISTVAULT_BYTE_ORDER_HPP
#define GISTVAULT_BYTE_ORDER_HPP

#include <cstdint>
#include <cstring>
#include <vector>
#include <boost/endian/conversion.hpp>

namespace gistvault::crypto {

// Container integers are little-endian on every platform
class ByteOrder {
public:
    // Converts host byte order to container byte order (little endian)
    template<typename T>
    static T toLittleEndian(T value) {
        return boost::endian::native_to_little(value);
    }

    // Converts container byte order (little endian) back to host byte order
    template<typename T>
    static T fromLittleEndian(T value) {
        return boost::endian::little_to_native(value);
    }

    // Appends value to buffer as sizeof(T) little-endian bytes
    template<typename T>
    static void append(std::vector<uint8_t>& buffer, T value) {
        T little = toLittleEndian(value);
        const auto* bytes = reinterpret_cast<const uint8_t*>(&little);
        buffer.insert(buffer.end(), bytes, bytes + sizeof(T));
    }

    // Reads sizeof(T) little-endian bytes starting at data
    template<typename T>
    static T read(const uint8_t* data) {
        T little;
        std::memcpy(&little, data, sizeof(T));
        return fromLittleEndian(little);
    }
};

} // namespace gistvault::crypto

#endif // GISTVAULT_BYTE_ORDER_HPP
