#ifndef GISTVAULT_DIGEST_HPP
#define GISTVAULT_DIGEST_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "crypto/crypto_error.hpp"

namespace gistvault::crypto {

static constexpr size_t SHA256_SIZE = 32;

// ---- HASHING ----
// Lowercase hex SHA-256 of input, computed with OpenSSL EVP
std::string sha256_hex(const std::string& input);
// Raw SHA-256 digest bytes
std::vector<uint8_t> sha256(const uint8_t* data, size_t length);


// ---- KEY DERIVATION ----
// PBKDF2-HMAC-SHA256 of secret over salt
std::vector<uint8_t> pbkdf2_sha256(const std::string& secret,
                                   const std::vector<uint8_t>& salt,
                                   unsigned int iterations,
                                   size_t output_length);


// ---- RANDOMNESS ----
// Cryptographically secure random bytes from RAND_bytes
std::vector<uint8_t> random_bytes(size_t count);


// ---- ENCODING ----
std::string base64_encode(const std::vector<uint8_t>& data);
// Throws EncodingError on malformed input
std::vector<uint8_t> base64_decode(const std::string& encoded);
std::string hex_encode(const uint8_t* data, size_t length);


// ---- COMPARISON ----
// Length-checked comparison that does not short-circuit on the first differing byte
bool constant_time_equal(const std::string& a, const std::string& b);
bool constant_time_equal(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

} // namespace gistvault::crypto

#endif // GISTVAULT_DIGEST_HPP
