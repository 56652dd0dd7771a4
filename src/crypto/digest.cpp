#include "crypto/digest.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gistvault::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  // Initialize new digest context
  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  // Free digest context when object is destroyed
  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

} // namespace


//==============================================
// HASHING
//==============================================

std::vector<uint8_t> sha256(const uint8_t* data, size_t length) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  DigestContext context;

  // Initialize the context with SHA-256 algorithm
  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }

  // Feed the input data into the hash function
  if (!EVP_DigestUpdate(context.get(), data, length)) {
    throw DigestError("Failed to update hash");
  }

  // Generate the final hash value
  if (!EVP_DigestFinal_ex(context.get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize hash");
  }

  return std::vector<uint8_t>(hash, hash + hash_len);
}

std::string sha256_hex(const std::string& input) {
  auto digest = sha256(reinterpret_cast<const uint8_t*>(input.data()), input.size());
  return hex_encode(digest.data(), digest.size());
}


//==============================================
// KEY DERIVATION
//==============================================

std::vector<uint8_t> pbkdf2_sha256(const std::string& secret,
                                   const std::vector<uint8_t>& salt,
                                   unsigned int iterations,
                                   size_t output_length) {
  if (iterations == 0 || output_length == 0) {
    throw KeyDerivationError("Iterations and output length must be positive");
  }

  std::vector<uint8_t> output(output_length);
  if (PKCS5_PBKDF2_HMAC(secret.data(), static_cast<int>(secret.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        static_cast<int>(iterations), EVP_sha256(),
                        static_cast<int>(output.size()), output.data()) != 1) {
    throw KeyDerivationError("PBKDF2 derivation failed");
  }
  return output;
}


//==============================================
// RANDOMNESS
//==============================================

std::vector<uint8_t> random_bytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Digest: RAND_bytes failed for " << count << " bytes";
    throw CryptoError("Failed to generate random bytes");
  }
  return bytes;
}


//==============================================
// ENCODING
//==============================================

std::string base64_encode(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    return "";
  }

  // EVP_EncodeBlock writes 4 output characters per 3 input bytes plus a terminator
  std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                data.data(), static_cast<int>(data.size()));
  if (written < 0) {
    throw EncodingError("Base64 encoding failed");
  }
  encoded.resize(static_cast<size_t>(written));
  return encoded;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
  if (encoded.empty()) {
    return {};
  }
  if (encoded.size() % 4 != 0) {
    throw EncodingError("Base64 input length is not a multiple of 4");
  }

  std::vector<uint8_t> decoded(3 * encoded.size() / 4);
  int written = EVP_DecodeBlock(decoded.data(),
                                reinterpret_cast<const unsigned char*>(encoded.data()),
                                static_cast<int>(encoded.size()));
  if (written < 0) {
    throw EncodingError("Malformed base64 input");
  }

  // EVP_DecodeBlock keeps the bytes that padding stands in for
  size_t padding = 0;
  if (encoded[encoded.size() - 1] == '=') ++padding;
  if (encoded[encoded.size() - 2] == '=') ++padding;
  decoded.resize(static_cast<size_t>(written) - padding);
  return decoded;
}

std::string hex_encode(const uint8_t* data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}


//==============================================
// COMPARISON
//==============================================

bool constant_time_equal(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool constant_time_equal(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace gistvault::crypto
