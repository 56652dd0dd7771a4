#ifndef GISTVAULT_CRYPTO_ERROR_HPP
#define GISTVAULT_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gistvault::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError("Digest error: " + message) {}
};

class KeyDerivationError : public CryptoError {
public:
    explicit KeyDerivationError(const std::string& message)
        : CryptoError("Key derivation error: " + message) {}
};

class EncodingError : public CryptoError {
public:
    explicit EncodingError(const std::string& message)
        : CryptoError("Encoding error: " + message) {}
};

} // namespace gistvault::crypto

#endif // GISTVAULT_CRYPTO_ERROR_HPP
