#ifndef GISTVAULT_PIN_AUTH_HPP
#define GISTVAULT_PIN_AUTH_HPP

#include <string>
#include "config/config.hpp"
#include "store/gist_record.hpp"

namespace gistvault::auth {

class PinAuthenticator {
public:
  // ---- CONSTRUCTOR ----
  explicit PinAuthenticator(const config::AuthConfig& config = config::AuthConfig{});


  // ---- HASHING ----
  // PBKDF2-HMAC-SHA256 of pin over the base64 salt, returned as base64.
  // Throws crypto::CryptoError if the salt is not valid base64.
  std::string hash_pin(const std::string& pin, const std::string& salt) const;
  // Fresh random salt, base64 encoded
  std::string generate_salt() const;


  // ---- VALIDATION ----
  // True only when the record is PIN-protected and pin hashes to the stored value.
  // Never throws; any failure during the comparison denies access.
  bool validate_pin(const std::string& pin, const store::GistRecord& record) const;
  // Throws core::InvalidInputError describing the first rule the pin breaks
  void check_strength(const std::string& pin) const;

  const config::AuthConfig& config() const { return config_; }

private:
  config::AuthConfig config_;
};

} // namespace gistvault::auth

#endif // GISTVAULT_PIN_AUTH_HPP
