#include "auth/pin_auth.hpp"
#include "core/gist_error.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace gistvault::auth {

namespace {

const std::array<const char*, 16> WEAK_PINS = {
  "1234", "0000", "1111", "2222", "3333", "4444", "5555", "6666",
  "7777", "8888", "9999", "password", "pass1234", "1234pass", "test1234",
  "admin123"
};

bool is_weak(const std::string& pin) {
  std::string lowered(pin);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(WEAK_PINS.begin(), WEAK_PINS.end(), lowered) != WEAK_PINS.end();
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

PinAuthenticator::PinAuthenticator(const config::AuthConfig& config) : config_(config) {
  BOOST_LOG_TRIVIAL(debug) << "Pin auth: Using " << config_.pbkdf2_iterations
                           << " PBKDF2 iterations";
}


//==============================================
// HASHING
//==============================================

std::string PinAuthenticator::hash_pin(const std::string& pin, const std::string& salt) const {
  std::vector<uint8_t> salt_bytes = crypto::base64_decode(salt);
  std::vector<uint8_t> derived = crypto::pbkdf2_sha256(pin, salt_bytes,
                                                       config_.pbkdf2_iterations,
                                                       config_.hash_length);
  return crypto::base64_encode(derived);
}

std::string PinAuthenticator::generate_salt() const {
  return crypto::base64_encode(crypto::random_bytes(config_.salt_length));
}


//==============================================
// VALIDATION
//==============================================

bool PinAuthenticator::validate_pin(const std::string& pin, const store::GistRecord& record) const {
  const store::PinProtection* protection = record.pin();
  if (!protection) {
    BOOST_LOG_TRIVIAL(debug) << "Pin auth: Gist " << record.id << " has no edit PIN";
    return false;
  }
  if (pin.empty()) {
    return false;
  }

  try {
    std::string computed = hash_pin(pin, protection->salt);
    return crypto::constant_time_equal(computed, protection->hash);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Pin auth: PIN check failed for gist " << record.id
                             << ": " << e.what();
    return false;
  }
}

void PinAuthenticator::check_strength(const std::string& pin) const {
  if (pin.size() < config_.min_pin_length) {
    throw core::InvalidInputError("PIN must be at least " +
                                  std::to_string(config_.min_pin_length) + " characters");
  }
  if (pin.size() > config_.max_pin_length) {
    throw core::InvalidInputError("PIN must be at most " +
                                  std::to_string(config_.max_pin_length) + " characters");
  }

  const bool has_letter = std::any_of(pin.begin(), pin.end(),
                                      [](unsigned char c) { return std::isalpha(c) != 0; });
  const bool has_digit = std::any_of(pin.begin(), pin.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
  if (!has_letter || !has_digit) {
    throw core::InvalidInputError("PIN must contain at least one letter and one number");
  }

  if (is_weak(pin)) {
    throw core::InvalidInputError("PIN is too common");
  }
}

} // namespace gistvault::auth
