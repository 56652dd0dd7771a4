#include "auth/deletion_proof.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>

namespace gistvault::auth {

std::string derive_deletion_proof(const std::string& created_at, uint64_t total_size,
                                  const std::string& id) {
  return crypto::sha256_hex(created_at + std::to_string(total_size) + id +
                            DELETION_PROOF_SUFFIX);
}

bool validate_deletion_proof(const std::string& candidate, const store::GistRecord& record) {
  if (candidate.empty()) {
    return false;
  }

  try {
    std::string expected = derive_deletion_proof(record.created_at, record.total_size, record.id);
    bool valid = crypto::constant_time_equal(candidate, expected);
    if (!valid) {
      BOOST_LOG_TRIVIAL(warning) << "Deletion proof: Rejected proof " << candidate.substr(0, 8)
                                 << "... for gist " << record.id;
    }
    return valid;
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Deletion proof: Digest failed for gist " << record.id
                             << ": " << e.what();
    return false;
  }
}

} // namespace gistvault::auth
