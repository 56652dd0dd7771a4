#ifndef GISTVAULT_DELETION_PROOF_HPP
#define GISTVAULT_DELETION_PROOF_HPP

#include <cstdint>
#include <string>
#include "store/gist_record.hpp"

namespace gistvault::auth {

// Suffix that keeps deletion proofs distinct from any other digest over the same fields
static constexpr const char* DELETION_PROOF_SUFFIX = "delete";

// Lowercase hex SHA-256 over created_at, decimal total_size, id and the suffix
std::string derive_deletion_proof(const std::string& created_at, uint64_t total_size,
                                  const std::string& id);

// Recomputes the proof from the record's current fields, compares in constant time
bool validate_deletion_proof(const std::string& candidate, const store::GistRecord& record);

} // namespace gistvault::auth

#endif // GISTVAULT_DELETION_PROOF_HPP
