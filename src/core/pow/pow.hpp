#pragma once

#include "shaderchain/common.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace shaderchain::core {

/**
 * Result of a nonce search
 */
struct NonceSolution {
    std::string result;           // Hex digest with the required zero prefix
    uint64_t nonce;               // Nonce that produces result
    uint32_t difficulty;          // Leading zero characters required
    uint64_t attempts;            // Hashes evaluated
    uint64_t compute_time_ms;     // Time taken to solve
};

/**
 * Proof-of-Work primitives for the challenge protocol
 *
 * Difficulty counts leading '0' characters of a hex SHA-256 digest, so each
 * step multiplies the expected search cost by 16.
 */
class ProofOfWork {
public:
    /**
     * Largest difficulty a solver accepts (10^8 work-proof rounds)
     */
    static constexpr uint32_t MAX_DIFFICULTY = 8;

    /**
     * Challenge difficulty for a trust score: max(1, 5 - floor(trust / 20))
     */
    static uint32_t difficulty_for_trust(int32_t trust_score);

    /**
     * Throwaway work bound to one shader: iterate
     * proof = sha256(proof + shader_id) 10^difficulty times from the seed
     */
    static std::string compute_work_proof(
        const std::string& seed,
        const std::string& shader_id,
        uint32_t difficulty
    );

    /**
     * Number of work-proof rounds for a difficulty
     */
    static uint64_t work_proof_iterations(uint32_t difficulty);

    /**
     * Hash evaluated by the nonce search: sha256(data + decimal(nonce))
     */
    static std::string nonce_hash(const std::string& data, uint64_t nonce);

    /**
     * Search nonces from 0 upwards (blocking)
     * @param data Chain head the search is bound to
     * @param difficulty Leading zero characters required
     * @param max_attempts Maximum nonce attempts (0 = unlimited)
     * @return Solution or nullopt if max_attempts reached
     */
    static std::optional<NonceSolution> find_nonce(
        const std::string& data,
        uint32_t difficulty,
        uint64_t max_attempts = 0
    );

    /**
     * Check that a digest starts with `difficulty` literal '0' characters
     */
    static bool meets_difficulty(const std::string& hex, uint32_t difficulty);

    /**
     * Count leading '0' characters
     */
    static uint32_t count_leading_zeros(const std::string& hex);
};

} // namespace shaderchain::core
