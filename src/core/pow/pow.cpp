#include "pow.hpp"
#include "crypto/sha256.hpp"
#include "shaderchain/time_utils.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace shaderchain::core {

uint32_t ProofOfWork::difficulty_for_trust(int32_t trust_score) {
    int32_t clamped = std::clamp(trust_score, constants::MIN_TRUST_SCORE, constants::MAX_TRUST_SCORE);
    int32_t difficulty = static_cast<int32_t>(constants::BASE_DIFFICULTY)
                       - clamped / constants::TRUST_PER_DIFFICULTY_STEP;
    return static_cast<uint32_t>(std::max(static_cast<int32_t>(constants::MIN_DIFFICULTY), difficulty));
}

uint64_t ProofOfWork::work_proof_iterations(uint32_t difficulty) {
    uint64_t iterations = 1;
    for (uint32_t i = 0; i < difficulty; ++i) {
        iterations *= 10;
    }
    return iterations;
}

std::string ProofOfWork::compute_work_proof(
    const std::string& seed,
    const std::string& shader_id,
    uint32_t difficulty
) {
    std::string proof = seed;
    uint64_t iterations = work_proof_iterations(difficulty);

    for (uint64_t i = 0; i < iterations; ++i) {
        proof = crypto::Sha256::hex(proof + shader_id);
    }

    return proof;
}

std::string ProofOfWork::nonce_hash(const std::string& data, uint64_t nonce) {
    return crypto::Sha256::hex(data + std::to_string(nonce));
}

std::optional<NonceSolution> ProofOfWork::find_nonce(
    const std::string& data,
    uint32_t difficulty,
    uint64_t max_attempts
) {
    SHADERCHAIN_LOG_DEBUG("Searching nonce (difficulty={})", difficulty);

    time::Timer timer;
    uint64_t nonce = 0;

    while (max_attempts == 0 || nonce < max_attempts) {
        std::string result = nonce_hash(data, nonce);

        if (meets_difficulty(result, difficulty)) {
            NonceSolution solution;
            solution.result = result;
            solution.nonce = nonce;
            solution.difficulty = difficulty;
            solution.attempts = nonce + 1;
            solution.compute_time_ms = timer.elapsed_milliseconds();

            SHADERCHAIN_LOG_DEBUG("Nonce found: nonce={}, time={}ms",
                                  solution.nonce, solution.compute_time_ms);
            return solution;
        }

        ++nonce;

        if (nonce % 100000 == 0) {
            SHADERCHAIN_LOG_TRACE("Nonce search progress: {} attempts", nonce);
        }
    }

    SHADERCHAIN_LOG_WARN("Nonce search failed: max attempts {} reached", max_attempts);
    return std::nullopt;
}

uint32_t ProofOfWork::count_leading_zeros(const std::string& hex) {
    uint32_t count = 0;
    for (char c : hex) {
        if (c != '0') {
            break;
        }
        ++count;
    }
    return count;
}

bool ProofOfWork::meets_difficulty(const std::string& hex, uint32_t difficulty) {
    return count_leading_zeros(hex) >= difficulty;
}

} // namespace shaderchain::core
