#pragma once

#include "shaderchain/common.hpp"
#include "core/chain/state_chain.hpp"
#include <map>
#include <string>
#include <vector>

namespace shaderchain::core {

/**
 * Work types understood by the challenge generator. Any other string
 * selects the fallback shader set.
 */
namespace work_types {
    constexpr const char* SHADER_VERIFY = "shader_verify";
    constexpr const char* FOLDING_CHAIN = "folding_chain";
    constexpr const char* ENTROPY_CHAIN = "entropy_chain";
}

/**
 * DRMChallenge - One server-issued challenge
 *
 * Transient: consumed by exactly one verification or discarded on expiry.
 */
struct DRMChallenge {
    std::string challenge_id;
    std::vector<std::string> required_shaders;
    std::map<std::string, std::string> input_seeds;   // shader id -> seed
    std::string previous_chain_hash;
    uint32_t difficulty = 0;
    uint64_t expires_at = 0;                          // Milliseconds since epoch
    std::string work_type;

    bool is_expired(uint64_t now_ms) const { return now_ms > expires_at; }
};

/**
 * DRMResponse - Client answer to exactly one challenge
 */
struct DRMResponse {
    std::string challenge_id;
    std::string client_version;
    std::vector<StateChainLink> state_chain;          // New links only
    std::string work_result;
    uint64_t nonce = 0;
    std::string client_signature;
};

/**
 * VerificationResult - Outcome of one verification (never stored)
 */
struct VerificationResult {
    bool valid = false;
    bool version_match = false;
    bool chain_integrity = false;
    bool work_valid = false;
    bool shader_outputs_match = false;
    std::vector<std::string> errors;

    std::string joined_errors() const;
};

/**
 * ClientState - Per-client record mutated after each verification
 */
struct ClientState {
    std::string client_id;
    std::string version;
    std::string last_chain_hash = constants::GENESIS_HASH;
    uint64_t chain_length = 0;
    uint64_t total_work_completed = 0;
    uint64_t last_verified_at = 0;
    int32_t trust_score = constants::INITIAL_TRUST_SCORE;
};

} // namespace shaderchain::core
