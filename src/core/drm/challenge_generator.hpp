#pragma once

#include "core/drm/stores.hpp"
#include "core/drm/types.hpp"
#include <string>
#include <vector>

namespace shaderchain::core {

/**
 * ChallengeGenerator - Server side challenge issuance
 *
 * Each challenge is bound to the client's chain head and to a fresh random
 * id, so seeds never repeat across challenges. Issued challenges are
 * recorded in the challenge registry; client state is only read.
 */
class ChallengeGenerator {
public:
    explicit ChallengeGenerator(DrmStores& stores,
                                uint64_t ttl_ms = constants::CHALLENGE_TTL_MS);

    /**
     * Issue a challenge for a client at its current chain position
     */
    DRMChallenge generate_challenge(const ClientState& state, const std::string& work_type);

    DRMChallenge generate_challenge(
        const ClientState& state,
        const std::string& work_type,
        uint64_t now_ms
    );

    /**
     * Required shader set for a work type (fallback: version proof only)
     */
    static std::vector<std::string> shaders_for_work_type(const std::string& work_type);

    /**
     * Seed for one shader: sha256(chain_hash + shader_id + challenge_id)
     */
    static std::string derive_seed(
        const std::string& chain_hash,
        const std::string& shader_id,
        const std::string& challenge_id
    );

    uint64_t ttl_ms() const { return ttl_ms_; }

private:
    DrmStores& stores_;
    uint64_t ttl_ms_;
};

} // namespace shaderchain::core
