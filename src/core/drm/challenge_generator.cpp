#include "core/drm/challenge_generator.hpp"
#include "core/pow/pow.hpp"
#include "core/shader/shader_registry.hpp"
#include "crypto/random.hpp"
#include "crypto/sha256.hpp"
#include "shaderchain/time_utils.hpp"
#include "utils/logger.hpp"

namespace shaderchain::core {

ChallengeGenerator::ChallengeGenerator(DrmStores& stores, uint64_t ttl_ms)
    : stores_(stores), ttl_ms_(ttl_ms)
{
}

DRMChallenge ChallengeGenerator::generate_challenge(
    const ClientState& state,
    const std::string& work_type
) {
    return generate_challenge(state, work_type, time::timestamp_milliseconds());
}

DRMChallenge ChallengeGenerator::generate_challenge(
    const ClientState& state,
    const std::string& work_type,
    uint64_t now_ms
) {
    DRMChallenge challenge;
    challenge.challenge_id = crypto::Random::generate_hex(constants::CHALLENGE_ID_BYTES);
    challenge.required_shaders = shaders_for_work_type(work_type);

    for (const auto& shader_id : challenge.required_shaders) {
        challenge.input_seeds[shader_id] =
            derive_seed(state.last_chain_hash, shader_id, challenge.challenge_id);
    }

    challenge.previous_chain_hash = state.last_chain_hash;
    challenge.difficulty = ProofOfWork::difficulty_for_trust(state.trust_score);
    challenge.expires_at = time::deadline_after(now_ms, ttl_ms_);
    challenge.work_type = work_type;

    stores_.challenges.insert(challenge, state.client_id);

    SHADERCHAIN_LOG_DEBUG("Challenge {} issued to {}: work={}, shaders={}, difficulty={}",
                          challenge.challenge_id, state.client_id, work_type,
                          challenge.required_shaders.size(), challenge.difficulty);

    return challenge;
}

std::vector<std::string> ChallengeGenerator::shaders_for_work_type(const std::string& work_type) {
    if (work_type == work_types::SHADER_VERIFY) {
        return {shader_ids::VERSION_PROOF, shader_ids::HASH_COMPUTE};
    }
    if (work_type == work_types::FOLDING_CHAIN) {
        return {shader_ids::FOLDING_ENERGY, shader_ids::VERSION_PROOF};
    }
    if (work_type == work_types::ENTROPY_CHAIN) {
        return {shader_ids::ENTROPY, shader_ids::HASH_COMPUTE, shader_ids::VERSION_PROOF};
    }
    return {shader_ids::VERSION_PROOF};
}

std::string ChallengeGenerator::derive_seed(
    const std::string& chain_hash,
    const std::string& shader_id,
    const std::string& challenge_id
) {
    return crypto::Sha256::hex(chain_hash + shader_id + challenge_id);
}

} // namespace shaderchain::core
