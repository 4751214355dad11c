#include "core/drm/verifier.hpp"
#include "core/pow/pow.hpp"
#include "shaderchain/time_utils.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace shaderchain::core {

std::string VerificationResult::joined_errors() const {
    std::string out;
    for (const auto& error : errors) {
        if (!out.empty()) {
            out += "; ";
        }
        out += error;
    }
    return out;
}

Verifier::Verifier(const VersionManifest& manifest,
                   const ShaderRegistry& registry,
                   DrmStores& stores,
                   bool strict_work)
    : manifest_(manifest),
      registry_(registry),
      stores_(stores),
      strict_work_(strict_work)
{
}

VerificationResult Verifier::verify(const DRMChallenge& challenge, const DRMResponse& response) const {
    return verify(challenge, response, time::timestamp_milliseconds());
}

VerificationResult Verifier::verify(
    const DRMChallenge& challenge,
    const DRMResponse& response,
    uint64_t now_ms
) const {
    // Hard stops: no partial validation signal. Checks that never ran keep
    // their flags set so the trust update charges only the base penalty.
    auto hard_stop = [](const std::string& error) {
        VerificationResult stopped;
        stopped.version_match = true;
        stopped.chain_integrity = true;
        stopped.work_valid = true;
        stopped.shader_outputs_match = true;
        stopped.errors.push_back(error);
        return stopped;
    };

    if (challenge.is_expired(now_ms)) {
        return hard_stop("Challenge expired");
    }

    if (response.challenge_id != challenge.challenge_id) {
        return hard_stop("Challenge ID mismatch");
    }

    VerificationResult result;

    // 1. Version
    result.version_match = response.client_version == manifest_.version;
    if (!result.version_match) {
        result.errors.push_back("Version mismatch: expected " + manifest_.version +
                                ", got " + response.client_version);
    }

    // 2. Chain integrity
    result.chain_integrity = StateChain::verify_links(response.state_chain,
                                                      challenge.previous_chain_hash);
    if (!result.chain_integrity) {
        result.errors.push_back("State chain integrity check failed");
    }

    // 3. Shader outputs
    result.shader_outputs_match = check_shader_outputs(challenge, response, result.errors);

    // 4. Work
    result.work_valid = ProofOfWork::meets_difficulty(response.work_result, challenge.difficulty);
    if (!result.work_valid) {
        result.errors.push_back("Work proof invalid or insufficient difficulty");
    } else if (strict_work_) {
        const std::string& head = response.state_chain.empty()
            ? challenge.previous_chain_hash
            : response.state_chain.back().link_hash;
        if (ProofOfWork::nonce_hash(head, response.nonce) != response.work_result) {
            result.work_valid = false;
            result.errors.push_back("Work result does not match nonce");
        }
    }

    result.valid = result.version_match && result.chain_integrity &&
                   result.work_valid && result.shader_outputs_match;

    if (result.valid) {
        SHADERCHAIN_LOG_INFO("Challenge {} verified", challenge.challenge_id);
    } else {
        SHADERCHAIN_LOG_WARN("Challenge {} failed verification: {}",
                             challenge.challenge_id, result.joined_errors());
    }

    return result;
}

bool Verifier::check_shader_outputs(
    const DRMChallenge& challenge,
    const DRMResponse& response,
    std::vector<std::string>& errors
) const {
    bool all_match = true;

    for (const auto& shader_id : challenge.required_shaders) {
        auto seed_it = challenge.input_seeds.find(shader_id);

        const StateChainLink* link = nullptr;
        if (seed_it != challenge.input_seeds.end()) {
            auto it = std::find_if(response.state_chain.begin(), response.state_chain.end(),
                [&](const StateChainLink& l) {
                    return l.fingerprint.shader_id == shader_id &&
                           l.fingerprint.input_seed == seed_it->second;
                });
            if (it != response.state_chain.end()) {
                link = &*it;
            }
        }

        if (link == nullptr) {
            all_match = false;
            errors.push_back("Missing state chain link for " + shader_id);
            continue;
        }

        std::string expected = registry_.execute(shader_id, seed_it->second);
        if (link->fingerprint.output_hash != expected) {
            all_match = false;
            errors.push_back("Shader output mismatch for " + shader_id);
        }
    }

    return all_match;
}

std::optional<ClientState> Verifier::update_client_state(
    const std::string& client_id,
    const DRMResponse& response,
    const VerificationResult& result
) {
    return update_client_state(client_id, response, result, time::timestamp_milliseconds());
}

std::optional<ClientState> Verifier::update_client_state(
    const std::string& client_id,
    const DRMResponse& response,
    const VerificationResult& result,
    uint64_t now_ms
) {
    auto updated = stores_.clients.update(client_id, [&](ClientState& state) {
        int32_t previous = state.trust_score;

        state.version = response.client_version;
        state.last_chain_hash = response.state_chain.empty()
            ? constants::GENESIS_HASH
            : response.state_chain.back().link_hash;
        state.chain_length += response.state_chain.size();
        state.total_work_completed += 1;
        state.last_verified_at = now_ms;
        state.trust_score = calculate_trust_score(previous, result);

        SHADERCHAIN_LOG_INFO("Trust for {}: {} -> {}", client_id, previous, state.trust_score);
    });

    if (!updated) {
        SHADERCHAIN_LOG_WARN("Trust update for unknown client {}", client_id);
    }
    return updated;
}

ClientState Verifier::initialize_client(const std::string& client_id, const std::string& version) {
    return stores_.clients.initialize(client_id, version);
}

std::optional<ClientState> Verifier::get_client_state(const std::string& client_id) const {
    return stores_.clients.get(client_id);
}

int32_t Verifier::calculate_trust_score(int32_t current, const VerificationResult& result) {
    auto clamp = [](int32_t score) {
        return std::clamp(score, constants::MIN_TRUST_SCORE, constants::MAX_TRUST_SCORE);
    };

    int32_t score = current;
    if (result.valid) {
        score = clamp(score + constants::TRUST_REWARD);
    } else {
        score = clamp(score - constants::TRUST_PENALTY);
    }

    if (!result.version_match) {
        score = clamp(score - constants::VERSION_MISMATCH_PENALTY);
    }
    if (!result.shader_outputs_match) {
        score = clamp(score - constants::SHADER_MISMATCH_PENALTY);
    }

    return score;
}

} // namespace shaderchain::core
