#include "core/drm/client_solver.hpp"
#include "core/pow/pow.hpp"
#include "crypto/sha256.hpp"
#include "shaderchain/error.hpp"
#include "shaderchain/time_utils.hpp"
#include "utils/logger.hpp"

namespace shaderchain::core {

DrmClient::DrmClient(std::string client_id, std::string client_version, const ShaderRegistry& registry)
    : client_id_(std::move(client_id)),
      client_version_(std::move(client_version)),
      registry_(registry),
      chain_(std::make_unique<StateChain>(client_version_, registry))
{
}

DRMResponse DrmClient::solve_challenge(const DRMChallenge& challenge) {
    // Validate everything before the chain is touched
    for (const auto& shader_id : challenge.required_shaders) {
        if (challenge.input_seeds.find(shader_id) == challenge.input_seeds.end() ||
            !registry_.contains(shader_id)) {
            throw MissingSeedError(shader_id);
        }
    }

    if (challenge.difficulty > ProofOfWork::MAX_DIFFICULTY) {
        throw ProtocolException(ErrorCode::OutOfRange,
            "difficulty " + std::to_string(challenge.difficulty) + " exceeds maximum " +
            std::to_string(ProofOfWork::MAX_DIFFICULTY));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    time::Timer timer;
    DRMResponse response;
    response.challenge_id = challenge.challenge_id;
    response.client_version = client_version_;

    for (const auto& shader_id : challenge.required_shaders) {
        const std::string& seed = challenge.input_seeds.at(shader_id);
        std::string work_proof = ProofOfWork::compute_work_proof(seed, shader_id, challenge.difficulty);
        response.state_chain.push_back(chain_->add_link(shader_id, seed, work_proof));

        SHADERCHAIN_LOG_DEBUG("Shader {} executed for challenge {}", shader_id, challenge.challenge_id);
    }

    auto solution = ProofOfWork::find_nonce(chain_->get_chain_hash(), challenge.difficulty);
    if (!solution) {
        throw ProtocolException(ErrorCode::Unknown, "nonce search ended without a solution");
    }

    response.work_result = solution->result;
    response.nonce = solution->nonce;
    response.client_signature = sign_result(client_id_, response.work_result,
                                            time::timestamp_milliseconds());

    SHADERCHAIN_LOG_DEBUG("Challenge {} solved: links={}, nonce={}, time={}ms",
                          challenge.challenge_id, response.state_chain.size(),
                          response.nonce, timer.elapsed_milliseconds());

    return response;
}

std::future<DRMResponse> DrmClient::solve_challenge_async(const DRMChallenge& challenge) {
    return std::async(std::launch::async, [this, challenge]() {
        return solve_challenge(challenge);
    });
}

ChainState DrmClient::chain_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ChainState{chain_->get_chain_hash(), chain_->length()};
}

ChainExport DrmClient::export_chain() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chain_->export_chain();
}

void DrmClient::import_chain(const ChainExport& data) {
    if (data.version != client_version_) {
        throw ChainImportError("chain version " + data.version +
                               " does not match client version " + client_version_);
    }

    auto imported = std::make_unique<StateChain>(StateChain::import_chain(data, registry_));

    std::lock_guard<std::mutex> lock(mutex_);
    chain_ = std::move(imported);

    SHADERCHAIN_LOG_INFO("Client {} restored chain with {} links", client_id_, chain_->length());
}

std::string DrmClient::sign_result(
    const std::string& client_id,
    const std::string& work_result,
    uint64_t timestamp_ms
) {
    return crypto::Sha256::hex(client_id + work_result + std::to_string(timestamp_ms));
}

} // namespace shaderchain::core
