#pragma once

#include "core/chain/state_chain.hpp"
#include "core/drm/types.hpp"
#include "core/shader/shader_registry.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace shaderchain::core {

/**
 * Head position of a solver's chain
 */
struct ChainState {
    std::string chain_hash;
    uint64_t chain_length = 0;
};

/**
 * DrmClient - Client side challenge solver
 *
 * Owns the client's state chain exclusively; only copies of new links leave
 * it inside a DRMResponse. Solving is CPU bound and blocking.
 */
class DrmClient {
public:
    DrmClient(std::string client_id, std::string client_version, const ShaderRegistry& registry);

    SHADERCHAIN_DISALLOW_COPY(DrmClient);

    /**
     * Execute the required shaders, extend the chain, search a nonce and
     * sign the result
     * @throws MissingSeedError if a required shader has no seed or is unknown
     *         to this client (the chain is left untouched)
     * @throws ProtocolException if the difficulty exceeds MAX_DIFFICULTY
     */
    DRMResponse solve_challenge(const DRMChallenge& challenge);

    /**
     * Run solve_challenge on a worker thread; exceptions surface through
     * the future
     */
    std::future<DRMResponse> solve_challenge_async(const DRMChallenge& challenge);

    ChainState chain_state() const;

    ChainExport export_chain() const;

    /**
     * Replace the local chain with an exported one
     * @throws ChainImportError if the export is corrupted or was written
     *         by another client version
     */
    void import_chain(const ChainExport& data);

    /**
     * Client signature: sha256(client_id + work_result + decimal(timestamp_ms))
     */
    static std::string sign_result(
        const std::string& client_id,
        const std::string& work_result,
        uint64_t timestamp_ms
    );

    const std::string& client_id() const { return client_id_; }
    const std::string& client_version() const { return client_version_; }

private:
    std::string client_id_;
    std::string client_version_;
    const ShaderRegistry& registry_;

    mutable std::mutex mutex_;
    std::unique_ptr<StateChain> chain_;
};

} // namespace shaderchain::core
