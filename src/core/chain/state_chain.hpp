#pragma once

#include "shaderchain/common.hpp"
#include "core/shader/shader_registry.hpp"
#include <string>
#include <vector>

namespace shaderchain::core {

/**
 * ShaderFingerprint - Result of one deterministic computation
 */
struct ShaderFingerprint {
    std::string shader_id;
    std::string version;
    std::string input_seed;
    std::string output_hash;
    uint64_t timestamp = 0;       // Milliseconds since epoch

    bool operator==(const ShaderFingerprint& other) const;
};

/**
 * StateChainLink - One hash-linked entry of a state chain
 *
 * link_hash = sha256(canonical JSON of {index, previousHash, fingerprint, workProof})
 */
struct StateChainLink {
    uint64_t index = 0;
    std::string previous_hash;
    ShaderFingerprint fingerprint;
    std::string work_proof;
    std::string link_hash;

    /**
     * Canonical serialization covered by link_hash
     */
    std::string canonical_payload() const;

    /**
     * Recompute the hash from the stored fields
     */
    std::string compute_hash() const;

    bool operator==(const StateChainLink& other) const;
};

/**
 * ChainExport - Transferable copy of a full chain
 */
struct ChainExport {
    std::vector<StateChainLink> links;
    std::string chain_hash;
    std::string version;
};

/**
 * StateChain - Append-only hash-linked history of shader executions
 *
 * Owned by exactly one writer (a client solver). Links are produced in
 * order and never rewritten; the head hash seeds the next challenge.
 */
class StateChain {
public:
    StateChain(std::string client_version, const ShaderRegistry& registry);

    /**
     * Execute a shader and append the resulting link
     * @throws UnknownShaderError if the shader is not registered
     * @return Copy of the appended link
     */
    StateChainLink add_link(
        const std::string& shader_id,
        const std::string& input_seed,
        const std::string& work_proof
    );

    /**
     * Current head hash (genesis sentinel for an empty chain)
     */
    const std::string& get_chain_hash() const { return current_hash_; }

    size_t length() const { return links_.size(); }
    const std::vector<StateChainLink>& links() const { return links_; }
    const std::string& version() const { return version_; }

    /**
     * Export the full link list plus head hash and version
     */
    ChainExport export_chain() const;

    /**
     * Rebuild a chain from an export
     * @throws ChainImportError if the links do not form an intact chain from
     *         genesis or the head hash does not match the last link
     */
    static StateChain import_chain(const ChainExport& data, const ShaderRegistry& registry);

    /**
     * Verify a link sequence: non-empty, first previous hash as expected,
     * every link hash recomputes, and each link points at its predecessor.
     */
    static bool verify_links(
        const std::vector<StateChainLink>& links,
        const std::string& expected_previous_hash
    );

private:
    std::string version_;
    const ShaderRegistry& registry_;
    std::vector<StateChainLink> links_;
    std::string current_hash_;
};

} // namespace shaderchain::core
