#include "core/chain/state_chain.hpp"
#include "crypto/sha256.hpp"
#include "shaderchain/error.hpp"
#include "shaderchain/time_utils.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>

namespace shaderchain::core {

// ShaderFingerprint

bool ShaderFingerprint::operator==(const ShaderFingerprint& other) const {
    return shader_id == other.shader_id &&
           version == other.version &&
           input_seed == other.input_seed &&
           output_hash == other.output_hash &&
           timestamp == other.timestamp;
}

// StateChainLink

std::string StateChainLink::canonical_payload() const {
    // Key order is part of the protocol
    nlohmann::ordered_json fp;
    fp["shaderId"] = fingerprint.shader_id;
    fp["version"] = fingerprint.version;
    fp["inputSeed"] = fingerprint.input_seed;
    fp["outputHash"] = fingerprint.output_hash;
    fp["timestamp"] = fingerprint.timestamp;

    nlohmann::ordered_json j;
    j["index"] = index;
    j["previousHash"] = previous_hash;
    j["fingerprint"] = fp;
    j["workProof"] = work_proof;
    return j.dump();
}

std::string StateChainLink::compute_hash() const {
    return crypto::Sha256::hex(canonical_payload());
}

bool StateChainLink::operator==(const StateChainLink& other) const {
    return index == other.index &&
           previous_hash == other.previous_hash &&
           fingerprint == other.fingerprint &&
           work_proof == other.work_proof &&
           link_hash == other.link_hash;
}

// StateChain

StateChain::StateChain(std::string client_version, const ShaderRegistry& registry)
    : version_(std::move(client_version)),
      registry_(registry),
      current_hash_(constants::GENESIS_HASH)
{
}

StateChainLink StateChain::add_link(
    const std::string& shader_id,
    const std::string& input_seed,
    const std::string& work_proof
) {
    std::string output = registry_.execute(shader_id, input_seed);

    StateChainLink link;
    link.index = links_.size();
    link.previous_hash = current_hash_;
    link.fingerprint.shader_id = shader_id;
    link.fingerprint.version = version_;
    link.fingerprint.input_seed = input_seed;
    link.fingerprint.output_hash = output;
    link.fingerprint.timestamp = time::timestamp_milliseconds();
    link.work_proof = work_proof;
    link.link_hash = link.compute_hash();

    links_.push_back(link);
    current_hash_ = link.link_hash;

    SHADERCHAIN_LOG_TRACE("Chain link {} added: shader={}, hash={}",
                          link.index, shader_id, link.link_hash);

    return link;
}

ChainExport StateChain::export_chain() const {
    return ChainExport{links_, current_hash_, version_};
}

StateChain StateChain::import_chain(const ChainExport& data, const ShaderRegistry& registry) {
    StateChain chain(data.version, registry);

    if (data.links.empty()) {
        if (data.chain_hash != constants::GENESIS_HASH) {
            throw ChainImportError("empty chain must have the genesis head hash");
        }
        return chain;
    }

    for (size_t i = 0; i < data.links.size(); ++i) {
        if (data.links[i].index != i) {
            throw ChainImportError("link " + std::to_string(i) + " has index " +
                                   std::to_string(data.links[i].index));
        }
    }

    if (!verify_links(data.links, constants::GENESIS_HASH)) {
        throw ChainImportError("links do not form an intact chain from genesis");
    }

    if (data.links.back().link_hash != data.chain_hash) {
        throw ChainImportError("head hash does not match the last link");
    }

    chain.links_ = data.links;
    chain.current_hash_ = data.chain_hash;

    SHADERCHAIN_LOG_DEBUG("Imported state chain: {} links, head={}",
                          chain.links_.size(), chain.current_hash_);
    return chain;
}

bool StateChain::verify_links(
    const std::vector<StateChainLink>& links,
    const std::string& expected_previous_hash
) {
    if (links.empty()) {
        return false;
    }

    if (links.front().previous_hash != expected_previous_hash) {
        return false;
    }

    for (size_t i = 0; i < links.size(); ++i) {
        const auto& link = links[i];

        // Recompute, don't trust
        if (link.link_hash != link.compute_hash()) {
            return false;
        }

        if (i > 0 && link.previous_hash != links[i - 1].link_hash) {
            return false;
        }
    }

    return true;
}

} // namespace shaderchain::core
