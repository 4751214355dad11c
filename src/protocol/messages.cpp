#include "protocol/messages.hpp"

namespace shaderchain::core {

// ShaderFingerprint

void to_json(nlohmann::json& j, const ShaderFingerprint& fp) {
    j = nlohmann::json{
        {"shaderId", fp.shader_id},
        {"version", fp.version},
        {"inputSeed", fp.input_seed},
        {"outputHash", fp.output_hash},
        {"timestamp", fp.timestamp}
    };
}

void from_json(const nlohmann::json& j, ShaderFingerprint& fp) {
    j.at("shaderId").get_to(fp.shader_id);
    j.at("version").get_to(fp.version);
    j.at("inputSeed").get_to(fp.input_seed);
    j.at("outputHash").get_to(fp.output_hash);
    j.at("timestamp").get_to(fp.timestamp);
}

// StateChainLink

void to_json(nlohmann::json& j, const StateChainLink& link) {
    j = nlohmann::json{
        {"index", link.index},
        {"previousHash", link.previous_hash},
        {"shaderFingerprint", link.fingerprint},
        {"workProof", link.work_proof},
        {"linkHash", link.link_hash}
    };
}

void from_json(const nlohmann::json& j, StateChainLink& link) {
    j.at("index").get_to(link.index);
    j.at("previousHash").get_to(link.previous_hash);
    if (j.contains("shaderFingerprint")) {
        j.at("shaderFingerprint").get_to(link.fingerprint);
    } else {
        j.at("fingerprint").get_to(link.fingerprint);
    }
    j.at("workProof").get_to(link.work_proof);
    j.at("linkHash").get_to(link.link_hash);
}

// ChainExport

void to_json(nlohmann::json& j, const ChainExport& data) {
    j = nlohmann::json{
        {"links", data.links},
        {"currentHash", data.chain_hash},
        {"version", data.version}
    };
}

void from_json(const nlohmann::json& j, ChainExport& data) {
    j.at("links").get_to(data.links);
    j.at("currentHash").get_to(data.chain_hash);
    j.at("version").get_to(data.version);
}

// DRMChallenge

void to_json(nlohmann::json& j, const DRMChallenge& challenge) {
    j = nlohmann::json{
        {"challengeId", challenge.challenge_id},
        {"requiredShaders", challenge.required_shaders},
        {"inputSeeds", challenge.input_seeds},
        {"previousChainHash", challenge.previous_chain_hash},
        {"difficulty", challenge.difficulty},
        {"expiresAt", challenge.expires_at},
        {"workType", challenge.work_type}
    };
}

void from_json(const nlohmann::json& j, DRMChallenge& challenge) {
    j.at("challengeId").get_to(challenge.challenge_id);
    j.at("requiredShaders").get_to(challenge.required_shaders);

    const auto& seeds = j.at("inputSeeds");
    challenge.input_seeds.clear();
    if (seeds.is_array()) {
        for (const auto& pair : seeds) {
            challenge.input_seeds[pair.at(0).get<std::string>()] = pair.at(1).get<std::string>();
        }
    } else {
        seeds.get_to(challenge.input_seeds);
    }

    j.at("previousChainHash").get_to(challenge.previous_chain_hash);
    j.at("difficulty").get_to(challenge.difficulty);
    j.at("expiresAt").get_to(challenge.expires_at);
    challenge.work_type = j.value("workType", std::string());
}

// DRMResponse

void to_json(nlohmann::json& j, const DRMResponse& response) {
    j = nlohmann::json{
        {"challengeId", response.challenge_id},
        {"clientVersion", response.client_version},
        {"stateChain", response.state_chain},
        {"workResult", response.work_result},
        {"nonce", response.nonce},
        {"clientSignature", response.client_signature}
    };
}

void from_json(const nlohmann::json& j, DRMResponse& response) {
    j.at("challengeId").get_to(response.challenge_id);
    j.at("clientVersion").get_to(response.client_version);
    j.at("stateChain").get_to(response.state_chain);
    j.at("workResult").get_to(response.work_result);
    j.at("nonce").get_to(response.nonce);
    response.client_signature = j.value("clientSignature", std::string());
}

// VerificationResult

void to_json(nlohmann::json& j, const VerificationResult& result) {
    j = nlohmann::json{
        {"valid", result.valid},
        {"versionMatch", result.version_match},
        {"chainIntegrity", result.chain_integrity},
        {"shaderOutputsMatch", result.shader_outputs_match},
        {"workValid", result.work_valid},
        {"errors", result.errors}
    };
}

// VersionManifest

void to_json(nlohmann::json& j, const VersionManifest& manifest) {
    j = nlohmann::json{
        {"version", manifest.version},
        {"shaderHashes", manifest.shader_hashes},
        {"expectedOutputs", manifest.expected_outputs},
        {"buildTimestamp", manifest.build_timestamp},
        {"signature", manifest.signature}
    };
}

} // namespace shaderchain::core

namespace shaderchain::protocol {

Result<Envelope> decode_envelope(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<Envelope>::Err(ErrorCode::ProtocolInvalidMessage,
                                     std::string("Malformed JSON: ") + e.what());
    }

    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return Result<Envelope>::Err(ErrorCode::ProtocolInvalidMessage, "Message has no type");
    }

    Envelope envelope;
    envelope.type = j["type"].get<std::string>();

    if (j.contains("sessionId") && j["sessionId"].is_string()) {
        envelope.session_id = j["sessionId"].get<std::string>();
    }

    if (j.contains("payload") && !j["payload"].is_null()) {
        envelope.payload = j["payload"];
    }

    return Result<Envelope>::Ok(std::move(envelope));
}

std::string encode_envelope(const Envelope& envelope) {
    nlohmann::json j;
    j["type"] = envelope.type;
    if (envelope.session_id) {
        j["sessionId"] = *envelope.session_id;
    }
    j["payload"] = envelope.payload;
    return j.dump();
}

nlohmann::json make_error(const std::string& message) {
    return nlohmann::json{{"type", message_types::ERROR_REPLY}, {"error", message}};
}

} // namespace shaderchain::protocol
