#pragma once

#include "shaderchain/error.hpp"
#include "core/chain/state_chain.hpp"
#include "core/drm/types.hpp"
#include "core/manifest/version_manifest.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// JSON wire forms of the protocol types (found through ADL)
namespace shaderchain::core {

void to_json(nlohmann::json& j, const ShaderFingerprint& fp);
void from_json(const nlohmann::json& j, ShaderFingerprint& fp);

void to_json(nlohmann::json& j, const StateChainLink& link);
void from_json(const nlohmann::json& j, StateChainLink& link);

void to_json(nlohmann::json& j, const ChainExport& data);
void from_json(const nlohmann::json& j, ChainExport& data);

// inputSeeds is written as an object; an array of [key, value] pairs is
// also accepted
void to_json(nlohmann::json& j, const DRMChallenge& challenge);
void from_json(const nlohmann::json& j, DRMChallenge& challenge);

void to_json(nlohmann::json& j, const DRMResponse& response);
void from_json(const nlohmann::json& j, DRMResponse& response);

void to_json(nlohmann::json& j, const VerificationResult& result);

void to_json(nlohmann::json& j, const VersionManifest& manifest);

} // namespace shaderchain::core

namespace shaderchain::protocol {

/**
 * Message type names
 */
namespace message_types {
    // Client -> server
    constexpr const char* INIT = "drm_init";
    constexpr const char* CHALLENGE_REQUEST = "drm_challenge_request";
    constexpr const char* RESPONSE = "drm_response";
    constexpr const char* RESOURCE_REQUEST = "drm_resource_request";

    // Server -> client
    constexpr const char* INIT_RESPONSE = "drm_init_response";
    constexpr const char* CHALLENGE = "drm_challenge";
    constexpr const char* VERIFY_RESULT = "drm_verify_result";
    constexpr const char* RESOURCE_RESPONSE = "drm_resource_response";
    constexpr const char* ERROR_REPLY = "drm_error";
}

/**
 * Envelope - Client message {"type", "sessionId"?, "payload"}
 */
struct Envelope {
    std::string type;
    std::optional<std::string> session_id;
    nlohmann::json payload = nlohmann::json::object();
};

/**
 * Parse a client message
 */
Result<Envelope> decode_envelope(const std::string& text);

std::string encode_envelope(const Envelope& envelope);

/**
 * Decode a payload into a protocol type
 */
template<typename T>
Result<T> decode_payload(const nlohmann::json& payload) {
    try {
        return Result<T>::Ok(payload.get<T>());
    } catch (const nlohmann::json::exception& e) {
        return Result<T>::Err(ErrorCode::ProtocolInvalidMessage,
                              std::string("Invalid payload: ") + e.what());
    }
}

/**
 * Server reply {"type": ..., "error": ...}
 */
nlohmann::json make_error(const std::string& message);

} // namespace shaderchain::protocol
