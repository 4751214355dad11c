#include "server/drm_service.hpp"
#include "shaderchain/time_utils.hpp"
#include "utils/logger.hpp"

namespace shaderchain::server {

using nlohmann::json;

namespace {
    const char* const CLIENT_NOT_INITIALIZED = "Client not initialized. Send drm_init first.";
}

// ServiceConfig

ServiceConfig ServiceConfig::from_config(const utils::Config& config) {
    ServiceConfig sc;
    sc.server_version = config.get_or<std::string>("server_version", sc.server_version);
    sc.build_salt = config.get_or<std::string>("build_salt", sc.build_salt);
    sc.signing_secret = config.get_or<std::string>("signing_secret", sc.signing_secret);
    sc.token_secret = config.get_or<std::string>("token_secret", sc.token_secret);
    sc.challenge_ttl_ms = config.get_or<uint64_t>("challenge_ttl_ms", sc.challenge_ttl_ms);
    sc.token_ttl_ms = config.get_or<uint64_t>("token_ttl_ms", sc.token_ttl_ms);
    sc.resource_ttl_ms = config.get_or<uint64_t>("resource_ttl_ms", sc.resource_ttl_ms);
    sc.session_idle_timeout_ms = config.get_or<uint64_t>("session_idle_timeout_ms", sc.session_idle_timeout_ms);
    sc.strict_work_verification = config.get_or<bool>("strict_work_verification", sc.strict_work_verification);
    sc.default_work_type = config.get_or<std::string>("default_work_type", sc.default_work_type);

    if (config.has("resources")) {
        auto catalog = security::ResourceCatalog::from_json(config.data().at("resources"));
        if (catalog.is_err()) {
            throw ShaderChainException(catalog.error().code(), catalog.error().message());
        }
        sc.catalog = catalog.value();
    }

    return sc;
}

// DrmService

DrmService::DrmService(ServiceConfig config)
    : config_(std::move(config)),
      registry_(config_.build_salt),
      manifest_(core::ManifestBuilder::build(config_.server_version, registry_, config_.signing_secret)),
      generator_(stores_, config_.challenge_ttl_ms),
      verifier_(manifest_, registry_, stores_, config_.strict_work_verification),
      issuer_(config_.token_secret, config_.token_ttl_ms),
      gate_(config_.catalog, issuer_, config_.resource_ttl_ms),
      sessions_(config_.session_idle_timeout_ms)
{
    SHADERCHAIN_LOG_INFO("DRM service ready: version={}, strict_work={}, resources={}",
                         manifest_.version, config_.strict_work_verification, config_.catalog.size());
}

std::string DrmService::open_session() {
    return open_session(time::timestamp_milliseconds());
}

std::string DrmService::open_session(uint64_t now_ms) {
    return sessions_.create_session(now_ms);
}

void DrmService::close_session(const std::string& session_id) {
    sessions_.remove_session(session_id);
    forget_client(session_id);
}

void DrmService::forget_client(const std::string& session_id) {
    size_t dropped = stores_.challenges.remove_client(session_id);
    if (stores_.clients.remove(session_id) || dropped > 0) {
        SHADERCHAIN_LOG_DEBUG("Dropped state of {} ({} pending challenges)", session_id, dropped);
    }
}

std::string DrmService::handle_message(const std::string& session_id, const std::string& text) {
    return handle_message(session_id, text, time::timestamp_milliseconds());
}

std::string DrmService::handle_message(const std::string& session_id, const std::string& text, uint64_t now_ms) {
    if (!sessions_.touch(session_id, now_ms)) {
        return protocol::make_error("Session not found").dump();
    }

    auto envelope = protocol::decode_envelope(text);
    if (envelope.is_err()) {
        SHADERCHAIN_LOG_WARN("Rejected message on {}: {}", session_id, envelope.error().message());
        return protocol::make_error(envelope.error().message()).dump();
    }

    const auto& msg = envelope.value();
    json reply;

    if (msg.type == protocol::message_types::INIT) {
        reply = handle_init(session_id, msg.payload, now_ms);
    } else if (msg.type == protocol::message_types::CHALLENGE_REQUEST) {
        reply = handle_challenge_request(session_id, msg.payload, now_ms);
    } else if (msg.type == protocol::message_types::RESPONSE) {
        reply = handle_response(session_id, msg.payload, now_ms);
    } else if (msg.type == protocol::message_types::RESOURCE_REQUEST) {
        reply = handle_resource_request(session_id, msg.payload, now_ms);
    } else {
        reply = protocol::make_error("Unknown message type: " + msg.type);
    }

    return reply.dump();
}

json DrmService::handle_init(const std::string& session_id, const json& payload, uint64_t now_ms) {
    if (!payload.is_object() || !payload.contains("clientVersion") || !payload["clientVersion"].is_string()) {
        return protocol::make_error("Invalid payload: clientVersion is required");
    }

    std::string client_version = payload["clientVersion"].get<std::string>();
    core::ClientState state = verifier_.initialize_client(session_id, client_version);
    bool version_match = client_version == manifest_.version;

    json reply;
    reply["type"] = protocol::message_types::INIT_RESPONSE;
    reply["serverVersion"] = manifest_.version;
    reply["versionMatch"] = version_match;
    reply["clientState"] = {
        {"trustScore", state.trust_score},
        {"chainLength", state.chain_length},
        {"totalWorkCompleted", state.total_work_completed}
    };

    if (version_match) {
        reply["initialChallenge"] = generator_.generate_challenge(state, config_.default_work_type, now_ms);
    } else {
        SHADERCHAIN_LOG_WARN("Client {} announced version {} (server {})",
                             session_id, client_version, manifest_.version);
        reply["initialChallenge"] = nullptr;
    }

    return reply;
}

json DrmService::handle_challenge_request(const std::string& session_id, const json& payload, uint64_t now_ms) {
    auto state = verifier_.get_client_state(session_id);
    if (!state) {
        return protocol::make_error(CLIENT_NOT_INITIALIZED);
    }

    std::string work_type = config_.default_work_type;
    if (payload.is_object() && payload.contains("workType") && payload["workType"].is_string()) {
        work_type = payload["workType"].get<std::string>();
    }

    json reply;
    reply["type"] = protocol::message_types::CHALLENGE;
    reply["challenge"] = generator_.generate_challenge(*state, work_type, now_ms);
    return reply;
}

json DrmService::handle_response(const std::string& session_id, const json& payload, uint64_t now_ms) {
    if (!verifier_.get_client_state(session_id)) {
        return protocol::make_error(CLIENT_NOT_INITIALIZED);
    }

    auto response = protocol::decode_payload<core::DRMResponse>(payload);
    if (response.is_err()) {
        return protocol::make_error(response.error().message());
    }

    auto challenge = stores_.challenges.take(response.value().challenge_id, session_id, now_ms);
    if (!challenge) {
        return json{
            {"type", protocol::message_types::VERIFY_RESULT},
            {"valid", false},
            {"error", "Challenge not found or expired"}
        };
    }

    core::VerificationResult result = verifier_.verify(*challenge, response.value(), now_ms);
    auto updated = verifier_.update_client_state(session_id, response.value(), result, now_ms);
    total_verifications_.fetch_add(1);

    if (result.valid) {
        uint64_t issued_at = challenge->expires_at - config_.challenge_ttl_ms;
        sessions_.record_challenge(session_id, time::elapsed_between(issued_at, now_ms), now_ms);
    }

    json reply = result;
    reply["type"] = protocol::message_types::VERIFY_RESULT;

    if (updated) {
        reply["updatedState"] = {
            {"trustScore", updated->trust_score},
            {"chainLength", updated->chain_length}
        };
    } else {
        reply["updatedState"] = nullptr;
    }

    if (result.valid && updated) {
        reply["accessToken"] = issuer_.issue(session_id, updated->last_chain_hash,
                                             updated->trust_score, now_ms);
    } else {
        reply["accessToken"] = nullptr;
    }

    return reply;
}

json DrmService::handle_resource_request(const std::string& session_id, const json& payload, uint64_t now_ms) {
    std::string resource_id;
    std::string access_token;
    if (payload.is_object()) {
        if (payload.contains("resourceId") && payload["resourceId"].is_string()) {
            resource_id = payload["resourceId"].get<std::string>();
        }
        if (payload.contains("accessToken") && payload["accessToken"].is_string()) {
            access_token = payload["accessToken"].get<std::string>();
        }
    }

    auto decision = gate_.check(session_id, verifier_.get_client_state(session_id),
                                resource_id, access_token, now_ms);

    json reply;
    reply["type"] = protocol::message_types::RESOURCE_RESPONSE;
    reply["granted"] = decision.granted;

    if (decision.granted) {
        reply["resourceId"] = decision.resource_id;
        reply["data"] = decision.data;
        if (decision.valid_until) {
            reply["validUntil"] = *decision.valid_until;
        }
    } else {
        reply["error"] = decision.error;
        if (!decision.hint.empty()) {
            reply["hint"] = decision.hint;
        }
    }

    return reply;
}

json DrmService::stats() const {
    return json{
        {"activeClients", stores_.clients.size()},
        {"totalVerifications", total_verifications_.load()},
        {"averageTrustScore", stores_.clients.average_trust()},
        {"activeChallenges", stores_.challenges.size()}
    };
}

size_t DrmService::purge_expired_challenges() {
    return purge_expired_challenges(time::timestamp_milliseconds());
}

size_t DrmService::purge_expired_challenges(uint64_t now_ms) {
    return stores_.challenges.purge_expired(now_ms);
}

std::vector<std::string> DrmService::cleanup_stale_sessions(uint64_t now_ms) {
    auto removed = sessions_.cleanup_stale_sessions(now_ms);
    for (const auto& session_id : removed) {
        forget_client(session_id);
    }
    return removed;
}

} // namespace shaderchain::server
