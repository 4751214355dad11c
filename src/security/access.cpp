#include "security/access.hpp"
#include "crypto/blake3.hpp"
#include "shaderchain/time_utils.hpp"
#include "utils/logger.hpp"
#include <sodium.h>

namespace shaderchain::security {

// AccessToken

std::string AccessToken::payload() const {
    nlohmann::ordered_json j;
    j["sessionId"] = session_id;
    j["chainHash"] = chain_hash;
    j["trustScore"] = trust_score;
    j["issuedAt"] = issued_at;
    j["expiresAt"] = expires_at;
    return j.dump();
}

// AccessTokenIssuer

AccessTokenIssuer::AccessTokenIssuer(const std::string& secret, uint64_t ttl_ms)
    : key_(crypto::Blake3::derive_key(secret)), ttl_ms_(ttl_ms)
{
}

std::string AccessTokenIssuer::mac(const std::string& payload) const {
    return crypto::Blake3::hash_to_hex(crypto::Blake3::keyed_hash(key_, payload));
}

std::string AccessTokenIssuer::issue(const std::string& session_id, const core::ClientState& state) const {
    return issue(session_id, state.last_chain_hash, state.trust_score, time::timestamp_milliseconds());
}

std::string AccessTokenIssuer::issue(
    const std::string& session_id,
    const std::string& chain_hash,
    int32_t trust_score,
    uint64_t now_ms
) const {
    AccessToken token;
    token.session_id = session_id;
    token.chain_hash = chain_hash;
    token.trust_score = trust_score;
    token.issued_at = now_ms;
    token.expires_at = time::deadline_after(now_ms, ttl_ms_);

    std::string payload = token.payload();
    return base64_encode(payload.data(), payload.size()) + "." + mac(payload);
}

Result<AccessToken> AccessTokenIssuer::verify(
    const std::string& token,
    const std::string& session_id,
    uint64_t now_ms
) const {
    auto dot = token.find('.');
    if (dot == std::string::npos || dot == 0) {
        return Result<AccessToken>::Err(ErrorCode::AccessTokenInvalid, "Malformed token");
    }

    auto decoded = base64_decode(token.substr(0, dot));
    if (!decoded) {
        return Result<AccessToken>::Err(ErrorCode::AccessTokenInvalid, "Malformed token payload");
    }
    std::string payload(decoded->begin(), decoded->end());

    auto presented = crypto::Blake3::hash_from_hex(token.substr(dot + 1));
    if (!presented) {
        return Result<AccessToken>::Err(ErrorCode::AccessTokenInvalid, "Malformed token MAC");
    }

    Hash256 expected = crypto::Blake3::keyed_hash(key_, payload);
    if (sodium_memcmp(expected.data(), presented->data(), expected.size()) != 0) {
        return Result<AccessToken>::Err(ErrorCode::AccessTokenInvalid, "Token MAC mismatch");
    }

    AccessToken claims;
    try {
        auto j = nlohmann::json::parse(payload);
        claims.session_id = j.at("sessionId").get<std::string>();
        claims.chain_hash = j.at("chainHash").get<std::string>();
        claims.trust_score = j.at("trustScore").get<int32_t>();
        claims.issued_at = j.at("issuedAt").get<uint64_t>();
        claims.expires_at = j.at("expiresAt").get<uint64_t>();
    } catch (const nlohmann::json::exception& e) {
        return Result<AccessToken>::Err(ErrorCode::AccessTokenInvalid,
                                        std::string("Bad token payload: ") + e.what());
    }

    if (claims.session_id != session_id) {
        return Result<AccessToken>::Err(ErrorCode::AccessTokenInvalid, "Token issued to another session");
    }

    if (claims.is_expired(now_ms)) {
        return Result<AccessToken>::Err(ErrorCode::AccessTokenExpired, "Token expired");
    }

    return Result<AccessToken>::Ok(claims);
}

// ResourceCatalog

void ResourceCatalog::add(Resource resource) {
    std::string id = resource.id;
    resources_[id] = std::move(resource);
}

const Resource* ResourceCatalog::find(const std::string& resource_id) const {
    auto it = resources_.find(resource_id);
    if (it == resources_.end()) {
        return nullptr;
    }
    return &it->second;
}

int32_t ResourceCatalog::default_threshold(const std::string& resource_id) {
    if (resource_id.find("legendary") != std::string::npos) return 80;
    if (resource_id.find("supreme") != std::string::npos) return 70;
    if (resource_id.find("advanced") != std::string::npos) return 60;
    return 50;
}

ResourceCatalog ResourceCatalog::default_catalog() {
    ResourceCatalog catalog;

    auto gated = [&](const std::string& id, const std::string& data) {
        catalog.add(Resource{id, true, default_threshold(id), data});
    };

    gated("content:legendary_bundle", "Legendary content bundle");
    gated("content:supreme_pack", "Supreme content pack");
    gated("config:advanced_profile", "Advanced configuration profile");
    gated("texture:rare_set", "Rare texture set");
    catalog.add(Resource{"content:public_notes", false, 0, "Public release notes"});

    return catalog;
}

Result<ResourceCatalog> ResourceCatalog::from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        return Result<ResourceCatalog>::Err(ErrorCode::ConfigInvalid, "resources must be an array");
    }

    ResourceCatalog catalog;
    try {
        for (const auto& entry : j) {
            Resource resource;
            resource.id = entry.at("id").get<std::string>();
            resource.gated = entry.value("gated", true);
            resource.min_trust = entry.value("minTrust", default_threshold(resource.id));
            resource.data = entry.value("data", std::string());
            catalog.add(std::move(resource));
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<ResourceCatalog>::Err(ErrorCode::ConfigInvalid,
                                            std::string("Bad resource entry: ") + e.what());
    }

    return Result<ResourceCatalog>::Ok(std::move(catalog));
}

// ResourceDecision

ResourceDecision ResourceDecision::allow(const Resource& resource, std::optional<uint64_t> valid_until) {
    ResourceDecision decision;
    decision.granted = true;
    decision.resource_id = resource.id;
    decision.data = resource.data;
    decision.valid_until = valid_until;
    return decision;
}

ResourceDecision ResourceDecision::deny(const std::string& error, const std::string& hint) {
    ResourceDecision decision;
    decision.error = error;
    decision.hint = hint;
    return decision;
}

// ResourceGate

ResourceGate::ResourceGate(const ResourceCatalog& catalog,
                           const AccessTokenIssuer& issuer,
                           uint64_t resource_ttl_ms)
    : catalog_(catalog), issuer_(issuer), resource_ttl_ms_(resource_ttl_ms)
{
}

ResourceDecision ResourceGate::check(
    const std::string& session_id,
    const std::optional<core::ClientState>& state,
    const std::string& resource_id,
    const std::string& access_token,
    uint64_t now_ms
) const {
    if (!state) {
        return ResourceDecision::deny("Client not verified");
    }

    const Resource* resource = catalog_.find(resource_id);
    if (resource == nullptr) {
        return ResourceDecision::deny("Resource not found");
    }

    if (!resource->gated) {
        return ResourceDecision::allow(*resource, std::nullopt);
    }

    auto token = issuer_.verify(access_token, session_id, now_ms);
    if (token.is_err()) {
        SHADERCHAIN_LOG_WARN("Access token rejected for {}: {}", session_id, token.error().message());
        return ResourceDecision::deny("Invalid access token");
    }

    if (state->trust_score < resource->min_trust) {
        return ResourceDecision::deny(
            "Insufficient trust score. Required: " + std::to_string(resource->min_trust) +
            ", Current: " + std::to_string(state->trust_score),
            "Complete more shader verification challenges to increase trust.");
    }

    SHADERCHAIN_LOG_INFO("Resource {} granted to {}", resource_id, session_id);
    return ResourceDecision::allow(*resource, time::deadline_after(now_ms, resource_ttl_ms_));
}

} // namespace shaderchain::security
