#pragma once

#include "shaderchain/common.hpp"
#include "shaderchain/error.hpp"
#include "core/drm/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace shaderchain::security {

/**
 * AccessToken - Claims carried by a server-issued access token
 */
struct AccessToken {
    std::string session_id;
    std::string chain_hash;
    int32_t trust_score = 0;
    uint64_t issued_at = 0;
    uint64_t expires_at = 0;

    bool is_expired(uint64_t now_ms) const { return now_ms >= expires_at; }

    /**
     * Canonical JSON text the MAC covers
     */
    std::string payload() const;
};

/**
 * AccessTokenIssuer - Short-lived tokens after a successful verification
 *
 * Format: base64(payload) "." hex(BLAKE3 keyed hash of payload). The key is
 * derived from the server token secret. There is no revocation list; tokens
 * simply expire.
 */
class AccessTokenIssuer {
public:
    explicit AccessTokenIssuer(const std::string& secret,
                               uint64_t ttl_ms = constants::ACCESS_TOKEN_TTL_MS);

    std::string issue(const std::string& session_id, const core::ClientState& state) const;

    std::string issue(
        const std::string& session_id,
        const std::string& chain_hash,
        int32_t trust_score,
        uint64_t now_ms
    ) const;

    /**
     * Check MAC, session binding and expiry
     */
    Result<AccessToken> verify(
        const std::string& token,
        const std::string& session_id,
        uint64_t now_ms
    ) const;

    uint64_t ttl_ms() const { return ttl_ms_; }

private:
    Hash256 key_;
    uint64_t ttl_ms_;

    std::string mac(const std::string& payload) const;
};

/**
 * Resource - One catalog entry
 */
struct Resource {
    std::string id;
    bool gated = true;
    int32_t min_trust = 50;
    std::string data;
};

/**
 * ResourceCatalog - Resources and their trust thresholds
 */
class ResourceCatalog {
public:
    ResourceCatalog() = default;

    void add(Resource resource);
    const Resource* find(const std::string& resource_id) const;
    size_t size() const { return resources_.size(); }

    /**
     * Threshold implied by the id: legendary 80, supreme 70, advanced 60,
     * otherwise 50
     */
    static int32_t default_threshold(const std::string& resource_id);

    static ResourceCatalog default_catalog();

    /**
     * Parse a catalog from a JSON array of {id, gated?, minTrust?, data?}
     */
    static Result<ResourceCatalog> from_json(const nlohmann::json& j);

private:
    std::map<std::string, Resource> resources_;
};

/**
 * ResourceDecision - Outcome of a resource request
 */
struct ResourceDecision {
    bool granted = false;
    std::string resource_id;
    std::string data;
    std::string error;
    std::string hint;
    std::optional<uint64_t> valid_until;

    static ResourceDecision allow(const Resource& resource, std::optional<uint64_t> valid_until);
    static ResourceDecision deny(const std::string& error, const std::string& hint = "");
};

/**
 * ResourceGate - Policy check for gated resources
 *
 * Order: client known, resource known, ungated, token valid, trust high
 * enough.
 */
class ResourceGate {
public:
    ResourceGate(const ResourceCatalog& catalog,
                 const AccessTokenIssuer& issuer,
                 uint64_t resource_ttl_ms = constants::RESOURCE_TTL_MS);

    ResourceDecision check(
        const std::string& session_id,
        const std::optional<core::ClientState>& state,
        const std::string& resource_id,
        const std::string& access_token,
        uint64_t now_ms
    ) const;

private:
    const ResourceCatalog& catalog_;
    const AccessTokenIssuer& issuer_;
    uint64_t resource_ttl_ms_;
};

} // namespace shaderchain::security
