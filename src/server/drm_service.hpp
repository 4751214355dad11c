#pragma once

#include "core/drm/challenge_generator.hpp"
#include "core/drm/stores.hpp"
#include "core/drm/verifier.hpp"
#include "core/manifest/version_manifest.hpp"
#include "core/shader/shader_registry.hpp"
#include "protocol/messages.hpp"
#include "security/access.hpp"
#include "server/session.hpp"
#include "utils/config.hpp"
#include <atomic>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace shaderchain::server {

/**
 * Service settings, normally read from the configuration file
 */
struct ServiceConfig {
    std::string server_version = SHADERCHAIN_VERSION_STRING;
    std::string build_salt = SHADERCHAIN_BUILD_SALT;
    std::string signing_secret = "shaderchain-dev-signing-secret";
    std::string token_secret = "shaderchain-dev-token-secret";
    uint64_t challenge_ttl_ms = constants::CHALLENGE_TTL_MS;
    uint64_t token_ttl_ms = constants::ACCESS_TOKEN_TTL_MS;
    uint64_t resource_ttl_ms = constants::RESOURCE_TTL_MS;
    uint64_t session_idle_timeout_ms = constants::SESSION_IDLE_TIMEOUT_MS;
    bool strict_work_verification = false;
    std::string default_work_type = core::work_types::SHADER_VERIFY;
    security::ResourceCatalog catalog = security::ResourceCatalog::default_catalog();

    /**
     * @throws ShaderChainException if the resource catalog is malformed
     */
    static ServiceConfig from_config(const utils::Config& config);
};

/**
 * DrmService - Server side of the message protocol
 *
 * Transport independent: a transport opens a session per connection and
 * feeds each received text frame to handle_message(), sending back the
 * returned text. The session id is the client id of the trust store.
 */
class DrmService {
public:
    explicit DrmService(ServiceConfig config = ServiceConfig());

    SHADERCHAIN_DISALLOW_COPY_AND_MOVE(DrmService);

    std::string open_session();
    std::string open_session(uint64_t now_ms);
    void close_session(const std::string& session_id);

    /**
     * Handle one client message and produce the reply text
     */
    std::string handle_message(const std::string& session_id, const std::string& text);
    std::string handle_message(const std::string& session_id, const std::string& text, uint64_t now_ms);

    /**
     * {activeClients, totalVerifications, averageTrustScore, activeChallenges}
     */
    nlohmann::json stats() const;

    size_t purge_expired_challenges();
    size_t purge_expired_challenges(uint64_t now_ms);

    std::vector<std::string> cleanup_stale_sessions(uint64_t now_ms);

    const core::VersionManifest& manifest() const { return manifest_; }
    const core::ShaderRegistry& registry() const { return registry_; }
    const SessionRegistry& sessions() const { return sessions_; }
    const ServiceConfig& config() const { return config_; }

private:
    ServiceConfig config_;
    core::ShaderRegistry registry_;
    core::VersionManifest manifest_;
    core::DrmStores stores_;
    core::ChallengeGenerator generator_;
    core::Verifier verifier_;
    security::AccessTokenIssuer issuer_;
    security::ResourceGate gate_;
    SessionRegistry sessions_;
    std::atomic<uint64_t> total_verifications_{0};

    // Client state and pending challenges are keyed by session id
    void forget_client(const std::string& session_id);

    nlohmann::json handle_init(const std::string& session_id, const nlohmann::json& payload, uint64_t now_ms);
    nlohmann::json handle_challenge_request(const std::string& session_id, const nlohmann::json& payload, uint64_t now_ms);
    nlohmann::json handle_response(const std::string& session_id, const nlohmann::json& payload, uint64_t now_ms);
    nlohmann::json handle_resource_request(const std::string& session_id, const nlohmann::json& payload, uint64_t now_ms);
};

} // namespace shaderchain::server
