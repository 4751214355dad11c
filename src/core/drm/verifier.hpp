#pragma once

#include "core/drm/stores.hpp"
#include "core/drm/types.hpp"
#include "core/manifest/version_manifest.hpp"
#include "core/shader/shader_registry.hpp"
#include <optional>
#include <string>

namespace shaderchain::core {

/**
 * Verifier - Server side trust boundary
 *
 * verify() is pure over its inputs and never throws on an adversarial
 * response: every failed check becomes a flag plus an error string.
 * Trust is only changed through update_client_state().
 */
class Verifier {
public:
    Verifier(const VersionManifest& manifest,
             const ShaderRegistry& registry,
             DrmStores& stores,
             bool strict_work = false);

    VerificationResult verify(const DRMChallenge& challenge, const DRMResponse& response) const;

    /**
     * Verify against an explicit clock
     * Expired or mismatched challenges stop before any other check.
     */
    VerificationResult verify(
        const DRMChallenge& challenge,
        const DRMResponse& response,
        uint64_t now_ms
    ) const;

    /**
     * Apply a completed verification to the client's state
     * @return updated state, nullopt if the client was never initialized
     */
    std::optional<ClientState> update_client_state(
        const std::string& client_id,
        const DRMResponse& response,
        const VerificationResult& result
    );

    std::optional<ClientState> update_client_state(
        const std::string& client_id,
        const DRMResponse& response,
        const VerificationResult& result,
        uint64_t now_ms
    );

    ClientState initialize_client(const std::string& client_id, const std::string& version);
    std::optional<ClientState> get_client_state(const std::string& client_id) const;

    /**
     * Trust after one verification: +5 / -20, then -30 for a version
     * mismatch and -50 for a shader mismatch, clamped to [0, 100] per step
     */
    static int32_t calculate_trust_score(int32_t current, const VerificationResult& result);

    const VersionManifest& manifest() const { return manifest_; }
    bool strict_work() const { return strict_work_; }

private:
    const VersionManifest& manifest_;
    const ShaderRegistry& registry_;
    DrmStores& stores_;
    bool strict_work_;

    bool check_shader_outputs(const DRMChallenge& challenge,
                              const DRMResponse& response,
                              std::vector<std::string>& errors) const;
};

} // namespace shaderchain::core
