#pragma once

#include "shaderchain/common.hpp"
#include "core/shader/shader_registry.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shaderchain::core {

/**
 * VersionManifest - Canonical description of one server build
 *
 * Ground truth for verification: the build version, a hash of every shader
 * definition and the expected output for every test seed. Immutable once
 * built.
 */
struct VersionManifest {
    std::string version;
    std::map<std::string, std::string> shader_hashes;      // shader id -> definition hash
    std::map<std::string, std::string> expected_outputs;   // test seed -> expected output
    uint64_t build_timestamp = 0;
    std::string signature;

    /**
     * Serialization of {version, shaderHashes, expectedOutputs, buildTimestamp}
     * covered by the signature
     */
    std::string signed_payload() const;

    /**
     * Recompute the signature with the signing secret
     */
    bool verify_signature(const std::string& signing_secret) const;

    /**
     * Compare a registry against this manifest
     * @return ids of shaders whose definition hash or test output differ
     */
    std::vector<std::string> diff_registry(const ShaderRegistry& registry) const;
};

/**
 * ManifestBuilder - Builds and signs the manifest at server start
 */
class ManifestBuilder {
public:
    static VersionManifest build(
        const std::string& version,
        const ShaderRegistry& registry,
        const std::string& signing_secret
    );

    /**
     * Build with an explicit timestamp (reproducible signatures)
     */
    static VersionManifest build(
        const std::string& version,
        const ShaderRegistry& registry,
        const std::string& signing_secret,
        uint64_t build_timestamp
    );

    /**
     * Hash-based signature: sha256(payload + signing_secret)
     */
    static std::string sign(const std::string& payload, const std::string& signing_secret);
};

} // namespace shaderchain::core
