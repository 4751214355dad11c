#include "core/manifest/version_manifest.hpp"
#include "crypto/sha256.hpp"
#include "shaderchain/time_utils.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <sodium.h>

namespace shaderchain::core {

// VersionManifest

std::string VersionManifest::signed_payload() const {
    nlohmann::ordered_json j;
    j["version"] = version;
    j["shaderHashes"] = shader_hashes;
    j["expectedOutputs"] = expected_outputs;
    j["buildTimestamp"] = build_timestamp;
    return j.dump();
}

bool VersionManifest::verify_signature(const std::string& signing_secret) const {
    std::string expected = ManifestBuilder::sign(signed_payload(), signing_secret);
    if (expected.size() != signature.size()) {
        return false;
    }
    return sodium_memcmp(expected.data(), signature.data(), expected.size()) == 0;
}

std::vector<std::string> VersionManifest::diff_registry(const ShaderRegistry& registry) const {
    std::vector<std::string> mismatched;

    for (const auto& def : registry.definitions()) {
        auto hash_it = shader_hashes.find(def.id);
        auto output_it = expected_outputs.find(def.test_seed);

        bool hash_ok = hash_it != shader_hashes.end() &&
                       hash_it->second == crypto::Sha256::hex(def.describe());
        bool output_ok = output_it != expected_outputs.end() &&
                         output_it->second == registry.execute(def.kind, def.test_seed);

        if (!hash_ok || !output_ok) {
            mismatched.push_back(def.id);
        }
    }

    return mismatched;
}

// ManifestBuilder

VersionManifest ManifestBuilder::build(
    const std::string& version,
    const ShaderRegistry& registry,
    const std::string& signing_secret
) {
    return build(version, registry, signing_secret, time::timestamp_milliseconds());
}

VersionManifest ManifestBuilder::build(
    const std::string& version,
    const ShaderRegistry& registry,
    const std::string& signing_secret,
    uint64_t build_timestamp
) {
    VersionManifest manifest;
    manifest.version = version;
    manifest.build_timestamp = build_timestamp;

    for (const auto& def : registry.definitions()) {
        manifest.shader_hashes[def.id] = crypto::Sha256::hex(def.describe());
        manifest.expected_outputs[def.test_seed] = registry.execute(def.kind, def.test_seed);
    }

    manifest.signature = sign(manifest.signed_payload(), signing_secret);

    SHADERCHAIN_LOG_INFO("Version manifest built: version={}, shaders={}",
                         manifest.version, manifest.shader_hashes.size());

    return manifest;
}

std::string ManifestBuilder::sign(const std::string& payload, const std::string& signing_secret) {
    return crypto::Sha256::hex(payload + signing_secret);
}

} // namespace shaderchain::core
