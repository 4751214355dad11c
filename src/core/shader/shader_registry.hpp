#pragma once

#include "shaderchain/common.hpp"
#include <optional>
#include <string>
#include <vector>

namespace shaderchain::core {

/**
 * Registered shader ids (wire names)
 */
namespace shader_ids {
    constexpr const char* HASH_COMPUTE = "hash_compute_v1";
    constexpr const char* FOLDING_ENERGY = "folding_energy_v1";
    constexpr const char* ENTROPY = "entropy_v1";
    constexpr const char* VERSION_PROOF = "version_proof_v1";
}

/**
 * ShaderKind - Closed set of deterministic compute kernels
 */
enum class ShaderKind {
    HASH_COMPUTE,     // Iterated SHA-256
    FOLDING_ENERGY,   // Pairwise Lennard-Jones style energy over a sequence
    ENTROPY,          // 16-word xor/shift mixing
    VERSION_PROOF     // SHA-256 salted with the per-build secret
};

/**
 * ShaderDefinition - Registered description of one shader
 *
 * The description (version, test seed and expected test output) is what the
 * version manifest hashes to detect a changed implementation.
 */
struct ShaderDefinition {
    ShaderKind kind;
    std::string id;
    std::string version;
    std::string test_seed;
    std::string expected_test_output;

    /**
     * Canonical compact JSON description:
     * {"version":...,"testSeed":...,"expectedTestOutput":...}
     */
    std::string describe() const;
};

/**
 * Pure shader kernels. Each maps a seed to a 64-character hex digest.
 */
namespace shaders {
    std::string hash_compute(const std::string& input);
    std::string folding_energy(const std::string& sequence);
    std::string entropy(const std::string& input);
    std::string version_proof(const std::string& input, const std::string& build_salt);

    // Fixed 10-digit rendering of the folding energy (NaN/Infinity spelled out)
    std::string format_energy(double energy);
}

/**
 * ShaderRegistry - Deterministic compute registry
 *
 * Dispatches a shader id to one of the registered kernels. Two registries
 * built with the same salt produce identical outputs for identical seeds;
 * a registry built with a different salt models a tampered client build.
 */
class ShaderRegistry {
public:
    explicit ShaderRegistry(std::string build_salt = SHADERCHAIN_BUILD_SALT);

    /**
     * Execute a shader by id
     * @throws UnknownShaderError if the id is not registered
     */
    std::string execute(const std::string& shader_id, const std::string& input_seed) const;

    /**
     * Execute a shader by kind
     */
    std::string execute(ShaderKind kind, const std::string& input_seed) const;

    bool contains(const std::string& shader_id) const;

    const std::vector<ShaderDefinition>& definitions() const { return definitions_; }
    const ShaderDefinition& definition(ShaderKind kind) const;

    /**
     * Run every shader against its test seed
     * @return ids whose output differs from the registered expectation
     */
    std::vector<std::string> self_check() const;

    const std::string& build_salt() const { return build_salt_; }

    static std::optional<ShaderKind> parse_shader_id(const std::string& shader_id);
    static const char* shader_id(ShaderKind kind);

private:
    std::string build_salt_;
    std::vector<ShaderDefinition> definitions_;
};

} // namespace shaderchain::core
