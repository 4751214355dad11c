#include "core/shader/shader_registry.hpp"
#include "crypto/sha256.hpp"
#include "shaderchain/error.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cmath>

namespace shaderchain::core {

namespace {
    constexpr int HASH_COMPUTE_ROUNDS = 1000;
    constexpr int ENTROPY_ROUNDS = 100;
    constexpr size_t ENTROPY_WORDS = 16;
    constexpr uint32_t ENTROPY_MULTIPLIER = 0x01000193;
}

// ShaderDefinition

std::string ShaderDefinition::describe() const {
    nlohmann::ordered_json j;
    j["version"] = version;
    j["testSeed"] = test_seed;
    j["expectedTestOutput"] = expected_test_output;
    return j.dump();
}

// Kernels

namespace shaders {

std::string hash_compute(const std::string& input) {
    std::string state = input;
    for (int i = 0; i < HASH_COMPUTE_ROUNDS; ++i) {
        state = crypto::Sha256::hex(state + std::to_string(i));
    }
    return state;
}

std::string format_energy(double energy) {
    if (std::isnan(energy)) {
        return "NaN";
    }
    if (std::isinf(energy)) {
        return energy > 0 ? "Infinity" : "-Infinity";
    }
    return fmt::format("{:.10f}", energy);
}

std::string folding_energy(const std::string& sequence) {
    std::vector<double> positions;
    positions.reserve(sequence.size() * 3);

    for (unsigned char c : sequence) {
        double code = static_cast<double>(c);
        positions.push_back(std::sin(code * 0.1) * 10);
        positions.push_back(std::cos(code * 0.1) * 10);
        positions.push_back(std::sin(code * 0.2) * 10);
    }

    // Pairwise interactions; coincident residues drive the sum non-finite
    double energy = 0;
    for (size_t i = 0; i < positions.size(); i += 3) {
        for (size_t j = i + 3; j < positions.size(); j += 3) {
            double dx = positions[i] - positions[j];
            double dy = positions[i + 1] - positions[j + 1];
            double dz = positions[i + 2] - positions[j + 2];
            double r2 = dx * dx + dy * dy + dz * dz;
            double r6 = r2 * r2 * r2;
            energy += 1 / r6 - 2 / (r6 * r6);
        }
    }

    return crypto::Sha256::hex(format_energy(energy) + sequence);
}

std::string entropy(const std::string& input) {
    std::array<uint32_t, ENTROPY_WORDS> state{};

    if (!input.empty()) {
        for (size_t i = 0; i < ENTROPY_WORDS; ++i) {
            auto b = static_cast<unsigned char>(input[i % input.size()]);
            state[i] = static_cast<uint32_t>(b) * ENTROPY_MULTIPLIER;
        }
    }

    for (int round = 0; round < ENTROPY_ROUNDS; ++round) {
        for (size_t i = 0; i < ENTROPY_WORDS; ++i) {
            uint32_t a = state[i];
            uint32_t b = state[(i + 1) % ENTROPY_WORDS];
            uint32_t c = state[(i + 5) % ENTROPY_WORDS];
            state[i] = a ^ (b << 7) ^ (c >> 3);
        }
    }

    // Serialize little-endian regardless of host order
    bytes buffer;
    buffer.reserve(ENTROPY_WORDS * 4);
    for (uint32_t word : state) {
        for (int shift = 0; shift < 32; shift += 8) {
            buffer.push_back(static_cast<byte>((word >> shift) & 0xFF));
        }
    }

    return crypto::Sha256::hex(buffer.data(), buffer.size());
}

std::string version_proof(const std::string& input, const std::string& build_salt) {
    return crypto::Sha256::hex(input + build_salt);
}

} // namespace shaders

// ShaderRegistry

ShaderRegistry::ShaderRegistry(std::string build_salt)
    : build_salt_(std::move(build_salt))
{
    // Expected outputs are for the default build salt
    definitions_ = {
        {ShaderKind::HASH_COMPUTE, shader_ids::HASH_COMPUTE, "1.0.0",
         std::string(64, '0'),
         "55c195fbf0b3e3d0770987e8459bce9bc396633c6a9ba0ffed09b8afc68eeafe"},
        {ShaderKind::FOLDING_ENERGY, shader_ids::FOLDING_ENERGY, "1.0.0",
         "ACDEFGHIKLMNPQRSTVWY",
         "ae5658a14e61269f7905e2988c36fa2dfe1c9af0fde34d9823b2ed2cdadf1d22"},
        {ShaderKind::ENTROPY, shader_ids::ENTROPY, "1.0.0",
         "1234567890abcdef",
         "7a759a0025d04b91e0594cd81edf936ac6575f12330d7295db55579e4bfdba20"},
        {ShaderKind::VERSION_PROOF, shader_ids::VERSION_PROOF, "1.0.0",
         "version_check",
         "c355f0d18c5d42cab0edfa2cd686e57d2f5b2b11dd40487aea1b4bf7d8d49684"},
    };
}

std::optional<ShaderKind> ShaderRegistry::parse_shader_id(const std::string& shader_id) {
    if (shader_id == shader_ids::HASH_COMPUTE) return ShaderKind::HASH_COMPUTE;
    if (shader_id == shader_ids::FOLDING_ENERGY) return ShaderKind::FOLDING_ENERGY;
    if (shader_id == shader_ids::ENTROPY) return ShaderKind::ENTROPY;
    if (shader_id == shader_ids::VERSION_PROOF) return ShaderKind::VERSION_PROOF;
    return std::nullopt;
}

const char* ShaderRegistry::shader_id(ShaderKind kind) {
    switch (kind) {
        case ShaderKind::HASH_COMPUTE: return shader_ids::HASH_COMPUTE;
        case ShaderKind::FOLDING_ENERGY: return shader_ids::FOLDING_ENERGY;
        case ShaderKind::ENTROPY: return shader_ids::ENTROPY;
        case ShaderKind::VERSION_PROOF: return shader_ids::VERSION_PROOF;
    }
    return "unknown";
}

bool ShaderRegistry::contains(const std::string& shader_id) const {
    return parse_shader_id(shader_id).has_value();
}

std::string ShaderRegistry::execute(const std::string& shader_id, const std::string& input_seed) const {
    auto kind = parse_shader_id(shader_id);
    if (!kind) {
        throw UnknownShaderError(shader_id);
    }
    return execute(*kind, input_seed);
}

std::string ShaderRegistry::execute(ShaderKind kind, const std::string& input_seed) const {
    switch (kind) {
        case ShaderKind::HASH_COMPUTE:
            return shaders::hash_compute(input_seed);
        case ShaderKind::FOLDING_ENERGY:
            return shaders::folding_energy(input_seed);
        case ShaderKind::ENTROPY:
            return shaders::entropy(input_seed);
        case ShaderKind::VERSION_PROOF:
            return shaders::version_proof(input_seed, build_salt_);
    }
    throw UnknownShaderError(std::to_string(static_cast<int>(kind)));
}

const ShaderDefinition& ShaderRegistry::definition(ShaderKind kind) const {
    for (const auto& def : definitions_) {
        if (def.kind == kind) {
            return def;
        }
    }
    throw UnknownShaderError(shader_id(kind));
}

std::vector<std::string> ShaderRegistry::self_check() const {
    std::vector<std::string> failed;

    for (const auto& def : definitions_) {
        auto output = execute(def.kind, def.test_seed);
        if (output != def.expected_test_output) {
            SHADERCHAIN_LOG_WARN("Shader self-check failed for {}: expected {}, got {}",
                                 def.id, def.expected_test_output, output);
            failed.push_back(def.id);
        } else {
            SHADERCHAIN_LOG_DEBUG("Shader self-check passed for {}", def.id);
        }
    }

    return failed;
}

} // namespace shaderchain::core
