#include "core/shader/shader_registry.hpp"
#include "shaderchain/error.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace shaderchain;
using namespace shaderchain::core;

class ShaderRegistryTest : public ::testing::Test {
protected:
    ShaderRegistry registry;
};

TEST_F(ShaderRegistryTest, TestVectors) {
    EXPECT_EQ(registry.execute(shader_ids::HASH_COMPUTE, std::string(64, '0')),
              "55c195fbf0b3e3d0770987e8459bce9bc396633c6a9ba0ffed09b8afc68eeafe");
    EXPECT_EQ(registry.execute(shader_ids::FOLDING_ENERGY, "ACDEFGHIKLMNPQRSTVWY"),
              "ae5658a14e61269f7905e2988c36fa2dfe1c9af0fde34d9823b2ed2cdadf1d22");
    EXPECT_EQ(registry.execute(shader_ids::ENTROPY, "1234567890abcdef"),
              "7a759a0025d04b91e0594cd81edf936ac6575f12330d7295db55579e4bfdba20");
    EXPECT_EQ(registry.execute(shader_ids::VERSION_PROOF, "version_check"),
              "c355f0d18c5d42cab0edfa2cd686e57d2f5b2b11dd40487aea1b4bf7d8d49684");
}

TEST_F(ShaderRegistryTest, SelfCheckPasses) {
    EXPECT_TRUE(registry.self_check().empty());
    EXPECT_EQ(registry.definitions().size(), 4);
}

TEST_F(ShaderRegistryTest, Deterministic) {
    for (const auto& def : registry.definitions()) {
        auto first = registry.execute(def.id, "seed-for-" + def.id);
        auto second = registry.execute(def.id, "seed-for-" + def.id);
        EXPECT_EQ(first, second) << def.id;
        EXPECT_TRUE(is_hash_hex(first)) << def.id;
    }

    ShaderRegistry other;
    EXPECT_EQ(registry.execute(shader_ids::ENTROPY, "abc"), other.execute(shader_ids::ENTROPY, "abc"));
}

TEST_F(ShaderRegistryTest, UnknownShaderThrows) {
    EXPECT_FALSE(registry.contains("raytrace_v1"));
    EXPECT_THROW(registry.execute("raytrace_v1", "seed"), UnknownShaderError);

    try {
        registry.execute("raytrace_v1", "seed");
        FAIL() << "expected UnknownShaderError";
    } catch (const UnknownShaderError& e) {
        EXPECT_EQ(e.shader_id(), "raytrace_v1");
    }
}

TEST_F(ShaderRegistryTest, DispatchByKindMatchesId) {
    for (const auto& def : registry.definitions()) {
        EXPECT_EQ(ShaderRegistry::parse_shader_id(def.id), def.kind);
        EXPECT_EQ(std::string(ShaderRegistry::shader_id(def.kind)), def.id);
        EXPECT_EQ(registry.execute(def.kind, "x"), registry.execute(def.id, "x"));
    }
}

TEST_F(ShaderRegistryTest, BuildSaltChangesOnlyVersionProof) {
    ShaderRegistry tampered("tampered_salt");

    EXPECT_NE(tampered.execute(shader_ids::VERSION_PROOF, "version_check"),
              registry.execute(shader_ids::VERSION_PROOF, "version_check"));
    EXPECT_EQ(tampered.execute(shader_ids::HASH_COMPUTE, "seed"),
              registry.execute(shader_ids::HASH_COMPUTE, "seed"));

    auto failed = tampered.self_check();
    ASSERT_EQ(failed.size(), 1);
    EXPECT_EQ(failed[0], shader_ids::VERSION_PROOF);
}

TEST_F(ShaderRegistryTest, FoldingEnergyFormatting) {
    EXPECT_EQ(shaders::format_energy(-1.8198495341), "-1.8198495341");
    EXPECT_EQ(shaders::format_energy(std::numeric_limits<double>::quiet_NaN()), "NaN");
    EXPECT_EQ(shaders::format_energy(std::numeric_limits<double>::infinity()), "Infinity");
    EXPECT_EQ(shaders::format_energy(-std::numeric_limits<double>::infinity()), "-Infinity");

    // Repeated residues coincide and make the energy non-finite
    EXPECT_EQ(shaders::folding_energy("ab12ab"),
              "4ca428366387ac4d113165f4274685c6fa0d532c13aff77ad0e45c0699615c6d");
}

TEST_F(ShaderRegistryTest, EmptySeeds) {
    for (const auto& def : registry.definitions()) {
        EXPECT_TRUE(is_hash_hex(registry.execute(def.id, ""))) << def.id;
    }
}

TEST_F(ShaderRegistryTest, DefinitionDescription) {
    const auto& def = registry.definition(ShaderKind::VERSION_PROOF);
    EXPECT_EQ(def.describe(),
              R"({"version":"1.0.0","testSeed":"version_check",)"
              R"("expectedTestOutput":"c355f0d18c5d42cab0edfa2cd686e57d2f5b2b11dd40487aea1b4bf7d8d49684"})");
}
