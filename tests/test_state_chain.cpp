#include "core/chain/state_chain.hpp"
#include "core/shader/shader_registry.hpp"
#include "shaderchain/error.hpp"
#include <gtest/gtest.h>

using namespace shaderchain;
using namespace shaderchain::core;

class StateChainTest : public ::testing::Test {
protected:
    ShaderRegistry registry;

    StateChain build_chain(size_t links) {
        StateChain chain("1.0.0", registry);
        const char* ids[] = {shader_ids::VERSION_PROOF, shader_ids::HASH_COMPUTE, shader_ids::ENTROPY};
        for (size_t i = 0; i < links; ++i) {
            chain.add_link(ids[i % 3], "seed-" + std::to_string(i), "proof-" + std::to_string(i));
        }
        return chain;
    }
};

TEST_F(StateChainTest, StartsAtGenesis) {
    StateChain chain("1.0.0", registry);
    EXPECT_EQ(chain.length(), 0);
    EXPECT_EQ(chain.get_chain_hash(), constants::GENESIS_HASH);
}

TEST_F(StateChainTest, LinkHashVector) {
    StateChainLink link;
    link.index = 0;
    link.previous_hash = constants::GENESIS_HASH;
    link.fingerprint.shader_id = shader_ids::VERSION_PROOF;
    link.fingerprint.version = "1.0.0";
    link.fingerprint.input_seed = "seed";
    link.fingerprint.output_hash = registry.execute(shader_ids::VERSION_PROOF, "seed");
    link.fingerprint.timestamp = 1700000000000ULL;
    link.work_proof = "proof";

    EXPECT_EQ(link.canonical_payload(),
              R"({"index":0,"previousHash":"0000000000000000000000000000000000000000000000000000000000000000",)"
              R"("fingerprint":{"shaderId":"version_proof_v1","version":"1.0.0","inputSeed":"seed",)"
              R"("outputHash":"254b5b0ddca754b182804d55698b6124c1e3cafd3d29adeb17446d4378749583",)"
              R"("timestamp":1700000000000},"workProof":"proof"})");
    EXPECT_EQ(link.compute_hash(), "e7bfa4c5b315ded77f825b6fb349e5487645ed76b620b31dd2ce5fd7dfe66e04");
}

TEST_F(StateChainTest, AddLinkAdvancesHead) {
    StateChain chain("1.0.0", registry);

    auto link = chain.add_link(shader_ids::VERSION_PROOF, "abc", "proof");

    EXPECT_EQ(link.index, 0);
    EXPECT_EQ(link.previous_hash, constants::GENESIS_HASH);
    EXPECT_EQ(link.fingerprint.version, "1.0.0");
    EXPECT_EQ(link.fingerprint.output_hash, registry.execute(shader_ids::VERSION_PROOF, "abc"));
    EXPECT_GT(link.fingerprint.timestamp, 0u);
    EXPECT_EQ(chain.get_chain_hash(), link.link_hash);
    EXPECT_EQ(chain.length(), 1);
}

TEST_F(StateChainTest, Continuity) {
    auto chain = build_chain(6);
    const auto& links = chain.links();

    ASSERT_EQ(links.size(), 6);
    for (size_t i = 0; i < links.size(); ++i) {
        EXPECT_EQ(links[i].index, i);
        EXPECT_EQ(links[i].link_hash, links[i].compute_hash());
        if (i > 0) {
            EXPECT_EQ(links[i].previous_hash, links[i - 1].link_hash);
        }
    }
    EXPECT_TRUE(StateChain::verify_links(links, constants::GENESIS_HASH));
    EXPECT_EQ(chain.get_chain_hash(), links.back().link_hash);
}

TEST_F(StateChainTest, VerifyLinksDetectsTampering) {
    auto chain = build_chain(3);
    auto links = chain.links();

    EXPECT_FALSE(StateChain::verify_links({}, constants::GENESIS_HASH));
    EXPECT_FALSE(StateChain::verify_links(links, std::string(64, 'f')));

    auto edited = links;
    edited[1].fingerprint.output_hash = std::string(64, 'a');
    EXPECT_FALSE(StateChain::verify_links(edited, constants::GENESIS_HASH));

    // Rehashing an edited link still breaks continuity with its successor
    edited[1].link_hash = edited[1].compute_hash();
    EXPECT_FALSE(StateChain::verify_links(edited, constants::GENESIS_HASH));

    auto reordered = links;
    std::swap(reordered[1], reordered[2]);
    EXPECT_FALSE(StateChain::verify_links(reordered, constants::GENESIS_HASH));

    // A suffix verifies against its own predecessor
    std::vector<StateChainLink> suffix(links.begin() + 1, links.end());
    EXPECT_TRUE(StateChain::verify_links(suffix, links[0].link_hash));
}

TEST_F(StateChainTest, UnknownShaderLeavesChainUnchanged) {
    auto chain = build_chain(2);
    auto head = chain.get_chain_hash();

    EXPECT_THROW(chain.add_link("unknown_v1", "seed", "proof"), UnknownShaderError);
    EXPECT_EQ(chain.length(), 2);
    EXPECT_EQ(chain.get_chain_hash(), head);
}

TEST_F(StateChainTest, ExportImport) {
    auto chain = build_chain(4);
    auto exported = chain.export_chain();

    EXPECT_EQ(exported.chain_hash, chain.get_chain_hash());
    EXPECT_EQ(exported.version, "1.0.0");

    auto restored = StateChain::import_chain(exported, registry);
    EXPECT_EQ(restored.length(), 4);
    EXPECT_EQ(restored.get_chain_hash(), chain.get_chain_hash());
    EXPECT_EQ(restored.links(), chain.links());

    // The restored chain keeps growing from the same head
    auto next = restored.add_link(shader_ids::HASH_COMPUTE, "next", "proof");
    EXPECT_EQ(next.index, 4);
    EXPECT_EQ(next.previous_hash, chain.get_chain_hash());
}

TEST_F(StateChainTest, ImportRejectsCorruption) {
    auto exported = build_chain(3).export_chain();

    auto bad_link = exported;
    bad_link.links[2].work_proof = "forged";
    EXPECT_THROW(StateChain::import_chain(bad_link, registry), ChainImportError);

    auto bad_head = exported;
    bad_head.chain_hash = std::string(64, '1');
    EXPECT_THROW(StateChain::import_chain(bad_head, registry), ChainImportError);

    auto bad_index = exported;
    bad_index.links[1].index = 7;
    EXPECT_THROW(StateChain::import_chain(bad_index, registry), ChainImportError);

    ChainExport empty{{}, constants::GENESIS_HASH, "1.0.0"};
    EXPECT_EQ(StateChain::import_chain(empty, registry).length(), 0);

    empty.chain_hash = std::string(64, '2');
    EXPECT_THROW(StateChain::import_chain(empty, registry), ChainImportError);
}
