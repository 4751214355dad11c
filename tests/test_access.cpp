#include "security/access.hpp"
#include "shaderchain/common.hpp"
#include <gtest/gtest.h>

using namespace shaderchain;
using namespace shaderchain::security;

class AccessTokenTest : public ::testing::Test {
protected:
    static constexpr uint64_t NOW = 1700000000000ULL;
    AccessTokenIssuer issuer{"token-secret"};
    std::string chain_hash = std::string(64, 'c');
};

TEST_F(AccessTokenTest, IssueAndVerify) {
    auto token = issuer.issue("session-1", chain_hash, 65, NOW);

    auto dot = token.find('.');
    ASSERT_NE(dot, std::string::npos);
    EXPECT_EQ(token.size() - dot - 1, 64u);

    auto claims = issuer.verify(token, "session-1", NOW + 1000);
    ASSERT_TRUE(claims.is_ok()) << claims.error().to_string();
    EXPECT_EQ(claims.value().session_id, "session-1");
    EXPECT_EQ(claims.value().chain_hash, chain_hash);
    EXPECT_EQ(claims.value().trust_score, 65);
    EXPECT_EQ(claims.value().issued_at, NOW);
    EXPECT_EQ(claims.value().expires_at, NOW + constants::ACCESS_TOKEN_TTL_MS);
}

TEST_F(AccessTokenTest, PayloadIsCanonicalJson) {
    AccessToken token{"s", "h", 50, 1, 2};
    EXPECT_EQ(token.payload(),
              R"({"sessionId":"s","chainHash":"h","trustScore":50,"issuedAt":1,"expiresAt":2})");
}

TEST_F(AccessTokenTest, Expiry) {
    auto token = issuer.issue("session-1", chain_hash, 65, NOW);

    EXPECT_TRUE(issuer.verify(token, "session-1", NOW + constants::ACCESS_TOKEN_TTL_MS - 1).is_ok());

    auto expired = issuer.verify(token, "session-1", NOW + constants::ACCESS_TOKEN_TTL_MS);
    ASSERT_TRUE(expired.is_err());
    EXPECT_EQ(expired.error().code(), ErrorCode::AccessTokenExpired);
}

TEST_F(AccessTokenTest, BoundToSession) {
    auto token = issuer.issue("session-1", chain_hash, 65, NOW);
    auto result = issuer.verify(token, "session-2", NOW);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::AccessTokenInvalid);
}

TEST_F(AccessTokenTest, RejectsForgery) {
    auto token = issuer.issue("session-1", chain_hash, 65, NOW);

    // Raised trust score with the original MAC
    AccessToken forged{"session-1", chain_hash, 100, NOW, NOW + constants::ACCESS_TOKEN_TTL_MS};
    std::string payload = forged.payload();
    std::string forged_token = base64_encode(payload.data(), payload.size()) + token.substr(token.find('.'));
    EXPECT_TRUE(issuer.verify(forged_token, "session-1", NOW).is_err());

    // Token from a server with another secret
    AccessTokenIssuer other("other-secret");
    EXPECT_TRUE(issuer.verify(other.issue("session-1", chain_hash, 65, NOW), "session-1", NOW).is_err());

    EXPECT_TRUE(issuer.verify("", "session-1", NOW).is_err());
    EXPECT_TRUE(issuer.verify("no-dot-here", "session-1", NOW).is_err());
    EXPECT_TRUE(issuer.verify(std::string(64, 'a'), "session-1", NOW).is_err());
    EXPECT_TRUE(issuer.verify("abc.def", "session-1", NOW).is_err());
}

TEST(ResourceCatalogTest, DefaultThresholds) {
    EXPECT_EQ(ResourceCatalog::default_threshold("content:legendary_bundle"), 80);
    EXPECT_EQ(ResourceCatalog::default_threshold("content:supreme_pack"), 70);
    EXPECT_EQ(ResourceCatalog::default_threshold("config:advanced_profile"), 60);
    EXPECT_EQ(ResourceCatalog::default_threshold("texture:rare_set"), 50);

    auto catalog = ResourceCatalog::default_catalog();
    EXPECT_EQ(catalog.size(), 5u);
    ASSERT_NE(catalog.find("content:public_notes"), nullptr);
    EXPECT_FALSE(catalog.find("content:public_notes")->gated);
    EXPECT_EQ(catalog.find("nothing"), nullptr);
}

TEST(ResourceCatalogTest, FromJson) {
    auto parsed = ResourceCatalog::from_json(nlohmann::json::parse(R"([
        {"id": "model:legendary_mesh", "data": "mesh"},
        {"id": "docs:readme", "gated": false},
        {"id": "config:custom", "minTrust": 75}
    ])"));
    ASSERT_TRUE(parsed.is_ok());

    const auto& catalog = parsed.value();
    EXPECT_EQ(catalog.find("model:legendary_mesh")->min_trust, 80);
    EXPECT_EQ(catalog.find("model:legendary_mesh")->data, "mesh");
    EXPECT_FALSE(catalog.find("docs:readme")->gated);
    EXPECT_EQ(catalog.find("config:custom")->min_trust, 75);

    EXPECT_TRUE(ResourceCatalog::from_json(nlohmann::json::object()).is_err());
    EXPECT_TRUE(ResourceCatalog::from_json(nlohmann::json::parse(R"([{"gated": true}])")).is_err());
}

class ResourceGateTest : public ::testing::Test {
protected:
    static constexpr uint64_t NOW = 1700000000000ULL;
    ResourceCatalog catalog = ResourceCatalog::default_catalog();
    AccessTokenIssuer issuer{"token-secret"};
    ResourceGate gate{catalog, issuer};

    core::ClientState client(int32_t trust) {
        core::ClientState state;
        state.client_id = "session-1";
        state.trust_score = trust;
        return state;
    }

    std::string token(int32_t trust) {
        return issuer.issue("session-1", constants::GENESIS_HASH, trust, NOW);
    }
};

TEST_F(ResourceGateTest, DecisionOrder) {
    auto unknown_client = gate.check("session-1", std::nullopt, "texture:rare_set", token(60), NOW);
    EXPECT_FALSE(unknown_client.granted);
    EXPECT_EQ(unknown_client.error, "Client not verified");

    auto missing = gate.check("session-1", client(60), "texture:nothing", token(60), NOW);
    EXPECT_EQ(missing.error, "Resource not found");

    auto ungated = gate.check("session-1", client(0), "content:public_notes", "", NOW);
    EXPECT_TRUE(ungated.granted);
    EXPECT_FALSE(ungated.valid_until.has_value());

    auto no_token = gate.check("session-1", client(100), "texture:rare_set", "", NOW);
    EXPECT_EQ(no_token.error, "Invalid access token");

    auto low_trust = gate.check("session-1", client(55), "content:legendary_bundle", token(55), NOW);
    EXPECT_FALSE(low_trust.granted);
    EXPECT_EQ(low_trust.error, "Insufficient trust score. Required: 80, Current: 55");
    EXPECT_EQ(low_trust.hint, "Complete more shader verification challenges to increase trust.");

    auto granted = gate.check("session-1", client(55), "texture:rare_set", token(55), NOW);
    EXPECT_TRUE(granted.granted);
    EXPECT_EQ(granted.resource_id, "texture:rare_set");
    EXPECT_EQ(granted.valid_until, std::optional<uint64_t>(NOW + constants::RESOURCE_TTL_MS));
}

TEST_F(ResourceGateTest, ExpiredTokenIsRejected) {
    auto decision = gate.check("session-1", client(90), "content:legendary_bundle", token(90),
                               NOW + constants::ACCESS_TOKEN_TTL_MS + 1);
    EXPECT_FALSE(decision.granted);
    EXPECT_EQ(decision.error, "Invalid access token");
}

TEST_F(ResourceGateTest, TrustComesFromCurrentState) {
    // A token minted at high trust does not outlive a later penalty
    auto decision = gate.check("session-1", client(10), "config:advanced_profile", token(90), NOW);
    EXPECT_FALSE(decision.granted);
    EXPECT_EQ(decision.error, "Insufficient trust score. Required: 60, Current: 10");
}
