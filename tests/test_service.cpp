#include "server/drm_service.hpp"
#include "core/drm/client_solver.hpp"
#include "protocol/messages.hpp"
#include <gtest/gtest.h>

using namespace shaderchain;
using namespace shaderchain::server;
using nlohmann::json;

class DrmServiceTest : public ::testing::Test {
protected:
    static constexpr uint64_t NOW = 1700000000000ULL;

    DrmService service;
    core::ShaderRegistry client_registry;

    json send(const std::string& session_id, const std::string& type,
              const json& payload, uint64_t now_ms = NOW) {
        protocol::Envelope envelope;
        envelope.type = type;
        envelope.payload = payload;
        return json::parse(service.handle_message(session_id, protocol::encode_envelope(envelope), now_ms));
    }

    json submit(const std::string& session_id, core::DrmClient& client,
                const json& challenge, uint64_t now_ms = NOW) {
        auto response = client.solve_challenge(challenge.get<core::DRMChallenge>());
        return send(session_id, protocol::message_types::RESPONSE, response, now_ms);
    }
};

TEST_F(DrmServiceTest, InitIssuesChallengeForMatchingVersion) {
    auto session = service.open_session(NOW);
    json reply = send(session, "drm_init", json{{"clientVersion", "1.0.0"}});

    EXPECT_EQ(reply["type"], "drm_init_response");
    EXPECT_EQ(reply["serverVersion"], "1.0.0");
    EXPECT_EQ(reply["versionMatch"], true);
    EXPECT_EQ(reply["clientState"]["trustScore"], 50);
    EXPECT_EQ(reply["clientState"]["chainLength"], 0);
    EXPECT_EQ(reply["clientState"]["totalWorkCompleted"], 0);
    ASSERT_TRUE(reply["initialChallenge"].is_object());
    EXPECT_EQ(reply["initialChallenge"]["difficulty"], 3);
    EXPECT_TRUE(reply["initialChallenge"]["inputSeeds"].is_object());
}

TEST_F(DrmServiceTest, InitWithOldVersionGetsNoChallenge) {
    auto session = service.open_session(NOW);
    json reply = send(session, "drm_init", json{{"clientVersion", "0.9.0"}});

    EXPECT_EQ(reply["versionMatch"], false);
    EXPECT_TRUE(reply["initialChallenge"].is_null());
}

TEST_F(DrmServiceTest, FullExchange) {
    auto session = service.open_session(NOW);
    core::DrmClient client(session, "1.0.0", client_registry);

    json init = send(session, "drm_init", json{{"clientVersion", "1.0.0"}});
    json result = submit(session, client, init["initialChallenge"]);

    EXPECT_EQ(result["type"], "drm_verify_result");
    EXPECT_EQ(result["valid"], true);
    EXPECT_EQ(result["errors"], json::array());
    EXPECT_EQ(result["updatedState"]["trustScore"], 55);
    EXPECT_EQ(result["updatedState"]["chainLength"], 2);
    ASSERT_TRUE(result["accessToken"].is_string());

    json challenge = send(session, "drm_challenge_request", json{{"workType", "entropy_chain"}});
    EXPECT_EQ(challenge["type"], "drm_challenge");
    EXPECT_EQ(challenge["challenge"]["requiredShaders"].size(), 3u);
    EXPECT_EQ(challenge["challenge"]["previousChainHash"], client.chain_state().chain_hash);

    result = submit(session, client, challenge["challenge"]);
    EXPECT_EQ(result["valid"], true);
    EXPECT_EQ(result["updatedState"]["trustScore"], 60);
    EXPECT_EQ(result["updatedState"]["chainLength"], 5);

    auto info = service.sessions().get_session(session);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->challenges_completed, 2u);

    auto stats = service.stats();
    EXPECT_EQ(stats["activeClients"], 1);
    EXPECT_EQ(stats["totalVerifications"], 2);
    EXPECT_EQ(stats["activeChallenges"], 0);
    EXPECT_DOUBLE_EQ(stats["averageTrustScore"].get<double>(), 60.0);
}

TEST_F(DrmServiceTest, ChallengeConsumedOnce) {
    auto session = service.open_session(NOW);
    core::DrmClient client(session, "1.0.0", client_registry);

    json init = send(session, "drm_init", json{{"clientVersion", "1.0.0"}});
    auto response = client.solve_challenge(init["initialChallenge"].get<core::DRMChallenge>());

    json first = send(session, "drm_response", response);
    EXPECT_EQ(first["valid"], true);

    json replay = send(session, "drm_response", response);
    EXPECT_EQ(replay["type"], "drm_verify_result");
    EXPECT_EQ(replay["valid"], false);
    EXPECT_EQ(replay["error"], "Challenge not found or expired");
}

TEST_F(DrmServiceTest, ExpiredChallengeIsNotFound) {
    auto session = service.open_session(NOW);
    core::DrmClient client(session, "1.0.0", client_registry);

    json init = send(session, "drm_init", json{{"clientVersion", "1.0.0"}});
    uint64_t late = NOW + constants::CHALLENGE_TTL_MS + 1;
    json result = submit(session, client, init["initialChallenge"], late);

    EXPECT_EQ(result["valid"], false);
    EXPECT_EQ(result["error"], "Challenge not found or expired");
    EXPECT_EQ(service.stats()["activeChallenges"], 0);
}

TEST_F(DrmServiceTest, ChallengeOfAnotherSessionIsNotFound) {
    auto alice = service.open_session(NOW);
    auto mallory = service.open_session(NOW);
    core::DrmClient client(mallory, "1.0.0", client_registry);

    json init = send(alice, "drm_init", json{{"clientVersion", "1.0.0"}});
    send(mallory, "drm_init", json{{"clientVersion", "1.0.0"}});

    json result = submit(mallory, client, init["initialChallenge"]);
    EXPECT_EQ(result["error"], "Challenge not found or expired");
}

TEST_F(DrmServiceTest, FailedVerificationStillPenalizes) {
    auto session = service.open_session(NOW);
    core::ShaderRegistry tampered("tampered_salt");
    core::DrmClient client(session, "1.0.0", tampered);

    json init = send(session, "drm_init", json{{"clientVersion", "1.0.0"}});
    json result = submit(session, client, init["initialChallenge"]);

    EXPECT_EQ(result["valid"], false);
    EXPECT_EQ(result["shaderOutputsMatch"], false);
    EXPECT_EQ(result["updatedState"]["trustScore"], 0);
    EXPECT_TRUE(result["accessToken"].is_null());
}

TEST_F(DrmServiceTest, ResourceRequests) {
    auto session = service.open_session(NOW);
    core::DrmClient client(session, "1.0.0", client_registry);

    json denied = send(session, "drm_resource_request",
                       json{{"resourceId", "texture:rare_set"}, {"accessToken", ""}});
    EXPECT_EQ(denied["type"], "drm_resource_response");
    EXPECT_EQ(denied["granted"], false);
    EXPECT_EQ(denied["error"], "Client not verified");

    json init = send(session, "drm_init", json{{"clientVersion", "1.0.0"}});
    json result = submit(session, client, init["initialChallenge"]);
    std::string token = result["accessToken"].get<std::string>();

    json granted = send(session, "drm_resource_request",
                        json{{"resourceId", "texture:rare_set"}, {"accessToken", token},
                             {"stateProof", json::array()}});
    EXPECT_EQ(granted["granted"], true);
    EXPECT_EQ(granted["resourceId"], "texture:rare_set");
    EXPECT_EQ(granted["validUntil"], NOW + constants::RESOURCE_TTL_MS);

    json legendary = send(session, "drm_resource_request",
                          json{{"resourceId", "content:legendary_bundle"}, {"accessToken", token}});
    EXPECT_EQ(legendary["granted"], false);
    EXPECT_EQ(legendary["error"], "Insufficient trust score. Required: 80, Current: 55");
    EXPECT_TRUE(legendary.contains("hint"));

    json public_notes = send(session, "drm_resource_request",
                             json{{"resourceId", "content:public_notes"}});
    EXPECT_EQ(public_notes["granted"], true);
    EXPECT_FALSE(public_notes.contains("validUntil"));

    json missing = send(session, "drm_resource_request",
                        json{{"resourceId", "content:unknown"}, {"accessToken", token}});
    EXPECT_EQ(missing["error"], "Resource not found");
}

TEST_F(DrmServiceTest, ProtocolErrors) {
    auto session = service.open_session(NOW);

    json uninitialized = send(session, "drm_challenge_request", json::object());
    EXPECT_EQ(uninitialized["type"], "drm_error");
    EXPECT_EQ(uninitialized["error"], "Client not initialized. Send drm_init first.");

    json unknown_type = send(session, "drm_teleport", json::object());
    EXPECT_EQ(unknown_type["type"], "drm_error");

    json malformed = json::parse(service.handle_message(session, "{not json", NOW));
    EXPECT_EQ(malformed["type"], "drm_error");

    json bad_init = send(session, "drm_init", json::object());
    EXPECT_EQ(bad_init["type"], "drm_error");

    send(session, "drm_init", json{{"clientVersion", "1.0.0"}});
    json bad_response = send(session, "drm_response", json{{"challengeId", "x"}});
    EXPECT_EQ(bad_response["type"], "drm_error");

    json no_session = json::parse(service.handle_message("nope", R"({"type":"drm_init"})", NOW));
    EXPECT_EQ(no_session["type"], "drm_error");
    EXPECT_EQ(no_session["error"], "Session not found");
}

TEST_F(DrmServiceTest, SessionLifecycle) {
    auto a = service.open_session(NOW);
    auto b = service.open_session(NOW);
    EXPECT_NE(a, b);
    EXPECT_EQ(service.sessions().size(), 2u);

    send(a, "drm_init", json{{"clientVersion", "1.0.0"}});
    EXPECT_EQ(service.stats()["activeClients"], 1);

    // Activity keeps a session alive
    send(b, "drm_init", json{{"clientVersion", "1.0.0"}}, NOW + constants::SESSION_IDLE_TIMEOUT_MS);
    EXPECT_EQ(service.stats()["activeClients"], 2);
    EXPECT_EQ(service.stats()["activeChallenges"], 2);

    auto removed = service.cleanup_stale_sessions(NOW + constants::SESSION_IDLE_TIMEOUT_MS + 1);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], a);

    // The evicted client's state and pending challenge go with its session
    EXPECT_EQ(service.stats()["activeClients"], 1);
    EXPECT_EQ(service.stats()["activeChallenges"], 1);

    service.close_session(b);
    EXPECT_EQ(service.sessions().size(), 0u);
    EXPECT_EQ(service.stats()["activeClients"], 0);
    EXPECT_EQ(service.stats()["activeChallenges"], 0);
}

TEST_F(DrmServiceTest, PurgeExpiredChallenges) {
    auto session = service.open_session(NOW);
    send(session, "drm_init", json{{"clientVersion", "1.0.0"}});
    send(session, "drm_challenge_request", json::object());
    EXPECT_EQ(service.stats()["activeChallenges"], 2);

    EXPECT_EQ(service.purge_expired_challenges(NOW + 1000), 0u);
    EXPECT_EQ(service.purge_expired_challenges(NOW + constants::CHALLENGE_TTL_MS + 1), 2u);
}

TEST(ServiceConfigTest, FromConfig) {
    auto config = utils::Config::load_from_json(R"({
        "server_version": "2.0.0",
        "challenge_ttl_ms": 5000,
        "strict_work_verification": true,
        "default_work_type": "folding_chain",
        "resources": [{"id": "content:custom", "minTrust": 10}]
    })");

    auto sc = ServiceConfig::from_config(config);
    EXPECT_EQ(sc.server_version, "2.0.0");
    EXPECT_EQ(sc.challenge_ttl_ms, 5000u);
    EXPECT_TRUE(sc.strict_work_verification);
    EXPECT_EQ(sc.default_work_type, "folding_chain");
    EXPECT_EQ(sc.catalog.size(), 1u);

    DrmService service(sc);
    EXPECT_EQ(service.manifest().version, "2.0.0");

    auto bad = utils::Config::load_from_json(R"({"resources": "all"})");
    EXPECT_THROW(ServiceConfig::from_config(bad), ShaderChainException);
}
