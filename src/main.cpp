#include <algorithm>
#include <iostream>
#include <filesystem>
#include <string>

// Core components
#include "core/drm/client_solver.hpp"
#include "core/shader/shader_registry.hpp"

// Protocol and server
#include "protocol/messages.hpp"
#include "server/drm_service.hpp"

// Utilities
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "shaderchain/common.hpp"
#include "shaderchain/time_utils.hpp"

using nlohmann::json;
using namespace shaderchain;

namespace {

void print_usage() {
    std::cout << "Usage: shaderchain [demo|manifest|selfcheck] [config]\n";
}

// Send one message through the service the way a transport would
json exchange(server::DrmService& service, const std::string& session_id,
              const std::string& type, const json& payload) {
    protocol::Envelope envelope;
    envelope.type = type;
    envelope.session_id = session_id;
    envelope.payload = payload;
    return json::parse(service.handle_message(session_id, protocol::encode_envelope(envelope)));
}

// Solve a challenge from a server message and submit the response
json solve_and_submit(server::DrmService& service, const std::string& session_id,
                      core::DrmClient& client, const json& challenge_json) {
    auto challenge = protocol::decode_payload<core::DRMChallenge>(challenge_json);
    if (challenge.is_err()) {
        throw ProtocolException(challenge.error().code(), challenge.error().message());
    }

    SHADERCHAIN_LOG_INFO("[{}] challenge {}: {} shaders, difficulty {}",
                         client.client_id().substr(0, 8), challenge.value().challenge_id,
                         challenge.value().required_shaders.size(), challenge.value().difficulty);

    core::DRMResponse response = client.solve_challenge_async(challenge.value()).get();
    return exchange(service, session_id, protocol::message_types::RESPONSE, response);
}

void log_verify_result(const std::string& label, const json& result) {
    SHADERCHAIN_LOG_INFO("[{}] valid={} version={} chain={} shaders={} work={}",
        label,
        result.value("valid", false),
        result.value("versionMatch", false),
        result.value("chainIntegrity", false),
        result.value("shaderOutputsMatch", false),
        result.value("workValid", false));

    for (const auto& error : result.value("errors", json::array())) {
        SHADERCHAIN_LOG_INFO("[{}]   error: {}", label, error.get<std::string>());
    }

    if (result.contains("updatedState") && result["updatedState"].is_object()) {
        SHADERCHAIN_LOG_INFO("[{}]   trust={} chainLength={}", label,
            result["updatedState"].value("trustScore", 0),
            result["updatedState"].value("chainLength", 0));
    }
}

int run_selfcheck(const server::ServiceConfig& sc) {
    core::ShaderRegistry registry(sc.build_salt);
    auto failed = registry.self_check();

    for (const auto& def : registry.definitions()) {
        bool ok = std::find(failed.begin(), failed.end(), def.id) == failed.end();
        std::cout << (ok ? "PASS " : "FAIL ") << def.id << "\n";
    }

    return failed.empty() ? 0 : 1;
}

int run_manifest(const server::ServiceConfig& sc) {
    core::ShaderRegistry registry(sc.build_salt);
    auto manifest = core::ManifestBuilder::build(sc.server_version, registry, sc.signing_secret);
    SHADERCHAIN_LOG_INFO("Manifest {} built at {}", manifest.version,
                         time::format_timestamp_ms(manifest.build_timestamp));
    json j = manifest;
    std::cout << j.dump(2) << std::endl;
    return 0;
}

int run_demo(const server::ServiceConfig& sc) {
    server::DrmService service(sc);
    const auto& version = service.manifest().version;

    // ========================================================================
    // HONEST CLIENT
    // ========================================================================

    SHADERCHAIN_LOG_INFO("=== Honest client ===");
    std::string honest_session = service.open_session();
    core::ShaderRegistry honest_registry(sc.build_salt);
    core::DrmClient honest(honest_session, version, honest_registry);

    json init = exchange(service, honest_session, protocol::message_types::INIT,
                         json{{"clientVersion", version}});
    SHADERCHAIN_LOG_INFO("Init: serverVersion={} versionMatch={} trust={}",
                         init.value("serverVersion", ""), init.value("versionMatch", false),
                         init["clientState"].value("trustScore", 0));

    std::string token;
    json result = solve_and_submit(service, honest_session, honest, init["initialChallenge"]);
    log_verify_result("honest#1", result);

    for (int round = 2; round <= 3; ++round) {
        json reply = exchange(service, honest_session, protocol::message_types::CHALLENGE_REQUEST,
                              json{{"workType", round == 2 ? core::work_types::FOLDING_CHAIN
                                                           : core::work_types::ENTROPY_CHAIN}});
        result = solve_and_submit(service, honest_session, honest, reply["challenge"]);
        log_verify_result("honest#" + std::to_string(round), result);
    }

    if (result["accessToken"].is_string()) {
        token = result["accessToken"].get<std::string>();
    }

    auto state = honest.chain_state();
    SHADERCHAIN_LOG_INFO("Client chain: length={} head={}", state.chain_length, state.chain_hash);

    // ========================================================================
    // WRONG VERSION CLIENT
    // ========================================================================

    SHADERCHAIN_LOG_INFO("=== Wrong version client ===");
    std::string stale_session = service.open_session();
    core::ShaderRegistry stale_registry(sc.build_salt);
    core::DrmClient stale(stale_session, "0.9.0", stale_registry);

    init = exchange(service, stale_session, protocol::message_types::INIT,
                    json{{"clientVersion", "0.9.0"}});
    SHADERCHAIN_LOG_INFO("Init: versionMatch={} initialChallenge={}",
                         init.value("versionMatch", false), !init["initialChallenge"].is_null());

    json reply = exchange(service, stale_session, protocol::message_types::CHALLENGE_REQUEST, json::object());
    log_verify_result("stale", solve_and_submit(service, stale_session, stale, reply["challenge"]));

    // ========================================================================
    // TAMPERED CLIENT
    // ========================================================================

    SHADERCHAIN_LOG_INFO("=== Tampered client ===");
    std::string tampered_session = service.open_session();
    core::ShaderRegistry tampered_registry("tampered_build_salt");
    core::DrmClient tampered(tampered_session, version, tampered_registry);

    init = exchange(service, tampered_session, protocol::message_types::INIT,
                    json{{"clientVersion", version}});
    log_verify_result("tampered",
                      solve_and_submit(service, tampered_session, tampered, init["initialChallenge"]));

    // ========================================================================
    // RESOURCE ACCESS
    // ========================================================================

    SHADERCHAIN_LOG_INFO("=== Resource access ===");
    for (const char* resource : {"content:public_notes", "texture:rare_set", "content:legendary_bundle"}) {
        json response = exchange(service, honest_session, protocol::message_types::RESOURCE_REQUEST,
                                 json{{"resourceId", resource},
                                      {"accessToken", token},
                                      {"stateProof", json::array()}});
        if (response.value("granted", false)) {
            SHADERCHAIN_LOG_INFO("{}: granted ({})", resource, response.value("data", ""));
        } else {
            SHADERCHAIN_LOG_INFO("{}: denied ({})", resource, response.value("error", ""));
        }
    }

    SHADERCHAIN_LOG_INFO("Stats: {}", service.stats().dump());
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::string command = "demo";
        if (argc > 1) {
            command = argv[1];
        }

        if (command == "-h" || command == "--help") {
            print_usage();
            return 0;
        }

        // Determine config file path
        std::string config_path = "shaderchain.conf";
        if (argc > 2) {
            config_path = argv[2];
        }

        // Built-in defaults apply when there is no config file
        utils::Config config;
        if (std::filesystem::exists(config_path)) {
            config = utils::Config::load_from_file(config_path);
        }

        utils::Logger::init(utils::LogSettings::from_config(config));

        SHADERCHAIN_LOG_INFO("ShaderChain v{}.{}.{}",
            SHADERCHAIN_VERSION_MAJOR,
            SHADERCHAIN_VERSION_MINOR,
            SHADERCHAIN_VERSION_PATCH
        );

        auto service_config = server::ServiceConfig::from_config(config);
        if (!config.has("signing_secret") || !config.has("token_secret")) {
            SHADERCHAIN_LOG_WARN("Using built-in development secrets");
        }

        if (command == "selfcheck") {
            return run_selfcheck(service_config);
        }
        if (command == "manifest") {
            return run_manifest(service_config);
        }
        if (command == "demo") {
            return run_demo(service_config);
        }

        print_usage();
        return 2;

    } catch (const ShaderChainException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
