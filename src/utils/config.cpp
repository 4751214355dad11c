#include "config.hpp"
#include <fstream>

namespace shaderchain::utils {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ShaderChainException(ErrorCode::ConfigNotFound,
                                   "Failed to open config file: " + path);
    }

    Config config;
    try {
        file >> config.data_;
    } catch (const json::parse_error& e) {
        throw ShaderChainException(ErrorCode::ConfigInvalid,
                                   "Failed to parse config file: " + std::string(e.what()));
    }

    if (!config.data_.is_object()) {
        throw ShaderChainException(ErrorCode::ConfigInvalid,
                                   "Config root must be a JSON object: " + path);
    }

    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    Config config;
    try {
        config.data_ = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ShaderChainException(ErrorCode::ConfigInvalid,
                                   "Failed to parse JSON: " + std::string(e.what()));
    }
    if (!config.data_.is_object()) {
        throw ShaderChainException(ErrorCode::ConfigInvalid, "Config root must be a JSON object");
    }
    return config;
}

} // namespace shaderchain::utils
