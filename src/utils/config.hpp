#pragma once

#include "shaderchain/error.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace shaderchain::utils {

using json = nlohmann::json;

/**
 * Configuration management system
 * Loads settings from a JSON document
 */
class Config {
public:
    Config() = default;

    /**
     * Load configuration from JSON file
     * @throws ShaderChainException if the file is missing or malformed
     */
    static Config load_from_file(const std::string& path);

    /**
     * Load configuration from JSON string
     */
    static Config load_from_json(const std::string& json_str);

    /**
     * Get a value from config; nullopt when absent or of the wrong type
     */
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        try {
            return it->template get<T>();
        } catch (const json::exception&) {
            return std::nullopt;
        }
    }

    /**
     * Get a value with default
     */
    template<typename T>
    T get_or(const std::string& key, const T& default_value) const {
        auto value = get<T>(key);
        return value.value_or(default_value);
    }

    /**
     * Get a value that must be present and well-typed
     */
    template<typename T>
    Result<T> require(const std::string& key) const {
        if (!has(key)) {
            return Result<T>::Err(ErrorCode::ConfigNotFound, "Missing config key: " + key);
        }
        auto value = get<T>(key);
        if (!value) {
            return Result<T>::Err(ErrorCode::ConfigInvalid, "Wrong type for config key: " + key);
        }
        return Result<T>::Ok(*value);
    }

    /**
     * Set a value
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        data_[key] = value;
    }

    bool has(const std::string& key) const {
        return data_.contains(key);
    }

    const json& data() const { return data_; }

private:
    json data_ = json::object();
};

} // namespace shaderchain::utils
