#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace shaderchain::utils {

class Config;

/**
 * Logging settings, read from the "log_level", "log_to_file" and
 * "log_file" configuration keys
 */
struct LogSettings {
    std::string level = "info";
    bool to_file = false;
    std::string file_path = "shaderchain.log";

    static LogSettings from_config(const Config& config);
};

/**
 * Process-wide protocol logger (spdlog)
 *
 * get() falls back to console-only info logging when init() was never
 * called, so library code and tests can log without setup.
 */
class Logger {
public:
    static void init(const LogSettings& settings = LogSettings());

    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace shaderchain::utils

#define SHADERCHAIN_LOG_TRACE(...)    shaderchain::utils::Logger::get()->trace(__VA_ARGS__)
#define SHADERCHAIN_LOG_DEBUG(...)    shaderchain::utils::Logger::get()->debug(__VA_ARGS__)
#define SHADERCHAIN_LOG_INFO(...)     shaderchain::utils::Logger::get()->info(__VA_ARGS__)
#define SHADERCHAIN_LOG_WARN(...)     shaderchain::utils::Logger::get()->warn(__VA_ARGS__)
#define SHADERCHAIN_LOG_ERROR(...)    shaderchain::utils::Logger::get()->error(__VA_ARGS__)
#define SHADERCHAIN_LOG_CRITICAL(...) shaderchain::utils::Logger::get()->critical(__VA_ARGS__)
