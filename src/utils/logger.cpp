#include "logger.hpp"
#include "config.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace shaderchain::utils {

namespace {
    constexpr size_t LOG_FILE_MAX_BYTES = 10 * 1024 * 1024;
    constexpr size_t LOG_FILE_ROTATIONS = 3;
}

std::shared_ptr<spdlog::logger> Logger::logger_;

LogSettings LogSettings::from_config(const Config& config) {
    LogSettings settings;
    settings.level = config.get_or<std::string>("log_level", settings.level);
    settings.to_file = config.get_or<bool>("log_to_file", settings.to_file);
    settings.file_path = config.get_or<std::string>("log_file", settings.file_path);
    return settings;
}

void Logger::init(const LogSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);

    if (settings.to_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            settings.file_path, LOG_FILE_MAX_BYTES, LOG_FILE_ROTATIONS);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("shaderchain", sinks.begin(), sinks.end());

    // Unrecognised names map to "off" in spdlog; keep info instead
    auto level = spdlog::level::from_str(settings.level);
    if (level == spdlog::level::off && settings.level != "off") {
        level = spdlog::level::info;
    }
    logger_->set_level(level);
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!logger_) {
        init();
    }
    return logger_;
}

} // namespace shaderchain::utils
