#include "core/logger.hpp"
#include "core/config.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace macroenv::core {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(once, []() {
        instance = spdlog::get("macroenv");
        if (!instance) {
            // stdout carries resolved values, so logs stay on stderr
            instance = spdlog::stderr_color_mt("macroenv");
        }
        instance->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        auto text = config::get_env("MACROENV_LOG_LEVEL");
        auto level = parse_log_level(text);
        instance->set_level(level.value_or(spdlog::level::warn));
        if (!text.empty() && !level) {
            instance->warn("Unknown MACROENV_LOG_LEVEL '{}', using warn", text);
        }
    });
    return instance;
}

void init_logger() {
    spdlog::set_default_logger(logger());
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    auto level = spdlog::level::from_str(text);
    if (level == spdlog::level::off && text != "off") {
        return std::nullopt;
    }
    return level;
}

} // namespace macroenv::core
