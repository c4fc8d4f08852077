#pragma once
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace macroenv::core {

// Shared "macroenv" logger. Created on first use with a stderr sink and the
// level named by MACROENV_LOG_LEVEL (warn when unset or unknown).
std::shared_ptr<spdlog::logger> logger();

// Make the macroenv logger the spdlog default logger.
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Level named by text (trace|debug|info|warn|error|critical|off); nullopt if unknown.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text);

} // namespace macroenv::core
