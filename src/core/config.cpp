#include "core/config.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace macroenv::core::config {

namespace {

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace

ParseMode parse_mode_from_string(const std::string& str) {
    if (to_lower(str) == "strict") return ParseMode::STRICT;
    return ParseMode::TOLERANT;
}

const char* parse_mode_to_string(ParseMode mode) {
    switch (mode) {
        case ParseMode::STRICT: return "strict";
        default: return "tolerant";
    }
}

ResolverOptions options_from_env() {
    ResolverOptions options;

#ifdef MACROENV_MANIFEST_DIR
    options.fallback_manifest_dir = MACROENV_MANIFEST_DIR;
#endif

    auto file = get_env("MACROENV_FILE");
    if (!file.empty()) {
        options.file_path = file;
    }

    auto manifest_dir = get_env("MACROENV_MANIFEST_DIR");
    if (!manifest_dir.empty()) {
        options.manifest_dir = manifest_dir;
    }

    auto mode = get_env("MACROENV_PARSE_MODE");
    if (!mode.empty()) {
        options.parse_mode = parse_mode_from_string(mode);
        if (options.parse_mode == ParseMode::TOLERANT && to_lower(mode) != "tolerant") {
            core::logger()->warn("Unknown MACROENV_PARSE_MODE '{}', using tolerant", mode);
        }
    }

    options.unquote_values = is_truthy(get_env("MACROENV_UNQUOTE"));
    return options;
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

bool is_truthy(const std::string& value) {
    auto lower = to_lower(value);
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

} // namespace macroenv::core::config
