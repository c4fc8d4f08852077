#pragma once
#include <filesystem>
#include <string>

namespace macroenv::core::config {

// How the key-value file parser treats a malformed line
enum class ParseMode {
    TOLERANT,   // skip the line and keep parsing
    STRICT      // fail the lookup at the first malformed line
};

ParseMode parse_mode_from_string(const std::string& str);
const char* parse_mode_to_string(ParseMode mode);

// Resolver configuration
struct ResolverOptions {
    std::string file_name = ".env";
    std::filesystem::path file_path;       // explicit file, bypasses manifest search
    std::filesystem::path manifest_dir;    // directory holding the build manifest
    std::filesystem::path fallback_manifest_dir;   // used when the manifest search finds nothing
    std::string manifest_name = "CMakeLists.txt";
    ParseMode parse_mode = ParseMode::TOLERANT;
    bool unquote_values = false;           // strip one pair of surrounding quotes
    std::string prompt = "Please enter a value for {}";   // {} is replaced by the name
};

// Build options from MACROENV_* environment variables on top of the defaults.
ResolverOptions options_from_env();

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

bool is_truthy(const std::string& value);

} // namespace macroenv::core::config
