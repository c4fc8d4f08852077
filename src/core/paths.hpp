#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config.hpp"

namespace macroenv::core::paths {

// Best-effort path to current executable; empty if unavailable.
std::filesystem::path executable_path();

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Roots the manifest search starts from: cwd first, then the executable dir.
std::vector<std::filesystem::path> manifest_search_roots();

// Walk upward from start to the first directory containing manifest_name.
std::optional<std::filesystem::path> find_manifest_dir(const std::filesystem::path& start,
                                                       const std::string& manifest_name);

// Where the key-value file should live for the given options.
// The file is not required to exist.
std::filesystem::path locate_env_file(const config::ResolverOptions& options);

} // namespace macroenv::core::paths
