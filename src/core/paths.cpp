#include "core/paths.hpp"
#include "core/logger.hpp"
#include <unistd.h>
#include <limits.h>

namespace macroenv::core::paths {

std::filesystem::path executable_path() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}

std::filesystem::path executable_dir() {
    auto exe = executable_path();
    if (exe.empty()) {
        return {};
    }
    return exe.parent_path();
}

std::vector<std::filesystem::path> manifest_search_roots() {
    std::vector<std::filesystem::path> roots;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        roots.push_back(cwd);
    }

    auto exe_dir = executable_dir();
    if (!exe_dir.empty() && exe_dir != cwd) {
        roots.push_back(exe_dir);
    }
    return roots;
}

std::optional<std::filesystem::path> find_manifest_dir(const std::filesystem::path& start,
                                                       const std::string& manifest_name) {
    if (start.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    auto dir = std::filesystem::absolute(start, ec);
    if (ec) {
        return std::nullopt;
    }

    while (true) {
        if (std::filesystem::is_regular_file(dir / manifest_name, ec)) {
            return dir;
        }
        auto parent = dir.parent_path();
        if (parent == dir) break;  // reached root
        dir = parent;
    }
    return std::nullopt;
}

std::filesystem::path locate_env_file(const config::ResolverOptions& options) {
    if (!options.file_path.empty()) {
        return options.file_path;
    }

    if (!options.manifest_dir.empty()) {
        return options.manifest_dir / options.file_name;
    }

    for (const auto& root : manifest_search_roots()) {
        auto dir = find_manifest_dir(root, options.manifest_name);
        if (dir) {
            core::logger()->debug("Found {} in {}", options.manifest_name, dir->string());
            return *dir / options.file_name;
        }
    }

    if (!options.fallback_manifest_dir.empty()) {
        core::logger()->debug("No {} found, using {}", options.manifest_name,
                              options.fallback_manifest_dir.string());
        return options.fallback_manifest_dir / options.file_name;
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    core::logger()->debug("No {} found, falling back to the working directory", options.manifest_name);
    return ec ? std::filesystem::path(options.file_name) : cwd / options.file_name;
}

} // namespace macroenv::core::paths
