#include "backends/file_backend.hpp"
#include "core/paths.hpp"
#include "core/logger.hpp"
#include <fstream>

namespace macroenv::backends {

FileBackend::FileBackend(const core::config::ResolverOptions& options)
    : locator_([options]() { return core::paths::locate_env_file(options); }) {
    parse_options_.mode = options.parse_mode;
    parse_options_.unquote_values = options.unquote_values;
}

FileBackend::FileBackend(FileLocator locator, ParseOptions parse_options)
    : locator_(std::move(locator))
    , parse_options_(parse_options) {}

std::filesystem::path FileBackend::file_path() const {
    return locator_ ? locator_() : std::filesystem::path();
}

LookupResult FileBackend::lookup(const std::string& name) const {
    auto path = file_path();
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        core::logger()->debug("Key-value file is a directory: {}", path.string());
        return LookupResult::failure(core::ErrorKind::READ_ERROR,
                                     path.string() + " is a directory");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        core::logger()->debug("Cannot open key-value file: {}", path.string());
        return LookupResult::failure(core::ErrorKind::READ_ERROR,
                                     "cannot open " + path.string());
    }

    auto report = parse_dotenv(file, parse_options_);
    if (file.bad()) {
        core::logger()->debug("Read of {} failed", path.string());
        return LookupResult::failure(core::ErrorKind::READ_ERROR,
                                     "failed to read " + path.string());
    }
    if (report.aborted) {
        const auto& issue = report.issues.front();
        core::logger()->debug("Strict parse of {} stopped at line {}", path.string(), issue.line);
        return LookupResult::failure(core::ErrorKind::PARSE_ERROR,
            path.string() + ":" + std::to_string(issue.line) + ": " + issue.reason);
    }

    const FileEntry* entry = report.find(name);
    if (!entry) {
        core::logger()->debug("{} not found in {}", name, path.string());
        return LookupResult::failure(core::ErrorKind::NOT_FOUND,
                                     name + " not found in " + path.string());
    }

    core::logger()->debug("Resolved {} from {} (line {})", name, path.string(), entry->line);
    return LookupResult::found(entry->value);
}

} // namespace macroenv::backends
