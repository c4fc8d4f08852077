#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include "backends/dotenv_parser.hpp"
#include "backends/lookup_result.hpp"
#include "core/config.hpp"

namespace macroenv::backends {

/**
 * Key-value file backend
 *
 * Re-reads and re-parses the file on every lookup so external edits are
 * always observed. The file is never written.
 */
class FileBackend {
public:
    // Returns the path of the key-value file to read
    using FileLocator = std::function<std::filesystem::path()>;

    // Locates the file through the manifest search described by options.
    explicit FileBackend(const core::config::ResolverOptions& options);

    FileBackend(FileLocator locator, ParseOptions parse_options);

    /**
     * Look up a key
     * Fails with READ_ERROR if the file cannot be opened, PARSE_ERROR if a
     * malformed line is hit in strict mode, NOT_FOUND if the key is absent.
     */
    LookupResult lookup(const std::string& name) const;

    std::filesystem::path file_path() const;

private:
    FileLocator locator_;
    ParseOptions parse_options_;
};

} // namespace macroenv::backends
