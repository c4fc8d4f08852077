#pragma once
#include <string>
#include "backends/file_backend.hpp"
#include "backends/input_backend.hpp"
#include "backends/system_backend.hpp"
#include "core/config.hpp"
#include "engine/result.hpp"
#include "engine/search_type.hpp"

namespace macroenv::engine {

/**
 * Resolves a variable name against the backends a selector names.
 *
 * Under ALL the backends are tried file -> system -> input and the first
 * success wins. NOT_FOUND, READ_ERROR and PARSE_ERROR move on to the next
 * backend; if every backend fails the result is RESOLUTION_FAILED with each
 * failure attached. Single-backend selectors return that backend's failure
 * unchanged. Nothing is cached between calls.
 */
class Resolver {
public:
    explicit Resolver(const core::config::ResolverOptions& options = core::config::options_from_env());

    Resolver(backends::FileBackend file, backends::SystemBackend system,
             backends::InputBackend input);

    ResolutionResult resolve(SearchType search, const std::string& name) const;

    // Same as resolve(SearchType::ALL, name)
    ResolutionResult resolve(const std::string& name) const;

    const backends::FileBackend& file_backend() const { return file_; }

private:
    backends::LookupResult consult(core::BackendKind backend, const std::string& name) const;

    backends::FileBackend file_;
    backends::SystemBackend system_;
    backends::InputBackend input_;
};

} // namespace macroenv::engine
