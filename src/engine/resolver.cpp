#include "engine/resolver.hpp"
#include "core/logger.hpp"

namespace macroenv::engine {

Resolver::Resolver(const core::config::ResolverOptions& options)
    : file_(options)
    , input_(options.prompt) {}

Resolver::Resolver(backends::FileBackend file, backends::SystemBackend system,
                   backends::InputBackend input)
    : file_(std::move(file))
    , system_(system)
    , input_(input) {}

backends::LookupResult Resolver::consult(core::BackendKind backend, const std::string& name) const {
    switch (backend) {
        case core::BackendKind::FILE:   return file_.lookup(name);
        case core::BackendKind::SYSTEM: return system_.lookup(name);
        case core::BackendKind::INPUT:  return input_.prompt(name);
    }
    return backends::LookupResult::failure(core::ErrorKind::NOT_FOUND, "unknown backend");
}

ResolutionResult Resolver::resolve(SearchType search, const std::string& name) const {
    ResolutionResult result;
    result.name = name;
    result.search = search;

    auto order = backend_order(search);
    for (size_t i = 0; i < order.size(); ++i) {
        auto lookup = consult(order[i], name);
        if (lookup.success) {
            result.success = true;
            result.value = std::move(lookup.value);
            result.backend = order[i];
            return result;
        }

        result.failures.push_back({order[i], lookup.error, lookup.message});

        bool last = i + 1 == order.size();
        if (!last && !core::is_fallthrough(lookup.error)) {
            result.error = lookup.error;
            core::logger()->debug("Resolution of {} stopped at {}: {}", name,
                          core::backend_kind_to_string(order[i]), lookup.message);
            return result;
        }
    }

    if (order.size() == 1) {
        result.error = result.failures.back().error;
    } else {
        result.error = core::ErrorKind::RESOLUTION_FAILED;
    }
    core::logger()->debug("{}", result.describe());
    return result;
}

ResolutionResult Resolver::resolve(const std::string& name) const {
    return resolve(SearchType::ALL, name);
}

} // namespace macroenv::engine
