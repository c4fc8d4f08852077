#include "backends/system_backend.hpp"
#include "core/logger.hpp"
#include <cstdlib>

namespace macroenv::backends {

LookupResult SystemBackend::lookup(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        core::logger()->debug("{} not set in the environment", name);
        return LookupResult::failure(core::ErrorKind::NOT_FOUND,
                                     name + " not set in the environment");
    }
    core::logger()->debug("Resolved {} from the environment", name);
    return LookupResult::found(value);
}

} // namespace macroenv::backends
