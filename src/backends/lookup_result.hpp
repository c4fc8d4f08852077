#pragma once
#include <string>
#include <utility>
#include "core/errors.hpp"

namespace macroenv::backends {

// Outcome of a single backend lookup
struct LookupResult {
    bool success = false;
    std::string value;
    core::ErrorKind error = core::ErrorKind::NONE;
    std::string message;

    static LookupResult found(std::string value) {
        LookupResult result;
        result.success = true;
        result.value = std::move(value);
        return result;
    }

    static LookupResult failure(core::ErrorKind error, std::string message) {
        LookupResult result;
        result.error = error;
        result.message = std::move(message);
        return result;
    }
};

} // namespace macroenv::backends
