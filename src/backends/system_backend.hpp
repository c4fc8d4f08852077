#pragma once
#include <string>
#include "backends/lookup_result.hpp"

namespace macroenv::backends {

// Reads the inherited process environment. Never writes it.
class SystemBackend {
public:
    LookupResult lookup(const std::string& name) const;
};

} // namespace macroenv::backends
