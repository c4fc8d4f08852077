#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors.hpp"
#include "engine/search_type.hpp"

namespace macroenv::engine {

// Why one backend in a resolution failed
struct BackendFailure {
    core::BackendKind backend;
    core::ErrorKind error;
    std::string message;
};

struct ResolutionResult {
    bool success = false;
    std::string name;
    SearchType search = SearchType::ALL;
    std::string value;
    std::optional<core::BackendKind> backend;    // set on success
    core::ErrorKind error = core::ErrorKind::NONE;
    std::vector<BackendFailure> failures;        // in the order tried

    // One-line human readable description of the failure
    std::string describe() const;
};

nlohmann::json to_json(const BackendFailure& failure);
nlohmann::json to_json(const ResolutionResult& result);

} // namespace macroenv::engine
