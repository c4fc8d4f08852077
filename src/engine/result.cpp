#include "engine/result.hpp"

namespace macroenv::engine {

std::string ResolutionResult::describe() const {
    if (success) {
        return name + " resolved from " + core::backend_kind_to_string(*backend);
    }

    std::string text = "cannot resolve " + name + " (" + core::error_kind_to_string(error) + ")";
    for (const auto& failure : failures) {
        text += "; ";
        text += core::backend_kind_to_string(failure.backend);
        text += ": ";
        text += failure.message;
    }
    return text;
}

nlohmann::json to_json(const BackendFailure& failure) {
    nlohmann::json j;
    j["backend"] = core::backend_kind_to_string(failure.backend);
    j["error"] = core::error_kind_to_string(failure.error);
    j["message"] = failure.message;
    return j;
}

nlohmann::json to_json(const ResolutionResult& result) {
    nlohmann::json j;
    j["name"] = result.name;
    j["source"] = search_type_to_string(result.search);
    j["success"] = result.success;

    if (result.success) {
        j["value"] = result.value;
        j["backend"] = core::backend_kind_to_string(*result.backend);
    } else {
        j["value"] = nullptr;
        j["backend"] = nullptr;
        j["error"] = core::error_kind_to_string(result.error);
    }

    nlohmann::json failures = nlohmann::json::array();
    for (const auto& failure : result.failures) {
        failures.push_back(to_json(failure));
    }
    j["failures"] = failures;
    return j;
}

} // namespace macroenv::engine
