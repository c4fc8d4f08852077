#include "macroenv.hpp"

namespace macroenv {

ResolutionError::ResolutionError(ResolutionResult result)
    : std::runtime_error(result.describe())
    , result_(std::move(result)) {}

ResolutionResult resolve(SearchType search, const std::string& name) {
    engine::Resolver resolver;
    return resolver.resolve(search, name);
}

ResolutionResult resolve(const std::string& name) {
    return resolve(SearchType::ALL, name);
}

std::string env(SearchType search, const std::string& name) {
    auto result = resolve(search, name);
    if (!result.success) {
        throw ResolutionError(std::move(result));
    }
    return result.value;
}

std::string env(const std::string& name) {
    return env(SearchType::ALL, name);
}

} // namespace macroenv
