#pragma once
#include <optional>
#include <string>
#include <vector>
#include "core/errors.hpp"

namespace macroenv::engine {

// Which backend(s) a resolution consults
enum class SearchType {
    FILE,
    SYSTEM,
    INPUT,
    ALL     // file, then system, then input
};

// Case-insensitive; nullopt for anything else.
std::optional<SearchType> search_type_from_string(const std::string& str);
const char* search_type_to_string(SearchType type);

// Backends tried for a selector, in order
std::vector<core::BackendKind> backend_order(SearchType type);

} // namespace macroenv::engine
