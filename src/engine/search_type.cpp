#include "engine/search_type.hpp"
#include <algorithm>
#include <cctype>

namespace macroenv::engine {

std::optional<SearchType> search_type_from_string(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "file") return SearchType::FILE;
    if (lower == "system") return SearchType::SYSTEM;
    if (lower == "input") return SearchType::INPUT;
    if (lower == "all") return SearchType::ALL;
    return std::nullopt;
}

const char* search_type_to_string(SearchType type) {
    switch (type) {
        case SearchType::FILE:   return "file";
        case SearchType::SYSTEM: return "system";
        case SearchType::INPUT:  return "input";
        case SearchType::ALL:    return "all";
        default: return "unknown";
    }
}

std::vector<core::BackendKind> backend_order(SearchType type) {
    switch (type) {
        case SearchType::FILE:   return {core::BackendKind::FILE};
        case SearchType::SYSTEM: return {core::BackendKind::SYSTEM};
        case SearchType::INPUT:  return {core::BackendKind::INPUT};
        case SearchType::ALL:
            return {core::BackendKind::FILE, core::BackendKind::SYSTEM, core::BackendKind::INPUT};
        default: return {};
    }
}

} // namespace macroenv::engine
