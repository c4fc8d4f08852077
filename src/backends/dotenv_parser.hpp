#pragma once
#include <cstddef>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/config.hpp"

namespace macroenv::backends {

// One KEY=VALUE line
struct FileEntry {
    std::string key;
    std::string value;
    size_t line = 0;    // 1-based
};

// A line that did not have the KEY=VALUE shape
struct ParseIssue {
    size_t line = 0;
    std::string text;
    std::string reason;
};

struct ParseOptions {
    core::config::ParseMode mode = core::config::ParseMode::TOLERANT;
    bool unquote_values = false;
};

struct ParseReport {
    std::unordered_map<std::string, FileEntry> entries;  // last duplicate wins
    std::vector<ParseIssue> issues;
    bool aborted = false;   // strict mode stopped at the first issue

    const FileEntry* find(const std::string& key) const;
};

ParseReport parse_dotenv(std::istream& in, const ParseOptions& options = {});
ParseReport parse_dotenv(const std::string& text, const ParseOptions& options = {});

// Strip surrounding whitespace (space, tab, CR, LF, FF, VT).
std::string trim(const std::string& str);

// Remove one pair of matching surrounding '"' or '\''.
std::string unquote(const std::string& str);

} // namespace macroenv::backends
