#include "backends/dotenv_parser.hpp"
#include "core/logger.hpp"
#include <sstream>

namespace macroenv::backends {

namespace {

constexpr const char* kWhitespace = " \t\r\n\f\v";

} // namespace

const FileEntry* ParseReport::find(const std::string& key) const {
    auto it = entries.find(key);
    if (it == entries.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(kWhitespace);
    if (start == std::string::npos) {
        return {};
    }
    size_t end = str.find_last_not_of(kWhitespace);
    return str.substr(start, end - start + 1);
}

std::string unquote(const std::string& str) {
    if (str.size() >= 2) {
        if ((str.front() == '"' && str.back() == '"') ||
            (str.front() == '\'' && str.back() == '\'')) {
            return str.substr(1, str.size() - 2);
        }
    }
    return str;
}

ParseReport parse_dotenv(std::istream& in, const ParseOptions& options) {
    ParseReport report;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;

        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }

        std::string reason;
        size_t eq_pos = stripped.find('=');
        if (eq_pos == std::string::npos) {
            reason = "missing '='";
        } else if (trim(stripped.substr(0, eq_pos)).empty()) {
            reason = "empty key";
        }

        if (!reason.empty()) {
            report.issues.push_back({line_number, line, reason});
            if (options.mode == core::config::ParseMode::STRICT) {
                report.aborted = true;
                return report;
            }
            core::logger()->warn("Skipping malformed line {}: {}", line_number, reason);
            continue;
        }

        FileEntry entry;
        entry.key = trim(stripped.substr(0, eq_pos));
        entry.value = trim(stripped.substr(eq_pos + 1));
        if (options.unquote_values) {
            entry.value = unquote(entry.value);
        }
        entry.line = line_number;
        report.entries[entry.key] = std::move(entry);
    }

    return report;
}

ParseReport parse_dotenv(const std::string& text, const ParseOptions& options) {
    std::istringstream in(text);
    return parse_dotenv(in, options);
}

} // namespace macroenv::backends
