#include "backends/input_backend.hpp"
#include "core/logger.hpp"
#include <iostream>

namespace macroenv::backends {

InputBackend::InputBackend(std::string prompt_template)
    : InputBackend(std::cin, std::cout, std::move(prompt_template)) {}

InputBackend::InputBackend(std::istream& in, std::ostream& out, std::string prompt_template)
    : in_(in)
    , out_(out)
    , prompt_template_(std::move(prompt_template)) {}

std::string InputBackend::prompt_text(const std::string& name) const {
    std::string text = prompt_template_;
    size_t pos = text.find("{}");
    if (pos != std::string::npos) {
        text.replace(pos, 2, name);
    }
    return text;
}

LookupResult InputBackend::prompt(const std::string& name) const {
    out_ << prompt_text(name) << std::endl;
    if (!out_) {
        core::logger()->warn("Failed to write prompt for {}", name);
    }

    std::string line;
    if (!std::getline(in_, line)) {
        core::logger()->debug("No input available for {}", name);
        return LookupResult::failure(core::ErrorKind::IO_ERROR,
            in_.eof() ? "end of input while reading " + name
                      : "failed to read " + name + " from input");
    }

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    core::logger()->debug("Read {} from input", name);
    return LookupResult::found(std::move(line));
}

} // namespace macroenv::backends
