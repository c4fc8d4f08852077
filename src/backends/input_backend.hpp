#pragma once
#include <istream>
#include <ostream>
#include <string>
#include "backends/lookup_result.hpp"

namespace macroenv::backends {

/**
 * Interactive terminal backend
 *
 * Writes one prompt line naming the variable, then blocks until a line is
 * read. There is no timeout and no retry.
 */
class InputBackend {
public:
    // Prompts on std::cout and reads std::cin.
    explicit InputBackend(std::string prompt_template = "Please enter a value for {}");

    InputBackend(std::istream& in, std::ostream& out,
                 std::string prompt_template = "Please enter a value for {}");

    // Fails with IO_ERROR on end-of-stream or a read failure.
    LookupResult prompt(const std::string& name) const;

    std::string prompt_text(const std::string& name) const;

private:
    std::istream& in_;
    std::ostream& out_;
    std::string prompt_template_;
};

} // namespace macroenv::backends
