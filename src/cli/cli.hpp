#pragma once
#include <istream>
#include <ostream>

namespace macroenv::cli {

// Exit codes of the macroenv command
constexpr int EXIT_RESOLVED = 0;
constexpr int EXIT_UNRESOLVED = 1;
constexpr int EXIT_USAGE = 2;

/**
 * Run the macroenv command
 *
 * Parses argv, resolves the named variable and writes the value (or JSON
 * with --json) to out. Usage errors and the prompt go to err; the prompt
 * reads from in.
 */
int run(int argc, const char* const argv[], std::istream& in, std::ostream& out, std::ostream& err);

} // namespace macroenv::cli
