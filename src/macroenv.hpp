/**
 * macroenv public entry points
 *
 *   MACRO_ENV(FILE, "TOKEN")     key-value file next to the build manifest
 *   MACRO_ENV(SYSTEM, "TOKEN")   process environment
 *   MACRO_ENV(INPUT, "TOKEN")    prompt on the terminal
 *   MACRO_ENV(ALL, "TOKEN")      file, then environment, then prompt
 *   MACRO_ENV("TOKEN")           same as ALL
 *
 * The macro and env() throw ResolutionError on failure; resolve() returns
 * the result without throwing.
 */
#pragma once
#include <stdexcept>
#include <string>
#include "engine/resolver.hpp"
#include "engine/result.hpp"
#include "engine/search_type.hpp"

namespace macroenv {

using engine::ResolutionResult;
using engine::SearchType;

class ResolutionError : public std::runtime_error {
public:
    explicit ResolutionError(ResolutionResult result);

    const ResolutionResult& result() const { return result_; }

private:
    ResolutionResult result_;
};

// Resolve with options taken from the MACROENV_* environment variables.
ResolutionResult resolve(SearchType search, const std::string& name);
ResolutionResult resolve(const std::string& name);

std::string env(SearchType search, const std::string& name);
std::string env(const std::string& name);

} // namespace macroenv

#define MACROENV_SELECT_(_1, _2, NAME, ...) NAME
#define MACROENV_NAME_ONLY_(name) ::macroenv::env(name)
#define MACROENV_WITH_SEARCH_(search, name) ::macroenv::env(::macroenv::SearchType::search, name)

#define MACRO_ENV(...) \
    MACROENV_SELECT_(__VA_ARGS__, MACROENV_WITH_SEARCH_, MACROENV_NAME_ONLY_, )(__VA_ARGS__)
