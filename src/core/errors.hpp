#pragma once
#include <string>

namespace macroenv::core {

// Sources a value can be resolved from
enum class BackendKind {
    FILE,
    SYSTEM,
    INPUT
};

// Why a lookup or a resolution failed
enum class ErrorKind {
    NONE,
    NOT_FOUND,          // backend consulted, key absent
    READ_ERROR,         // key-value file could not be opened
    PARSE_ERROR,        // malformed line under the strict parse policy
    IO_ERROR,           // terminal read failed or hit end-of-stream
    RESOLUTION_FAILED   // every backend in the chain failed
};

const char* backend_kind_to_string(BackendKind kind);
const char* error_kind_to_string(ErrorKind kind);

// Fallback chains only move on from errors that mean "not here".
inline bool is_fallthrough(ErrorKind kind) {
    return kind == ErrorKind::NOT_FOUND ||
           kind == ErrorKind::READ_ERROR ||
           kind == ErrorKind::PARSE_ERROR;
}

} // namespace macroenv::core
