#include "core/errors.hpp"

namespace macroenv::core {

const char* backend_kind_to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::FILE:   return "file";
        case BackendKind::SYSTEM: return "system";
        case BackendKind::INPUT:  return "input";
        default: return "unknown";
    }
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:              return "none";
        case ErrorKind::NOT_FOUND:         return "not_found";
        case ErrorKind::READ_ERROR:        return "read_error";
        case ErrorKind::PARSE_ERROR:       return "parse_error";
        case ErrorKind::IO_ERROR:          return "io_error";
        case ErrorKind::RESOLUTION_FAILED: return "resolution_failed";
        default: return "unknown";
    }
}

} // namespace macroenv::core
