#pragma once

#include <fcl/result.hpp>

namespace fcl::cli {

// Standard exit codes for CLI commands
// Named with FCL_ prefix to avoid conflict with system macros
constexpr int FCL_EXIT_SUCCESS = 0;
constexpr int FCL_EXIT_USER_ERROR = 1;     // Invalid arguments, usage errors
constexpr int FCL_EXIT_NOT_FOUND = 2;      // Directory/file not found
constexpr int FCL_EXIT_IO_ERROR = 3;       // File/journal/storage errors
constexpr int FCL_EXIT_INTERNAL = 4;       // Internal/unexpected errors

inline int exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return FCL_EXIT_SUCCESS;
        case ErrorCode::INVALID_ARGUMENT:
            return FCL_EXIT_USER_ERROR;
        case ErrorCode::NOT_FOUND:
            return FCL_EXIT_NOT_FOUND;
        case ErrorCode::PERMISSION_DENIED:
        case ErrorCode::STORAGE_ERROR:
        case ErrorCode::ALREADY_EXISTS:
        case ErrorCode::IO_ERROR:
        case ErrorCode::CORRUPTION:
            return FCL_EXIT_IO_ERROR;
        case ErrorCode::INTERNAL_ERROR:
            return FCL_EXIT_INTERNAL;
    }
    return FCL_EXIT_INTERNAL;
}

}  // namespace fcl::cli
