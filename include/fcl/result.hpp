#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fcl {

// Error codes for the file-operations engine
enum class ErrorCode {
    OK = 0,
    NOT_FOUND,          // Target directory or file missing
    INVALID_ARGUMENT,   // Bad dimension, negative day count, malformed pattern
    PERMISSION_DENIED,  // Access denied on read/write/delete
    STORAGE_ERROR,      // Journal or index persistence failure
    ALREADY_EXISTS,
    IO_ERROR,
    CORRUPTION,
    INTERNAL_ERROR
};

// Error with code and message
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return std::string(error_code_name(code_)) + ": " + message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
            case ErrorCode::STORAGE_ERROR: return "STORAGE_ERROR";
            case ErrorCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::CORRUPTION: return "CORRUPTION";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        }
        return "UNKNOWN";
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Result type for operations that can fail
// Holds either a value or an Error, in the spirit of C++23's std::expected
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::move(value)) {}

    // Error constructors
    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : data_(Error(code, std::move(message))) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::move(std::get<T>(data_));
    }

    // Access error (throws if success)
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        if (ok()) {
            return ErrorCode::OK;
        }
        return error().code();
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(Error(code, std::move(message))) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

    void value() const {
        if (!ok()) {
            throw std::runtime_error(error_.to_string());
        }
    }

private:
    Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

inline Error Err(ErrorCode code, std::string message = "") {
    return Error(code, std::move(message));
}

// Map a std::filesystem error onto the engine's taxonomy
inline Error Err(const std::error_code& ec, const std::string& context) {
    ErrorCode code = ErrorCode::IO_ERROR;
    if (ec == std::errc::no_such_file_or_directory) {
        code = ErrorCode::NOT_FOUND;
    } else if (ec == std::errc::permission_denied ||
               ec == std::errc::operation_not_permitted) {
        code = ErrorCode::PERMISSION_DENIED;
    }
    return Error(code, context + ": " + ec.message());
}

}  // namespace fcl
