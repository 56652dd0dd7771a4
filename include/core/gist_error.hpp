#ifndef GISTVAULT_GIST_ERROR_HPP
#define GISTVAULT_GIST_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gistvault::core {

enum class ErrorCode {
    INVALID_INPUT,
    INVALID_BINARY_FORMAT,
    NOT_FOUND,
    GONE,
    UNAUTHORIZED,
    FORBIDDEN,
    CONFLICT,
    STORAGE_ERROR
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INPUT: return "Invalid input";
        case ErrorCode::INVALID_BINARY_FORMAT: return "Invalid binary format";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::GONE: return "Gone";
        case ErrorCode::UNAUTHORIZED: return "Unauthorized";
        case ErrorCode::FORBIDDEN: return "Forbidden";
        case ErrorCode::CONFLICT: return "Conflict";
        case ErrorCode::STORAGE_ERROR: return "Storage error";
        default: return "Undefined error";
    }
}

// Status the routing layer answers with for each error kind
inline int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INPUT: return 400;
        case ErrorCode::INVALID_BINARY_FORMAT: return 400;
        case ErrorCode::NOT_FOUND: return 404;
        case ErrorCode::GONE: return 410;
        case ErrorCode::UNAUTHORIZED: return 401;
        case ErrorCode::FORBIDDEN: return 403;
        case ErrorCode::CONFLICT: return 409;
        case ErrorCode::STORAGE_ERROR: return 500;
        default: return 500;
    }
}

class GistError : public std::runtime_error {
public:
    GistError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class InvalidInputError : public GistError {
public:
    explicit InvalidInputError(const std::string& message)
        : GistError(ErrorCode::INVALID_INPUT, "Invalid input: " + message) {}
};

class InvalidBinaryFormatError : public GistError {
public:
    explicit InvalidBinaryFormatError(const std::string& message)
        : GistError(ErrorCode::INVALID_BINARY_FORMAT, "Invalid binary format: " + message) {}
};

class NotFoundError : public GistError {
public:
    explicit NotFoundError(const std::string& message)
        : GistError(ErrorCode::NOT_FOUND, "Not found: " + message) {}
};

// Record exists but is past its expiry
class GoneError : public GistError {
public:
    explicit GoneError(const std::string& message)
        : GistError(ErrorCode::GONE, "Gone: " + message) {}
};

// Required credential missing
class UnauthorizedError : public GistError {
public:
    explicit UnauthorizedError(const std::string& message)
        : GistError(ErrorCode::UNAUTHORIZED, "Unauthorized: " + message) {}
};

// Credential invalid, or operation not allowed for the record's protection class
class ForbiddenError : public GistError {
public:
    explicit ForbiddenError(const std::string& message)
        : GistError(ErrorCode::FORBIDDEN, "Forbidden: " + message) {}
};

class ConflictError : public GistError {
public:
    explicit ConflictError(const std::string& message)
        : GistError(ErrorCode::CONFLICT, "Conflict: " + message) {}
};

class StorageError : public GistError {
public:
    explicit StorageError(const std::string& message)
        : GistError(ErrorCode::STORAGE_ERROR, "Storage error: " + message) {}
};

} // namespace gistvault::core

#endif // GISTVAULT_GIST_ERROR_HPP
