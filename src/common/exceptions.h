/**
 * @file exceptions.h
 * @brief Exception hierarchy for holomodel-service
 *
 * Provides typed exceptions with error codes for better error handling
 */

#pragma once

#include <stdexcept>
#include <string>
#include "error_codes.h"

namespace holomodel::common {

/**
 * @brief Base exception for all holomodel-service errors
 */
class HolomodelException : public std::runtime_error {
private:
    ErrorCode code_;
    std::string details_;

public:
    explicit HolomodelException(
        ErrorCode code,
        const std::string& message,
        const std::string& details = "")
        : std::runtime_error(message)
        , code_(code)
        , details_(details) {}

    ErrorCode getCode() const {
        return code_;
    }

    /**
     * @brief Get error details (server-side only, never sent to clients)
     */
    const std::string& getDetails() const {
        return details_;
    }

    /**
     * @brief Convert to ErrorResponse
     */
    ErrorResponse toErrorResponse() const {
        return ErrorResponse(code_, what());
    }
};

// =============================================================================
// Request Exceptions
// =============================================================================

class RequestException : public HolomodelException {
public:
    explicit RequestException(
        ErrorCode code,
        const std::string& message,
        const std::string& details = "")
        : HolomodelException(code, message, details) {}
};

class MissingFileException : public RequestException {
public:
    explicit MissingFileException(const std::string& fieldName)
        : RequestException(
            ErrorCode::REQUEST_MISSING_FILE,
            "Multipart field '" + fieldName + "' is required",
            "Field: " + fieldName) {}
};

class InvalidMultipartException : public RequestException {
public:
    explicit InvalidMultipartException(const std::string& details = "")
        : RequestException(
            ErrorCode::REQUEST_INVALID_MULTIPART,
            "Request body is not valid multipart/form-data",
            details) {}
};

// =============================================================================
// Storage Exceptions
// =============================================================================

class StorageException : public HolomodelException {
public:
    explicit StorageException(
        ErrorCode code,
        const std::string& message,
        const std::string& details = "")
        : HolomodelException(code, message, details) {}
};

class StorageInitException : public StorageException {
public:
    explicit StorageInitException(const std::string& dir, const std::string& error)
        : StorageException(
            ErrorCode::STORAGE_INIT_FAILED,
            "Failed to initialize upload storage",
            "Dir: " + dir + ", Error: " + error) {}
};

class StorageWriteException : public StorageException {
public:
    explicit StorageWriteException(const std::string& path, const std::string& error)
        : StorageException(
            ErrorCode::STORAGE_WRITE_FAILED,
            "Failed to store uploaded file",
            "Path: " + path + ", Error: " + error) {}
};

// =============================================================================
// Configuration Exceptions
// =============================================================================

class ConfigException : public HolomodelException {
public:
    explicit ConfigException(const std::string& variable, const std::string& reason)
        : HolomodelException(
            ErrorCode::CONFIG_INVALID_VALUE,
            "Invalid configuration value for " + variable,
            reason) {}
};

} // namespace holomodel::common
