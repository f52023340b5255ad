/**
 * @file error_codes.h
 * @brief Standardized error codes for holomodel-service
 *
 * Provides consistent error codes across all components
 * Format: COMPONENT_ERROR_TYPE_DETAIL
 */

#pragma once

#include <string>
#include <json/json.h>

namespace holomodel::common {

/**
 * @brief Error code enumeration
 */
enum class ErrorCode {
    // Request Errors (4000-4999)
    REQUEST_INVALID_MULTIPART = 4001,
    REQUEST_MISSING_FILE = 4002,

    // Storage Errors (5000-5999)
    STORAGE_INIT_FAILED = 5001,
    STORAGE_WRITE_FAILED = 5002,

    // Configuration Errors (6000-6999)
    CONFIG_INVALID_VALUE = 6001,

    // System Errors (9000-9999)
    SYSTEM_INTERNAL_ERROR = 9001,
};

/**
 * @brief Convert error code to string
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        // Request
        case ErrorCode::REQUEST_INVALID_MULTIPART: return "REQUEST_INVALID_MULTIPART";
        case ErrorCode::REQUEST_MISSING_FILE: return "REQUEST_MISSING_FILE";

        // Storage
        case ErrorCode::STORAGE_INIT_FAILED: return "STORAGE_INIT_FAILED";
        case ErrorCode::STORAGE_WRITE_FAILED: return "STORAGE_WRITE_FAILED";

        // Config
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";

        // System
        case ErrorCode::SYSTEM_INTERNAL_ERROR: return "SYSTEM_INTERNAL_ERROR";

        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Convert error code to HTTP status code
 *
 * Multipart problems answer 422 to match the validation status clients of
 * this API already handle.
 */
inline int errorCodeToHttpStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::REQUEST_INVALID_MULTIPART:
        case ErrorCode::REQUEST_MISSING_FILE:
            return 422;
        default:
            return 500;  // Storage, config, system
    }
}

/**
 * @brief Error response builder
 */
class ErrorResponse {
private:
    ErrorCode code_;
    std::string message_;
    std::string requestId_;

public:
    ErrorResponse(ErrorCode code, const std::string& message)
        : code_(code), message_(message) {}

    /**
     * @brief Set request ID for tracing
     */
    ErrorResponse& setRequestId(const std::string& requestId) {
        requestId_ = requestId;
        return *this;
    }

    /**
     * @brief Convert to JSON response body
     *
     * Exception details are never part of the body; they are logged.
     */
    Json::Value toJson() const {
        Json::Value json;
        json["success"] = false;
        json["error"]["code"] = errorCodeToString(code_);
        json["error"]["numericCode"] = static_cast<int>(code_);
        json["error"]["message"] = message_;

        if (!requestId_.empty()) {
            json["requestId"] = requestId_;
        }

        return json;
    }

    int getHttpStatus() const {
        return errorCodeToHttpStatus(code_);
    }
};

} // namespace holomodel::common
