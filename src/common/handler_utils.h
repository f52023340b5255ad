#pragma once

#include <string>
#include <json/json.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <spdlog/spdlog.h>

#include "error_codes.h"
#include "logger.h"

/**
 * @file handler_utils.h
 * @brief Handler-level helpers for request context and error responses
 *
 * Provides:
 *   - makeRequestContext(): RequestContext populated from a Drogon request
 *   - errorResponse(): JSON error envelope with the mapped HTTP status
 *   - internalError(): sanitized 500 response (logs real error, returns generic message)
 */

namespace holomodel::common::handler {

inline RequestContext makeRequestContext(const drogon::HttpRequestPtr& req) {
    return RequestContext(
        generateRequestId(),
        req->methodString(),
        req->path(),
        req->peerAddr().toIp());
}

/**
 * Create JSON error response for a known error.
 */
inline drogon::HttpResponsePtr errorResponse(const ErrorResponse& error) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(error.toJson());
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(error.getHttpStatus()));
    return resp;
}

/**
 * Create sanitized 500 Internal Server Error response.
 * Logs real exception details server-side; returns generic message to client.
 */
inline drogon::HttpResponsePtr internalError(
    const RequestContext& ctx, const std::exception& e) {
    RequestLog::failed(ctx, ErrorCode::SYSTEM_INTERNAL_ERROR, "Unhandled error", e.what());
    ErrorResponse error(ErrorCode::SYSTEM_INTERNAL_ERROR, "Internal server error");
    error.setRequestId(ctx.requestId());
    return errorResponse(error);
}

} // namespace holomodel::common::handler
