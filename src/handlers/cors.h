#pragma once

/**
 * @file cors.h
 * @brief Permissive CORS for the browser front end
 *
 * Any origin, method and header is allowed, with credentials.
 */

#include <drogon/HttpAppFramework.h>

namespace holomodel::handlers {

/**
 * @brief Add CORS headers to a response
 *
 * The request Origin is echoed back (with "Vary: Origin") because browsers
 * reject a wildcard origin on credentialed requests; without an Origin
 * header the wildcard is used.
 */
void applyCorsHeaders(const drogon::HttpRequestPtr& req, const drogon::HttpResponsePtr& resp);

/**
 * @brief Answer OPTIONS preflight requests for any path with 204
 */
drogon::HttpResponsePtr makePreflightResponse(const drogon::HttpRequestPtr& req);

/**
 * @brief Pre-routing advice: OPTIONS on any path is answered here, before
 *        the router can reject it for a GET-only or POST-only route
 */
void corsPreRouting(const drogon::HttpRequestPtr& req,
                    drogon::AdviceCallback&& acb,
                    drogon::AdviceChainCallback&& accb);

/**
 * @brief Install CORS advices on the application
 *
 * Preflights are answered before routing so every route, including
 * parameterized ones, is covered.
 */
void registerCors(drogon::HttpAppFramework& app);

} // namespace holomodel::handlers
