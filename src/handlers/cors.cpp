/**
 * @file cors.cpp
 * @brief CORS advices
 */

#include "cors.h"

#include <spdlog/spdlog.h>

namespace holomodel::handlers {

namespace {

constexpr const char* kAllowedMethods = "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT";
constexpr const char* kPreflightMaxAgeSec = "600";

} // anonymous namespace

void applyCorsHeaders(const drogon::HttpRequestPtr& req, const drogon::HttpResponsePtr& resp) {
    const std::string& origin = req->getHeader("origin");
    if (origin.empty()) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
    } else {
        resp->addHeader("Access-Control-Allow-Origin", origin);
        resp->addHeader("Vary", "Origin");
    }
    resp->addHeader("Access-Control-Allow-Credentials", "true");
}

drogon::HttpResponsePtr makePreflightResponse(const drogon::HttpRequestPtr& req) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(drogon::k204NoContent);

    applyCorsHeaders(req, resp);
    resp->addHeader("Access-Control-Allow-Methods", kAllowedMethods);

    const std::string& requestedHeaders = req->getHeader("access-control-request-headers");
    resp->addHeader("Access-Control-Allow-Headers", requestedHeaders.empty() ? "*" : requestedHeaders);
    resp->addHeader("Access-Control-Max-Age", kPreflightMaxAgeSec);
    return resp;
}

void corsPreRouting(const drogon::HttpRequestPtr& req,
                    drogon::AdviceCallback&& acb,
                    drogon::AdviceChainCallback&& accb) {
    if (req->method() == drogon::Options) {
        acb(makePreflightResponse(req));
        return;
    }
    accb();
}

void registerCors(drogon::HttpAppFramework& app) {
    app.registerPreRoutingAdvice(corsPreRouting);

    app.registerPreSendingAdvice(
        [](const drogon::HttpRequestPtr& req,
           const drogon::HttpResponsePtr& resp) {
            applyCorsHeaders(req, resp);
        });

    spdlog::info("[Cors] Advices registered (all origins)");
}

} // namespace holomodel::handlers
