/** @file info_handler.cpp
 *  @brief InfoHandler implementation
 */

#include "info_handler.h"

#include <spdlog/spdlog.h>

#include "../common/version.h"

namespace holomodel::handlers {

namespace {

Json::Value endpoint(const char* method, const char* path, const char* description) {
    Json::Value ep;
    ep["method"] = method;
    ep["path"] = path;
    ep["description"] = description;
    return ep;
}

} // anonymous namespace

void InfoHandler::registerRoutes(drogon::HttpAppFramework& app) {
    app.registerHandler(
        "/",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleInfo(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[InfoHandler] Routes registered");
}

Json::Value InfoHandler::buildInfo() {
    Json::Value result;
    result["name"] = common::kServiceName;
    result["description"] = "Image upload service returning a 3D model asset per job";
    result["version"] = common::kServiceVersion;

    Json::Value endpoints(Json::arrayValue);
    endpoints.append(endpoint("POST", "/upload", "Upload an image (multipart field 'file')"));
    endpoints.append(endpoint("GET", "/model/{job_id}", "Get the model URL for a job"));
    endpoints.append(endpoint("GET", "/api/health", "Health check endpoint"));
    result["endpoints"] = endpoints;

    return result;
}

void InfoHandler::handleInfo(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    callback(drogon::HttpResponse::newHttpJsonResponse(buildInfo()));
}

} // namespace holomodel::handlers
