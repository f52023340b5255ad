/** @file health_handler.cpp
 *  @brief HealthHandler implementation
 */

#include "health_handler.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

#include "../common/version.h"
#include "../storage/i_file_storage.h"

namespace holomodel::handlers {

HealthHandler::HealthHandler(
    storage::IFileStorage* fileStorage,
    std::function<std::string()> getCurrentTimestamp)
    : fileStorage_(fileStorage),
      getCurrentTimestamp_(std::move(getCurrentTimestamp)) {

    if (!fileStorage_ || !getCurrentTimestamp_) {
        throw std::invalid_argument("HealthHandler: dependencies cannot be nullptr");
    }

    spdlog::info("[HealthHandler] Initialized");
}

void HealthHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /api/health
    app.registerHandler(
        "/api/health",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleHealth(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[HealthHandler] Routes registered");
}

void HealthHandler::handleHealth(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    bool storageUp = fileStorage_->isAvailable();

    Json::Value result;
    result["service"] = common::kServiceName;
    result["status"] = storageUp ? "UP" : "DOWN";
    result["version"] = common::kServiceVersion;
    result["timestamp"] = getCurrentTimestamp_();
    result["uploadDir"] = fileStorage_->baseDir();

    auto resp = drogon::HttpResponse::newHttpJsonResponse(result);
    if (!storageUp) {
        spdlog::warn("[HealthHandler] Upload directory unavailable: {}", fileStorage_->baseDir());
        resp->setStatusCode(drogon::k503ServiceUnavailable);
    }
    callback(resp);
}

} // namespace holomodel::handlers
