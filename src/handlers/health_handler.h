#pragma once

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>
#include <string>

namespace holomodel::storage {
    class IFileStorage;
}

namespace holomodel::handlers {

/**
 * @brief Health check endpoint handler
 *
 * Provides:
 * - GET /api/health - Service health including upload directory state
 */
class HealthHandler {
public:
    /**
     * @brief Construct HealthHandler
     *
     * @param fileStorage Upload storage to probe (non-owning pointer)
     * @param getCurrentTimestamp Function that returns current timestamp string
     */
    HealthHandler(
        storage::IFileStorage* fileStorage,
        std::function<std::string()> getCurrentTimestamp);

    void registerRoutes(drogon::HttpAppFramework& app);

    /**
     * @brief GET /api/health
     *
     * Response (200, or 503 when the upload directory is gone):
     * {
     *   "service": "holomodel-service",
     *   "status": "UP",
     *   "version": "1.0.0",
     *   "timestamp": "2026-10-19 10:00:00",
     *   "uploadDir": "storage/uploads"
     * }
     */
    void handleHealth(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

private:
    storage::IFileStorage* fileStorage_;
    std::function<std::string()> getCurrentTimestamp_;
};

} // namespace holomodel::handlers
