#pragma once

/**
 * @file model_handler.h
 * @brief Model lookup endpoint handler
 */

#include <drogon/drogon.h>
#include <functional>
#include <string>

namespace holomodel::services {
    class ModelService;
}

namespace holomodel::handlers {

/**
 * @brief Handler for GET /model/{job_id}
 *
 * The job id is passed through unvalidated; unknown ids resolve like any other.
 */
class ModelHandler {
public:
    /**
     * @param modelService Model lookup (non-owning pointer)
     */
    explicit ModelHandler(services::ModelService* modelService);

    void registerRoutes(drogon::HttpAppFramework& app);

    /**
     * @brief GET /model/{job_id}
     *
     * Response (200):
     * {
     *   "model_url": "https://raw.githubusercontent.com/.../DamagedHelmet.glb"
     * }
     */
    void handleGetModel(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& jobId);

private:
    services::ModelService* modelService_;
};

} // namespace holomodel::handlers
