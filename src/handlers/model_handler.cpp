/** @file model_handler.cpp
 *  @brief ModelHandler implementation
 */

#include "model_handler.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

#include "../common/handler_utils.h"
#include "../common/logger.h"
#include "../services/model_service.h"

namespace holomodel::handlers {

ModelHandler::ModelHandler(services::ModelService* modelService)
    : modelService_(modelService) {
    if (!modelService_) {
        throw std::invalid_argument("ModelHandler: modelService cannot be nullptr");
    }
    spdlog::info("[ModelHandler] Initialized");
}

void ModelHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /model/{job_id}
    app.registerHandler(
        "/model/{job_id}",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& jobId) {
            handleGetModel(req, std::move(callback), jobId);
        },
        {drogon::Get}
    );

    spdlog::info("[ModelHandler] Routes registered");
}

void ModelHandler::handleGetModel(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& jobId) {

    common::RequestContext ctx = common::handler::makeRequestContext(req);
    ctx.setJobId(jobId);
    common::RequestLog::started(ctx);

    drogon::HttpResponsePtr resp;
    try {
        auto model = modelService_->getModel(jobId);
        resp = drogon::HttpResponse::newHttpJsonResponse(model.toJson());
    } catch (const std::exception& e) {
        resp = common::handler::internalError(ctx, e);
    }

    common::RequestLog::finished(ctx, static_cast<int>(resp->statusCode()));
    callback(resp);
}

} // namespace holomodel::handlers
