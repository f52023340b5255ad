/**
 * @file model_service.cpp
 * @brief ModelService implementation
 */

#include "model_service.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace holomodel::services {

ModelService::ModelService(std::string modelUrl)
    : modelUrl_(std::move(modelUrl)) {
    if (modelUrl_.empty()) {
        throw std::invalid_argument("ModelService: modelUrl cannot be empty");
    }
    spdlog::info("[ModelService] Initialized (modelUrl: {})", modelUrl_);
}

domain::models::ModelReference ModelService::getModel(const std::string& jobId) const {
    spdlog::debug("[ModelService] Resolving model for job '{}'", jobId);

    domain::models::ModelReference ref;
    ref.modelUrl = modelUrl_;
    return ref;
}

} // namespace holomodel::services
