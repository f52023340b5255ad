/**
 * @file model_service.h
 * @brief Resolves the 3D model asset for a job
 */

#pragma once

#include <string>
#include "../domain/models/upload_receipt.h"

namespace holomodel::services {

/**
 * @brief Model lookup
 *
 * No reconstruction pipeline exists: every job resolves to the same
 * preconfigured model asset, including ids that were never issued.
 */
class ModelService {
public:
    /**
     * @param modelUrl Asset URL returned for every job
     * @throws std::invalid_argument if modelUrl is empty
     */
    explicit ModelService(std::string modelUrl);

    /**
     * @brief Model location for a job id; the id is not validated
     */
    domain::models::ModelReference getModel(const std::string& jobId) const;

    const std::string& modelUrl() const {
        return modelUrl_;
    }

private:
    std::string modelUrl_;
};

} // namespace holomodel::services
