/**
 * @file upload_receipt.h
 * @brief Domain models returned by the upload and model endpoints
 *
 * Plain data objects passed from the service layer to the handlers.
 */

#pragma once

#include <string>
#include <cstdint>
#include <json/json.h>

namespace holomodel::domain::models {

/**
 * @brief Outcome of a stored upload
 *
 * storagePath and sizeBytes are server-side bookkeeping for logs; only the
 * job id and model URL go to the client.
 */
struct UploadReceipt {
    std::string jobId;        // UUID v4
    std::string modelUrl;
    std::string storagePath;  // {uploadDir}/{jobId}.jpg
    int64_t sizeBytes = 0;

    /**
     * @brief Client-facing body: {"job_id", "model_url"}
     */
    Json::Value toJson() const;
};

/**
 * @brief Model location returned for a job id
 */
struct ModelReference {
    std::string modelUrl;

    Json::Value toJson() const {
        Json::Value json;
        json["model_url"] = modelUrl;
        return json;
    }
};

} // namespace holomodel::domain::models
