/**
 * @file upload_receipt.cpp
 * @brief Implementation of UploadReceipt domain model
 */

#include "upload_receipt.h"

namespace holomodel::domain::models {

Json::Value UploadReceipt::toJson() const {
    Json::Value json;
    json["job_id"] = jobId;
    json["model_url"] = modelUrl;
    return json;
}

} // namespace holomodel::domain::models
