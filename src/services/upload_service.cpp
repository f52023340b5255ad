/**
 * @file upload_service.cpp
 * @brief UploadService implementation
 */

#include "upload_service.h"
#include "model_service.h"
#include "../domain/models/job_id.h"
#include "../storage/i_file_storage.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace holomodel::services {

UploadService::UploadService(storage::IFileStorage* storage, ModelService* modelService)
    : storage_(storage), modelService_(modelService) {
    if (!storage_ || !modelService_) {
        throw std::invalid_argument("UploadService: dependencies cannot be nullptr");
    }
    spdlog::info("[UploadService] Initialized (storage: {})", storage_->baseDir());
}

domain::models::UploadReceipt UploadService::uploadImage(const std::vector<uint8_t>& content) {
    auto jobId = domain::models::JobId::generate();

    domain::models::UploadReceipt receipt;
    receipt.jobId = jobId.toString();
    receipt.storagePath = storage_->store(jobId.storageFileName(), content);
    receipt.sizeBytes = static_cast<int64_t>(content.size());
    receipt.modelUrl = modelService_->getModel(receipt.jobId).modelUrl;

    spdlog::info("[UploadService] Stored upload: jobId={}, size={} bytes, path={}",
                 receipt.jobId, receipt.sizeBytes, receipt.storagePath);
    return receipt;
}

} // namespace holomodel::services
