#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "../domain/models/upload_receipt.h"

/**
 * @file upload_service.h
 * @brief Upload Service - image upload business logic
 *
 * Responsibilities:
 * - Issue a job id for every upload
 * - Persist the uploaded bytes as {jobId}.jpg
 * - Attach the model location to the receipt
 *
 * Does NOT handle:
 * - HTTP request/response and multipart parsing (Handler's job)
 * - Content validation (any bytes are accepted, including none)
 */

namespace holomodel::storage {
    class IFileStorage;
}

namespace holomodel::services {

class ModelService;

/**
 * @brief Upload Service Class
 */
class UploadService {
public:
    /**
     * @brief Constructor with Dependency Injection
     * @param storage File storage (non-owning pointer)
     * @param modelService Model lookup (non-owning pointer)
     * @throws std::invalid_argument if a dependency is nullptr
     */
    UploadService(storage::IFileStorage* storage, ModelService* modelService);

    ~UploadService() = default;

    /**
     * @brief Store an uploaded image under a freshly generated job id
     *
     * @param content Raw bytes of the uploaded file
     * @return Receipt with job id and model URL
     * @throws common::StorageWriteException if the file cannot be written
     */
    domain::models::UploadReceipt uploadImage(const std::vector<uint8_t>& content);

private:
    storage::IFileStorage* storage_;
    ModelService* modelService_;
};

} // namespace holomodel::services
