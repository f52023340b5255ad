#pragma once

/**
 * @file upload_handler.h
 * @brief Upload endpoint handler
 *
 * Provides:
 * - POST /upload - Store an image and return {job_id, model_url}
 */

#include <drogon/drogon.h>
#include <functional>

namespace holomodel::services {
    class UploadService;
}

namespace holomodel::handlers {

/**
 * @brief Upload endpoint handler
 *
 * Parses the multipart body, hands the bytes of the "file" part to
 * UploadService, and maps failures to the JSON error envelope.
 */
class UploadHandler {
public:
    /// Multipart form field carrying the image
    static constexpr const char* kFileField = "file";

    /**
     * @param uploadService Upload service (non-owning pointer)
     * @throws std::invalid_argument if uploadService is nullptr
     */
    explicit UploadHandler(services::UploadService* uploadService);

    /**
     * @brief Register upload routes with Drogon application
     */
    void registerRoutes(drogon::HttpAppFramework& app);

    /**
     * @brief POST /upload
     *
     * Request: multipart/form-data with a file part named "file".
     *
     * Response (200):
     * {
     *   "job_id": "3f0c2a9e-5b1d-4c8e-9a7f-1e2d3c4b5a69",
     *   "model_url": "https://raw.githubusercontent.com/.../DamagedHelmet.glb"
     * }
     *
     * 422 when the body is not multipart or has no "file" part,
     * 500 when the file cannot be written.
     */
    void handleUpload(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

private:
    services::UploadService* uploadService_;
};

} // namespace holomodel::handlers
