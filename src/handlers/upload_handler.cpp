/**
 * @file upload_handler.cpp
 * @brief UploadHandler implementation
 */

#include "upload_handler.h"

#include <spdlog/spdlog.h>
#include <json/json.h>

#include <stdexcept>
#include <vector>

#include "../common/exceptions.h"
#include "../common/handler_utils.h"
#include "../common/logger.h"
#include "../services/upload_service.h"

using holomodel::common::RequestLog;
using holomodel::common::RequestContext;

namespace {

/**
 * @brief First uploaded file whose form field matches fieldName
 */
const drogon::HttpFile* findFilePart(const std::vector<drogon::HttpFile>& files,
                                     const std::string& fieldName) {
    for (const auto& file : files) {
        if (file.getItemName() == fieldName) {
            return &file;
        }
    }
    return nullptr;
}

} // anonymous namespace

namespace holomodel::handlers {

UploadHandler::UploadHandler(services::UploadService* uploadService)
    : uploadService_(uploadService) {
    if (!uploadService_) {
        throw std::invalid_argument("UploadHandler: uploadService cannot be nullptr");
    }
    spdlog::info("[UploadHandler] Initialized");
}

void UploadHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // POST /upload
    app.registerHandler(
        "/upload",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleUpload(req, std::move(callback));
        },
        {drogon::Post}
    );

    spdlog::info("[UploadHandler] Routes registered");
}

void UploadHandler::handleUpload(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    RequestContext ctx = common::handler::makeRequestContext(req);
    RequestLog::started(ctx);

    drogon::HttpResponsePtr resp;
    try {
        drogon::MultiPartParser parser;
        int parseResult;
        {
            common::StageTimer timer(ctx, "parse");
            parseResult = parser.parse(req);
        }
        if (parseResult != 0) {
            throw common::InvalidMultipartException(
                "Content-Type: " + req->getHeader("content-type"));
        }

        const drogon::HttpFile* file = findFilePart(parser.getFiles(), kFileField);
        if (!file) {
            throw common::MissingFileException(kFileField);
        }

        std::vector<uint8_t> content(file->fileData(), file->fileData() + file->fileLength());

        domain::models::UploadReceipt receipt;
        {
            common::StageTimer timer(ctx, "store");
            receipt = uploadService_->uploadImage(content);
        }
        ctx.setJobId(receipt.jobId);

        Json::Value logData;
        logData["originalName"] = file->getFileName();
        logData["sizeBytes"] = Json::Value::Int64(receipt.sizeBytes);
        logData["storagePath"] = receipt.storagePath;
        RequestLog::event(ctx, "UPLOAD_STORED", logData);

        resp = drogon::HttpResponse::newHttpJsonResponse(receipt.toJson());

    } catch (const common::HolomodelException& e) {
        RequestLog::failed(ctx, e.getCode(), e.what(), e.getDetails());
        auto error = e.toErrorResponse();
        error.setRequestId(ctx.requestId());
        resp = common::handler::errorResponse(error);

    } catch (const std::exception& e) {
        resp = common::handler::internalError(ctx, e);
    }

    RequestLog::finished(ctx, static_cast<int>(resp->statusCode()));
    callback(resp);
}

} // namespace holomodel::handlers
