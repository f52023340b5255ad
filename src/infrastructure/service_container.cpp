/**
 * @file service_container.cpp
 * @brief ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"

#include <spdlog/spdlog.h>

#include "../common/exceptions.h"
#include "../storage/local_file_storage.h"
#include "../services/model_service.h"
#include "../services/upload_service.h"

namespace holomodel::infrastructure {

struct ServiceContainer::Impl {
    // Storage
    std::unique_ptr<storage::IFileStorage> fileStorage;

    // Services
    std::unique_ptr<services::ModelService> modelService;
    std::unique_ptr<services::UploadService> uploadService;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("Initializing service container...");

    try {
        // Step 1: Upload storage (creates the directory on first start)
        impl_->fileStorage = std::make_unique<storage::LocalFileStorage>(config.uploadDir);

        // Step 2: Services
        impl_->modelService = std::make_unique<services::ModelService>(config.modelUrl);
        impl_->uploadService = std::make_unique<services::UploadService>(
            impl_->fileStorage.get(), impl_->modelService.get());

    } catch (const common::HolomodelException& e) {
        spdlog::critical("Service container initialization failed: {} ({})", e.what(), e.getDetails());
        shutdown();
        return false;
    } catch (const std::exception& e) {
        spdlog::critical("Service container initialization failed: {}", e.what());
        shutdown();
        return false;
    }

    spdlog::info("Service container initialized");
    return true;
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    // Reverse dependency order
    impl_->uploadService.reset();
    impl_->modelService.reset();
    impl_->fileStorage.reset();
}

storage::IFileStorage* ServiceContainer::fileStorage() const {
    return impl_->fileStorage.get();
}

services::ModelService* ServiceContainer::modelService() const {
    return impl_->modelService.get();
}

services::UploadService* ServiceContainer::uploadService() const {
    return impl_->uploadService.get();
}

} // namespace holomodel::infrastructure
