#pragma once

/**
 * @file service_container.h
 * @brief Centralized service container for holomodel-service
 *
 * Owns storage and services.
 * Provides non-owning pointer accessors for handler construction.
 */

#include <memory>

namespace holomodel::storage {
    class IFileStorage;
}

namespace holomodel::services {
    class ModelService;
    class UploadService;
}

namespace holomodel::infrastructure {

struct AppConfig;

class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @param config Application configuration
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    // --- Storage Accessors ---
    storage::IFileStorage* fileStorage() const;

    // --- Service Accessors ---
    services::ModelService* modelService() const;
    services::UploadService* uploadService() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace holomodel::infrastructure
