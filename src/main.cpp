/**
 * @file main.cpp
 * @brief holomodel-service - image upload to 3D model REST service
 *
 * Accepts an uploaded image, stores it under a generated job id and
 * returns the model asset URL for that job.
 */

#include <drogon/drogon.h>
#include <trantor/utils/Date.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>

#include "common/exceptions.h"
#include "common/version.h"
#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"
#include "handlers/cors.h"
#include "handlers/health_handler.h"
#include "handlers/info_handler.h"
#include "handlers/model_handler.h"
#include "handlers/upload_handler.h"

using holomodel::infrastructure::AppConfig;
using holomodel::infrastructure::ServiceContainer;

namespace {

/**
 * @brief Print application banner
 */
void printBanner() {
    std::cout << R"(
  _   _       _                           _      _
 | | | | ___ | | ___  _ __ ___   ___   __| | ___| |
 | |_| |/ _ \| |/ _ \| '_ ` _ \ / _ \ / _` |/ _ \ |
 |  _  | (_) | | (_) | | | | | | (_) | (_| |  __/ |
 |_| |_|\___/|_|\___/|_| |_| |_|\___/ \__,_|\___|_|

)" << std::endl;
    std::cout << "  " << holomodel::common::kServiceName << " - Image to 3D Model" << std::endl;
    std::cout << "  Version: " << holomodel::common::kServiceVersion << std::endl;
    std::cout << std::endl;
}

/**
 * @brief Initialize logging system
 */
void initializeLogging(const AppConfig& config) {
    try {
        auto level = spdlog::level::from_str(config.logLevel);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(level);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logDir + "/holomodel-service.log", 1024 * 1024 * 10, 5);
        file_sink->set_level(level);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>("multi_sink",
            spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(3));

        spdlog::info("Logging initialized (level: {})", config.logLevel);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log init failed: " << ex.what() << std::endl;
    }
}

} // anonymous namespace

/**
 * @brief Main entry point
 */
int main(int /* argc */, char* /* argv */[]) {
    printBanner();

    AppConfig appConfig;
    try {
        appConfig = AppConfig::fromEnvironment();
        appConfig.validate();
    } catch (const holomodel::common::ConfigException& e) {
        std::cerr << e.what() << ": " << e.getDetails() << std::endl;
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(appConfig.logDir, ec);
    if (ec) {
        std::cerr << "Cannot create log directory " << appConfig.logDir << ": " << ec.message() << std::endl;
        return 1;
    }

    initializeLogging(appConfig);

    spdlog::info("Starting {}...", holomodel::common::kServiceName);
    spdlog::info("Upload dir: {}", appConfig.uploadDir);
    spdlog::info("Model URL: {}", appConfig.modelUrl);

    ServiceContainer services;
    if (!services.initialize(appConfig)) {
        spdlog::critical("Startup aborted");
        return 1;
    }

    try {
        auto& app = drogon::app();

        // Server settings
        app.setLogPath(appConfig.logDir)
           .setLogLevel(trantor::Logger::kInfo)
           .addListener("0.0.0.0", appConfig.serverPort)
           .setThreadNum(appConfig.threadNum)
           .setClientMaxBodySize(static_cast<size_t>(appConfig.maxBodySizeMB) * 1024 * 1024);

        holomodel::handlers::registerCors(app);

        // Handlers live until app.run() returns
        holomodel::handlers::UploadHandler uploadHandler(services.uploadService());
        holomodel::handlers::ModelHandler modelHandler(services.modelService());
        holomodel::handlers::HealthHandler healthHandler(
            services.fileStorage(),
            []() { return trantor::Date::now().toFormattedString(false); });
        holomodel::handlers::InfoHandler infoHandler;

        uploadHandler.registerRoutes(app);
        modelHandler.registerRoutes(app);
        healthHandler.registerRoutes(app);
        infoHandler.registerRoutes(app);

        spdlog::info("Server starting on http://0.0.0.0:{}", appConfig.serverPort);
        spdlog::info("Press Ctrl+C to stop the server");

        app.run();

    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        return 1;
    }

    spdlog::info("Server stopped");
    return 0;
}
