#pragma once

/**
 * @file app_config.h
 * @brief holomodel-service application configuration
 *
 * Loaded from environment variables at startup.
 */

#include <string>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include "../common/exceptions.h"

namespace holomodel::infrastructure {

/// Asset returned for every job until a reconstruction backend exists
inline constexpr const char* kDefaultModelUrl =
    "https://raw.githubusercontent.com/KhronosGroup/glTF-Sample-Models/master/2.0/DamagedHelmet/glTF-Binary/DamagedHelmet.glb";

struct AppConfig {
    int serverPort = 8000;
    int threadNum = 4;
    int maxBodySizeMB = 50;  // HTTP upload body size limit (MB)

    std::string uploadDir = "storage/uploads";
    std::string modelUrl = kDefaultModelUrl;

    std::string logDir = "logs";
    std::string logLevel = "info";

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("SERVER_PORT")) config.serverPort = parseInt("SERVER_PORT", val);
        if (auto val = std::getenv("THREAD_NUM")) config.threadNum = parseInt("THREAD_NUM", val);
        if (auto val = std::getenv("MAX_BODY_SIZE_MB")) config.maxBodySizeMB = parseInt("MAX_BODY_SIZE_MB", val);

        if (auto val = std::getenv("UPLOAD_DIR")) config.uploadDir = val;
        if (auto val = std::getenv("MODEL_URL")) config.modelUrl = val;

        if (auto val = std::getenv("LOG_DIR")) config.logDir = val;
        if (auto val = std::getenv("LOG_LEVEL")) config.logLevel = val;

        return config;
    }

    /**
     * @throws common::ConfigException on the first invalid value
     */
    void validate() const {
        if (serverPort < 1 || serverPort > 65535) {
            throw common::ConfigException("SERVER_PORT", "must be in 1..65535, got " + std::to_string(serverPort));
        }
        if (threadNum < 1) {
            throw common::ConfigException("THREAD_NUM", "must be positive, got " + std::to_string(threadNum));
        }
        if (maxBodySizeMB < 1) {
            throw common::ConfigException("MAX_BODY_SIZE_MB", "must be positive, got " + std::to_string(maxBodySizeMB));
        }
        if (uploadDir.empty()) {
            throw common::ConfigException("UPLOAD_DIR", "must not be empty");
        }
        if (modelUrl.empty()) {
            throw common::ConfigException("MODEL_URL", "must not be empty");
        }
        if (spdlog::level::from_str(logLevel) == spdlog::level::off && logLevel != "off") {
            throw common::ConfigException("LOG_LEVEL", "unknown level '" + logLevel + "'");
        }
    }

private:
    static int parseInt(const char* name, const std::string& value) {
        try {
            size_t pos = 0;
            int parsed = std::stoi(value, &pos);
            if (pos != value.size()) {
                throw common::ConfigException(name, "trailing characters in '" + value + "'");
            }
            return parsed;
        } catch (const std::invalid_argument&) {
            throw common::ConfigException(name, "not a number: '" + value + "'");
        } catch (const std::out_of_range&) {
            throw common::ConfigException(name, "out of range: '" + value + "'");
        }
    }
};

} // namespace holomodel::infrastructure
