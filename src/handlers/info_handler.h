#pragma once

/**
 * @file info_handler.h
 * @brief Service description endpoint
 */

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>

namespace holomodel::handlers {

/**
 * @brief GET / - service name, version and endpoint list
 */
class InfoHandler {
public:
    void registerRoutes(drogon::HttpAppFramework& app);

    static Json::Value buildInfo();

    void handleInfo(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);
};

} // namespace holomodel::handlers
