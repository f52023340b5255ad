/**
 * @file logger.h
 * @brief Per-request log lines for the upload and model endpoints
 *
 * Each handled request logs a "started" line and a "finished" line. The
 * finished line carries the status, the job id the request issued or asked
 * for, and the time spent in each recorded stage, e.g.
 *
 *   [REQ-1760868000000-12] POST /upload -> 200 job=3f2a... parse=0ms store=2ms (3ms)
 */

#pragma once

#include <spdlog/spdlog.h>
#include <json/json.h>

#include <atomic>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "error_codes.h"

namespace holomodel::common {

/**
 * @brief State collected while one request is handled
 */
class RequestContext {
public:
    using Stage = std::pair<std::string, long long>;

    RequestContext(std::string requestId, std::string method,
                   std::string endpoint, std::string clientIp)
        : requestId_(std::move(requestId))
        , method_(std::move(method))
        , endpoint_(std::move(endpoint))
        , clientIp_(std::move(clientIp))
        , startTime_(std::chrono::steady_clock::now()) {}

    const std::string& requestId() const { return requestId_; }
    const std::string& method() const { return method_; }
    const std::string& endpoint() const { return endpoint_; }
    const std::string& clientIp() const { return clientIp_; }
    const std::string& jobId() const { return jobId_; }
    const std::vector<Stage>& stages() const { return stages_; }

    /// Job issued by an upload, or the id a model lookup asked for
    void setJobId(std::string jobId) { jobId_ = std::move(jobId); }

    void recordStage(std::string name, long long elapsedMs) {
        stages_.emplace_back(std::move(name), elapsedMs);
    }

    long long elapsedMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime_).count();
    }

private:
    std::string requestId_;
    std::string method_;
    std::string endpoint_;
    std::string clientIp_;
    std::string jobId_;
    std::vector<Stage> stages_;
    std::chrono::steady_clock::time_point startTime_;
};

/**
 * @brief Records the duration of a scope as a stage of the request
 */
class StageTimer {
public:
    StageTimer(RequestContext& ctx, std::string stage)
        : ctx_(ctx)
        , stage_(std::move(stage))
        , startTime_(std::chrono::steady_clock::now()) {}

    ~StageTimer() {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime_).count();
        ctx_.recordStage(std::move(stage_), ms);
    }

    StageTimer(const StageTimer&) = delete;
    StageTimer& operator=(const StageTimer&) = delete;

private:
    RequestContext& ctx_;
    std::string stage_;
    std::chrono::steady_clock::time_point startTime_;
};

class RequestLog {
public:
    static void started(const RequestContext& ctx) {
        spdlog::info("[{}] {} {} from {}",
                     ctx.requestId(), ctx.method(), ctx.endpoint(), ctx.clientIp());
    }

    /**
     * @brief Log why a request failed
     *
     * Codes answered with 5xx are server faults and log at error level with
     * their details; client mistakes log at warn level.
     */
    static void failed(const RequestContext& ctx, ErrorCode code,
                       const std::string& message, const std::string& details = "") {
        std::string text = errorCodeToString(code) + ": " + message;
        if (errorCodeToHttpStatus(code) >= 500) {
            if (!details.empty()) {
                text += " - " + details;
            }
            spdlog::error("[{}] {}", ctx.requestId(), text);
        } else {
            spdlog::warn("[{}] {}", ctx.requestId(), text);
        }
    }

    /// One compact JSON line per domain event
    static void event(const RequestContext& ctx, const std::string& name, const Json::Value& data) {
        Json::Value line;
        line["requestId"] = ctx.requestId();
        line["event"] = name;
        if (!ctx.jobId().empty()) {
            line["jobId"] = ctx.jobId();
        }
        line["data"] = data;

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        spdlog::info("{}", Json::writeString(builder, line));
    }

    static void finished(const RequestContext& ctx, int statusCode) {
        std::string outcome = summary(ctx);
        spdlog::info("[{}] {} {} -> {}{}{} ({}ms)",
                     ctx.requestId(), ctx.method(), ctx.endpoint(), statusCode,
                     outcome.empty() ? "" : " ", outcome, ctx.elapsedMs());
    }

    /**
     * @brief "job=<id> <stage>=<n>ms ..." (empty when nothing was recorded)
     */
    static std::string summary(const RequestContext& ctx) {
        std::string out;
        if (!ctx.jobId().empty()) {
            out = "job=" + ctx.jobId();
        }
        for (const auto& stage : ctx.stages()) {
            if (!out.empty()) out += ' ';
            out += stage.first + "=" + std::to_string(stage.second) + "ms";
        }
        return out;
    }
};

/**
 * @brief Request id: "REQ-<epoch ms>-<sequence>", unique within the process
 */
inline std::string generateRequestId() {
    static std::atomic<unsigned long> sequence{0};
    auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "REQ-" + std::to_string(timestamp) + "-" + std::to_string(++sequence);
}

} // namespace holomodel::common
