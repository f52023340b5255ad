#pragma once

/**
 * @file job_id.h
 * @brief Job identifier issued for every upload (UUID v4)
 */

#include <string>
#include <utility>

namespace holomodel::domain::models {

/**
 * @brief Job identifier value type
 *
 * Identifiers are generated server-side and are never looked up again, so
 * there is no factory from arbitrary client input.
 */
class JobId {
public:
    /**
     * @brief Generate a new random UUID v4 identifier
     */
    static JobId generate();

    /**
     * @brief Check the canonical 8-4-4-4-12 lowercase hex layout of a v4 UUID
     */
    static bool isValidFormat(const std::string& value);

    [[nodiscard]] const std::string& toString() const {
        return value_;
    }

    /**
     * @brief File name under which the upload for this job is stored
     *
     * Always ".jpg", whatever the uploaded content actually is.
     */
    [[nodiscard]] std::string storageFileName() const {
        return value_ + ".jpg";
    }

    bool operator==(const JobId& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const JobId& other) const {
        return !(*this == other);
    }

private:
    explicit JobId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

} // namespace holomodel::domain::models
