#pragma once

/**
 * @file i_file_storage.h
 * @brief Port interface for uploaded file storage
 */

#include <cstdint>
#include <string>
#include <vector>

namespace holomodel::storage {

/**
 * @brief Port interface for file storage
 */
class IFileStorage {
public:
    virtual ~IFileStorage() = default;

    /**
     * @brief Store file content, replacing any file of the same name
     * @param fileName File name relative to the storage root
     * @param content File content
     * @return Storage path
     * @throws common::StorageWriteException on failure
     */
    virtual std::string store(const std::string& fileName, const std::vector<uint8_t>& content) = 0;

    /**
     * @brief Check that the storage root is still usable
     */
    virtual bool isAvailable() const = 0;

    virtual std::string baseDir() const = 0;
};

} // namespace holomodel::storage
