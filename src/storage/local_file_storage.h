#pragma once

/**
 * @file local_file_storage.h
 * @brief Local filesystem adapter for uploaded files
 */

#include "i_file_storage.h"

#include <filesystem>

namespace holomodel::storage {

/**
 * @brief Flat directory on the local filesystem
 *
 * Files are written directly under the base directory. There is no locking,
 * quota, or cleanup; concurrent writes to distinct names are independent.
 */
class LocalFileStorage : public IFileStorage {
public:
    /**
     * @brief Construct and create the base directory if missing
     * @throws common::StorageInitException if the directory cannot be created
     */
    explicit LocalFileStorage(const std::string& baseDir);

    std::string store(const std::string& fileName, const std::vector<uint8_t>& content) override;
    bool isAvailable() const override;

    std::string baseDir() const override {
        return basePath_.string();
    }

private:
    std::filesystem::path basePath_;

    static void ensureDirectoryExists(const std::filesystem::path& path);
};

} // namespace holomodel::storage
