/**
 * @file local_file_storage.cpp
 * @brief LocalFileStorage implementation
 */

#include "local_file_storage.h"
#include "../common/exceptions.h"

#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace holomodel::storage {

LocalFileStorage::LocalFileStorage(const std::string& baseDir)
    : basePath_(baseDir) {
    ensureDirectoryExists(basePath_);
    spdlog::info("[LocalFileStorage] Initialized (baseDir: {})", basePath_.string());
}

void LocalFileStorage::ensureDirectoryExists(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return;
    }

    fs::create_directories(path, ec);
    if (ec) {
        throw common::StorageInitException(path.string(), ec.message());
    }
    if (!fs::is_directory(path, ec)) {
        throw common::StorageInitException(path.string(), "path exists and is not a directory");
    }
}

std::string LocalFileStorage::store(const std::string& fileName, const std::vector<uint8_t>& content) {
    fs::path filePath = basePath_ / fileName;
    std::string pathStr = filePath.string();

    std::ofstream file(pathStr, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw common::StorageWriteException(pathStr, std::strerror(errno));
    }

    file.write(reinterpret_cast<const char*>(content.data()),
               static_cast<std::streamsize>(content.size()));
    file.close();

    if (!file) {
        throw common::StorageWriteException(pathStr, "write failed");
    }

    spdlog::debug("[LocalFileStorage] Stored {} bytes at {}", content.size(), pathStr);
    return pathStr;
}

bool LocalFileStorage::isAvailable() const {
    std::error_code ec;
    return fs::is_directory(basePath_, ec);
}

} // namespace holomodel::storage
