/**
 * @file job_id.cpp
 * @brief JobId implementation
 */

#include "job_id.h"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace holomodel::domain::models {

JobId JobId::generate() {
    // Shared engine; HTTP I/O threads generate ids concurrently
    static std::mutex genMutex;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    uint64_t ab;
    uint64_t cd;
    {
        std::lock_guard<std::mutex> lock(genMutex);
        ab = dis(gen);
        cd = dis(gen);
    }

    // Set version (4) and variant (RFC 4122)
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << ((ab >> 32) & 0xFFFFFFFF) << '-';
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << '-';
    ss << std::setw(4) << (ab & 0xFFFF) << '-';
    ss << std::setw(4) << ((cd >> 48) & 0xFFFF) << '-';
    ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);

    return JobId(ss.str());
}

bool JobId::isValidFormat(const std::string& value) {
    if (value.length() != 36) {
        return false;
    }

    for (size_t i = 0; i < value.length(); ++i) {
        char c = value[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') {
                return false;
            }
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }

    // Version nibble and RFC 4122 variant
    if (value[14] != '4') {
        return false;
    }
    char variant = value[19];
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

} // namespace holomodel::domain::models
