#pragma once

/**
 * @file version.h
 * @brief Service identity reported by health, info and the start-up banner
 */

namespace holomodel::common {

inline constexpr const char* kServiceName = "holomodel-service";
inline constexpr const char* kServiceVersion = "1.0.0";

} // namespace holomodel::common
