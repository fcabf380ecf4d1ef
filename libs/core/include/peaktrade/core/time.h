#pragma once

#include <chrono>
#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>

namespace peaktrade::core {

[[nodiscard]] std::int64_t now_unix_ns();
[[nodiscard]] kj::String now_utc_iso8601();

/**
 * @brief Format a wall-clock instant in local time with a strftime pattern
 *
 * Report headers use "%Y-%m-%d %H:%M:%S", report file names "%Y%m%d_%H%M%S".
 */
[[nodiscard]] kj::String format_local_time(std::chrono::system_clock::time_point tp,
                                           kj::StringPtr pattern);

} // namespace peaktrade::core
