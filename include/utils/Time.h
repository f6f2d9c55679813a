#pragma once

#include <chrono>
#include <string>

namespace VoiceGuard {
namespace Utils {

/**
 * @brief Local time as ISO-8601 with microseconds, e.g. 2026-10-19T18:56:02.123456
 */
std::string isoTimestamp(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

} // namespace Utils
} // namespace VoiceGuard
