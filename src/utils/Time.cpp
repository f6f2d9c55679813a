#include "utils/Time.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace VoiceGuard {
namespace Utils {

std::string isoTimestamp(std::chrono::system_clock::time_point when) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        when.time_since_epoch()).count() % 1000000;
    if (micros < 0) {
        micros += 1000000;
    }

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

} // namespace Utils
} // namespace VoiceGuard
