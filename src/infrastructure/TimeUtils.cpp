/**
 * @file TimeUtils.cpp
 * @brief Implementation of TimeUtils.
 */

#include "infrastructure/TimeUtils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace medoracle::infrastructure {

namespace {

std::tm ToUtc(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

std::string TimeUtils::NowIso8601() {
    return ToIso8601(std::chrono::system_clock::now());
}

std::string TimeUtils::ToIso8601(std::chrono::system_clock::time_point tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;
    if (micros < 0) micros += 1000000;
    std::tm tm = ToUtc(std::chrono::system_clock::to_time_t(tp));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return ss.str();
}

} // namespace medoracle::infrastructure
