/**
 * @file TimeUtils.hpp
 * @brief Timestamp formatting shared by packages, records and commitments.
 */

#pragma once
#include <chrono>
#include <string>

namespace medoracle::infrastructure {

class TimeUtils {
public:
    /** @brief Current UTC time as "YYYY-MM-DDTHH:MM:SS.ffffffZ". */
    static std::string NowIso8601();

    static std::string ToIso8601(std::chrono::system_clock::time_point tp);
};

} // namespace medoracle::infrastructure
