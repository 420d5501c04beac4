#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Convert Timestamp to ISO 8601 UTC string (YYYY-MM-DDTHH:MM:SSZ)
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 string with 'Z' or +HH:MM/-HH:MM offset to Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Parse YYYY-MM-DD as midnight UTC
    Timestamp dateToTimestamp(const std::string& date);

    long long toEpochSeconds(const Timestamp& ts);
    Timestamp fromEpochSeconds(long long seconds);

    Timestamp addDays(const Timestamp& ts, int days);

    std::string directionToString(Direction direction);
    std::string actionToString(SignalAction action);
    std::string exitReasonToString(ExitReason reason);

} // namespace utils
} // namespace core
