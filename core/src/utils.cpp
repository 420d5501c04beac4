#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>
#include <cmath>      // For std::pow
#include <cctype>     // For std::isdigit
#include <ctime>

namespace core {
namespace utils {

    namespace {
        std::time_t toUtcEpoch(std::tm& tm, const std::string& source) {
            // timegm interprets struct tm as UTC. Use _mkgmtime on Windows.
            #ifdef _WIN32
                std::time_t tt = _mkgmtime(&tm);
            #else
                std::time_t tt = timegm(&tm);
            #endif
            if (tt == static_cast<std::time_t>(-1)) {
                 throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + source);
            }
            return tt;
        }
    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        } else {
             throw std::runtime_error("Timestamp missing or invalid timezone offset/indicator: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(toUtcEpoch(tm, iso_string));
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // Local time minus its offset gives UTC
        return base_tp_utc - offset_duration;
    }

    Timestamp dateToTimestamp(const std::string& date) {
        std::tm tm = {};
        std::istringstream ss(date);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse date (expected YYYY-MM-DD): " + date);
        }
        return std::chrono::system_clock::from_time_t(toUtcEpoch(tm, date));
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    long long toEpochSeconds(const Timestamp& ts) {
        return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    }

    Timestamp fromEpochSeconds(long long seconds) {
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::seconds(seconds)));
    }

    Timestamp addDays(const Timestamp& ts, int days) {
        return ts + std::chrono::hours(24 * days);
    }

    std::string directionToString(Direction direction) {
        switch (direction) {
            case Direction::Flat:  return "flat";
            case Direction::Long:  return "long";
            case Direction::Short: return "short";
        }
        return "unknown";
    }

    std::string actionToString(SignalAction action) {
        switch (action) {
            case SignalAction::None:       return "None";
            case SignalAction::EnterLong:  return "EnterLong";
            case SignalAction::ExitLong:   return "ExitLong";
            case SignalAction::EnterShort: return "EnterShort";
            case SignalAction::ExitShort:  return "ExitShort";
        }
        return "UnknownAction";
    }

    std::string exitReasonToString(ExitReason reason) {
        switch (reason) {
            case ExitReason::StopLoss:       return "stop_loss";
            case ExitReason::TrailingStop:   return "trailing_stop";
            case ExitReason::TakeProfit:     return "take_profit";
            case ExitReason::MaxHoldingDays: return "max_holding_days";
            case ExitReason::OpposingSignal: return "opposing_signal";
            case ExitReason::EndOfData:      return "end_of_data";
        }
        return "unknown";
    }

} // namespace utils
} // namespace core
