#include "bar_validator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cmath>

namespace data {

    BarSequenceChecker::BarSequenceChecker(std::string symbol) : symbol_(std::move(symbol)) {}

    void BarSequenceChecker::check(const core::Bar& bar) {
        if (bar.symbol != symbol_) {
            throw core::DataIntegrityException(fmt::format("Bar for '{}' found in the series of '{}' at {}.",
                bar.symbol, symbol_, core::utils::timestampToString(bar.timestamp)));
        }
        if (last_timestamp_) {
            if (bar.timestamp == *last_timestamp_) {
                throw core::DataIntegrityException(fmt::format("Duplicate bar for {} at {}.",
                    symbol_, core::utils::timestampToString(bar.timestamp)));
            }
            if (bar.timestamp < *last_timestamp_) {
                throw core::DataIntegrityException(fmt::format("Out-of-order bar for {}: {} after {}.", symbol_,
                    core::utils::timestampToString(bar.timestamp), core::utils::timestampToString(*last_timestamp_)));
            }
        }
        if (!std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low) || !std::isfinite(bar.close)) {
            throw core::DataIntegrityException(fmt::format("Non-finite price in bar for {} at {}.",
                symbol_, core::utils::timestampToString(bar.timestamp)));
        }
        if (bar.high < bar.low) {
            throw core::DataIntegrityException(fmt::format("Bar for {} at {} has high {} below low {}.",
                symbol_, core::utils::timestampToString(bar.timestamp), bar.high, bar.low));
        }
        if (bar.volume < 0) {
            throw core::DataIntegrityException(fmt::format("Negative volume in bar for {} at {}.",
                symbol_, core::utils::timestampToString(bar.timestamp)));
        }
        last_timestamp_ = bar.timestamp;
        ++count_;
    }

    void BarSequenceChecker::reset() {
        last_timestamp_.reset();
        count_ = 0;
    }

    void validateBarSeries(const std::string& symbol, const core::TimeSeries<core::Bar>& bars) {
        BarSequenceChecker checker(symbol);
        for (const auto& bar : bars) {
            checker.check(bar);
        }
        core::logging::getLogger()->trace("Validated {} bars for {}", bars.size(), symbol);
    }

} // namespace data
