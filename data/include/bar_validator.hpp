#pragma once

#include "datatypes.hpp"
#include <optional>
#include <string>

namespace data {

    // Incremental integrity check for one symbol's bar sequence. Throws
    // core::DataIntegrityException on a bar for another symbol, a timestamp that
    // does not strictly increase, or an inconsistent OHLC range.
    class BarSequenceChecker {
    public:
        explicit BarSequenceChecker(std::string symbol);

        void check(const core::Bar& bar);
        void reset();

        size_t count() const { return count_; }

    private:
        std::string symbol_;
        std::optional<core::Timestamp> last_timestamp_;
        size_t count_ = 0;
    };

    // Whole-series form of BarSequenceChecker
    void validateBarSeries(const std::string& symbol, const core::TimeSeries<core::Bar>& bars);

} // namespace data
