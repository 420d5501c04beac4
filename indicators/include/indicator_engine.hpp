#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include <optional>
#include <vector>

namespace indicators {

// Indicator values for one bar. A field is empty while its window has not filled.
struct IndicatorSnapshot {
    core::Timestamp timestamp;
    double close = 0.0;
    long long volume = 0;

    std::optional<double> ema_short;
    std::optional<double> ema_long;
    std::optional<double> macd;
    std::optional<double> macd_signal;
    std::optional<double> macd_histogram;
    std::optional<double> rsi;
    std::optional<double> bb_upper;
    std::optional<double> bb_middle;
    std::optional<double> bb_lower;
    std::optional<double> volume_ma;

    // Throws core::InsufficientDataException when the value is absent
    static double require(const std::optional<double>& value, const char* field_name);
};

// Computes every configured indicator over a bar series in one pass. Snapshot i
// depends only on bars 0..i.
class IndicatorEngine {
public:
    IndicatorEngine(const core::TrendParams& trend, const core::ReversalParams& reversal);

    // One snapshot per input bar, same order
    std::vector<IndicatorSnapshot> compute(const core::TimeSeries<core::Bar>& bars) const;

private:
    core::TrendParams trend_;
    core::ReversalParams reversal_;
};

} // namespace indicators
