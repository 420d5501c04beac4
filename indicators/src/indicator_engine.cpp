#include "indicator_engine.hpp"
#include "ema_indicator.hpp"
#include "sma_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "bollinger_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

namespace indicators {

namespace {

    // Result k of an indicator belongs to bar k + lookback
    void scatter(const core::TimeSeries<double>& values, int lookback,
                 std::vector<IndicatorSnapshot>& snapshots,
                 std::optional<double> IndicatorSnapshot::*field) {
        for (size_t k = 0; k < values.size(); ++k) {
            snapshots[k + static_cast<size_t>(lookback)].*field = values[k];
        }
    }

    bool hasEnough(const IIndicator& indicator, size_t bar_count) {
        return bar_count >= static_cast<size_t>(indicator.getRequiredBars());
    }

} // end anonymous namespace

double IndicatorSnapshot::require(const std::optional<double>& value, const char* field_name) {
    if (!value.has_value()) {
        throw core::InsufficientDataException(fmt::format("Indicator value '{}' is not available yet.", field_name));
    }
    return *value;
}

IndicatorEngine::IndicatorEngine(const core::TrendParams& trend, const core::ReversalParams& reversal)
    : trend_(trend), reversal_(reversal) {}

std::vector<IndicatorSnapshot> IndicatorEngine::compute(const core::TimeSeries<core::Bar>& bars) const {
    auto logger = core::logging::getLogger();
    std::vector<IndicatorSnapshot> snapshots(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        snapshots[i].timestamp = bars[i].timestamp;
        snapshots[i].close = bars[i].close;
        snapshots[i].volume = bars[i].volume;
    }
    if (bars.empty()) {
        return snapshots;
    }

    EmaIndicator ema_short(trend_.ema_short);
    EmaIndicator ema_long(trend_.ema_long);
    MacdIndicator macd(trend_.macd_fast, trend_.macd_slow, trend_.macd_signal);
    SmaIndicator volume_ma(trend_.volume_ma_period, PriceSource::Volume);
    RsiIndicator rsi(reversal_.rsi_period);
    BollingerBandsIndicator bands(reversal_.bollinger_period, reversal_.bollinger_std);

    if (hasEnough(ema_short, bars.size())) {
        ema_short.calculate(bars);
        scatter(ema_short.getResult(), ema_short.getLookback(), snapshots, &IndicatorSnapshot::ema_short);
    }
    if (hasEnough(ema_long, bars.size())) {
        ema_long.calculate(bars);
        scatter(ema_long.getResult(), ema_long.getLookback(), snapshots, &IndicatorSnapshot::ema_long);
    }
    if (hasEnough(macd, bars.size())) {
        macd.calculate(bars);
        scatter(macd.getResult(), macd.getLookback(), snapshots, &IndicatorSnapshot::macd);
        scatter(macd.getSignalLine(), macd.getLookback(), snapshots, &IndicatorSnapshot::macd_signal);
        scatter(macd.getHistogram(), macd.getLookback(), snapshots, &IndicatorSnapshot::macd_histogram);
    }
    if (hasEnough(volume_ma, bars.size())) {
        volume_ma.calculate(bars);
        scatter(volume_ma.getResult(), volume_ma.getLookback(), snapshots, &IndicatorSnapshot::volume_ma);
    }
    if (hasEnough(rsi, bars.size())) {
        rsi.calculate(bars);
        scatter(rsi.getResult(), rsi.getLookback(), snapshots, &IndicatorSnapshot::rsi);
    }
    if (hasEnough(bands, bars.size())) {
        bands.calculate(bars);
        scatter(bands.getUpperBand(), bands.getLookback(), snapshots, &IndicatorSnapshot::bb_upper);
        scatter(bands.getResult(), bands.getLookback(), snapshots, &IndicatorSnapshot::bb_middle);
        scatter(bands.getLowerBand(), bands.getLookback(), snapshots, &IndicatorSnapshot::bb_lower);
    }

    logger->trace("Computed indicator snapshots for {} bars of {}", bars.size(), bars.front().symbol);
    return snapshots;
}

} // namespace indicators
