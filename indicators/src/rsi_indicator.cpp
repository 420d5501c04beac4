#include "rsi_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <stdexcept>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ < 2) {
         throw std::invalid_argument("RSI period must be at least 2.");
    }

    // Wilder smoothing needs `period` price changes, i.e. period+1 closes
    lookback_ = TA_RSI_Lookback(period_);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_RSI_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->debug("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() < static_cast<size_t>(getRequiredBars())) {
        throw core::InsufficientDataException(fmt::format("{} needs {} bars, got {}.", name_, getRequiredBars(), input.size()));
    }

    const int period = period_;
    results_ = runTaLib(name_, extractSeries(input, PriceSource::Close), lookback_,
        [period](int end_idx, const double* in, int* out_begin, int* out_count, double* out) {
            return static_cast<int>(TA_RSI(0, end_idx, in, period, out_begin, out_count, out));
        });

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
