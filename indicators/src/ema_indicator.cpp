#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <stdexcept>

namespace indicators {

std::vector<double> computeEma(const std::vector<double>& values, int period) {
    if (period < 2) {
        throw std::invalid_argument("EMA period must be at least 2.");
    }
    return runTaLib(fmt::format("EMA({})", period), values, TA_EMA_Lookback(period),
        [period](int end_idx, const double* in, int* out_begin, int* out_count, double* out) {
            return static_cast<int>(TA_EMA(0, end_idx, in, period, out_begin, out_count, out));
        });
}

EmaIndicator::EmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ < 2) {
         throw std::invalid_argument("EMA period must be at least 2.");
    }
    lookback_ = TA_EMA_Lookback(period_);
    name_ = fmt::format("EMA({})", period_);
    core::logging::getLogger()->debug("EmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& EmaIndicator::getResult() const {
    return results_;
}

void EmaIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    core::logging::getLogger()->trace("Calculating {}...", name_);
    results_.clear();
    results_ = computeEma(extractSeries(input, PriceSource::Close), period_);
}

} // namespace indicators
