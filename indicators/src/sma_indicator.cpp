#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // Include TA-Lib C API header
#include <stdexcept>

namespace indicators {

SmaIndicator::SmaIndicator(int period, PriceSource source)
    : period_(period), source_(source), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument("SMA period must be positive.");
    }

    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = (source_ == PriceSource::Volume) ? fmt::format("VOLUME_SMA({})", period_)
                                             : fmt::format("SMA({})", period_);
    core::logging::getLogger()->debug("SmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& SmaIndicator::getResult() const {
    return results_;
}

void SmaIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() < static_cast<size_t>(getRequiredBars())) {
        throw core::InsufficientDataException(fmt::format("{} needs {} bars, got {}.", name_, getRequiredBars(), input.size()));
    }

    const int period = period_;
    results_ = runTaLib(name_, extractSeries(input, source_), lookback_,
        [period](int end_idx, const double* in, int* out_begin, int* out_count, double* out) {
            return static_cast<int>(TA_MA(0, end_idx, in, period, TA_MAType_SMA, out_begin, out_count, out));
        });

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
