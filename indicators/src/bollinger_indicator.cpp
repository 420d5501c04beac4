#include "bollinger_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <stdexcept>

namespace indicators {

BollingerBandsIndicator::BollingerBandsIndicator(int period, double std_dev_multiplier)
    : period_(period), std_dev_multiplier_(std_dev_multiplier), lookback_(0)
{
    if (period_ < 2) {
        throw std::invalid_argument("Bollinger period must be at least 2.");
    }
    if (std_dev_multiplier_ < 0.0) {
        throw std::invalid_argument("Bollinger standard deviation multiplier must not be negative.");
    }

    lookback_ = TA_BBANDS_Lookback(period_, std_dev_multiplier_, std_dev_multiplier_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA_BBANDS_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("BBANDS({},{})", period_, std_dev_multiplier_);
    core::logging::getLogger()->debug("BollingerBandsIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string BollingerBandsIndicator::getName() const {
    return name_;
}

int BollingerBandsIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& BollingerBandsIndicator::getResult() const {
    return middle_;
}

void BollingerBandsIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    upper_.clear();
    middle_.clear();
    lower_.clear();

    if (input.size() < static_cast<size_t>(getRequiredBars())) {
        throw core::InsufficientDataException(fmt::format("{} needs {} bars, got {}.", name_, getRequiredBars(), input.size()));
    }

    std::vector<double> closes = extractSeries(input, PriceSource::Close);
    const size_t output_size = closes.size() - static_cast<size_t>(lookback_);
    upper_.resize(output_size);
    middle_.resize(output_size);
    lower_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    // TA_BBANDS uses the population standard deviation
    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(closes.size()) - 1,
        closes.data(),
        period_,
        std_dev_multiplier_,   // optInNbDevUp
        std_dev_multiplier_,   // optInNbDevDn
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        upper_.data(),
        middle_.data(),
        lower_.data()
    );

    if (ret_code != TA_SUCCESS) {
        upper_.clear();
        middle_.clear();
        lower_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_BBANDS failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
        logger->warn("TA_BBANDS out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                     out_begin_idx, lookback_, name_);
    }
    upper_.resize(out_nb_element);
    middle_.resize(out_nb_element);
    lower_.resize(out_nb_element);

    logger->trace("Successfully calculated {} results for {}", middle_.size(), name_);
}

} // namespace indicators
