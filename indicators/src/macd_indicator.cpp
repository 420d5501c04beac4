#include "macd_indicator.hpp"
#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <stdexcept>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_period_(fast_period), slow_period_(slow_period), signal_period_(signal_period), lookback_(0)
{
    if (fast_period_ < 2 || slow_period_ < 2 || signal_period_ < 2) {
        throw std::invalid_argument("MACD periods must be at least 2.");
    }
    if (fast_period_ >= slow_period_) {
        throw std::invalid_argument("MACD fast period must be shorter than the slow period.");
    }

    // slow EMA defined at index slow-1, signal EMA needs signal_period MACD values on top
    lookback_ = (slow_period_ - 1) + (signal_period_ - 1);
    name_ = fmt::format("MACD({},{},{})", fast_period_, slow_period_, signal_period_);
    core::logging::getLogger()->debug("MacdIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& MacdIndicator::getResult() const {
    return macd_;
}

void MacdIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    macd_.clear();
    signal_.clear();
    histogram_.clear();

    if (input.size() < static_cast<size_t>(getRequiredBars())) {
        throw core::InsufficientDataException(fmt::format("{} needs {} bars, got {}.", name_, getRequiredBars(), input.size()));
    }

    std::vector<double> closes = extractSeries(input, PriceSource::Close);
    std::vector<double> fast = computeEma(closes, fast_period_);
    std::vector<double> slow = computeEma(closes, slow_period_);

    // fast[k] belongs to bar k+fast-1, slow[k] to bar k+slow-1
    const size_t offset = static_cast<size_t>(slow_period_ - fast_period_);
    std::vector<double> macd_line;
    macd_line.reserve(slow.size());
    for (size_t k = 0; k < slow.size(); ++k) {
        macd_line.push_back(fast[k + offset] - slow[k]);
    }

    signal_ = computeEma(macd_line, signal_period_);

    // Trim the MACD line so all outputs start at the same bar
    const size_t trim = static_cast<size_t>(signal_period_ - 1);
    macd_.assign(macd_line.begin() + static_cast<std::ptrdiff_t>(trim), macd_line.end());

    histogram_.reserve(signal_.size());
    for (size_t k = 0; k < signal_.size(); ++k) {
        histogram_.push_back(macd_[k] - signal_[k]);
    }

    logger->trace("Successfully calculated {} results for {}", macd_.size(), name_);
}

} // namespace indicators
