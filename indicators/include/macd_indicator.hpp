#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// MACD = EMA(fast) - EMA(slow); signal = EMA(MACD, signal_period);
// histogram = MACD - signal. All three lines share one alignment: the first
// output belongs to the bar where the signal line becomes defined.
class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_period, int slow_period, int signal_period);

    virtual ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;

    // MACD line
    const core::TimeSeries<double>& getResult() const override;
    const core::TimeSeries<double>& getSignalLine() const { return signal_; }
    const core::TimeSeries<double>& getHistogram() const { return histogram_; }

private:
    const int fast_period_;
    const int slow_period_;
    const int signal_period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> macd_;
    core::TimeSeries<double> signal_;
    core::TimeSeries<double> histogram_;
};

} // namespace indicators
