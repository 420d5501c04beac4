#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// SMA(period) +/- std_dev_multiplier * rolling population standard deviation
class BollingerBandsIndicator : public IIndicator {
public:
    BollingerBandsIndicator(int period, double std_dev_multiplier);

    virtual ~BollingerBandsIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;

    // Middle band
    const core::TimeSeries<double>& getResult() const override;
    const core::TimeSeries<double>& getUpperBand() const { return upper_; }
    const core::TimeSeries<double>& getLowerBand() const { return lower_; }

private:
    const int period_;
    const double std_dev_multiplier_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> upper_;
    core::TimeSeries<double> middle_;
    core::TimeSeries<double> lower_;
};

} // namespace indicators
