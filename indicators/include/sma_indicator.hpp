#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>

namespace indicators {

// Simple moving average of closes, or of volume for the volume moving average
class SmaIndicator : public IIndicator {
public:
    explicit SmaIndicator(int period, PriceSource source = PriceSource::Close);

    virtual ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    PriceSource source_;
    int lookback_;              // Calculated TA-Lib lookback
    std::string name_;          // Indicator name (e.g., "SMA(20)", "VOLUME_SMA(20)")
    core::TimeSeries<double> results_;
};

} // namespace indicators
