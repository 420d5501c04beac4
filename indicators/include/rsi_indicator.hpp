#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Wilder RSI; undefined until period+1 closes are available
class RsiIndicator : public IIndicator {
public:
    explicit RsiIndicator(int period);

    virtual ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
