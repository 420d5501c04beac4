#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// EMA over an arbitrary series (k = 2/(period+1), seeded with the SMA of the
// first `period` values). Output element k belongs to input element k+period-1.
std::vector<double> computeEma(const std::vector<double>& values, int period);

class EmaIndicator : public IIndicator {
public:
    explicit EmaIndicator(int period);

    virtual ~EmaIndicator() override = default;

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
