#pragma once

#include "datatypes.hpp" // Needs Bar, TimeSeries
#include <functional>
#include <string>
#include <vector>

namespace indicators {

// Which bar field an indicator consumes
enum class PriceSource {
    Close,
    Volume
};

// Copies the requested field of every bar into a contiguous array for TA-Lib
std::vector<double> extractSeries(const core::TimeSeries<core::Bar>& input, PriceSource source);

// One TA-Lib call over input [0, end_idx]: (end_idx, input, out_begin_idx, out_nb_element, output) -> TA_RetCode
using TaLibCall = std::function<int(int, const double*, int*, int*, double*)>;

// Runs a single-output TA-Lib function and returns its valid outputs. Throws
// core::IndicatorCalculationException on a TA-Lib error or when the first output
// is not at `lookback`.
std::vector<double> runTaLib(const std::string& name, const std::vector<double>& values, int lookback, const TaLibCall& call);

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "EMA(5)", "RSI(14)")
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first valid output.
    // Result index k corresponds to input index k + getLookback().
    virtual int getLookback() const = 0;

    // Smallest input size that yields one output value (getLookback() + 1)
    int getRequiredBars() const { return getLookback() + 1; }

    // Calculate the indicator over the input bars and store the result internally.
    // Throws core::InsufficientDataException when input.size() < getRequiredBars().
    virtual void calculate(const core::TimeSeries<core::Bar>& input) = 0;

    // Primary output line, aligned as described for getLookback()
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

} // namespace indicators
