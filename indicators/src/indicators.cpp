#include "indicators.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"

namespace indicators {

std::vector<double> extractSeries(const core::TimeSeries<core::Bar>& input, PriceSource source) {
    std::vector<double> values;
    values.reserve(input.size());
    for (const auto& bar : input) {
        values.push_back(source == PriceSource::Close ? bar.close : static_cast<double>(bar.volume));
    }
    return values;
}

std::vector<double> runTaLib(const std::string& name, const std::vector<double>& values, int lookback, const TaLibCall& call) {
    if (values.size() <= static_cast<size_t>(lookback)) {
        throw core::InsufficientDataException(fmt::format("{} needs {} values, got {}.", name, lookback + 1, values.size()));
    }

    // TA-Lib output size = input size - lookback
    std::vector<double> out(values.size() - static_cast<size_t>(lookback));
    int out_begin_idx = 0;  // Index of the first valid output element relative to input
    int out_nb_element = 0; // Number of elements calculated

    const int ret_code = call(static_cast<int>(values.size()) - 1, values.data(), &out_begin_idx, &out_nb_element, out.data());
    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(fmt::format("TA-Lib failed for {} with code {}", name, ret_code));
    }
    if (out_begin_idx != lookback) {
        throw core::IndicatorCalculationException(
            fmt::format("TA-Lib out_begin_idx ({}) does not match lookback ({}) for {}.", out_begin_idx, lookback, name));
    }
    out.resize(out_nb_element);
    return out;
}

} // namespace indicators
