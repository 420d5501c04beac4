#pragma once
#include "datatypes.hpp"

namespace strategy_engine {

    // Closed set of strategy variants, evaluated in configured order
    enum class StrategyKind {
        Trend,
        Reversal
    };

    // How per-strategy votes are fused into one effective signal
    enum class CombineMode {
        Any,  // First non-flat vote wins; opposing votes cancel to flat
        All   // Every strategy must agree on a non-flat direction
    };

    enum class CrossType {
        None,
        CrossesAbove,
        CrossesBelow
    };

} // namespace strategy_engine
