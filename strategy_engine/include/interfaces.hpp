#pragma once

#include <vector>
#include <string>

#include "datatypes.hpp"        // Provides Signal, Direction
#include "common_types.hpp"
#include "indicator_engine.hpp" // Provides IndicatorSnapshot

namespace strategy_engine {

    // --- Strategy Interface ---
    // Votes a direction for one bar from the indicator history of one symbol.
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        // Get the unique name of the strategy ("trend", "reversal")
        virtual std::string getName() const = 0;

        virtual StrategyKind getKind() const = 0;

        // Evaluate the bar at `index`; only snapshots[0..index] may be read.
        // Throws core::InsufficientDataException while a required value is absent.
        virtual core::Signal evaluate(const std::string& symbol,
                                      const std::vector<indicators::IndicatorSnapshot>& snapshots,
                                      size_t index) const = 0;
    };

} // namespace strategy_engine
