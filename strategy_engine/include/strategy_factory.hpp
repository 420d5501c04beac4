#pragma once

#include <string>
#include <vector>
#include <memory> // For std::unique_ptr

#include "interfaces.hpp"
#include "config.hpp"

namespace strategy_engine {

    class StrategyFactory {
    public:
        // Build one strategy by its config name ("trend" or "reversal").
        // Unknown names throw core::ConfigException.
        static std::unique_ptr<IStrategy> createStrategy(const std::string& name, const core::TradingConfig& config);

        // Strategies for `active_strategies`, in configured order
        static std::vector<std::unique_ptr<IStrategy>> createStrategies(const core::TradingConfig& config);

        static StrategyKind parseStrategyKind(const std::string& name);
        static CombineMode parseCombineMode(const std::string& mode);
    };

} // namespace strategy_engine
