#include "strategy_factory.hpp"
#include "trend_strategy.hpp"
#include "reversal_strategy.hpp"
#include "logging.hpp"
#include "exceptions.hpp"

#include <algorithm>
#include <cctype>

namespace strategy_engine {

    namespace { // file-local helpers

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

    } // end anonymous namespace

    StrategyKind StrategyFactory::parseStrategyKind(const std::string& name) {
        const std::string lower = toLower(name);
        if (lower == "trend") return StrategyKind::Trend;
        if (lower == "reversal") return StrategyKind::Reversal;
        throw core::ConfigException(fmt::format("Unknown strategy '{}'. Expected 'trend' or 'reversal'.", name));
    }

    CombineMode StrategyFactory::parseCombineMode(const std::string& mode) {
        const std::string lower = toLower(mode);
        if (lower == "any") return CombineMode::Any;
        if (lower == "all") return CombineMode::All;
        throw core::ConfigException(fmt::format("Unknown strategy_mode '{}'. Expected 'any' or 'all'.", mode));
    }

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const std::string& name, const core::TradingConfig& config) {
        switch (parseStrategyKind(name)) {
            case StrategyKind::Trend:
                return std::make_unique<TrendStrategy>(config.trend);
            case StrategyKind::Reversal:
                return std::make_unique<ReversalStrategy>(config.reversal);
        }
        throw core::ConfigException(fmt::format("Unhandled strategy kind for '{}'.", name));
    }

    std::vector<std::unique_ptr<IStrategy>> StrategyFactory::createStrategies(const core::TradingConfig& config) {
        auto logger = core::logging::getLogger();
        std::vector<std::unique_ptr<IStrategy>> strategies;
        strategies.reserve(config.active_strategies.size());

        for (const auto& name : config.active_strategies) {
            auto strategy = createStrategy(name, config);
            const bool duplicate = std::any_of(strategies.begin(), strategies.end(),
                [&](const std::unique_ptr<IStrategy>& s) { return s->getKind() == strategy->getKind(); });
            if (duplicate) {
                throw core::ConfigException(fmt::format("Strategy '{}' is listed more than once.", name));
            }
            strategies.push_back(std::move(strategy));
        }
        if (strategies.empty()) {
            throw core::ConfigException("No active strategies configured.");
        }

        logger->info("Created {} strategies: {}", strategies.size(), fmt::join(config.active_strategies, ", "));
        return strategies;
    }

} // namespace strategy_engine
