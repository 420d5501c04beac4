#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <fstream>
#include <cstdlib>
#include <algorithm>

namespace core {

    namespace {

        // Copy value at `key` into `target` if present; wrong JSON type is a config error
        template <typename T>
        void readOptional(const json& section, const char* key, T& target, const std::string& section_name) {
            if (!section.contains(key)) {
                return;
            }
            try {
                target = section.at(key).get<T>();
            } catch (const json::exception& e) {
                throw ConfigException(fmt::format("Invalid value for '{}.{}': {}", section_name, key, e.what()));
            }
        }

        const json& sectionOf(const json& root, const char* name) {
            static const json empty = json::object();
            if (!root.contains(name)) {
                return empty;
            }
            const json& section = root.at(name);
            if (!section.is_object()) {
                throw ConfigException(fmt::format("Config section '{}' must be an object.", name));
            }
            return section;
        }

        void requirePositive(int value, const char* name) {
            if (value <= 0) {
                throw ConfigException(fmt::format("'{}' must be positive (got {}).", name, value));
            }
        }

        // Smoothing windows below 2 are degenerate
        void requirePeriod(int value, const char* name) {
            if (value < 2) {
                throw ConfigException(fmt::format("'{}' must be at least 2 (got {}).", name, value));
            }
        }

        void requireNonNegative(double value, const char* name) {
            if (value < 0.0) {
                throw ConfigException(fmt::format("'{}' must not be negative (got {}).", name, value));
            }
        }

    } // end anonymous namespace

    TradingConfig configFromJson(const json& root) {
        if (!root.is_object()) {
            throw ConfigException("Config root must be a JSON object.");
        }
        TradingConfig config;

        const json& trading = sectionOf(root, "trading");
        readOptional(trading, "symbols", config.symbols, "trading");
        readOptional(trading, "timeframe", config.timeframe, "trading");
        readOptional(trading, "update_interval", config.update_interval_seconds, "trading");

        const json& strategies = sectionOf(root, "strategies");
        readOptional(strategies, "active_strategies", config.active_strategies, "strategies");
        readOptional(strategies, "strategy_mode", config.strategy_mode, "strategies");

        const json& trend = sectionOf(strategies, "trend");
        readOptional(trend, "ema_short", config.trend.ema_short, "strategies.trend");
        readOptional(trend, "ema_long", config.trend.ema_long, "strategies.trend");
        readOptional(trend, "macd_fast", config.trend.macd_fast, "strategies.trend");
        readOptional(trend, "macd_slow", config.trend.macd_slow, "strategies.trend");
        readOptional(trend, "macd_signal", config.trend.macd_signal, "strategies.trend");
        readOptional(trend, "volume_ma_period", config.trend.volume_ma_period, "strategies.trend");
        readOptional(trend, "min_volume_factor", config.trend.min_volume_factor, "strategies.trend");

        const json& reversal = sectionOf(strategies, "reversal");
        readOptional(reversal, "rsi_period", config.reversal.rsi_period, "strategies.reversal");
        readOptional(reversal, "rsi_oversold", config.reversal.rsi_oversold, "strategies.reversal");
        readOptional(reversal, "rsi_overbought", config.reversal.rsi_overbought, "strategies.reversal");
        readOptional(reversal, "bollinger_period", config.reversal.bollinger_period, "strategies.reversal");
        readOptional(reversal, "bollinger_std", config.reversal.bollinger_std, "strategies.reversal");

        const json& execution = sectionOf(root, "execution");
        readOptional(execution, "commission_rate", config.commission_rate, "execution");
        readOptional(execution, "max_positions", config.max_positions, "execution");
        readOptional(execution, "max_position_size", config.max_position_size, "execution");
        readOptional(execution, "max_holding_days", config.max_holding_days, "execution");
        readOptional(execution, "order_timeout_ms", config.order_timeout_ms, "execution");

        const json& risk = sectionOf(root, "risk");
        readOptional(risk, "stop_loss_percent", config.stop_loss_percent, "risk");
        readOptional(risk, "trailing_stop_percent", config.trailing_stop_percent, "risk");
        readOptional(risk, "take_profit_percent", config.take_profit_percent, "risk");

        const json& backtest = sectionOf(root, "backtest");
        readOptional(backtest, "initial_capital", config.initial_capital, "backtest");
        readOptional(backtest, "min_data_points", config.min_data_points, "backtest");
        readOptional(backtest, "risk_free_rate", config.risk_free_rate, "backtest");

        const json& mode = sectionOf(root, "mode");
        readOptional(mode, "demo_mode", config.demo_mode, "mode");
        readOptional(mode, "log_level", config.log_level, "mode");
        readOptional(mode, "database", config.database_path, "mode");

        const json& broker = sectionOf(root, "broker");
        readOptional(broker, "base_url", config.broker.base_url, "broker");
        readOptional(broker, "account_id", config.broker.account_id, "broker");
        readOptional(broker, "class_code", config.broker.class_code, "broker");

        const char* token_env = std::getenv("BROKER_TOKEN");
        if (token_env) {
            config.broker.token = token_env;
        }

        validateConfig(config);
        return config;
    }

    TradingConfig loadConfig(const std::string& path) {
        auto logger = logging::getLogger();
        logger->info("Loading configuration from: {}", path);

        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }
        json root;
        try {
            root = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }

        TradingConfig config = configFromJson(root);
        logger->info("Configuration loaded: {} symbol(s), strategies [{}] in '{}' mode",
                     config.symbols.size(), fmt::join(config.active_strategies, ", "), config.strategy_mode);
        return config;
    }

    void validateConfig(const TradingConfig& config) {
        if (config.symbols.empty()) {
            throw ConfigException("At least one symbol must be configured.");
        }
        if (config.active_strategies.empty()) {
            throw ConfigException("At least one active strategy must be configured.");
        }
        if (config.strategy_mode != "any" && config.strategy_mode != "all") {
            throw ConfigException(fmt::format("strategy_mode must be 'any' or 'all' (got '{}').", config.strategy_mode));
        }

        requirePeriod(config.trend.ema_short, "trend.ema_short");
        requirePeriod(config.trend.ema_long, "trend.ema_long");
        requirePeriod(config.trend.macd_fast, "trend.macd_fast");
        requirePeriod(config.trend.macd_slow, "trend.macd_slow");
        requirePeriod(config.trend.macd_signal, "trend.macd_signal");
        requirePositive(config.trend.volume_ma_period, "trend.volume_ma_period");
        if (config.trend.ema_short >= config.trend.ema_long) {
            throw ConfigException("trend.ema_short must be shorter than trend.ema_long.");
        }
        if (config.trend.macd_fast >= config.trend.macd_slow) {
            throw ConfigException("trend.macd_fast must be shorter than trend.macd_slow.");
        }
        requireNonNegative(config.trend.min_volume_factor, "trend.min_volume_factor");

        requirePeriod(config.reversal.rsi_period, "reversal.rsi_period");
        requirePeriod(config.reversal.bollinger_period, "reversal.bollinger_period");
        requireNonNegative(config.reversal.bollinger_std, "reversal.bollinger_std");
        if (config.reversal.rsi_oversold >= config.reversal.rsi_overbought) {
            throw ConfigException("reversal.rsi_oversold must be below reversal.rsi_overbought.");
        }

        requireNonNegative(config.commission_rate, "execution.commission_rate");
        requirePositive(config.max_positions, "execution.max_positions");
        requirePositive(config.max_holding_days, "execution.max_holding_days");
        requirePositive(config.order_timeout_ms, "execution.order_timeout_ms");
        if (config.max_position_size <= 0.0 || config.max_position_size > 1.0) {
            throw ConfigException(fmt::format("execution.max_position_size must be in (0, 1] (got {}).", config.max_position_size));
        }

        requireNonNegative(config.stop_loss_percent, "risk.stop_loss_percent");
        requireNonNegative(config.trailing_stop_percent, "risk.trailing_stop_percent");
        requireNonNegative(config.take_profit_percent, "risk.take_profit_percent");
        if (config.stop_loss_percent >= 100.0) {
            throw ConfigException("risk.stop_loss_percent must be below 100.");
        }

        if (config.initial_capital <= 0.0) {
            throw ConfigException("backtest.initial_capital must be positive.");
        }
        requirePositive(config.min_data_points, "backtest.min_data_points");
        requirePositive(config.update_interval_seconds, "trading.update_interval");
    }

    json configToJson(const TradingConfig& config) {
        return json{
            {"trading", {
                {"symbols", config.symbols},
                {"timeframe", config.timeframe},
                {"update_interval", config.update_interval_seconds}}},
            {"strategies", {
                {"active_strategies", config.active_strategies},
                {"strategy_mode", config.strategy_mode},
                {"trend", {
                    {"ema_short", config.trend.ema_short},
                    {"ema_long", config.trend.ema_long},
                    {"macd_fast", config.trend.macd_fast},
                    {"macd_slow", config.trend.macd_slow},
                    {"macd_signal", config.trend.macd_signal},
                    {"volume_ma_period", config.trend.volume_ma_period},
                    {"min_volume_factor", config.trend.min_volume_factor}}},
                {"reversal", {
                    {"rsi_period", config.reversal.rsi_period},
                    {"rsi_oversold", config.reversal.rsi_oversold},
                    {"rsi_overbought", config.reversal.rsi_overbought},
                    {"bollinger_period", config.reversal.bollinger_period},
                    {"bollinger_std", config.reversal.bollinger_std}}}}},
            {"execution", {
                {"commission_rate", config.commission_rate},
                {"max_positions", config.max_positions},
                {"max_position_size", config.max_position_size},
                {"max_holding_days", config.max_holding_days},
                {"order_timeout_ms", config.order_timeout_ms}}},
            {"risk", {
                {"stop_loss_percent", config.stop_loss_percent},
                {"trailing_stop_percent", config.trailing_stop_percent},
                {"take_profit_percent", config.take_profit_percent}}},
            {"backtest", {
                {"initial_capital", config.initial_capital},
                {"min_data_points", config.min_data_points},
                {"risk_free_rate", config.risk_free_rate}}},
            {"mode", {
                {"demo_mode", config.demo_mode},
                {"log_level", config.log_level},
                {"database", config.database_path}}},
            {"broker", {
                {"base_url", config.broker.base_url},
                {"account_id", config.broker.account_id},
                {"class_code", config.broker.class_code}}}
        };
    }

} // namespace core
