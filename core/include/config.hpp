#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace core {

    using json = nlohmann::json;

    struct TrendParams {
        int ema_short = 5;
        int ema_long = 15;
        int macd_fast = 12;
        int macd_slow = 26;
        int macd_signal = 9;
        int volume_ma_period = 20;
        double min_volume_factor = 1.5;
    };

    struct ReversalParams {
        int rsi_period = 14;
        double rsi_oversold = 30.0;
        double rsi_overbought = 70.0;
        int bollinger_period = 20;
        double bollinger_std = 2.0;
    };

    struct BrokerSettings {
        std::string base_url = "https://invest-public-api.tinkoff.ru/rest";
        std::string account_id;
        std::string class_code = "TQBR";  // Exchange board used to resolve tickers
        std::string token; // Filled from BROKER_TOKEN, never read from the file
    };

    // Read once at startup; not reloaded mid-run
    struct TradingConfig {
        // trading
        std::vector<std::string> symbols {"SBER", "GAZP", "LKOH", "ROSN"};
        std::string timeframe = "day";
        int update_interval_seconds = 900;

        // strategies
        std::vector<std::string> active_strategies {"trend", "reversal"};
        std::string strategy_mode = "any";
        TrendParams trend;
        ReversalParams reversal;

        // execution
        double commission_rate = 0.003;
        int max_positions = 1;
        double max_position_size = 0.9;  // Fraction of available capital per position
        int max_holding_days = 7;
        int order_timeout_ms = 5000;

        // risk (percent values, 2.5 == 2.5%)
        double stop_loss_percent = 2.5;
        double trailing_stop_percent = 1.8;
        double take_profit_percent = 6.0;

        // backtest
        double initial_capital = 50000.0;
        int min_data_points = 30;
        double risk_free_rate = 0.02;    // Annual, used for the Sharpe ratio

        // mode
        bool demo_mode = false;
        std::string log_level = "info";
        std::string database_path = "market_data.db";

        BrokerSettings broker;
    };

    // Missing keys keep their defaults; invalid values throw ConfigException
    TradingConfig configFromJson(const json& root);
    TradingConfig loadConfig(const std::string& path);

    void validateConfig(const TradingConfig& config);

    json configToJson(const TradingConfig& config);

} // namespace core
