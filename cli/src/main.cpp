// cli/src/main.cpp

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

#include "logging.hpp"
#include "exceptions.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "backtester.hpp"
#include "optimizer.hpp"
#include "report_writer.hpp"
#include "live_trader.hpp"
#include "notifications.hpp"
#include "rest_broker_client.hpp"

namespace {

    volatile std::sig_atomic_t g_shutdown_requested = 0;

    void handleShutdownSignal(int) {
        g_shutdown_requested = 1;
    }

    struct CliOptions {
        std::string command;
        std::string config_path = "config/default_config.json";
        std::optional<std::string> db_path;
        std::vector<std::string> symbols;
        std::optional<std::string> from_date;
        std::optional<std::string> to_date;
        std::optional<std::string> report_path;

        // optimize
        std::optional<std::string> strategy;
        std::string metric = "sharpe_ratio";
        int workers = 4;
        std::optional<int> window_days;
        int step_days = 30;
    };

    void printUsage(std::ostream& out) {
        out << "Usage:\n"
            << "  equity_trader backtest [--config FILE] [--db FILE] [--symbol SYM]... [--from YYYY-MM-DD]\n"
            << "                         [--to YYYY-MM-DD] [--report FILE]\n"
            << "  equity_trader optimize [--config FILE] [--db FILE] [--symbol SYM]... [--from YYYY-MM-DD]\n"
            << "                         [--to YYYY-MM-DD] [--strategy trend|reversal|combined]\n"
            << "                         [--metric NAME] [--workers N] [--window DAYS [--step DAYS]]\n"
            << "                         [--report FILE]\n"
            << "  equity_trader live     [--config FILE] [--db FILE]\n";
    }

    int parsePositiveInt(const std::string& option, const std::string& value) {
        try {
            size_t consumed = 0;
            const int parsed = std::stoi(value, &consumed);
            if (consumed == value.size() && parsed > 0) {
                return parsed;
            }
        } catch (const std::logic_error&) {
            // Reported below
        }
        throw core::ConfigException("Option '" + option + "' needs a positive whole number, got '" + value + "'.");
    }

    CliOptions parseArguments(int argc, char* argv[]) {
        if (argc < 2) {
            throw core::ConfigException("No command given.");
        }
        CliOptions options;
        options.command = argv[1];
        if (options.command != "backtest" && options.command != "optimize" && options.command != "live") {
            throw core::ConfigException("Unknown command '" + options.command + "'.");
        }

        const bool optimizing = options.command == "optimize";
        const bool replays = options.command == "backtest" || optimizing;
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (i + 1 >= argc) {
                throw core::ConfigException("Option '" + arg + "' needs a value.");
            }
            const std::string value = argv[++i];
            if (arg == "--config") {
                options.config_path = value;
            } else if (arg == "--db") {
                options.db_path = value;
            } else if (arg == "--symbol" && replays) {
                options.symbols.push_back(value);
            } else if (arg == "--from" && replays) {
                options.from_date = value;
            } else if (arg == "--to" && replays) {
                options.to_date = value;
            } else if (arg == "--report" && replays) {
                options.report_path = value;
            } else if (arg == "--strategy" && optimizing) {
                options.strategy = value;
            } else if (arg == "--metric" && optimizing) {
                options.metric = value;
            } else if (arg == "--workers" && optimizing) {
                options.workers = parsePositiveInt(arg, value);
            } else if (arg == "--window" && optimizing) {
                options.window_days = parsePositiveInt(arg, value);
            } else if (arg == "--step" && optimizing) {
                options.step_days = parsePositiveInt(arg, value);
            } else {
                throw core::ConfigException("Unknown option '" + arg + "' for command '" + options.command + "'.");
            }
        }
        return options;
    }

    int runBacktest(const core::TradingConfig& config, const CliOptions& options, data::DatabaseManager& db_manager) {
        auto logger = core::logging::getLogger();

        std::optional<core::Timestamp> start_time;
        std::optional<core::Timestamp> end_time;
        if (options.from_date) {
            start_time = core::utils::dateToTimestamp(*options.from_date);
        }
        if (options.to_date) {
            // Inclusive of the whole end day
            end_time = core::utils::addDays(core::utils::dateToTimestamp(*options.to_date), 1) - std::chrono::seconds(1);
        }

        data::SqliteMarketDataFeed feed(db_manager, start_time, end_time);
        backtester::Backtester the_backtester(config, feed);
        backtester::BacktestResult result = the_backtester.run(options.symbols);

        for (const auto& [symbol, reason] : result.symbol_errors) {
            logger->warn("Skipped {}: {}", symbol, reason);
        }

        if (options.report_path) {
            backtester::JsonReportWriter writer(*options.report_path);
            writer.publish(result);
            logger->info("Report written to {}", *options.report_path);
        } else {
            std::cout << backtester::backtestResultToJson(result).dump(2) << std::endl;
        }
        return 0;
    }

    // Writes to --report, or prints to stdout
    void emitJson(const CliOptions& options, const nlohmann::json& document) {
        if (options.report_path) {
            backtester::writeJsonFile(*options.report_path, document);
            core::logging::getLogger()->info("Report written to {}", *options.report_path);
        } else {
            std::cout << document.dump(2) << std::endl;
        }
    }

    int runOptimize(core::TradingConfig config, const CliOptions& options, data::DatabaseManager& db_manager) {
        auto logger = core::logging::getLogger();

        // Without --strategy the configured strategies are kept and only risk settings are searched
        if (options.strategy) {
            config.active_strategies = *options.strategy == "combined" ? std::vector<std::string>{"trend", "reversal"}
                                                                      : std::vector<std::string>{*options.strategy};
        }
        const backtester::ParameterGrid grid = backtester::defaultParameterGrid(options.strategy.value_or(""));

        backtester::OptimizerOptions optimizer_options;
        optimizer_options.metric = options.metric;
        optimizer_options.max_workers = options.workers;

        if (options.window_days) {
            if (!options.from_date || !options.to_date) {
                throw core::ConfigException("Walk-forward optimization needs --from and --to.");
            }
            const core::Timestamp start = core::utils::dateToTimestamp(*options.from_date);
            const core::Timestamp end = core::utils::addDays(core::utils::dateToTimestamp(*options.to_date), 1);
            data::SqliteMarketDataFeed feed(db_manager, start, end - std::chrono::seconds(1));
            backtester::Optimizer optimizer(config, feed, optimizer_options);
            backtester::WalkForwardResult result =
                optimizer.walkForward(grid, start, end, *options.window_days, options.step_days, options.symbols);
            emitJson(options, backtester::walkForwardResultToJson(result));
            return result.best_window ? 0 : 1;
        }

        std::optional<core::Timestamp> start_time;
        std::optional<core::Timestamp> end_time;
        if (options.from_date) {
            start_time = core::utils::dateToTimestamp(*options.from_date);
        }
        if (options.to_date) {
            end_time = core::utils::addDays(core::utils::dateToTimestamp(*options.to_date), 1) - std::chrono::seconds(1);
        }
        data::SqliteMarketDataFeed feed(db_manager, start_time, end_time);
        backtester::Optimizer optimizer(config, feed, optimizer_options);
        backtester::OptimizationResult result = optimizer.gridSearch(grid, options.symbols);
        emitJson(options, backtester::optimizationResultToJson(result));
        if (!result.best()) {
            logger->error("No parameter combination produced a result.");
            return 1;
        }
        return 0;
    }

    int runLive(const core::TradingConfig& config, data::DatabaseManager& db_manager) {
        auto logger = core::logging::getLogger();

        auto feed = std::make_shared<data::SqliteMarketDataFeed>(db_manager);
        std::shared_ptr<execution::IBrokerAdapter> broker;
        if (config.demo_mode) {
            logger->info("Demo mode: orders are simulated, no broker connection.");
        } else {
            broker = std::make_shared<execution::RestBrokerClient>(config.broker);
        }
        auto notifications = std::make_shared<trading::LoggingNotificationSink>();

        trading::LiveTrader trader(config, feed, broker, notifications);

        std::signal(SIGINT, handleShutdownSignal);
        std::signal(SIGTERM, handleShutdownSignal);

        std::atomic<bool> trader_done{false};
        std::thread watcher([&trader, &trader_done]() {
            while (!trader_done.load()) {
                if (g_shutdown_requested) {
                    core::logging::getLogger()->info("Shutdown signal received, stopping trader...");
                    trader.stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });

        try {
            trader.run();
        } catch (const std::exception&) {
            trader_done = true;
            watcher.join();
            throw;
        }
        trader_done = true;
        watcher.join();

        const auto& ledger = trader.getLedger();
        logger->info("Live session finished: {} trades, {} fills, {} rejections.",
                     ledger.getTrades().size(), ledger.getFillCount(), ledger.getRejectionCount());
        return 0;
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        CliOptions options;
        try {
            options = parseArguments(argc, argv);
        } catch (const core::ConfigException& ex) {
            std::cerr << ex.what() << "\n";
            printUsage(std::cerr);
            return 2;
        }

        // Console logger until the configured level is known
        core::logging::initializeConsoleOnly(spdlog::level::info);
        core::TradingConfig config = core::loadConfig(options.config_path);
        if (options.db_path) {
            config.database_path = *options.db_path;
        }

        const auto console_level = core::logging::level_from_string(config.log_level);
        core::logging::initialize("equity_trader", console_level, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Equity trader starting: command '{}', config '{}'", options.command, options.config_path);

        data::DatabaseManager db_manager(config.database_path);
        if (!db_manager.connect()) {
            throw core::DataLoadException("Cannot open database '" + config.database_path + "'.");
        }
        if (!db_manager.initializeSchema()) {
            throw core::DataLoadException("Cannot initialize schema in '" + config.database_path + "'.");
        }

        int exit_code = 0;
        if (options.command == "backtest") {
            exit_code = runBacktest(config, options, db_manager);
        } else if (options.command == "optimize") {
            exit_code = runOptimize(config, options, db_manager);
        } else {
            exit_code = runLive(config, db_manager);
        }

        db_manager.disconnect();
        logger->info("Equity trader finished.");
        return exit_code;

    } catch (const core::TradingPlatformException& ex) {
        std::cerr << "Platform Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Platform Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }
}
