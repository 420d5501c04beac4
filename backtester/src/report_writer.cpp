#include "report_writer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>

namespace backtester {

    namespace {

        // JSON has no infinity; an unbounded profit factor is written as null
        json finiteOrNull(double value) {
            return std::isfinite(value) ? json(value) : json(nullptr);
        }

    } // end anonymous namespace

    json tradeToJson(const core::Trade& trade) {
        return json{
            {"symbol", trade.symbol},
            {"direction", core::utils::directionToString(trade.direction)},
            {"quantity", trade.quantity},
            {"entry_time", core::utils::timestampToString(trade.entry_time)},
            {"entry_price", trade.entry_price},
            {"exit_time", core::utils::timestampToString(trade.exit_time)},
            {"exit_price", trade.exit_price},
            {"exit_reason", core::utils::exitReasonToString(trade.exit_reason)},
            {"pnl", trade.pnl},
            {"commission_paid", trade.commission_paid},
            {"return_pct", trade.return_pct}
        };
    }

    json metricsToJson(const BacktestMetrics& metrics) {
        return json{
            {"initial_capital", metrics.initial_capital},
            {"final_capital", metrics.final_capital},
            {"total_pnl", metrics.total_pnl},
            {"total_return_pct", metrics.total_return_pct},
            {"annual_return_pct", metrics.annual_return_pct},
            {"max_drawdown_pct", metrics.max_drawdown_pct},
            {"volatility_pct", metrics.volatility_pct},
            {"sharpe_ratio", metrics.sharpe_ratio},
            {"sortino_ratio", metrics.sortino_ratio},
            {"calmar_ratio", metrics.calmar_ratio},
            {"total_trades", metrics.total_trades},
            {"winning_trades", metrics.winning_trades},
            {"losing_trades", metrics.losing_trades},
            {"win_rate_pct", metrics.win_rate_pct},
            {"profit_factor", finiteOrNull(metrics.profit_factor)},
            {"avg_win_pnl", metrics.avg_win_pnl},
            {"avg_loss_pnl", metrics.avg_loss_pnl},
            {"avg_trade_duration_days", metrics.avg_trade_duration_days},
            {"total_commission", metrics.total_commission},
            {"exit_reasons", metrics.exit_reasons}
        };
    }

    json backtestResultToJson(const BacktestResult& result) {
        json trades = json::array();
        for (const auto& trade : result.trades) {
            trades.push_back(tradeToJson(trade));
        }

        json equity = json::array();
        for (const auto& point : result.equity_curve) {
            equity.push_back({
                {"timestamp", core::utils::timestampToString(point.timestamp)},
                {"capital", point.capital},
                {"unrealized_pnl", point.unrealized_pnl}
            });
        }

        return json{
            {"symbols", result.symbols},
            {"symbol_errors", result.symbol_errors},
            {"fills", result.fills},
            {"rejections", result.rejections},
            {"metrics", metricsToJson(result.metrics)},
            {"trades", trades},
            {"equity_curve", equity}
        };
    }

    json optimizationResultToJson(const OptimizationResult& result) {
        json runs = json::array();
        for (const auto& run : result.runs) {
            json entry = {
                {"parameters", run.parameters},
                {"score", run.metrics ? finiteOrNull(run.score) : json(nullptr)}
            };
            if (run.metrics) {
                entry["metrics"] = metricsToJson(*run.metrics);
            } else {
                entry["error"] = run.error;
            }
            runs.push_back(std::move(entry));
        }

        const OptimizationRun* best = result.best();
        return json{
            {"metric", result.metric},
            {"total_combinations", result.runs.size()},
            {"elapsed_seconds", result.elapsed_seconds},
            {"best_parameters", best ? json(best->parameters) : json(nullptr)},
            {"best_score", best ? finiteOrNull(best->score) : json(nullptr)},
            {"runs", runs}
        };
    }

    json walkForwardResultToJson(const WalkForwardResult& result) {
        json windows = json::array();
        for (const auto& window : result.windows) {
            json entry = {
                {"train_start", core::utils::timestampToString(window.train_start)},
                {"train_end", core::utils::timestampToString(window.train_end)},
                {"validation_end", core::utils::timestampToString(window.validation_end)},
                {"best_parameters", window.best_parameters},
                {"train_metrics", window.train_metrics ? metricsToJson(*window.train_metrics) : json(nullptr)},
                {"validation_metrics", window.validation_metrics ? metricsToJson(*window.validation_metrics) : json(nullptr)},
                {"validation_score", window.validation_metrics ? finiteOrNull(window.validation_score) : json(nullptr)}
            };
            if (!window.error.empty()) {
                entry["error"] = window.error;
            }
            windows.push_back(std::move(entry));
        }

        return json{
            {"metric", result.metric},
            {"elapsed_seconds", result.elapsed_seconds},
            {"stability_score", result.stability_score},
            {"best_window", result.best_window ? json(*result.best_window) : json(nullptr)},
            {"best_parameters", result.best_parameters},
            {"windows", windows}
        };
    }

    void writeJsonFile(const std::string& output_path, const json& document, int indent) {
        std::filesystem::path path(output_path);
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                throw core::BacktestException(fmt::format("Cannot create report directory '{}': {}",
                                                          path.parent_path().string(), ec.message()));
            }
        }

        std::ofstream out(path);
        if (!out.is_open()) {
            throw core::BacktestException(fmt::format("Cannot open report file '{}' for writing.", output_path));
        }
        out << document.dump(indent) << '\n';
        if (!out) {
            throw core::BacktestException(fmt::format("Failed to write report file '{}'.", output_path));
        }
    }

    JsonReportWriter::JsonReportWriter(std::string output_path, int indent)
        : output_path_(std::move(output_path)), indent_(indent) {}

    void JsonReportWriter::publish(const BacktestResult& result) {
        writeJsonFile(output_path_, backtestResultToJson(result), indent_);
        core::logging::getLogger()->info("Backtest report written to {}", output_path_);
    }

} // namespace backtester
