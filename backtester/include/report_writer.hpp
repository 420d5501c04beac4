#pragma once

#include "backtester.hpp"
#include "optimizer.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace backtester {

    using json = nlohmann::json;

    class IReportSink {
    public:
        virtual ~IReportSink() = default;
        virtual void publish(const BacktestResult& result) = 0;
    };

    json tradeToJson(const core::Trade& trade);
    json metricsToJson(const BacktestMetrics& metrics);

    // Trades, equity curve, metrics and per-symbol errors
    json backtestResultToJson(const BacktestResult& result);

    json optimizationResultToJson(const OptimizationResult& result);
    json walkForwardResultToJson(const WalkForwardResult& result);

    // Creates missing parent directories. Throws core::BacktestException on I/O errors.
    void writeJsonFile(const std::string& output_path, const json& document, int indent = 2);

    // Writes backtestResultToJson to a file. Throws core::BacktestException on I/O errors.
    class JsonReportWriter : public IReportSink {
    public:
        explicit JsonReportWriter(std::string output_path, int indent = 2);

        void publish(const BacktestResult& result) override;

    private:
        std::string output_path_;
        int indent_;
    };

} // namespace backtester
