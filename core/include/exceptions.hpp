#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class TradingPlatformException : public std::runtime_error {
    public:
        explicit TradingPlatformException(const std::string& message)
            : std::runtime_error(message) {}

        explicit TradingPlatformException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class DataLoadException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class ApiRequestException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class IndicatorCalculationException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    // Indicator window not yet filled; the caller has to wait for more bars
    class InsufficientDataException : public IndicatorCalculationException {
    public: using IndicatorCalculationException::IndicatorCalculationException; };

    // Non-monotonic or duplicate timestamps, or a bar for the wrong symbol
    class DataIntegrityException : public DataLoadException {
    public: using DataLoadException::DataLoadException; };

    class StrategyException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    // Fill or exit for a symbol that is not awaiting one
    class OrderStateException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class BacktestException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    // Too few bars for a symbol to run a backtest at all
    class InsufficientHistoryException : public BacktestException {
    public: using BacktestException::BacktestException; };

} // namespace core
