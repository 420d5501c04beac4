#pragma once

#include "broker_adapter.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace execution {

    // Request building and response parsing, kept free of any network access
    namespace rest {

        using json = nlohmann::json;

        // {"units": "123", "nano": 450000000} -> 123.45
        double quotationToDouble(const json& quotation);

        // Whole lots for `shares`, or nullopt when `shares` is not a positive multiple of `lot`
        std::optional<long long> sharesToLots(long long shares, long long lot);

        // ShareBy answer -> instrument. Throws core::ApiRequestException on malformed input.
        InstrumentInfo parseInstrumentResponse(const std::string& symbol, const std::string& body);

        // Market order for the instrument's FIGI. Throws std::invalid_argument if the
        // order quantity is not a whole number of lots.
        json buildPostOrderRequest(const core::Order& order, const InstrumentInfo& instrument, const std::string& account_id);

        // Maps an HTTP answer to a Fill (quantity in shares) or a Rejection; never throws
        ExecutionResult parsePostOrderResponse(const core::Order& order, const InstrumentInfo& instrument,
                                               long status_code, const std::string& body);

        // Share positions from a portfolio document, quantities in shares. Known FIGIs
        // are mapped back to their ticker. Throws core::ApiRequestException on malformed input.
        std::vector<core::Position> parsePortfolioResponse(const std::string& body,
                                                           const std::map<std::string, InstrumentInfo>& instruments_by_figi = {});

    } // namespace rest

    // HTTP/JSON broker adapter (bearer token auth). Instruments are resolved once
    // per ticker and cached.
    class RestBrokerClient : public IBrokerAdapter {
    public:
        explicit RestBrokerClient(const core::BrokerSettings& settings);

        ExecutionResult submitOrder(const core::Order& order, std::chrono::milliseconds timeout) override;
        InstrumentInfo getInstrument(const std::string& symbol) override;
        std::vector<core::Position> getOpenPositions() override;

    private:
        std::string base_url_;
        std::string account_id_;
        std::string class_code_;
        std::string token_;

        std::mutex instruments_mutex_;
        std::map<std::string, InstrumentInfo> instruments_;
    };

} // namespace execution
