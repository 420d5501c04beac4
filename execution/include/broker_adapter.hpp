#pragma once

#include "execution_handler.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace execution {

    // Exchange listing of a ticker. Orders are placed in lots of `lot` shares.
    struct InstrumentInfo {
        std::string symbol;
        std::string figi;
        std::string class_code;
        long long lot = 1;
    };

    // Broker connectivity used in live mode. Quantities crossing this interface
    // are always in shares; adapters convert to the broker's lot units.
    class IBrokerAdapter {
    public:
        virtual ~IBrokerAdapter() = default;

        // May block up to `timeout`. Broker-side failures come back as Rejection.
        virtual ExecutionResult submitOrder(const core::Order& order, std::chrono::milliseconds timeout) = 0;

        // Throws core::ApiRequestException when the ticker cannot be resolved
        virtual InstrumentInfo getInstrument(const std::string& symbol) = 0;

        // Positions currently held at the broker, for startup reconciliation.
        // Throws core::ApiRequestException when the broker cannot be queried.
        virtual std::vector<core::Position> getOpenPositions() = 0;
    };

} // namespace execution
