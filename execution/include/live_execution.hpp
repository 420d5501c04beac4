#pragma once

#include "execution_handler.hpp"
#include "broker_adapter.hpp"
#include <chrono>
#include <memory>

namespace execution {

    // Forwards orders to the broker with a hard deadline. An order that is not
    // answered within the timeout is reported as Rejection{"timeout"}; a late
    // answer is logged and dropped, and the order is never sent again.
    class LiveExecutionHandler : public IExecutionHandler {
    public:
        LiveExecutionHandler(std::shared_ptr<IBrokerAdapter> broker, std::chrono::milliseconds timeout);

        std::string getName() const override { return "live"; }

        ExecutionResult submit(const core::Order& order) override;

    private:
        std::shared_ptr<IBrokerAdapter> broker_;
        std::chrono::milliseconds timeout_;
    };

} // namespace execution
