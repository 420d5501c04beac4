#pragma once

#include "execution_handler.hpp"

namespace execution {

    // Fills every valid order at its reference price; commission = price * quantity * rate
    class SimulatedExecutionHandler : public IExecutionHandler {
    public:
        explicit SimulatedExecutionHandler(double commission_rate);

        std::string getName() const override { return "simulated"; }

        ExecutionResult submit(const core::Order& order) override;

    private:
        double commission_rate_;
    };

} // namespace execution
