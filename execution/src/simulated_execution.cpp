#include "simulated_execution.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <stdexcept>

namespace execution {

    SimulatedExecutionHandler::SimulatedExecutionHandler(double commission_rate)
        : commission_rate_(commission_rate)
    {
        if (commission_rate_ < 0.0) {
            throw std::invalid_argument("Commission rate cannot be negative.");
        }
    }

    ExecutionResult SimulatedExecutionHandler::submit(const core::Order& order) {
        auto logger = core::logging::getLogger();
        if (order.action == core::SignalAction::None) {
            return core::Rejection{order.order_id, "no action"};
        }
        if (order.quantity <= 0) {
            return core::Rejection{order.order_id, "non-positive quantity"};
        }
        if (order.reference_price <= 0.0) {
            return core::Rejection{order.order_id, "non-positive price"};
        }

        core::Fill fill;
        fill.order_id = order.order_id;
        fill.timestamp = order.timestamp;
        fill.symbol = order.symbol;
        fill.action = order.action;
        fill.quantity = order.quantity;
        fill.price = order.reference_price;
        fill.commission = fill.price * static_cast<double>(fill.quantity) * commission_rate_;

        logger->trace("Simulated fill {}: {} {} x{} @ {:.4f}, commission {:.4f}", fill.order_id,
                      core::utils::actionToString(fill.action), fill.symbol, fill.quantity, fill.price, fill.commission);
        return fill;
    }

} // namespace execution
