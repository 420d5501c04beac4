#include "live_execution.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

namespace execution {

    LiveExecutionHandler::LiveExecutionHandler(std::shared_ptr<IBrokerAdapter> broker, std::chrono::milliseconds timeout)
        : broker_(std::move(broker)), timeout_(timeout)
    {
        if (!broker_) {
            throw std::invalid_argument("LiveExecutionHandler requires a broker adapter.");
        }
        if (timeout_.count() <= 0) {
            throw std::invalid_argument("Order timeout must be positive.");
        }
        core::logging::getLogger()->info("LiveExecutionHandler ready, order timeout {} ms", timeout_.count());
    }

    ExecutionResult LiveExecutionHandler::submit(const core::Order& order) {
        auto logger = core::logging::getLogger();
        logger->info("Submitting {} {} {} x{} to broker", order.order_id, core::utils::actionToString(order.action),
                     order.symbol, order.quantity);

        auto promise = std::make_shared<std::promise<ExecutionResult>>();
        auto abandoned = std::make_shared<std::atomic<bool>>(false);
        std::future<ExecutionResult> answer = promise->get_future();

        // The worker owns everything it touches so it can outlive this call
        std::thread([broker = broker_, order, timeout = timeout_, promise, abandoned]() {
            try {
                ExecutionResult result = broker->submitOrder(order, timeout);
                if (abandoned->load()) {
                    core::logging::getLogger()->warn("Late broker answer for {} discarded ({})", order.order_id,
                                                     isFill(result) ? "fill" : std::get<core::Rejection>(result).reason);
                }
                promise->set_value(std::move(result));
            } catch (const std::exception& e) {
                promise->set_value(core::Rejection{order.order_id, e.what()});
            } catch (...) {
                // Anything escaping this thread would terminate the process
                core::logging::getLogger()->error("Broker adapter threw a non-standard exception for {}", order.order_id);
                promise->set_value(core::Rejection{order.order_id, "unknown broker error"});
            }
        }).detach();

        if (answer.wait_for(timeout_) != std::future_status::ready) {
            abandoned->store(true);
            logger->error("Order {} timed out after {} ms", order.order_id, timeout_.count());
            return core::Rejection{order.order_id, "timeout"};
        }

        ExecutionResult result = answer.get();
        if (const auto* rejection = std::get_if<core::Rejection>(&result)) {
            logger->warn("Order {} rejected by broker: {}", order.order_id, rejection->reason);
        }
        return result;
    }

} // namespace execution
