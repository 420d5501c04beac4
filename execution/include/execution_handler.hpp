#pragma once

#include "datatypes.hpp"
#include <string>
#include <variant>

namespace execution {

    // Outcome of one order: filled, or rejected with a reason. Never thrown.
    using ExecutionResult = std::variant<core::Fill, core::Rejection>;

    class IExecutionHandler {
    public:
        virtual ~IExecutionHandler() = default;

        virtual std::string getName() const = 0;

        virtual ExecutionResult submit(const core::Order& order) = 0;
    };

    inline bool isFill(const ExecutionResult& result) {
        return std::holds_alternative<core::Fill>(result);
    }

} // namespace execution
