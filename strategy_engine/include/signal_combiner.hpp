#pragma once

#include "common_types.hpp"
#include <vector>
#include <string>

namespace strategy_engine {

    // Fuses the ordered per-strategy votes for one bar into the effective signal
    class SignalCombiner {
    public:
        explicit SignalCombiner(CombineMode mode);

        CombineMode getMode() const { return mode_; }

        // Votes must be in configured strategy order. Result is named "combined".
        core::Signal combine(const std::vector<core::Signal>& votes,
                             const core::Timestamp& timestamp,
                             const std::string& symbol) const;

    private:
        CombineMode mode_;
    };

} // namespace strategy_engine
