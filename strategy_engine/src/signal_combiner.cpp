#include "signal_combiner.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>

namespace strategy_engine {

    SignalCombiner::SignalCombiner(CombineMode mode) : mode_(mode) {}

    core::Signal SignalCombiner::combine(const std::vector<core::Signal>& votes,
                                         const core::Timestamp& timestamp,
                                         const std::string& symbol) const {
        core::Signal result;
        result.timestamp = timestamp;
        result.symbol = symbol;
        result.strategy_name = "combined";

        if (votes.empty()) {
            return result;
        }

        auto is = [](core::Direction d) {
            return [d](const core::Signal& s) { return s.direction == d; };
        };
        bool any_long = std::any_of(votes.begin(), votes.end(), is(core::Direction::Long));
        bool any_short = std::any_of(votes.begin(), votes.end(), is(core::Direction::Short));

        if (mode_ == CombineMode::Any) {
            if (any_long && any_short) {
                core::logging::getLogger()->debug("{}: conflicting long/short votes at {}, staying flat",
                                                  symbol, core::utils::timestampToString(timestamp));
                return result;
            }
            auto first = std::find_if(votes.begin(), votes.end(),
                                      [](const core::Signal& s) { return s.direction != core::Direction::Flat; });
            if (first != votes.end()) {
                result.direction = first->direction;
            }
        } else {
            const core::Direction common = votes.front().direction;
            if (common != core::Direction::Flat && std::all_of(votes.begin(), votes.end(), is(common))) {
                result.direction = common;
            }
        }
        return result;
    }

} // namespace strategy_engine
