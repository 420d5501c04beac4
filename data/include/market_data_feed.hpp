#pragma once

#include "datatypes.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace data {

    // Lazy, restartable sequence of bars for one symbol and timeframe.
    // next() throws core::DataIntegrityException on out-of-order or duplicate bars.
    class IBarStream {
    public:
        virtual ~IBarStream() = default;

        // Next bar, or nullopt at the end of the data
        virtual std::optional<core::Bar> next() = 0;

        // Start again from the first bar
        virtual void reset() = 0;
    };

    class IMarketDataFeed {
    public:
        virtual ~IMarketDataFeed() = default;

        // Throws core::DataLoadException when the symbol cannot be served
        virtual std::unique_ptr<IBarStream> openStream(const std::string& symbol, const std::string& timeframe) = 0;
    };

    // Drains a stream from its current position
    core::TimeSeries<core::Bar> readAll(IBarStream& stream);

    // Serves bars held in memory (tests, replays of fetched data)
    class InMemoryMarketDataFeed : public IMarketDataFeed {
    public:
        void addBars(const std::string& symbol, const std::string& timeframe, core::TimeSeries<core::Bar> bars);

        std::unique_ptr<IBarStream> openStream(const std::string& symbol, const std::string& timeframe) override;

    private:
        std::map<std::pair<std::string, std::string>, std::shared_ptr<const core::TimeSeries<core::Bar>>> series_;
    };

} // namespace data
