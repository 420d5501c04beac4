#include "market_data_feed.hpp"
#include "bar_validator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

namespace data {

    namespace {

        class InMemoryBarStream : public IBarStream {
        public:
            InMemoryBarStream(std::string symbol, std::shared_ptr<const core::TimeSeries<core::Bar>> bars)
                : bars_(std::move(bars)), checker_(std::move(symbol)) {}

            std::optional<core::Bar> next() override {
                if (position_ >= bars_->size()) {
                    return std::nullopt;
                }
                const core::Bar& bar = (*bars_)[position_++];
                checker_.check(bar);
                return bar;
            }

            void reset() override {
                position_ = 0;
                checker_.reset();
            }

        private:
            std::shared_ptr<const core::TimeSeries<core::Bar>> bars_;
            BarSequenceChecker checker_;
            size_t position_ = 0;
        };

    } // end anonymous namespace

    core::TimeSeries<core::Bar> readAll(IBarStream& stream) {
        core::TimeSeries<core::Bar> bars;
        while (auto bar = stream.next()) {
            bars.push_back(std::move(*bar));
        }
        return bars;
    }

    void InMemoryMarketDataFeed::addBars(const std::string& symbol, const std::string& timeframe, core::TimeSeries<core::Bar> bars) {
        core::logging::getLogger()->debug("InMemoryMarketDataFeed: {} bars for {} ({})", bars.size(), symbol, timeframe);
        series_[{symbol, timeframe}] = std::make_shared<const core::TimeSeries<core::Bar>>(std::move(bars));
    }

    std::unique_ptr<IBarStream> InMemoryMarketDataFeed::openStream(const std::string& symbol, const std::string& timeframe) {
        auto it = series_.find({symbol, timeframe});
        if (it == series_.end()) {
            throw core::DataLoadException(fmt::format("No bars for {} ({}) in memory feed.", symbol, timeframe));
        }
        return std::make_unique<InMemoryBarStream>(symbol, it->second);
    }

} // namespace data
