#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"
#include "market_data_feed.hpp"

namespace data {

// SQLite bar store. Bars are keyed by (symbol, timeframe, epoch seconds).
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // INSERT OR IGNORE inside one transaction; returns false and rolls back on error
    bool saveBars(const core::TimeSeries<core::Bar>& bars, const std::string& timeframe);

    // Bars in [start, end], oldest first. Throws core::DataLoadException on SQL errors.
    core::TimeSeries<core::Bar> queryBars(const std::string& symbol,
                                          const std::string& timeframe,
                                          std::optional<core::Timestamp> start_time = std::nullopt,
                                          std::optional<core::Timestamp> end_time = std::nullopt);

    // Cursor over the same range as queryBars; must not outlive this manager
    std::unique_ptr<IBarStream> openCursor(const std::string& symbol,
                                           const std::string& timeframe,
                                           std::optional<core::Timestamp> start_time = std::nullopt,
                                           std::optional<core::Timestamp> end_time = std::nullopt);

    long long countBars(const std::string& symbol, const std::string& timeframe);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

// Market data feed backed by a DatabaseManager, optionally restricted to a date range
class SqliteMarketDataFeed : public IMarketDataFeed {
public:
    SqliteMarketDataFeed(DatabaseManager& database,
                         std::optional<core::Timestamp> start_time = std::nullopt,
                         std::optional<core::Timestamp> end_time = std::nullopt);

    std::unique_ptr<IBarStream> openStream(const std::string& symbol, const std::string& timeframe) override;

private:
    DatabaseManager& database_;
    std::optional<core::Timestamp> start_time_;
    std::optional<core::Timestamp> end_time_;
};

} // namespace data
