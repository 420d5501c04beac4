#include "database_manager.hpp"
#include "bar_validator.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <limits>

namespace data
{

    namespace
    {

        const char *const kSelectBarsSql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM bars
            WHERE symbol = ?
              AND timeframe = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        long long lowerBound(const std::optional<core::Timestamp> &ts)
        {
            return ts ? core::utils::toEpochSeconds(*ts) : std::numeric_limits<long long>::min();
        }

        long long upperBound(const std::optional<core::Timestamp> &ts)
        {
            return ts ? core::utils::toEpochSeconds(*ts) : std::numeric_limits<long long>::max();
        }

        // Prepares kSelectBarsSql with all four parameters bound
        sqlite3_stmt *prepareRangeQuery(sqlite3 *db,
                                        const std::string &symbol,
                                        const std::string &timeframe,
                                        const std::optional<core::Timestamp> &start_time,
                                        const std::optional<core::Timestamp> &end_time)
        {
            sqlite3_stmt *stmt = nullptr;
            int rc = sqlite3_prepare_v2(db, kSelectBarsSql, -1, &stmt, nullptr);
            if (rc != SQLITE_OK)
            {
                std::string message = sqlite3_errmsg(db);
                sqlite3_finalize(stmt);
                throw core::DataLoadException(fmt::format("Failed to prepare bar query [{}]: {}", rc, message));
            }
            // Index is 1-based; the statement keeps its own copy of the text
            sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, timeframe.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 3, lowerBound(start_time));
            sqlite3_bind_int64(stmt, 4, upperBound(end_time));
            return stmt;
        }

        core::Bar readBarRow(sqlite3_stmt *stmt, const std::string &symbol)
        {
            core::Bar bar;
            bar.symbol = symbol;
            bar.timestamp = core::utils::fromEpochSeconds(sqlite3_column_int64(stmt, 0));
            bar.open = sqlite3_column_double(stmt, 1);
            bar.high = sqlite3_column_double(stmt, 2);
            bar.low = sqlite3_column_double(stmt, 3);
            bar.close = sqlite3_column_double(stmt, 4);
            bar.volume = sqlite3_column_int64(stmt, 5);
            return bar;
        }

        // Steps a prepared range query one row at a time
        class SqliteBarStream : public IBarStream
        {
        public:
            SqliteBarStream(sqlite3 *db, sqlite3_stmt *stmt, std::string symbol)
                : db_(db), stmt_(stmt), symbol_(std::move(symbol)), checker_(symbol_) {}

            ~SqliteBarStream() override
            {
                sqlite3_finalize(stmt_);
            }

            SqliteBarStream(const SqliteBarStream &) = delete;
            SqliteBarStream &operator=(const SqliteBarStream &) = delete;

            std::optional<core::Bar> next() override
            {
                if (done_)
                {
                    return std::nullopt;
                }
                int rc = sqlite3_step(stmt_);
                if (rc == SQLITE_DONE)
                {
                    done_ = true;
                    return std::nullopt;
                }
                if (rc != SQLITE_ROW)
                {
                    throw core::DataLoadException(fmt::format("Error stepping bar cursor for {} [{}]: {}",
                                                              symbol_, rc, sqlite3_errmsg(db_)));
                }
                core::Bar bar = readBarRow(stmt_, symbol_);
                checker_.check(bar);
                return bar;
            }

            void reset() override
            {
                sqlite3_reset(stmt_); // Bindings are kept
                done_ = false;
                checker_.reset();
            }

        private:
            sqlite3 *db_;
            sqlite3_stmt *stmt_;
            std::string symbol_;
            BarSequenceChecker checker_;
            bool done_ = false;
        };

    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually an unfinalized cursor still open
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS bars (
            symbol TEXT NOT NULL,
            timeframe TEXT NOT NULL,
            timestamp INTEGER NOT NULL, -- Unix epoch seconds, UTC
            open REAL NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            close REAL NOT NULL,
            volume INTEGER NOT NULL,
            PRIMARY KEY (symbol, timeframe, timestamp)
        );
    )";

        bool success = executeSQL(create_bars_sql);
        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed.");
        }
        return success;
    }

    core::TimeSeries<core::Bar> DatabaseManager::queryBars(
        const std::string &symbol,
        const std::string &timeframe,
        std::optional<core::Timestamp> start_time,
        std::optional<core::Timestamp> end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot query bars: Not connected to database.");
        }

        logger->debug("Querying bars for {} ({}) between {} and {}", symbol, timeframe,
                      start_time ? core::utils::timestampToString(*start_time) : "-inf",
                      end_time ? core::utils::timestampToString(*end_time) : "+inf");

        sqlite3_stmt *stmt = prepareRangeQuery(db_, symbol, timeframe, start_time, end_time);

        core::TimeSeries<core::Bar> bars;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            bars.push_back(readBarRow(stmt, symbol));
        }

        if (rc != SQLITE_DONE)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::DataLoadException(fmt::format("Error stepping through bar query [{}]: {}", rc, message));
        }
        sqlite3_finalize(stmt);

        logger->debug("Loaded {} bars for {} ({}).", bars.size(), symbol, timeframe);
        return bars;
    }

    std::unique_ptr<IBarStream> DatabaseManager::openCursor(const std::string &symbol,
                                                            const std::string &timeframe,
                                                            std::optional<core::Timestamp> start_time,
                                                            std::optional<core::Timestamp> end_time)
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot open bar cursor: Not connected to database.");
        }
        sqlite3_stmt *stmt = prepareRangeQuery(db_, symbol, timeframe, start_time, end_time);
        return std::make_unique<SqliteBarStream>(db_, stmt, symbol);
    }

    long long DatabaseManager::countBars(const std::string &symbol, const std::string &timeframe)
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot count bars: Not connected to database.");
        }
        const char *sql = "SELECT COUNT(*) FROM bars WHERE symbol = ? AND timeframe = ?;";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::DataLoadException(fmt::format("Failed to prepare count query [{}]: {}", rc, message));
        }
        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, timeframe.c_str(), -1, SQLITE_TRANSIENT);

        long long count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW)
        {
            count = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return count;
    }

    bool DatabaseManager::saveBars(const core::TimeSeries<core::Bar> &bars, const std::string &timeframe)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save bars: Not connected to database.");
            return false;
        }
        if (bars.empty())
        {
            logger->debug("No bars provided to save ({}).", timeframe);
            return true; // Nothing to do, report success
        }

        logger->debug("Attempting to save/ignore {} bars ({})", bars.size(), timeframe);

        // Duplicates on (symbol, timeframe, timestamp) are ignored
        const char *sql = R"(
INSERT OR IGNORE INTO bars
(symbol, timeframe, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt); // Safe if stmt is null
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving bars.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &bar : bars)
        {
            sqlite3_bind_text(stmt, 1, bar.symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, timeframe.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 3, core::utils::toEpochSeconds(bar.timestamp));
            sqlite3_bind_double(stmt, 4, bar.open);
            sqlite3_bind_double(stmt, 5, bar.high);
            sqlite3_bind_double(stmt, 6, bar.low);
            sqlite3_bind_double(stmt, 7, bar.close);
            sqlite3_bind_int64(stmt, 8, bar.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize the statement BEFORE commit/rollback
        sqlite3_finalize(stmt);

        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                logger->error("Failed to COMMIT transaction for saving bars.");
                if (!executeSQL("ROLLBACK;"))
                {
                    logger->error("ROLLBACK after failed COMMIT also failed; database state is uncertain.");
                }
                return false;
            }
            logger->info("Saved {} new bars (duplicates ignored, {}).", saved_count, timeframe);
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            logger->error("Failed to ROLLBACK transaction for saving bars.");
        }
        logger->warn("Transaction rolled back due to error during bar save ({}).", timeframe);
        return false;
    }

    SqliteMarketDataFeed::SqliteMarketDataFeed(DatabaseManager &database,
                                               std::optional<core::Timestamp> start_time,
                                               std::optional<core::Timestamp> end_time)
        : database_(database), start_time_(start_time), end_time_(end_time) {}

    std::unique_ptr<IBarStream> SqliteMarketDataFeed::openStream(const std::string &symbol, const std::string &timeframe)
    {
        return database_.openCursor(symbol, timeframe, start_time_, end_time_);
    }

} // namespace data
