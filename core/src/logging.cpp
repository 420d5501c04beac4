#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

namespace core {
namespace logging {

    static std::shared_ptr<spdlog::logger> global_logger;

    namespace {

        const char* kLoggerName = "EquityTrader";
        const char* kUtcPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";
        const char* kLogDirectory = "logs";
        constexpr size_t kMaxLogFileBytes = 10 * 1024 * 1024;
        constexpr size_t kMaxLogFiles = 5;

        const std::vector<std::pair<const char*, spdlog::level::level_enum>> kLevelNames = {
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"warning", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"err", spdlog::level::err},
            {"critical", spdlog::level::critical},
            {"crit", spdlog::level::critical},
            {"off", spdlog::level::off}
        };

        // SPDLOG_LEVEL wins over whatever the config asked for
        std::optional<spdlog::level::level_enum> levelFromEnvironment() {
            const char* env_level = std::getenv("SPDLOG_LEVEL");
            if (!env_level) {
                return std::nullopt;
            }
            std::cout << "[Logging] SPDLOG_LEVEL overrides log level: " << env_level << std::endl;
            return level_from_string(env_level);
        }

        // Falls back to the working directory when the log directory cannot be created
        std::filesystem::path prepareLogDirectory() {
            std::filesystem::path dir(kLogDirectory);
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                std::cerr << "[Logging] Cannot create log directory '" << dir.string() << "': " << ec.message() << std::endl;
                return std::filesystem::path(".");
            }
            return dir;
        }

        // <dir>/<base>_YYYYmmdd_HHMMSSZ.log
        std::filesystem::path timestampedLogPath(const std::filesystem::path& dir, const std::string& base_name) {
            const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm{};
            gmtime_r(&now, &utc_tm);
            char stamp[32];
            std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%SZ", &utc_tm);
            return dir / fmt::format("{}_{}.log", base_name, stamp);
        }

        template <typename Sink, typename... Args>
        spdlog::sink_ptr makeSink(spdlog::level::level_enum level, Args&&... args) {
            auto sink = std::make_shared<Sink>(std::forward<Args>(args)...);
            sink->set_level(level);
            sink->set_pattern(kUtcPattern);
            return sink;
        }

        void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
            if (global_logger) {
                spdlog::drop(global_logger->name());
            }
            global_logger = std::move(logger);
            spdlog::register_logger(global_logger);
            spdlog::set_default_logger(global_logger);
            global_logger->set_level(level);
            spdlog::flush_on(spdlog::level::err);
        }

    } // end anonymous namespace

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level)
    {
        if (auto overridden = levelFromEnvironment()) {
            console_level = *overridden;
            file_level = *overridden;
        }

        const std::filesystem::path log_path = timestampedLogPath(prepareLogDirectory(), base_log_filename);
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(makeSink<spdlog::sinks::stdout_color_sink_mt>(console_level));
        try {
            sinks.push_back(makeSink<spdlog::sinks::rotating_file_sink_mt>(
                file_level, log_path.string(), kMaxLogFileBytes, kMaxLogFiles, true));
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "[Logging] File logging disabled, cannot open '" << log_path.string() << "': " << ex.what() << std::endl;
        }

        install(std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end()),
                std::min(console_level, file_level));

        #ifdef NDEBUG
            const char* build_type = "Release";
        #else
            const char* build_type = "Debug";
        #endif
        getLogger()->info("Logging initialized ({} build). Console: {}, file: {} -> {}",
                          build_type,
                          spdlog::level::to_string_view(console_level),
                          spdlog::level::to_string_view(file_level),
                          sinks.size() > 1 ? log_path.string() : std::string("disabled"));
    }

    void initializeConsoleOnly(spdlog::level::level_enum level) {
        install(std::make_shared<spdlog::logger>(kLoggerName, makeSink<spdlog::sinks::stdout_color_sink_mt>(level)), level);
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
            throw std::runtime_error("Logger accessed before initialization. Call core::logging::initialize() first.");
        }
        return global_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string lower = level_str;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
        auto found = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                                  [&lower](const auto& entry) { return lower == entry.first; });
        if (found != kLevelNames.end()) {
            return found->second;
        }
        std::cerr << "[Logging] Unrecognized log level '" << level_str << "', using 'info'." << std::endl;
        return spdlog::level::info;
    }

} // namespace logging
} // namespace core
