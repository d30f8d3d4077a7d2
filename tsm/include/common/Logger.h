#pragma once

#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>

#define TSM_LOGGER_PRIVATE_NS __detail
#define TSM_PRIVATE_CALL(func) TSM_LOGGER_PRIVATE_NS::func

namespace TSM {

namespace TSM_LOGGER_PRIVATE_NS {
void doFormatAndLog(spdlog::level::level_enum level, const std::string &message, const std::source_location &loc);
void doInitializeLogger(const std::string &logDir, bool logToFile);
void doSetLevel(spdlog::level::level_enum level);
std::string extractCleanFunctionName(const std::source_location &loc);
void ensureLoggerInitialized();
}  // namespace TSM_LOGGER_PRIVATE_NS

/**
 * @brief Process-wide logging facade over spdlog
 *
 * The logger is created lazily on first use with a colored console sink.
 * The initial level comes from the SPDLOG_LEVEL environment variable
 * (default: info). Every message is prefixed with the calling function.
 */
class Logger {
public:
    /**
     * @brief Initialize with an additional file sink
     * @param logDir Directory receiving tsm.log (created when missing)
     * @param logToFile Attach the file sink
     */
    static void initialize(const std::string &logDir, bool logToFile = true) {
        TSM_PRIVATE_CALL(doInitializeLogger)(logDir, logToFile);
    }

    /**
     * @brief Override the level chosen at initialization (command line -v / -q)
     */
    static void setLevel(spdlog::level::level_enum level) {
        TSM_PRIVATE_CALL(doSetLevel)(level);
    }

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        TSM_PRIVATE_CALL(doFormatAndLog)(spdlog::level::trace, message, loc);
    }

    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        TSM_PRIVATE_CALL(doFormatAndLog)(spdlog::level::debug, message, loc);
    }

    static void info(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        TSM_PRIVATE_CALL(doFormatAndLog)(spdlog::level::info, message, loc);
    }

    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        TSM_PRIVATE_CALL(doFormatAndLog)(spdlog::level::warn, message, loc);
    }

    static void error(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        TSM_PRIVATE_CALL(doFormatAndLog)(spdlog::level::err, message, loc);
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;

    friend void TSM_LOGGER_PRIVATE_NS::ensureLoggerInitialized();
    friend void TSM_LOGGER_PRIVATE_NS::doFormatAndLog(spdlog::level::level_enum level, const std::string &message,
                                                      const std::source_location &loc);
    friend void TSM_LOGGER_PRIVATE_NS::doInitializeLogger(const std::string &logDir, bool logToFile);
    friend void TSM_LOGGER_PRIVATE_NS::doSetLevel(spdlog::level::level_enum level);
};

}  // namespace TSM

#define LOG_TRACE(...) TSM::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) TSM::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) TSM::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) TSM::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) TSM::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
