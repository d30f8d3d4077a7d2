#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace TSM {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace TSM_LOGGER_PRIVATE_NS {

namespace {

constexpr const char *LOGGER_NAME = "TSM";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

// SPDLOG_LEVEL overrides the default level; unknown values fall back to info
spdlog::level::level_enum levelFromEnvironment() {
    const char *envLevel = std::getenv("SPDLOG_LEVEL");
    if (!envLevel) {
        return spdlog::level::info;
    }

    std::string levelStr(envLevel);
    std::transform(levelStr.begin(), levelStr.end(), levelStr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (levelStr == "trace") {
        return spdlog::level::trace;
    } else if (levelStr == "debug") {
        return spdlog::level::debug;
    } else if (levelStr == "warn" || levelStr == "warning") {
        return spdlog::level::warn;
    } else if (levelStr == "err" || levelStr == "error") {
        return spdlog::level::err;
    } else if (levelStr == "critical") {
        return spdlog::level::critical;
    } else if (levelStr == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

void ensureLoggerInitialized() {
    if (!Logger::logger_) {
        doInitializeLogger("", false);
    }
}

std::string extractCleanFunctionName(const std::source_location &loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    // Skip the return type: the qualified name starts after the last top-level space
    size_t nameStart = 0;
    int angleDepth = 0;
    for (size_t i = 0; i < parenPos; i++) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (c == ' ' && angleDepth == 0) {
            nameStart = i + 1;
        }
    }

    std::string result;
    angleDepth = 0;
    for (size_t i = nameStart; i < parenPos; i++) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (angleDepth == 0 && c != '*' && c != '&') {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

void doFormatAndLog(spdlog::level::level_enum level, const std::string &message, const std::source_location &loc) {
    ensureLoggerInitialized();
    if (Logger::logger_ && Logger::logger_->should_log(level)) {
        Logger::logger_->log(level, extractCleanFunctionName(loc) + "() - " + message);
    }
}

void doInitializeLogger(const std::string &logDir, bool logToFile) {
    if (Logger::logger_) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(consoleSink);

    bool fileSinkFailed = false;
    if (logToFile && !logDir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(logDir, ec);
        if (ec) {
            fileSinkFailed = true;
        } else {
            std::filesystem::path logPath = std::filesystem::path(logDir) / "tsm.log";

            auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
            fileSink->set_pattern(FILE_PATTERN);
            sinks.push_back(fileSink);
        }
    }

    Logger::logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    Logger::logger_->set_level(levelFromEnvironment());

    if (fileSinkFailed) {
        Logger::logger_->warn("Logger: Cannot create log directory '{}', logging to console only", logDir);
    }
}

void doSetLevel(spdlog::level::level_enum level) {
    ensureLoggerInitialized();
    Logger::logger_->set_level(level);
}

}  // namespace TSM_LOGGER_PRIVATE_NS

}  // namespace TSM
