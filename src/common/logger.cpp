// =============================================================================
// logq - Logger Module Implementation
// =============================================================================

#include "logq/common/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace logq::log {

namespace {

// =============================================================================
// Global State
// =============================================================================

/// @brief Global logger instance pointer.
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Flag indicating if the logger has been initialized.
std::atomic<bool> gInitialized{false};

/// @brief Mutex for initialization synchronization.
std::mutex gInitMutex;

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void initLocked(const Config& config) {
    if (gInitialized.load(std::memory_order_acquire)) {
        return;
    }

    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole) {
        auto consoleSink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
        sinks.push_back(consoleSink);
    }

    if (!config.logFile.empty()) {
        auto fileSink = quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile,
            []() {
                quill::FileSinkConfig fileSinkConfig;
                fileSinkConfig.set_open_mode('w');
                return fileSinkConfig;
            }(),
            quill::FileEventNotifier{});
        sinks.push_back(fileSink);
    }

    quill::Logger* loggerPtr = nullptr;
    if (!sinks.empty()) {
        loggerPtr = quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    } else {
        // No sinks configured: fall back to the console
        auto consoleSink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
        loggerPtr = quill::Frontend::create_or_get_logger(config.loggerName, std::move(consoleSink));
    }

    loggerPtr->set_log_level(toQuillLevel(config.level));

    gLogger.store(loggerPtr, std::memory_order_release);
    gInitialized.store(true, std::memory_order_release);
}

}  // namespace

// =============================================================================
// Level Conversion Implementation
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
        default:
            return quill::LogLevel::Info;
    }
}

Level levelFromString(std::string_view levelStr) noexcept {
    const std::string lower = toLower(levelStr);

    if (lower == "trace") {
        return Level::kTrace;
    }
    if (lower == "debug") {
        return Level::kDebug;
    }
    if (lower == "info") {
        return Level::kInfo;
    }
    if (lower == "warning" || lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "error") {
        return Level::kError;
    }
    if (lower == "critical" || lower == "fatal") {
        return Level::kCritical;
    }

    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
        case Level::kCritical:
            return "critical";
        default:
            return "info";
    }
}

// =============================================================================
// Logger Initialization Implementation
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    initLocked(config);
}

// =============================================================================
// Logger Access Implementation
// =============================================================================

quill::Logger* logger() {
    quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
    if (loggerPtr != nullptr) {
        return loggerPtr;
    }

    // Lazily bring up a console logger for callers that never ran init()
    std::lock_guard<std::mutex> lock(gInitMutex);
    Config defaults;
    defaults.level = Level::kWarning;
    initLocked(defaults);
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return gInitialized.load(std::memory_order_acquire);
}

void flush() {
    if (isInitialized()) {
        quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
        if (loggerPtr != nullptr) {
            loggerPtr->flush_log();
        }
    }
}

void shutdown() {
    if (isInitialized()) {
        flush();

        quill::Backend::stop();

        gLogger.store(nullptr, std::memory_order_release);
        gInitialized.store(false, std::memory_order_release);
    }
}

}  // namespace logq::log
