#include "switchyard/utils/logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace switchyard {
namespace utils {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warn};

std::mutex& sinkMutex() {
    static std::mutex mutex;
    return mutex;
}

LogSink& currentSink() {
    static LogSink sink;
    return sink;
}

} // namespace

void setLogLevel(LogLevel level) {
    g_level.store(level);
}

LogLevel getLogLevel() {
    return g_level.load();
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    currentSink() = std::move(sink);
}

bool isLogEnabled(LogLevel level) {
    const LogLevel threshold = g_level.load();
    return threshold != LogLevel::Off && level >= threshold;
}

void writeLog(LogLevel level, const std::string& message) {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(sinkMutex());
        if (!currentSink()) {
            std::clog << "[" << toString(level) << "] " << message << std::endl;
            return;
        }
        sink = currentSink();
    }
    // Called unlocked so a sink may log or replace itself
    sink(level, message);
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warn:     return "WARN";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> logLevelFromString(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return std::nullopt;
}

} // namespace utils
} // namespace switchyard
