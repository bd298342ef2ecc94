#ifndef SWITCHYARD_UTILS_LOGGING_HPP
#define SWITCHYARD_UTILS_LOGGING_HPP

#include <functional>
#include <optional>
#include <sstream>
#include <string>

namespace switchyard {
namespace utils {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Receives every record that passes the level filter.
using LogSink = std::function<void(LogLevel, const std::string&)>;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

/**
 * @brief Replace the destination of log records.
 *
 * Passing an empty function restores the default sink, which writes
 * "[LEVEL] message" lines to std::clog.
 */
void setLogSink(LogSink sink);

bool isLogEnabled(LogLevel level);
void writeLog(LogLevel level, const std::string& message);

const char* toString(LogLevel level);

/// Parse a lower-case level name ("debug" ... "critical", "off").
std::optional<LogLevel> logLevelFromString(const std::string& name);

} // namespace utils
} // namespace switchyard

// The message argument is any streamable expression, e.g.
//   SWLOG_INFO("registered '" << key << "'");
#define SWLOG(level, message) \
    do { \
        if (::switchyard::utils::isLogEnabled(level)) { \
            std::ostringstream swlog_stream_; \
            swlog_stream_ << message; \
            ::switchyard::utils::writeLog(level, swlog_stream_.str()); \
        } \
    } while (false)

#define SWLOG_DEBUG(message)    SWLOG(::switchyard::utils::LogLevel::Debug, message)
#define SWLOG_INFO(message)     SWLOG(::switchyard::utils::LogLevel::Info, message)
#define SWLOG_WARN(message)     SWLOG(::switchyard::utils::LogLevel::Warn, message)
#define SWLOG_ERROR(message)    SWLOG(::switchyard::utils::LogLevel::Error, message)
#define SWLOG_CRITICAL(message) SWLOG(::switchyard::utils::LogLevel::Critical, message)

#endif // SWITCHYARD_UTILS_LOGGING_HPP
