#ifndef P2PLINK_LOGGER_H
#define P2PLINK_LOGGER_H

#include <string>
#include <functional>

namespace p2plink {

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Phase transitions and command summaries
    WARNING = 2,   // Problems only
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

// Prefix attached to every log line (one id per pairing session)
void setSessionId(const std::string& session_id);
std::string generate_session_id(size_t len);

void nativeLog(const std::string& message);

// Set a callback for log messages (desktop CLI and tests).
// Pass an empty function to restore stderr output.
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// "debug"|"info"|"warn"|"warning"|"error"|"none"; unknown values map to INFO
LogLevel log_level_from_string(const std::string& value);

// Async logging: messages go to a queue drained by a background thread.
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

} // namespace p2plink

#define LOG_DEBUG(msg) if (::p2plink::get_log_level() <= ::p2plink::LogLevel::DEBUG) ::p2plink::nativeLog(msg)
#define LOG_INFO(msg)  if (::p2plink::get_log_level() <= ::p2plink::LogLevel::INFO) ::p2plink::nativeLog(msg)
#define LOG_WARN(msg)  if (::p2plink::get_log_level() <= ::p2plink::LogLevel::WARNING) ::p2plink::nativeLog(msg)
#define LOG_ERROR(msg) if (::p2plink::get_log_level() <= ::p2plink::LogLevel::ERROR) ::p2plink::nativeLog(msg)

#endif // P2PLINK_LOGGER_H
