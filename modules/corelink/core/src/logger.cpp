#include "logger.h"
#include <mutex>
#include <random>
#include <algorithm>
#include <string>
#include <iostream>
#include <queue>
#include <thread>
#include <memory>
#include <condition_variable>
#include <atomic>
#include <cctype>

namespace p2plink {

/**
 * @brief The session ID for logging.
 */
static std::string g_sessionId = "NO_SESSION";

/**
 * @brief Mutex for protecting the logger.
 */
static std::mutex g_logMutex;

/**
 * @brief Global log level (for conditional logging)
 * Default: INFO (skips DEBUG messages)
 */
static LogLevel g_log_level = LogLevel::INFO;

static std::function<void(const std::string&)> g_log_callback;

/**
 * @brief Global async logging state
 */
static std::atomic<bool> g_async_logging_enabled(false);
static std::queue<std::string> g_log_queue;
static std::mutex g_log_queue_mutex;
static std::condition_variable g_log_queue_cv;
static std::atomic<bool> g_log_thread_running(false);
static std::unique_ptr<std::thread> g_log_thread;

/**
 * @brief Generates a random session ID.
 * @param len The length of the session ID to generate.
 * @return The generated session ID.
 */
std::string generate_session_id(size_t len) {
    static const char alphanum[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    std::string tmp_s;
    tmp_s.reserve(len);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> distrib(0, sizeof(alphanum) - 2);

    for (size_t i = 0; i < len; ++i) {
        tmp_s += alphanum[distrib(gen)];
    }

    return tmp_s;
}

/**
 * @brief Sets the session ID for logging.
 * @param session_id The session ID to set.
 */
void setSessionId(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sessionId = session_id;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

/**
 * @brief Sets the global log level (for conditional logging)
 * @param level The log level to set.
 */
void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_level = level;
}

/**
 * @brief Gets the current global log level
 * @return The current log level.
 */
LogLevel get_log_level() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_log_level;
}

LogLevel log_level_from_string(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none") return LogLevel::NONE;
    return LogLevel::INFO;
}

// Caller must hold g_logMutex.
static void emit_locked(const std::string& line) {
    if (g_log_callback) {
        g_log_callback(line);
    } else {
        std::cerr << line << std::endl;
    }
}

/**
 * @brief Background thread worker for async logging
 */
static void async_log_worker() {
    for (;;) {
        std::unique_lock<std::mutex> lock(g_log_queue_mutex);
        g_log_queue_cv.wait(lock, [&] { return !g_log_queue.empty() || !g_log_thread_running; });

        if (g_log_queue.empty()) {
            // Stopped and fully drained
            return;
        }

        auto msg = std::move(g_log_queue.front());
        g_log_queue.pop();
        lock.unlock();

        std::lock_guard<std::mutex> out_lock(g_logMutex);
        emit_locked(msg);
    }
}

/**
 * @brief Enables async logging (non-blocking)
 */
void enable_async_logging() {
    if (g_async_logging_enabled) return;

    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_thread_running = true;
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
    g_async_logging_enabled = true;
}

/**
 * @brief Disables async logging and flushes remaining messages
 */
void disable_async_logging() {
    if (!g_async_logging_enabled) return;

    g_async_logging_enabled = false;
    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        g_log_thread_running = false;
    }
    g_log_queue_cv.notify_all();

    if (g_log_thread && g_log_thread->joinable()) {
        g_log_thread->join();
    }
    g_log_thread.reset();
}

/**
 * @brief Check if async logging is enabled
 */
bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

/**
 * @brief Logs a message to stderr (or the registered callback).
 * @param message The message to log.
 */
void nativeLog(const std::string& message) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        session_id = g_sessionId;
    }
    std::string log_message = "[" + session_id + "] " + message;

    if (is_async_logging_enabled()) {
        {
            std::lock_guard<std::mutex> lock(g_log_queue_mutex);
            g_log_queue.push(std::move(log_message));
        }
        g_log_queue_cv.notify_one();
    } else {
        std::lock_guard<std::mutex> lock(g_logMutex);
        emit_locked(log_message);
    }
}

} // namespace p2plink
