#pragma once

#include <string>
#include <memory>

namespace viva {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/// Parse "debug" / "info" / "warn" / "error" (case-insensitive); unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Process-wide logger shared by all interview sessions
 *
 * Lines go to the console and, if configured, to a log file. Each thread may
 * carry a session tag (see ScopedLogSession) that is printed with every line
 * it writes, so interleaved output from parallel interviews stays readable.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel level();

    /// Tag attached to lines logged from the calling thread (empty = none).
    static void set_thread_session(const std::string& session_id);
    static const std::string& thread_session();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

/// Tags the current thread's log lines with a session id for its lifetime.
class ScopedLogSession {
public:
    explicit ScopedLogSession(const std::string& session_id)
        : previous_(Logger::thread_session()) {
        Logger::set_thread_session(session_id);
    }
    ~ScopedLogSession() { Logger::set_thread_session(previous_); }

    ScopedLogSession(const ScopedLogSession&) = delete;
    ScopedLogSession& operator=(const ScopedLogSession&) = delete;

private:
    std::string previous_;
};

} // namespace viva

#define LOG_DEBUG(msg) viva::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) viva::Logger::info(msg)
#define LOG_WARN(msg) viva::Logger::warn(msg)
#define LOG_ERROR(msg) viva::Logger::error(msg)

// Component tags
#define LOG_SESSION(msg) viva::Logger::info(std::string("[Session] ") + (msg))
#define LOG_PLAN(msg) viva::Logger::info(std::string("[Plan] ") + (msg))
#define LOG_BUDGET(msg) viva::Logger::info(std::string("[Budget] ") + (msg))
#define LOG_DECISION(msg) viva::Logger::info(std::string("[Decision] ") + (msg))
#define LOG_SCORER(msg) viva::Logger::info(std::string("[Scorer] ") + (msg))
#define LOG_TIMER(msg) viva::Logger::debug(std::string("[Timer] ") + (msg))
#define LOG_AUDIO(msg) viva::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_VAD(msg) viva::Logger::debug(std::string("[VAD] ") + (msg))
#define LOG_STT(msg) viva::Logger::info(std::string("[STT] ") + (msg))
#define LOG_TTS(msg) viva::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_TRACE(session_id, stage, data) viva::Logger::info(std::string("[trace] session_id=") + (session_id) + " stage=" + (stage) + " " + (data))
