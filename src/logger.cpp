#include "logger.h"
#include "utils.h"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace viva {

namespace {

thread_local std::string t_session;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

/// "[LEVEL] 10:15:02.123 {session}: message"
std::string format_line(LogLevel level, const std::string& message, bool with_time) {
    std::string line = "[" + std::string(level_tag(level)) + "]";
    if (with_time) line += " " + timestamp();
    if (!t_session.empty()) line += " {" + t_session + "}";
    return line + ": " + message;
}

std::ostream& console_for(LogLevel level) {
    return level >= LogLevel::WARN ? std::cerr : std::cout;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string n = utils::normalize_copy(utils::trim_copy(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file) : min_level_(min_level) {
        if (output_file.empty()) return;
        file_.open(output_file, std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "Warning: cannot open log file " << output_file << ", logging to console only" << std::endl;
        }
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) return;

        std::string line = format_line(level, message, true);
        console_for(level) << line << std::endl;
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

private:
    mutable std::mutex mutex_;
    LogLevel min_level_;
    std::ofstream file_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (impl_) {
        impl_->log(level, message);
        return;
    }
    // Before initialize(): console only, no DEBUG
    if (level == LogLevel::DEBUG) return;
    console_for(level) << format_line(level, message, false) << std::endl;
}

void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { log(LogLevel::INFO, message); }
void Logger::warn(const std::string& message) { log(LogLevel::WARN, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }

void Logger::set_level(LogLevel level) {
    if (impl_) impl_->set_level(level);
}

LogLevel Logger::level() {
    return impl_ ? impl_->level() : LogLevel::INFO;
}

void Logger::set_thread_session(const std::string& session_id) {
    t_session = session_id;
}

const std::string& Logger::thread_session() {
    return t_session;
}

} // namespace viva
