/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef IGAK_CORE_LOGGER_H
#define IGAK_CORE_LOGGER_H

/**
 * @file Logger.h
 * @brief Logging infrastructure for the assembly kernels
 *
 * Thread-safe logger with severity levels, console/file output, custom
 * handlers and RAII timing. Worker threads of the assembly pool log through
 * the same instance.
 */

#include "Types.h"
#include "Config.h"
#include <chrono>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace igak {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
    DEBUG    = 0,
    INFO     = 1,
    WARNING  = 2,
    ERROR    = 3,
    CRITICAL = 4,
    OFF      = 5
};

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default:                 return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name (case-insensitive); returns false if unknown
 */
bool parse_log_level(const std::string& text, LogLevel& level);

// ============================================================================
// Timer
// ============================================================================

/**
 * @brief Wall-clock stopwatch used for assembly timings
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    void start() {
        start_time_ = Clock::now();
        is_running_ = true;
    }

    void stop() {
        if (is_running_) {
            end_time_ = Clock::now();
            is_running_ = false;
        }
    }

    /// Elapsed seconds; a running timer reports time up to now
    double elapsed() const {
        const TimePoint end = is_running_ ? Clock::now() : end_time_;
        return std::chrono::duration<double>(end - start_time_).count();
    }

private:
    TimePoint start_time_{};
    TimePoint end_time_{};
    bool is_running_ = false;
};

// ============================================================================
// Log Message
// ============================================================================

struct LogMessage {
    LogLevel level;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * @brief Process-wide logger
 *
 * Configured from the environment at static-initialization time:
 * IGAK_LOG_LEVEL, IGAK_LOG_FILE, IGAK_LOG_CONSOLE, IGAK_LOG_SHOW_TIME.
 */
class Logger {
public:
    using LogHandler = std::function<void(const LogMessage&)>;

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void set_level(LogLevel level);
    LogLevel get_level() const;

    void set_console_output(bool enabled);

    /**
     * @brief Append log output to a file; an empty name closes the file
     */
    void set_file_output(const std::string& filename);

    void set_show_timestamp(bool show);

    /**
     * @brief Whether a message at this level would be emitted
     */
    bool enabled(LogLevel level) const;

    void log(LogLevel level,
             const std::string& message,
             const char* file = "",
             int line = 0,
             const char* function = "");

    void log_timed(LogLevel level,
                   const std::string& message,
                   double elapsed_seconds);

    void add_handler(LogHandler handler);

    /// Drop all custom handlers
    void clear_handlers();

    void flush();

private:
    Logger();
    ~Logger();

    std::string format_message(const LogMessage& msg) const;

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool console_output_;
    bool show_timestamp_;
    std::ofstream file_stream_;
    std::vector<LogHandler> handlers_;
};

// ============================================================================
// Scoped Timer
// ============================================================================

/**
 * @brief Logs "Starting"/"Completed" around a scope with the elapsed time
 */
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name, LogLevel level = LogLevel::INFO);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double elapsed() const { return timer_.elapsed(); }

private:
    std::string name_;
    LogLevel level_;
    Timer timer_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define IGAK_LOG(level, message) \
    igak::Logger::instance().log(level, message, __FILE__, __LINE__, __FUNCTION__)

#if IGAK_DEBUG_MODE
    #define IGAK_LOG_DEBUG(message) IGAK_LOG(igak::LogLevel::DEBUG, message)
#else
    #define IGAK_LOG_DEBUG(message) ((void)0)
#endif

#define IGAK_LOG_INFO(message) IGAK_LOG(igak::LogLevel::INFO, message)
#define IGAK_LOG_WARNING(message) IGAK_LOG(igak::LogLevel::WARNING, message)
#define IGAK_LOG_ERROR(message) IGAK_LOG(igak::LogLevel::ERROR, message)
#define IGAK_LOG_CRITICAL(message) IGAK_LOG(igak::LogLevel::CRITICAL, message)

#define IGAK_TIMED_SCOPE_CONCAT_(a, b) a##b
#define IGAK_TIMED_SCOPE_NAME_(line) IGAK_TIMED_SCOPE_CONCAT_(igak_scoped_timer_, line)

#define IGAK_TIMED_SCOPE(name) \
    igak::ScopedTimer IGAK_TIMED_SCOPE_NAME_(__LINE__)(name)

#define IGAK_TIMED_SCOPE_LEVEL(name, level) \
    igak::ScopedTimer IGAK_TIMED_SCOPE_NAME_(__LINE__)(name, level)

// ============================================================================
// Stream-based Logging
// ============================================================================

class LogStream {
public:
    explicit LogStream(LogLevel level) : level_(level) {}

    ~LogStream() {
        Logger::instance().log(level_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::ostringstream stream_;
};

#define IGAK_INFO()    igak::LogStream(igak::LogLevel::INFO)

} // namespace igak

#endif // IGAK_CORE_LOGGER_H
