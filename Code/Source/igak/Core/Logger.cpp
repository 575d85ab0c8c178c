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

/**
 * @file Logger.cpp
 * @brief Logger implementation and environment-driven initialization
 */

#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace igak {

namespace {

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool env_flag(const char* value) {
    std::string text(value);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text != "false" && text != "0" && text != "off";
}

} // anonymous namespace

bool parse_log_level(const std::string& text, LogLevel& level) {
    const std::string name = to_upper(text);
    if (name == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (name == "INFO") {
        level = LogLevel::INFO;
    } else if (name == "WARNING" || name == "WARN") {
        level = LogLevel::WARNING;
    } else if (name == "ERROR") {
        level = LogLevel::ERROR;
    } else if (name == "CRITICAL" || name == "CRIT") {
        level = LogLevel::CRITICAL;
    } else if (name == "OFF") {
        level = LogLevel::OFF;
    } else {
        return false;
    }
    return true;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger()
    : min_level_(LogLevel::INFO),
      console_output_(true),
      show_timestamp_(true) {}

Logger::~Logger() {
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_output_ = enabled;
}

void Logger::set_file_output(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    if (filename.empty()) {
        return;
    }
    file_stream_.open(filename, std::ios::app);
    if (!file_stream_.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
    }
}

void Logger::set_show_timestamp(bool show) {
    std::lock_guard<std::mutex> lock(mutex_);
    show_timestamp_ = show;
}

bool Logger::enabled(LogLevel level) const {
    #if !IGAK_DEBUG_MODE
    if (level == LogLevel::DEBUG) return false;
    #endif
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::OFF && level >= min_level_;
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const char* file,
                 int line,
                 const char* function) {
    if (!enabled(level)) {
        return;
    }

    LogMessage msg;
    msg.level = level;
    msg.message = message;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    msg.timestamp = std::chrono::system_clock::now();
    msg.thread_id = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string formatted = format_message(msg);

    if (console_output_) {
        if (level >= LogLevel::WARNING) {
            std::cerr << formatted << std::flush;
        } else {
            std::cout << formatted << std::flush;
        }
    }

    if (file_stream_.is_open()) {
        file_stream_ << formatted << std::flush;
    }

    for (const auto& handler : handlers_) {
        handler(msg);
    }
}

void Logger::log_timed(LogLevel level,
                       const std::string& message,
                       double elapsed_seconds) {
    std::ostringstream oss;
    oss << message << " (elapsed: " << std::fixed << std::setprecision(3)
        << elapsed_seconds << "s)";
    log(level, oss.str());
}

void Logger::add_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void Logger::clear_handlers() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
}

std::string Logger::format_message(const LogMessage& msg) const {
    std::ostringstream oss;

    if (show_timestamp_) {
        const std::time_t t = std::chrono::system_clock::to_time_t(msg.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            msg.timestamp.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&t, &local);
        oss << "[" << std::put_time(&local, "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    oss << "[" << log_level_to_string(msg.level) << "] " << msg.message;

    #if IGAK_DEBUG_MODE
    if (msg.level >= LogLevel::WARNING && !msg.file.empty()) {
        oss << " (" << msg.file << ":" << msg.line;
        if (!msg.function.empty()) {
            oss << " in " << msg.function << "()";
        }
        oss << ")";
    }
    #endif

    oss << "\n";
    return oss.str();
}

// ============================================================================
// ScopedTimer
// ============================================================================

ScopedTimer::ScopedTimer(std::string name, LogLevel level)
    : name_(std::move(name)), level_(level) {
    timer_.start();
    Logger::instance().log(level_, "Starting: " + name_);
}

ScopedTimer::~ScopedTimer() {
    timer_.stop();
    Logger::instance().log_timed(level_, "Completed: " + name_, timer_.elapsed());
}

// ============================================================================
// Environment Initialization
// ============================================================================

namespace {

class LoggerInitializer {
public:
    LoggerInitializer() {
        auto& logger = Logger::instance();

        if (const char* env_level = std::getenv("IGAK_LOG_LEVEL")) {
            LogLevel level = LogLevel::INFO;
            if (parse_log_level(env_level, level)) {
                logger.set_level(level);
            }
        }

        if (const char* env_file = std::getenv("IGAK_LOG_FILE")) {
            logger.set_file_output(env_file);
        }

        if (const char* env_console = std::getenv("IGAK_LOG_CONSOLE")) {
            logger.set_console_output(env_flag(env_console));
        }

        if (const char* env_time = std::getenv("IGAK_LOG_SHOW_TIME")) {
            logger.set_show_timestamp(env_flag(env_time));
        }
    }
};

static LoggerInitializer logger_init;

} // anonymous namespace

} // namespace igak
