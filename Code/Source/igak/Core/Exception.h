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

#ifndef IGAK_CORE_EXCEPTION_H
#define IGAK_CORE_EXCEPTION_H

/**
 * @file Exception.h
 * @brief Exception hierarchy for the assembly kernels
 *
 * All errors raised by the library derive from igak::Exception and carry a
 * Status code, the throwing source location and, in debug builds, a
 * demangled stack trace.
 */

#include "Types.h"
#include "Config.h"
#include <cstdlib>
#include <exception>
#include <sstream>
#include <string>
#include <vector>

#if defined(__GNUC__) && !defined(_WIN32)
#include <execinfo.h>
#include <cxxabi.h>
#endif

namespace igak {

// ============================================================================
// Base Exception Class
// ============================================================================

/**
 * @brief Base exception class for all library exceptions
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message,
                       Status status = Status::Unknown)
        : message_(message),
          status_(status),
          line_(0) {
        capture_context();
        build_what();
    }

    Exception(const std::string& message,
              const char* file,
              int line,
              const char* function = "",
              Status status = Status::Unknown)
        : message_(message),
          status_(status),
          file_(file),
          line_(line),
          function_(function) {
        capture_context();
        build_what();
    }

    Exception(const Exception&) = default;

    ~Exception() noexcept override = default;

    const char* what() const noexcept override {
        return what_.c_str();
    }

    Status status() const noexcept { return status_; }

    /// Message without location and trace decoration
    const std::string& message() const noexcept { return message_; }

    const std::string& file() const noexcept { return file_; }

    int line() const noexcept { return line_; }

    const std::string& function() const noexcept { return function_; }

    const std::vector<std::string>& stack_trace() const noexcept {
        return stack_trace_;
    }

    /**
     * @brief Prepend context, e.g. the form or chunk that was running
     */
    void add_context(const std::string& context) {
        message_ = context + "\n  -> " + message_;
        build_what();
    }

protected:
    std::string message_;
    Status status_;
    std::string file_;
    int line_;
    std::string function_;
    std::vector<std::string> stack_trace_;
    std::string what_;

    void capture_context() {
        #if IGAK_DEBUG_MODE
        capture_stack_trace();
        #endif
    }

    void capture_stack_trace() {
        #if defined(__GNUC__) && !defined(_WIN32)
        constexpr int MAX_FRAMES = 32;
        void* frames[MAX_FRAMES];
        const int n_frames = backtrace(frames, MAX_FRAMES);

        char** symbols = backtrace_symbols(frames, n_frames);
        if (symbols == nullptr) {
            return;
        }
        for (int i = 1; i < n_frames; ++i) {
            std::string symbol(symbols[i]);

            const std::size_t open = symbol.find('(');
            const std::size_t plus = symbol.find('+', open);
            if (open != std::string::npos && plus != std::string::npos) {
                const std::string mangled = symbol.substr(open + 1, plus - open - 1);
                int rc = 0;
                char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &rc);
                if (rc == 0 && demangled != nullptr) {
                    symbol.replace(open + 1, plus - open - 1, demangled);
                }
                std::free(demangled);
            }
            stack_trace_.push_back(std::move(symbol));
        }
        std::free(symbols);
        #endif
    }

    void build_what() {
        std::ostringstream oss;
        oss << "[igak] " << status_to_string(status_) << "\n";

        if (!file_.empty()) {
            oss << "  Location: " << file_ << ":" << line_;
            if (!function_.empty()) {
                oss << " in " << function_ << "()";
            }
            oss << "\n";
        }

        oss << "  Message: " << message_ << "\n";

        #if IGAK_DEBUG_MODE
        if (!stack_trace_.empty()) {
            oss << "  Stack trace:\n";
            for (std::size_t i = 0; i < stack_trace_.size() && i < 10; ++i) {
                oss << "    #" << i << " " << stack_trace_[i] << "\n";
            }
        }
        #endif

        what_ = oss.str();
    }
};

// ============================================================================
// Specific Exception Types
// ============================================================================

class InvalidArgumentException : public Exception {
public:
    InvalidArgumentException(const std::string& message,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : Exception(message, file, line, function, Status::InvalidArgument) {}
};

/**
 * @brief Operand ranks or lengths disagree while building an expression
 */
class ShapeMismatchException : public Exception {
public:
    ShapeMismatchException(const std::string& message,
                           const char* file = "",
                           int line = 0,
                           const char* function = "")
        : Exception(message, file, line, function, Status::ShapeMismatch) {}
};

/**
 * @brief Geometry dimension does not match the compiled kernel dimension
 */
class InvalidDimensionException : public Exception {
public:
    InvalidDimensionException(const std::string& message,
                              const char* file = "",
                              int line = 0,
                              const char* function = "")
        : Exception(message, file, line, function, Status::InvalidDimension) {}
};

/**
 * @brief A dof, component or multi-index lies outside its valid range
 */
class IndexOutOfRangeException : public Exception {
public:
    IndexOutOfRangeException(const std::string& message,
                             std::size_t index,
                             std::size_t bound,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : Exception(build_message(message, index, bound), file, line, function,
                    Status::IndexOutOfRange),
          index_(index),
          bound_(bound) {}

    std::size_t index() const noexcept { return index_; }
    std::size_t bound() const noexcept { return bound_; }

private:
    std::size_t index_;
    std::size_t bound_;

    static std::string build_message(const std::string& msg,
                                     std::size_t index, std::size_t bound) {
        return msg + " (index " + std::to_string(index) +
               " not in [0, " + std::to_string(bound) + "))";
    }
};

class AssemblyException : public Exception {
public:
    AssemblyException(const std::string& message,
                      const char* file = "",
                      int line = 0,
                      const char* function = "")
        : Exception(message, file, line, function, Status::AssemblyError) {}
};

class NotImplementedException : public Exception {
public:
    NotImplementedException(const std::string& feature,
                            const char* file = "",
                            int line = 0,
                            const char* function = "")
        : Exception("Feature not implemented: " + feature, file, line, function,
                    Status::NotImplemented) {}
};

// ============================================================================
// Exception Throwing Macros
// ============================================================================

#define IGAK_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__, __FUNCTION__)

#define IGAK_THROW_IF_3(condition, ExceptionType, message) \
    do { \
        if (IGAK_UNLIKELY(condition)) { \
            IGAK_THROW(ExceptionType, message); \
        } \
    } while (0)

#define IGAK_THROW_IF_2(condition, message) \
    do { \
        if (IGAK_UNLIKELY(condition)) { \
            IGAK_THROW(igak::Exception, message); \
        } \
    } while (0)

#define IGAK_THROW_IF_SELECT(_1, _2, _3, NAME, ...) NAME

/**
 * @brief Conditional throw
 *
 * Two arguments (condition, message) throw igak::Exception; three arguments
 * (condition, ExceptionType, message) throw the given type.
 */
#define IGAK_THROW_IF(...) \
    IGAK_THROW_IF_SELECT(__VA_ARGS__, IGAK_THROW_IF_3, IGAK_THROW_IF_2)(__VA_ARGS__)

#define IGAK_CHECK_ARG(condition, message) \
    IGAK_THROW_IF(!(condition), igak::InvalidArgumentException, message)

#define IGAK_CHECK_NOT_NULL(ptr, name) \
    IGAK_THROW_IF((ptr) == nullptr, igak::InvalidArgumentException, \
                  std::string(name) + " is null")

/**
 * @brief Check an unsigned index against its bound
 */
#define IGAK_CHECK_INDEX(index, size, what_msg) \
    do { \
        if (IGAK_UNLIKELY(static_cast<std::size_t>(index) >= static_cast<std::size_t>(size))) { \
            throw igak::IndexOutOfRangeException(what_msg, \
                                                 static_cast<std::size_t>(index), \
                                                 static_cast<std::size_t>(size), \
                                                 __FILE__, __LINE__, __FUNCTION__); \
        } \
    } while (0)

#define IGAK_NOT_IMPLEMENTED(feature) \
    IGAK_THROW(igak::NotImplementedException, feature)

} // namespace igak

#endif // IGAK_CORE_EXCEPTION_H
