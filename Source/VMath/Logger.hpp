#pragma once


// =============================
// VMath - Logger.hpp (C++20, minimal but solid)
// =============================
// Goals
//  - Always-safe to include (no heavy deps, header-only)
//  - printf-style backend (std::vfprintf), format strings checked by the compiler
//  - Zero/low overhead when disabled (compile-time switches)
//  - Simple runtime min-level filter and optional category filter
//  - Thread-safe emission (coarse-grained mutex around a single print)
//  - No dynamic allocations in our code
//
// Non-goals (for now)
//  - Async logging, ring buffers, files, colors, sinks fan-out
//
// Notes
//  - Categories are plain string literals (const char*). Keep them short (e.g., "Math", "Color").
//  - Math code only reaches the logger through VMATH_ASSERT and the VMATH_LOG_* macros.

#include <cstdint>
#include <atomic>
#include <mutex>
#include <string_view>
#include <cstdarg>      // va_list
#include <cstdio>       // std::FILE, stdout/stderr, std::vfprintf
#include <cstdlib>      // std::abort

#include "VMath/Platform/PlatformCompiler.hpp"
#include "VMath/Platform/PlatformMacros.hpp"

#ifndef VMATH_ENABLE_LOGGING
#  define VMATH_ENABLE_LOGGING 1
#endif
#ifndef VMATH_ENABLE_LOG_ASSERT
#  define VMATH_ENABLE_LOG_ASSERT 1
#endif

namespace vmath::core {

    enum class LogLevel : std::uint8_t {
        Disabled = 0,
        Fatal = 1,
        Error = 2,
        Warn = 3,
        Info = 4,
        Verbose = 5,
        // NOTE: higher number == more chatty
        // MinLevel policy: a message is emitted if (level <= MinLevel).
    };

    struct LoggerConfig {
        std::atomic<LogLevel> MinLevel{ LogLevel::Info };
        // If non-null, only messages whose category equals this filter are printed.
        // Keep nullptr to accept all categories.
        // Must stay a stable C-string literal (e.g., "Math").
        std::atomic<const char*> CategoryEqualsFilter{ nullptr };
        // If non-null, every level is written to this stream instead of stdout/stderr.
        std::atomic<std::FILE*> OutputStream{ nullptr };
    };

    class Logger final {
    public:
        static Logger& Get() noexcept {
            static Logger g;
            return g;
        }

        static void SetMinLevel(LogLevel lvl) noexcept { Get().mCfg.MinLevel.store(lvl, std::memory_order_relaxed); }
        static LogLevel GetMinLevel() noexcept { return Get().mCfg.MinLevel.load(std::memory_order_relaxed); }
        static void SetCategoryEqualsFilter(const char* cat) noexcept {
            Get().mCfg.CategoryEqualsFilter.store(cat, std::memory_order_relaxed);
        }
        static void SetOutputStream(std::FILE* stream) noexcept {
            Get().mCfg.OutputStream.store(stream, std::memory_order_relaxed);
        }
        static std::FILE* GetOutputStream() noexcept { return Get().mCfg.OutputStream.load(std::memory_order_relaxed); }

        // Public check to short-circuit expensive logging
        static bool IsEnabled(LogLevel lvl, const char* category) noexcept {
            return ShouldEmit(lvl, category);
        }

        // ----------------------
        // Level-specific helpers
        // ----------------------
        VMATH_PRINTF_FORMAT(2, 3)
        static void Info(const char* category, const char* fmt, ...) noexcept {
            va_list args;
            va_start(args, fmt);
            VPrint(LogLevel::Info, category, stdout, fmt, args);
            va_end(args);
        }
        VMATH_PRINTF_FORMAT(2, 3)
        static void Warn(const char* category, const char* fmt, ...) noexcept {
            va_list args;
            va_start(args, fmt);
            VPrint(LogLevel::Warn, category, stderr, fmt, args);
            va_end(args);
        }
        VMATH_PRINTF_FORMAT(2, 3)
        static void Error(const char* category, const char* fmt, ...) noexcept {
            va_list args;
            va_start(args, fmt);
            VPrint(LogLevel::Error, category, stderr, fmt, args);
            va_end(args);
        }
        [[noreturn]] VMATH_PRINTF_FORMAT(2, 3)
        static void Fatal(const char* category, const char* fmt, ...) noexcept {
            va_list args;
            va_start(args, fmt);
            VPrint(LogLevel::Fatal, category, stderr, fmt, args);
            va_end(args);
            std::fflush(stderr);
            std::abort();
        }
        VMATH_PRINTF_FORMAT(2, 3)
        static void Verbose(const char* category, const char* fmt, ...) noexcept {
            va_list args;
            va_start(args, fmt);
            VPrint(LogLevel::Verbose, category, stdout, fmt, args);
            va_end(args);
        }

        // Generic entry (level chosen by caller).
        VMATH_PRINTF_FORMAT(3, 4)
        static void Log(LogLevel lvl, const char* category, const char* fmt, ...) noexcept {
            std::FILE* stream = (lvl <= LogLevel::Error) ? stderr : stdout;
            va_list args;
            va_start(args, fmt);
            VPrint(lvl, category, stream, fmt, args);
            va_end(args);
        }

    private:
        Logger() = default;

        static bool ShouldEmit(LogLevel lvl, const char* category) noexcept {
            Logger& self = Get();
            if (lvl == LogLevel::Disabled) return false;
            if (lvl > self.mCfg.MinLevel.load(std::memory_order_relaxed)) return false;
            const char* filter = self.mCfg.CategoryEqualsFilter.load(std::memory_order_relaxed);
            if (filter) {
                if (!category) return false; // filter active => category is required
                if (std::string_view(filter) != category) return false;
            }
            return true;
        }

        static void VPrint(LogLevel lvl, const char* category, std::FILE* stream, const char* fmt, va_list args) noexcept {
            if (!ShouldEmit(lvl, category)) return;
            Logger& self = Get();
            if (std::FILE* redirected = self.mCfg.OutputStream.load(std::memory_order_relaxed)) {
                stream = redirected;
            }
            const char* lvlStr = ToShortLevel(lvl);
            std::scoped_lock lock(self.mMutex);
            if (category) {
                std::fprintf(stream, "[%s][%s] ", lvlStr, category);
            }
            else {
                std::fprintf(stream, "[%s] ", lvlStr);
            }
            std::vfprintf(stream, fmt, args);
            std::fputc('\n', stream);
        }

        static const char* ToShortLevel(LogLevel lvl) noexcept {
            switch (lvl) {
            case LogLevel::Fatal:   return "F";
            case LogLevel::Error:   return "E";
            case LogLevel::Warn:    return "W";
            case LogLevel::Info:    return "I";
            case LogLevel::Verbose: return "V";
            default:                return "-";
            }
        }

    private:
        std::mutex mMutex{};
        LoggerConfig mCfg{};
    };

} // namespace vmath::core

// ----------------------
// Public log macros (single evaluation of Category)
// ----------------------
#if VMATH_ENABLE_LOGGING
#define VMATH_LOG_VERBOSE(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::vmath::core::Logger::IsEnabled(::vmath::core::LogLevel::Verbose, _cat)) { \
            ::vmath::core::Logger::Verbose(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define VMATH_LOG_INFO(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::vmath::core::Logger::IsEnabled(::vmath::core::LogLevel::Info, _cat)) { \
            ::vmath::core::Logger::Info(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define VMATH_LOG_WARNING(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::vmath::core::Logger::IsEnabled(::vmath::core::LogLevel::Warn, _cat)) { \
            ::vmath::core::Logger::Warn(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define VMATH_LOG_ERROR(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::vmath::core::Logger::IsEnabled(::vmath::core::LogLevel::Error, _cat)) { \
            ::vmath::core::Logger::Error(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define VMATH_LOG_FATAL(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        ::vmath::core::Logger::Fatal(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
    } while (0)
#else
#define VMATH_LOG_VERBOSE(Category, Fmt, ...)  ((void)0)
#define VMATH_LOG_INFO(Category, Fmt, ...)     ((void)0)
#define VMATH_LOG_WARNING(Category, Fmt, ...)  ((void)0)
#define VMATH_LOG_ERROR(Category, Fmt, ...)    ((void)0)
#define VMATH_LOG_FATAL(Category, Fmt, ...)    ((void)0)
#endif

// ----------------------
// Assert macros
// ----------------------
// Asserts never abort: they report the violated precondition and the caller
// continues with its documented fallback value.
// VMATH_ASSERT reports under VMATH_ASSERT_CATEGORY; subsystems route their own
// preconditions through VMATH_ASSERT_CAT with a category of their choosing.
#ifndef VMATH_ASSERT_CATEGORY
#define VMATH_ASSERT_CATEGORY "Assert"
#endif

#if VMATH_ENABLE_LOG_ASSERT
#include <source_location>

#ifndef VMATH_ASSERT_CAT
#define VMATH_ASSERT_CAT(Category, Expr, Msg) do { \
            if (VMATH_UNLIKELY(!(Expr))) { \
                const auto loc = std::source_location::current(); \
                ::vmath::core::Logger::Error((Category), "%s (%s:%u): %s", \
                    loc.function_name(), loc.file_name(), static_cast<unsigned>(loc.line()), (Msg)); \
            } \
        } while(0)
#endif

#ifndef VMATH_ASSERT
// Argument-counting helper to choose ASSERT_1 or ASSERT_2
#define VMATH_EXPAND(x) x
#define VMATH_GET_MACRO(_1,_2,NAME,...) NAME

// 1-arg form: VMATH_ASSERT(Expr)
#define VMATH_ASSERT_1(Expr) VMATH_ASSERT_CAT(VMATH_ASSERT_CATEGORY, Expr, "assertion failed: " #Expr)

// 2-arg form: VMATH_ASSERT(Expr, Msg)
#define VMATH_ASSERT_2(Expr, Msg) VMATH_ASSERT_CAT(VMATH_ASSERT_CATEGORY, Expr, Msg)

// Dispatcher that supports both 1-arg and 2-arg calls
#define VMATH_ASSERT(...) \
            VMATH_EXPAND(VMATH_GET_MACRO(__VA_ARGS__, VMATH_ASSERT_2, VMATH_ASSERT_1)(__VA_ARGS__))

#endif
#else
#ifndef VMATH_ASSERT_CAT
#define VMATH_ASSERT_CAT(Category, Expr, Msg) ((void)0)
#endif
#ifndef VMATH_ASSERT
#define VMATH_ASSERT(...) ((void)0)
#endif
#endif
