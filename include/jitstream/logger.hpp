/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace jitstream {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

/*
 * Process-wide logger. Lines go to stderr as
 *   [time] [LEVEL] [thread] message
 * so stdout stays free for jitctl's results. The level comes from
 * JITSTREAM_LOG_LEVEL (name or 0-4) unless a tool sets one explicitly.
 */
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    // True when JITSTREAM_LOG_LEVEL held a usable value.
    static bool initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& text) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }
};

void setThreadName(const std::string& name);

// Names the current thread until the scope ends. Keep-alive loops are
// short-lived, so their names must not outlive them.
class ThreadLabel final {
public:
    explicit ThreadLabel(const std::string& name) { setThreadName(name); }
    ~ThreadLabel();

    ThreadLabel(const ThreadLabel&) = delete;
    ThreadLabel& operator=(const ThreadLabel&) = delete;
};

}

#define LOG_ERROR(msg) ::jitstream::Logger::error(msg)
#define LOG_WARN(msg)  ::jitstream::Logger::warn(msg)
#define LOG_INFO(msg)  ::jitstream::Logger::info(msg)
#define LOG_DEBUG(msg) ::jitstream::Logger::debug(msg)
#define LOG_TRACE(msg) ::jitstream::Logger::trace(msg)
