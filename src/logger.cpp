/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace jitstream {

namespace {
constexpr LogLevel kDefaultLevel = LogLevel::INFO;

// Function-local so detached keep-alive threads can still log during exit.
struct LogState {
    std::atomic<int> level{-1};   // -1 until first use
    std::mutex mutex;
    std::unordered_map<std::thread::id, std::string> names;
};

LogState& state() {
    static LogState* instance = new LogState();
    return *instance;
}

const char* levelTag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "?????";
    }
}

std::optional<LogLevel> envLevel() noexcept {
    const char* value = std::getenv("JITSTREAM_LOG_LEVEL");
    if (value == nullptr) {
        return std::nullopt;
    }
    return Logger::parseLevel(value);
}

std::string threadLabel(LogState& s) {
    auto it = s.names.find(std::this_thread::get_id());
    if (it != s.names.end()) {
        return it->second;
    }
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "T%04zx",
                  std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xffff);
    return buffer;
}
}

void Logger::setLevel(LogLevel level) noexcept {
    state().level.store(static_cast<int>(level));
}

bool Logger::initFromEnv() noexcept {
    auto level = envLevel();
    state().level.store(static_cast<int>(level.value_or(kDefaultLevel)));
    return level.has_value();
}

LogLevel Logger::level() noexcept {
    int current = state().level.load();
    if (current < 0) {
        initFromEnv();
        current = state().level.load();
    }
    return static_cast<LogLevel>(current);
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (!enabled(level)) {
        return;
    }
    try {
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

        LogState& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        std::fprintf(stderr, "[%s.%03lld] [%s] [%s] %s\n", stamp, static_cast<long long>(ms), levelTag(level),
                     threadLabel(s).c_str(), message.c_str());
        std::fflush(stderr);
    } catch (const std::exception&) {
        // Logging never throws
    }
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) noexcept {
    std::string name(text);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "error" || name == "0") return LogLevel::ERROR;
    if (name == "warn" || name == "warning" || name == "1") return LogLevel::WARN;
    if (name == "info" || name == "2") return LogLevel::INFO;
    if (name == "debug" || name == "3") return LogLevel::DEBUG;
    if (name == "trace" || name == "4") return LogLevel::TRACE;
    return std::nullopt;
}

void setThreadName(const std::string& name) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.names[std::this_thread::get_id()] = name;
}

ThreadLabel::~ThreadLabel() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.names.erase(std::this_thread::get_id());
}

}
