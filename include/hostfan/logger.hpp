/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace hostfan {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Receives each formatted line instead of stderr. Called under the logger's
// lock, so a sink must not log.
using LogSink = std::function<void(LogLevel, const std::string& line)>;

class Logger {
public:
    static void setSink(LogSink sink);
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool parseLevel(const std::string& text, LogLevel& out) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
std::string getThreadName(int worker_id);

}

#define LOG_ERROR(msg) ::hostfan::Logger::error(msg)
#define LOG_WARN(msg)  ::hostfan::Logger::warn(msg)
#define LOG_INFO(msg)  ::hostfan::Logger::info(msg)
#define LOG_DEBUG(msg) ::hostfan::Logger::debug(msg)
#define LOG_TRACE(msg) ::hostfan::Logger::trace(msg)
