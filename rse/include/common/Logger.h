// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2026 The RSE Authors
//
// This file is part of RSE (Rule Step Engine).

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace RSE {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * 1. Default mode: spdlog backend writing to stderr (stdout is reserved for
 *    the JSON produced by the rule-debugger tool)
 * 2. Custom mode: hosts inject their own ILoggerBackend implementation
 *
 * Thread-safe: backend installation is guarded, logging goes through the
 * backend which is itself synchronized.
 *
 * @code
 * RSE::Logger::initialize();
 * LOG_INFO("Debugging rule with {} lines", lineCount);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     *
     * @param backend User's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stderr, no file)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     *
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace RSE

// fmt (shipped with spdlog) provides the formatting; the macros capture the
// caller's source_location so every record carries its function name.
#define LOG_TRACE(...) RSE::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) RSE::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) RSE::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) RSE::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) RSE::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
