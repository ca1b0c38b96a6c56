// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2026 The RSE Authors
//
// This file is part of RSE (Rule Step Engine).

#pragma once

#include <source_location>
#include <string>

namespace RSE {

/**
 * @brief Log level enumeration
 *
 * Matches common logging frameworks (spdlog, glog, etc.)
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Logger backend interface for dependency injection
 *
 * Hosts embedding the rule debugger (editor plugins, test harnesses) can route
 * engine diagnostics into their own logging system by implementing this
 * interface and passing it to Logger::setBackend().
 *
 * @code
 * class EditorLogger : public RSE::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message,
 *              const std::source_location &loc) override {
 *         panel_->append(level, message, loc.line());
 *     }
 *     void setLevel(LogLevel level) override { panel_->setMinLevel(level); }
 *     void flush() override {}
 * };
 *
 * RSE::Logger::setBackend(std::make_unique<EditorLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Pre-formatted message (function name already included)
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level
     *
     * Messages below this level should be ignored.
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace RSE
