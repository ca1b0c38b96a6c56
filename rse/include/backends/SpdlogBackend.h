// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2026 The RSE Authors
//
// This file is part of RSE (Rule Step Engine).

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace RSE {

/**
 * @brief spdlog-based logger backend
 *
 * Console output goes to stderr: the rule-debugger tool prints its JSON
 * result on stdout and the two streams must never interleave.
 * An optional file sink writes "rse.log" into the given directory.
 *
 * The SPDLOG_LEVEL environment variable overrides the initial level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum convertLevel(LogLevel level);
    void applyEnvironmentLevel();
};

}  // namespace RSE
