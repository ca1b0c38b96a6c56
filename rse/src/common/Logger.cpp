// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2026 The RSE Authors
//
// This file is part of RSE (Rule Step Engine).

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace RSE {

std::unique_ptr<ILoggerBackend> Logger::backend_;

static std::mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Trace, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Debug, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Info, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Warn, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Error, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    const std::string signature = loc.function_name();

    // Drop template arguments first so spaces inside them do not confuse the scan
    std::string flattened;
    flattened.reserve(signature.size());
    int depth = 0;
    for (char c : signature) {
        if (c == '<') {
            depth++;
        } else if (c == '>') {
            depth--;
        } else if (depth == 0) {
            flattened += c;
        }
    }

    size_t paren = flattened.find('(');
    if (paren == std::string::npos) {
        return "UnknownFunction";
    }

    std::string head = flattened.substr(0, paren);
    while (!head.empty() && std::isspace(static_cast<unsigned char>(head.back()))) {
        head.pop_back();
    }

    // "void RSE::Foo::bar" -> "RSE::Foo::bar"
    size_t space = head.find_last_of(" *&");
    std::string name = (space == std::string::npos) ? head : head.substr(space + 1);

    return name.empty() ? "UnknownFunction" : name;
}

}  // namespace RSE
