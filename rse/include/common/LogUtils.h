#pragma once

#include <string>

namespace RSE {
namespace Log {

/**
 * @brief Sanitize rule text for safe logging
 *
 * Rule sources and log_message() payloads are user text. Control characters
 * are rewritten so a single log record always stays on one line:
 * - '\n' → "\\n"
 * - '\r' → "\\r"
 * - '\t' → "\\t"
 * - Other control chars → '?'
 * - Everything else (including UTF-8 continuation bytes) → preserved
 *
 * @param input Raw string that may contain control characters
 * @return Sanitized string safe for logging
 */
inline std::string sanitize(const std::string &input) {
    std::string sanitized;
    sanitized.reserve(input.length());

    for (char c : input) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '\n') {
            sanitized += "\\n";
        } else if (c == '\r') {
            sanitized += "\\r";
        } else if (c == '\t') {
            sanitized += "\\t";
        } else if (uc < 32 || uc == 127) {
            sanitized += '?';
        } else {
            sanitized += c;
        }
    }

    return sanitized;
}

/**
 * @brief Shorten long text for single-line log previews
 */
inline std::string preview(const std::string &input, size_t maxLength = 80) {
    std::string clean = sanitize(input);
    if (clean.length() <= maxLength) {
        return clean;
    }
    return clean.substr(0, maxLength) + "...";
}

}  // namespace Log
}  // namespace RSE
