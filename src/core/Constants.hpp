#pragma once

#include <cstddef>

/**
 * @brief Constants shared by the git front end
 *
 * Centralizes separators and resource limits so the argument builders and
 * the parsers agree on them.
 */
namespace havc {

namespace Constants {
    // Framing tokens for --pretty=format output; chosen to be absent from real commit text
    constexpr const char* RECORD_SEPARATOR = "\xC2\xB1\xC2\xB1\xC2\xB1\xC2\xB1";  // ±±±± in UTF-8
    constexpr const char* FIELD_SEPARATOR = "\xC2\xA7\xC2\xA7\xC2\xA7\xC2\xA7";   // §§§§ in UTF-8

    // Full log: hash, short, author name, author email, timestamp, subject, body(+status)
    constexpr size_t FULL_LOG_FIELDS = 7;
    // Lightweight log: hash, parents, iso date, subject
    constexpr size_t LIGHTWEIGHT_LOG_FIELDS = 4;

    // Log limits
    constexpr int DEFAULT_MAX_COMMITS = 500;

    // Process limits
    constexpr int DEFAULT_TIMEOUT_MS = 30000;
    constexpr size_t DEFAULT_MAX_OUTPUT_BYTES = 10 * 1024 * 1024;

    constexpr const char* DEFAULT_GIT_BINARY = "git";
    constexpr const char* DEFAULT_BRANCH = "master";
}
}
