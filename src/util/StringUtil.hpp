#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace havc {

namespace strings {

/// Strip leading and trailing ASCII whitespace
std::string trim(const std::string& s);

/// Split on every occurrence of a multi-byte separator. Always returns at least one element.
std::vector<std::string> split(const std::string& s, const std::string& separator);

/**
 * @brief Split on a separator, stopping after maxParts - 1 cuts
 *
 * The last element holds the unsplit remainder, so a separator that shows
 * up inside the final field stays part of it.
 */
std::vector<std::string> splitN(const std::string& s, const std::string& separator, size_t maxParts);

/// Split on '\n'; a trailing '\r' on each line is kept
std::vector<std::string> splitLines(const std::string& s);

/// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> splitWhitespace(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

bool startsWith(const std::string& s, const std::string& prefix);

/// UTC "YYYY-MM-DDTHH:MM:SS.000Z"
std::string formatIso8601(std::chrono::system_clock::time_point tp);

}

}
