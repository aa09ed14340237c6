#pragma once

#include <string>
#include <vector>

#include "core/CommitRecord.hpp"
#include "core/Constants.hpp"

namespace havc {

struct LogOptions {
    int maxCount{Constants::DEFAULT_MAX_COMMITS};
    std::string file;   // Repo-relative path; empty means the whole history
};

/**
 * @brief Builds git log argument vectors and parses their output
 *
 * All functions are pure: they never start a process and never fail.
 * Malformed records degrade to empty fields because commit text is user
 * controlled and must not break history listing.
 *
 * Known ambiguity in the full log: the body and the name-status line are
 * not separated by a field separator. With a file filter, a body whose
 * last line looks like "M<whitespace>..." is read as a status line. The
 * heuristic is kept as is; callers needing certainty should not filter
 * by file.
 */
namespace HistoryParser {

/// Arguments after "git" for the full log, e.g. {"log", "--max-count=500", ...}
std::vector<std::string> fullLogArgs(const LogOptions& options);

/// Arguments after "git" for the graph-oriented log
std::vector<std::string> lightweightLogArgs();

/**
 * @brief Parse full log output
 * @param raw Output of `git <fullLogArgs()>`
 * @param fileFiltered True when the log was restricted to one path
 */
History<CommitRecord> parseFullLog(const std::string& raw, bool fileFiltered);

/// Parse output of `git <lightweightLogArgs()>`
History<LightweightCommitRecord> parseLightweightLog(const std::string& raw);

/**
 * @brief Split a trailing blob into body and name-status code
 * @param blob Text after the sixth field separator
 * @param[out] body Body with the status line removed, outer-trimmed
 * @return Status from the last line, or Unknown if it is not a status line
 */
FileStatus extractStatus(const std::string& blob, std::string& body);

}

}
