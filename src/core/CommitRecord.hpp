#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace havc {

/// Change applied to the filtered path by one commit (from --name-status)
enum class FileStatus { Unknown, Added, Modified, Deleted };

/// 'A', 'M', 'D' or '?' for Unknown
char fileStatusCode(FileStatus status);

/// Maps 'A', 'M', 'D' to their status; anything else is Unknown
FileStatus fileStatusFromCode(char code);

/**
 * @brief One commit from the full log
 *
 * Produced from:
 *   <R>%H<F>%h<F>%an<F>%ae<F>%at<F>%s<F>%b
 * followed, when the log was filtered to one path, by a name-status line
 * such as "M\tconfiguration.yaml".
 */
struct CommitRecord {
    std::string hash;              // Full hex hash
    std::string shortHash;         // Abbreviated hash as git chose it
    std::string authorName;
    std::string authorEmail;
    std::chrono::system_clock::time_point timestamp{};  // Author time
    std::string subject;           // First line of the message
    std::string body;              // Rest of the message, inner newlines kept
    FileStatus status{FileStatus::Unknown};
};

/**
 * @brief One commit from the graph-oriented log
 *
 * Parents are kept in git's order: the first entry is the first parent,
 * which downstream ancestry walks rely on.
 */
struct LightweightCommitRecord {
    std::string hash;
    std::vector<std::string> parents;   // Empty for a root commit, 2+ for a merge
    std::string date;                   // %aI, kept verbatim
    std::string subject;

    bool isRoot() const { return parents.empty(); }
    bool isMerge() const { return parents.size() > 1; }
};

/**
 * @brief Ordered result of one log request
 *
 * Records are kept in the order git emitted them (newest first).
 * Immutable once built.
 */
template <typename Record>
class History {
public:
    History() = default;
    explicit History(std::vector<Record> records) : records_(std::move(records)) {}

    const std::vector<Record>& all() const { return records_; }

    /// First (newest) record, or nullptr when the history is empty
    const Record* latest() const { return records_.empty() ? nullptr : &records_.front(); }

    size_t total() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    std::vector<Record> records_;
};

}
