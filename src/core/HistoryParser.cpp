#include "core/HistoryParser.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>

#include "util/StringUtil.hpp"

namespace havc {

char fileStatusCode(FileStatus status) {
    switch (status) {
        case FileStatus::Added: return 'A';
        case FileStatus::Modified: return 'M';
        case FileStatus::Deleted: return 'D';
        case FileStatus::Unknown: break;
    }
    return '?';
}

FileStatus fileStatusFromCode(char code) {
    switch (code) {
        case 'A': return FileStatus::Added;
        case 'M': return FileStatus::Modified;
        case 'D': return FileStatus::Deleted;
        default: return FileStatus::Unknown;
    }
}

namespace {

/// Record fragments with separator-only or whitespace-only pieces removed
std::vector<std::string> splitRecords(const std::string& raw) {
    std::vector<std::string> records;
    for (auto& fragment : strings::split(raw, Constants::RECORD_SEPARATOR)) {
        if (strings::trim(fragment).empty()) continue;
        records.push_back(std::move(fragment));
    }
    return records;
}

/// Field i trimmed, or "" when the record was short
std::string field(const std::vector<std::string>& parts, size_t i) {
    return i < parts.size() ? strings::trim(parts[i]) : std::string();
}

std::chrono::system_clock::time_point parseEpochSeconds(const std::string& text) {
    int64_t seconds = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, seconds);
    if (ec != std::errc() || ptr != last) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::time_point{std::chrono::seconds(seconds)};
}

/// "A", "M" or "D" followed by at least one whitespace character
bool isStatusLine(const std::string& line) {
    if (line.size() < 2) return false;
    if (line[0] != 'A' && line[0] != 'M' && line[0] != 'D') return false;
    return std::isspace(static_cast<unsigned char>(line[1])) != 0;
}

}

namespace HistoryParser {

std::vector<std::string> fullLogArgs(const LogOptions& options) {
    const std::string F = Constants::FIELD_SEPARATOR;
    std::vector<std::string> args{
        "log",
        "--max-count=" + std::to_string(options.maxCount),
        "--date=iso",
        std::string("--pretty=format:") + Constants::RECORD_SEPARATOR
            + "%H" + F + "%h" + F + "%an" + F + "%ae" + F + "%at" + F + "%s" + F + "%b",
    };
    if (!options.file.empty()) {
        args.emplace_back("--name-status");
        args.emplace_back("--");
        args.push_back(options.file);
    }
    return args;
}

std::vector<std::string> lightweightLogArgs() {
    const std::string F = Constants::FIELD_SEPARATOR;
    return {
        "log",
        "--pretty=format:%H" + F + "%P" + F + "%aI" + F + "%s" + Constants::RECORD_SEPARATOR,
        "--date-order",
    };
}

FileStatus extractStatus(const std::string& blob, std::string& body) {
    std::string trimmed = strings::trim(blob);
    std::vector<std::string> lines = strings::splitLines(trimmed);
    const std::string& lastLine = lines.back();
    if (!isStatusLine(lastLine)) {
        body = trimmed;
        return FileStatus::Unknown;
    }
    FileStatus status = fileStatusFromCode(lastLine[0]);
    lines.pop_back();
    body = strings::trim(strings::join(lines, "\n"));
    return status;
}

History<CommitRecord> parseFullLog(const std::string& raw, bool fileFiltered) {
    if (strings::trim(raw).empty()) return History<CommitRecord>{};

    std::vector<CommitRecord> commits;
    for (const auto& fragment : splitRecords(raw)) {
        auto parts = strings::splitN(fragment, Constants::FIELD_SEPARATOR, Constants::FULL_LOG_FIELDS);

        CommitRecord c;
        c.hash = field(parts, 0);
        c.shortHash = field(parts, 1);
        c.authorName = field(parts, 2);
        c.authorEmail = field(parts, 3);
        c.timestamp = parseEpochSeconds(field(parts, 4));
        c.subject = field(parts, 5);

        std::string blob = parts.size() > 6 ? parts[6] : std::string();
        if (fileFiltered) {
            c.status = extractStatus(blob, c.body);
        } else {
            c.body = strings::trim(blob);
        }
        commits.push_back(std::move(c));
    }
    return History<CommitRecord>(std::move(commits));
}

History<LightweightCommitRecord> parseLightweightLog(const std::string& raw) {
    if (strings::trim(raw).empty()) return History<LightweightCommitRecord>{};

    std::vector<LightweightCommitRecord> commits;
    for (const auto& fragment : splitRecords(raw)) {
        auto parts = strings::splitN(fragment, Constants::FIELD_SEPARATOR, Constants::LIGHTWEIGHT_LOG_FIELDS);

        LightweightCommitRecord c;
        c.hash = field(parts, 0);
        c.parents = strings::splitWhitespace(field(parts, 1));
        c.date = field(parts, 2);
        c.subject = field(parts, 3);
        commits.push_back(std::move(c));
    }
    return History<LightweightCommitRecord>(std::move(commits));
}

}

}
