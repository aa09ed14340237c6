#pragma once

#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace havc {

/**
 * @brief Working-tree file access used by the restore engine
 *
 * Strategy interface so restore can be exercised against stores that
 * fail on demand.
 */
class IFileStore {
public:
    virtual ~IFileStore() = default;

    /// Whole file as bytes; ErrorCode::NotFound when the file does not exist
    virtual Expected<std::string> read(const std::filesystem::path& path) = 0;

    /// Replace the file's contents in place
    virtual Expected<void> write(const std::filesystem::path& path, const std::string& bytes) = 0;

    /// Create the parent directory chain of `path` if missing
    virtual Expected<void> ensureParentDirectory(const std::filesystem::path& path) = 0;
};

/**
 * @brief Direct filesystem store for network-mounted working trees
 *
 * Writes truncate and rewrite the target itself. No temp file and no
 * rename: CIFS/SMB mounts reject rename-over-existing with EEXIST, which
 * is what breaks `git checkout` there.
 *
 * Every write is read back and compared by CRC-32 and length; a mismatch
 * is reported as IoError.
 */
class LocalFileStore : public IFileStore {
public:
    Expected<std::string> read(const std::filesystem::path& path) override;
    Expected<void> write(const std::filesystem::path& path, const std::string& bytes) override;
    Expected<void> ensureParentDirectory(const std::filesystem::path& path) override;
};

}
