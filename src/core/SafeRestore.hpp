#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <string>

#include "core/FileStore.hpp"
#include "core/GitClient.hpp"
#include "util/Expected.hpp"

namespace havc {

/**
 * @brief States of a single-file restore
 *
 *   Attempting --write ok---------------> Committed
 *   Attempting --fetch/write failed, backup rewritten--> RolledBack
 *   Attempting --fetch/write failed, backup rewrite failed--> Corrupted
 *
 * A failure with no backup (the file did not exist) leaves the state at
 * Attempting and the original error is returned as is.
 */
enum class RestoreState { Attempting, Committed, RolledBack, Corrupted };

const char* restoreStateName(RestoreState state);

/**
 * @brief Non-atomic replace of one file with backup and rollback
 *
 * Usage:
 *   RestoreTransaction tx(store, target);
 *   if (auto b = tx.captureBackup(); !b) return b.error();
 *   auto w = tx.commit(bytes);
 *   if (!w) return tx.abort(w.error());
 *
 * Not thread-safe; concurrent restores of one path must be serialized by
 * the caller.
 */
class RestoreTransaction {
public:
    RestoreTransaction(IFileStore& store, std::filesystem::path target);

    /**
     * @brief Remember the target's current bytes
     *
     * A missing target is not an error: there is simply nothing to roll
     * back to. Any other read failure is returned and nothing is written.
     */
    Expected<void> captureBackup();

    /// Create parent directories and overwrite the target; Committed on success
    Expected<void> commit(const std::string& bytes);

    /**
     * @brief Undo after a failed fetch or write
     * @param cause The failure that stopped the restore
     * @return RestoreRolledBack, RestoreFailed, or `cause` when there was no backup
     */
    Error abort(const Error& cause);

    RestoreState state() const { return state_; }
    bool hasBackup() const { return hasBackup_; }
    const std::filesystem::path& target() const { return target_; }

private:
    IFileStore& store_;
    std::filesystem::path target_;
    std::string backup_;
    bool hasBackup_{false};
    RestoreState state_{RestoreState::Attempting};
};

/**
 * @brief Restores a working-tree file to its content at a revision
 *
 * Fetches the blob with `git show <rev>:<path>` and writes it through an
 * IFileStore instead of running `git checkout`, which fails on CIFS/SMB
 * mounts that reject atomic replace.
 */
class SafeRestore {
public:
    SafeRestore(GitClient git, std::shared_ptr<IFileStore> store);

    /**
     * @brief Restore `path` (relative to the configured root) to `revision`
     *
     * A target that exists but cannot be read (permissions, I/O error) stops
     * the restore before git runs and its read error is returned. Only a
     * missing target counts as "no backup"; overwriting a file whose bytes
     * were never captured would leave nothing to roll back to.
     *
     * @return Success, the read error of an unreadable target,
     *         the fetch error when no backup existed,
     *         RestoreRolledBack when the old content was put back,
     *         RestoreFailed when even that failed (file state unknown)
     */
    Expected<void> restore(const std::string& revision, const std::string& path);

    /**
     * @brief restore() on a std::async thread
     *
     * The task works on its own copy of the client and shares the file
     * store, so this object may be destroyed before the future is ready.
     * lastState() is not updated by async restores.
     */
    std::future<Expected<void>> restoreAsync(std::string revision, std::string path) const;

    /// State reached by the most recent restore() call
    RestoreState lastState() const { return lastState_; }

private:
    GitClient git_;
    std::shared_ptr<IFileStore> store_;
    RestoreState lastState_{RestoreState::Attempting};
};

}
