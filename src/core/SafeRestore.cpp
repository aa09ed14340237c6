#include "core/SafeRestore.hpp"

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace havc {

const char* restoreStateName(RestoreState state) {
    switch (state) {
        case RestoreState::Attempting: return "attempting";
        case RestoreState::Committed: return "committed";
        case RestoreState::RolledBack: return "rolled-back";
        case RestoreState::Corrupted: return "corrupted";
    }
    return "unknown";
}

RestoreTransaction::RestoreTransaction(IFileStore& store, fs::path target)
    : store_(store), target_(std::move(target)) {}

Expected<void> RestoreTransaction::captureBackup() {
    auto current = store_.read(target_);
    if (current) {
        backup_ = std::move(current.value());
        hasBackup_ = true;
        return {};
    }
    if (current.error().code == ErrorCode::NotFound) {
        hasBackup_ = false;
        return {};
    }
    return current.error();
}

Expected<void> RestoreTransaction::commit(const std::string& bytes) {
    auto dir = store_.ensureParentDirectory(target_);
    if (!dir) return dir.error();
    auto written = store_.write(target_, bytes);
    if (!written) return written.error();
    state_ = RestoreState::Committed;
    return {};
}

Error RestoreTransaction::abort(const Error& cause) {
    auto& log = Logger::instance();
    log.error("Restore failed for " + target_.string() + ": " + cause.message);

    if (!hasBackup_) {
        return cause;
    }

    auto rewritten = store_.write(target_, backup_);
    if (rewritten) {
        state_ = RestoreState::RolledBack;
        log.warn("Restored backup after failed restore: " + target_.string());
        Error err = cause;
        err.code = ErrorCode::RestoreRolledBack;
        err.message = "Restore of " + target_.string() + " rolled back, file unchanged: " + cause.message;
        return err;
    }

    state_ = RestoreState::Corrupted;
    log.critical("Restore failed AND could not restore backup for " + target_.string()
        + "; file may be partially written or missing: " + rewritten.error().message);
    Error err = cause;
    err.code = ErrorCode::RestoreFailed;
    err.message = "Restore of " + target_.string() + " failed and rollback failed (" + rewritten.error().message
        + "); file may be partially written or missing. Original failure: " + cause.message;
    return err;
}

SafeRestore::SafeRestore(GitClient git, std::shared_ptr<IFileStore> store)
    : git_(std::move(git)), store_(std::move(store)) {}

std::future<Expected<void>> SafeRestore::restoreAsync(std::string revision, std::string path) const {
    return std::async(std::launch::async, [git = git_, store = store_, revision = std::move(revision),
                                           path = std::move(path)] {
        SafeRestore worker(git, store);
        return worker.restore(revision, path);
    });
}

Expected<void> SafeRestore::restore(const std::string& revision, const std::string& path) {
    lastState_ = RestoreState::Attempting;
    if (revision.empty()) return Error{ErrorCode::InvalidArgs, "restore: missing revision"};
    if (path.empty()) return Error{ErrorCode::InvalidArgs, "restore: missing path"};
    if (!store_) return Error{ErrorCode::InternalError, "restore: no file store"};

    fs::path rel = fs::path(path).lexically_normal();
    if (rel.is_absolute() || rel.empty() || rel == "." || *rel.begin() == "..") {
        return Error{ErrorCode::InvalidArgs, "restore: path must stay inside the repository: " + path};
    }

    RestoreTransaction tx(*store_, git_.config().root / rel);
    auto backup = tx.captureBackup();
    if (!backup) return backup.error();

    // git wants forward slashes in <rev>:<path>
    auto blob = git_.showFileAtCommit(revision, rel.generic_string());
    if (!blob) {
        Error err = tx.abort(blob.error());
        lastState_ = tx.state();
        return err;
    }

    auto written = tx.commit(blob.value());
    lastState_ = tx.state();
    if (!written) {
        Error err = tx.abort(written.error());
        lastState_ = tx.state();
        return err;
    }

    Logger::instance().debug("Restored " + rel.generic_string() + " to " + revision);
    return {};
}

}
