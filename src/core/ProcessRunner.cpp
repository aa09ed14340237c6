#include "core/ProcessRunner.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "util/StringUtil.hpp"

namespace havc {

namespace {

/// Owns one file descriptor; closes on destruction
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_{-1};
};

bool makePipe(Fd& readEnd, Fd& writeEnd) {
    // Close-on-exec must be set atomically: another thread may fork at any time
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return true;
}

std::string describe(const std::vector<std::string>& argv) {
    return strings::join(argv, " ");
}

void killAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

Error spawnError(const std::vector<std::string>& argv, const std::string& what, int err) {
    return Error{ErrorCode::SpawnFailed, "Cannot run '" + describe(argv) + "': " + what + ": " + std::strerror(err)};
}

}

Expected<ProcessOutput> PosixProcessRunner::run(const std::vector<std::string>& argv,
                                                const std::filesystem::path& cwd,
                                                const RunOptions& options) {
    if (argv.empty()) {
        return Error{ErrorCode::InvalidArgs, "Empty argument vector"};
    }

    Fd outRead, outWrite, errRead, errWrite, execRead, execWrite;
    if (!makePipe(outRead, outWrite) || !makePipe(errRead, errWrite) || !makePipe(execRead, execWrite)) {
        return spawnError(argv, "pipe", errno);
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    const std::string dir = cwd.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        return spawnError(argv, "fork", errno);
    }

    if (pid == 0) {
        int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
        ::dup2(outWrite.get(), STDOUT_FILENO);
        ::dup2(errWrite.get(), STDERR_FILENO);
        int err = 0;
        if (::chdir(dir.c_str()) != 0) {
            err = errno;
        } else {
            ::execvp(cargv[0], cargv.data());
            err = errno;
        }
        // Report why we never reached the program; execWrite is close-on-exec so success sends nothing
        ssize_t ignored = ::write(execWrite.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    outWrite.reset();
    errWrite.reset();
    execWrite.reset();

    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(execRead.get(), &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return spawnError(argv, "exec in " + dir, childErr);
    }

    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::milliseconds(options.timeoutMs);

    ProcessOutput result;
    std::string* sinks[2] = {&result.stdoutText, &result.stderrText};
    Fd* sources[2] = {&outRead, &errRead};
    char buffer[8192];

    while (outRead.valid() || errRead.valid()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remaining <= 0) {
            killAndReap(pid);
            return Error{ErrorCode::Timeout, "'" + describe(argv) + "' timed out after " + std::to_string(options.timeoutMs) + " ms"};
        }

        pollfd fds[2];
        int owners[2];
        nfds_t count = 0;
        for (int i = 0; i < 2; ++i) {
            if (!sources[i]->valid()) continue;
            fds[count].fd = sources[i]->get();
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            owners[count] = i;
            ++count;
        }

        int ready = ::poll(fds, count, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            killAndReap(pid);
            return spawnError(argv, "poll", err);
        }
        if (ready == 0) continue;

        for (nfds_t k = 0; k < count; ++k) {
            if (fds[k].revents == 0) continue;
            int i = owners[k];
            ssize_t got = ::read(sources[i]->get(), buffer, sizeof(buffer));
            if (got < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                sources[i]->reset();
                continue;
            }
            if (got == 0) {
                sources[i]->reset();
                continue;
            }
            sinks[i]->append(buffer, static_cast<size_t>(got));
            if (sinks[i]->size() > options.maxOutputBytes) {
                killAndReap(pid);
                return Error{ErrorCode::OutputTooLarge, "'" + describe(argv) + "' produced more than "
                    + std::to_string(options.maxOutputBytes) + " bytes of output"};
            }
        }
    }

    // Pipes are closed; the child may still be exiting
    int status = 0;
    while (true) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            return spawnError(argv, "waitpid", errno);
        }
        if (Clock::now() >= deadline) {
            killAndReap(pid);
            return Error{ErrorCode::Timeout, "'" + describe(argv) + "' timed out after " + std::to_string(options.timeoutMs) + " ms"};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    if (result.exitCode != 0) {
        Error err{ErrorCode::ExternalToolFailed,
                  "'" + describe(argv) + "' exited with code " + std::to_string(result.exitCode)};
        std::string detail = strings::trim(result.stderrText);
        if (!detail.empty()) err.message += ": " + detail;
        err.exitCode = result.exitCode;
        err.toolStderr = result.stderrText;
        return err;
    }
    return result;
}

}
