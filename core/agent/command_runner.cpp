#include "command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <thread>

#include "logging/logger.hpp"

namespace hostlink {
namespace agent {

namespace {

constexpr int kExitCodeExecFailed = 127;
constexpr int kSignalExitBase = 128;
constexpr int kDrainAfterKillMs = 500;
constexpr int64_t kReapPollMs = 10;
constexpr size_t kReadChunk = 4096;

// Closes the descriptor on scope exit
class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard &) = delete;
    FdGuard &operator=(const FdGuard &) = delete;

    int get() const { return fd_; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

struct Stream {
    FdGuard fd;
    std::string *buffer = nullptr;
    bool open = true;
};

// Read what is available; returns false on EOF or error
bool drain_once(Stream &stream, size_t limit, bool &truncated) {
    char chunk[kReadChunk];
    ssize_t n = ::read(stream.fd.get(), chunk, sizeof(chunk));
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    if (n <= 0) {
        return false;
    }
    const size_t room = stream.buffer->size() < limit ? limit - stream.buffer->size() : 0;
    const size_t take = std::min(room, static_cast<size_t>(n));
    stream.buffer->append(chunk, take);
    if (take < static_cast<size_t>(n)) {
        truncated = true;
    }
    return true;
}

int64_t ms_until(std::chrono::steady_clock::time_point deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())
        .count();
}

}  // namespace

nlohmann::json CommandResult::to_json() const {
    nlohmann::json j = {{"exitCode", exit_code}, {"stdout", stdout_text}, {"stderr", stderr_text}};
    if (timed_out) {
        j["timedOut"] = true;
    }
    if (truncated) {
        j["truncated"] = true;
    }
    return j;
}

CommandRunner::CommandRunner(const runtime::ExecConfig &config) : config_(config) {}

CommandResult CommandRunner::run(const std::string &command, const std::optional<std::string> &cwd,
                                 std::optional<int64_t> timeout_ms) const {
    if (cwd && !std::filesystem::is_directory(*cwd)) {
        throw std::runtime_error("Cannot run in '" + *cwd + "': No such directory");
    }

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (::pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        throw std::runtime_error(std::string("Failed to create stdout pipe: ") + std::strerror(errno));
    }
    FdGuard stdout_read(stdout_pipe[0]);
    FdGuard stdout_write(stdout_pipe[1]);
    if (::pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        throw std::runtime_error(std::string("Failed to create stderr pipe: ") + std::strerror(errno));
    }
    FdGuard stderr_read(stderr_pipe[0]);
    FdGuard stderr_write(stderr_pipe[1]);

    // Everything the child touches is prepared before fork
    const char *shell = config_.shell.c_str();
    const char *cwd_str = cwd ? cwd->c_str() : nullptr;

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("Fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        if (cwd_str != nullptr && ::chdir(cwd_str) != 0) {
            _exit(kExitCodeExecFailed);
        }
        ::execl(shell, shell, "-c", command.c_str(), static_cast<char *>(nullptr));
        _exit(kExitCodeExecFailed);
    }

    // Parent
    ::setpgid(pid, pid);
    stdout_write.reset();
    stderr_write.reset();

    CommandResult result;
    Stream streams[2];
    streams[0].fd.reset(stdout_read.release());
    streams[0].buffer = &result.stdout_text;
    streams[1].fd.reset(stderr_read.release());
    streams[1].buffer = &result.stderr_text;

    const int64_t timeout = timeout_ms.value_or(config_.default_timeout_ms);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout);
    bool killed = false;

    while (streams[0].open || streams[1].open) {
        int64_t wait_ms = ms_until(deadline);
        if (wait_ms <= 0) {
            if (killed) {
                LOG_WARN("[Exec] Output still open after kill, abandoning pipes");
                break;
            }
            LOG_WARN("[Exec] Command timed out after " << timeout << "ms, killing process group " << pid);
            ::kill(-pid, SIGKILL);
            killed = true;
            result.timed_out = true;
            deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kDrainAfterKillMs);
            continue;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        int index_of[2];
        for (int i = 0; i < 2; ++i) {
            if (streams[i].open) {
                fds[count].fd = streams[i].fd.get();
                fds[count].events = POLLIN;
                fds[count].revents = 0;
                index_of[count] = i;
                ++count;
            }
        }

        int ready = ::poll(fds, count, static_cast<int>(wait_ms));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[Exec] poll failed: " << std::strerror(errno));
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            Stream &stream = streams[index_of[i]];
            if (!drain_once(stream, config_.max_output_bytes, result.truncated)) {
                stream.open = false;
            }
        }
    }

    // Output can close long before the process exits, so the deadline still applies here
    int status = 0;
    bool reaped = false;
    while (!killed) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            reaped = true;
            break;
        }
        if (done < 0 && errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
        int64_t wait_ms = ms_until(deadline);
        if (wait_ms <= 0) {
            LOG_WARN("[Exec] Command timed out after " << timeout << "ms, killing process group " << pid);
            ::kill(-pid, SIGKILL);
            killed = true;
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min<int64_t>(wait_ms, kReapPollMs)));
    }
    while (!reaped && ::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (result.timed_out) {
        result.exit_code = kExitCodeTimedOut;
        if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') {
            result.stderr_text += "\n";
        }
        result.stderr_text += "Command timed out after " + std::to_string(timeout) + "ms";
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = kSignalExitBase + WTERMSIG(status);
    } else {
        result.exit_code = 1;
    }

    LOG_DEBUG("[Exec] '" << command << "' exited with " << result.exit_code);
    return result;
}

}  // namespace agent
}  // namespace hostlink
