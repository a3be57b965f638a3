#include "process_runner.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <fstream>
#include <optional>
#include <fmt/format.h>

namespace {

/**
 * @brief Owns a file descriptor and closes it on destruction.
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }
    ~FileDescriptor() { reset(); }

    int get() const { return fd_; }
    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

bool makePipe(FileDescriptor& readEnd, FileDescriptor& writeEnd) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        return false;
    }
    readEnd = FileDescriptor(fds[0]);
    writeEnd = FileDescriptor(fds[1]);
    return true;
}

// Runs in the forked child only.
[[noreturn]] void execChild(const ProcessRequest& request, int stdoutFd, int stderrFd, int errorFd) {
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
        ::dup2(devNull, STDIN_FILENO);
    }
    ::dup2(stdoutFd, STDOUT_FILENO);
    ::dup2(stderrFd, STDERR_FILENO);

    for (const auto& [name, value] : request.env) {
        ::setenv(name.c_str(), value.c_str(), 1);
    }

    std::vector<char*> argv;
    argv.reserve(request.args.size() + 2);
    argv.push_back(const_cast<char*>(request.program.c_str()));
    for (const auto& arg : request.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    ::execvp(request.program.c_str(), argv.data());

    int err = errno;
    [[maybe_unused]] auto written = ::write(errorFd, &err, sizeof(err));
    ::_exit(127);
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

/**
 * @brief Waits for the child until the deadline passes.
 *
 * @return The exit code, or std::nullopt if the child is still running at the deadline.
 */
std::optional<int> waitForChildUntil(pid_t pid, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        int status = 0;
        pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped < 0 && errno != EINTR) {
            return -1;
        }
        if (reaped == pid) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return -1;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }
        ::poll(nullptr, 0, static_cast<int>(std::min<long long>(remaining.count(), 20)));
    }
}

BackupError timeoutError(const ProcessRequest& request) {
    return BackupError::database(fmt::format(
        "{} did not finish within {} ms and was killed", request.program, request.timeout.count()));
}

} // namespace

Result<ProcessResult> PosixProcessRunner::run(const ProcessRequest& request) {
    FileDescriptor outRead, outWrite, errRead, errWrite, execRead, execWrite;
    if (!makePipe(outRead, outWrite) || !makePipe(errRead, errWrite) || !makePipe(execRead, execWrite)) {
        return std::unexpected(BackupError::io("create pipe", std::error_code(errno, std::generic_category())));
    }

    std::ofstream stdoutSink;
    if (request.stdoutFile) {
        stdoutSink.open(*request.stdoutFile, std::ios::binary | std::ios::trunc);
        if (!stdoutSink.is_open()) {
            return std::unexpected(BackupError::io(fmt::format("Failed to open output file: {}", request.stdoutFile->string())));
        }
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(BackupError::database(
            fmt::format("Failed to execute {}: {}", request.program, std::strerror(errno))));
    }
    if (pid == 0) {
        execChild(request, outWrite.get(), errWrite.get(), execWrite.get());
    }

    outWrite.reset();
    errWrite.reset();
    execWrite.reset();

    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execRead.get(), &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        waitForChild(pid);
        return std::unexpected(BackupError::database(
            fmt::format("Failed to execute {}: {}", request.program, std::strerror(execErrno))));
    }

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + request.timeout;
    bool writeFailed = false;
    char buf[8192];

    pollfd fds[2] = {{outRead.get(), POLLIN, 0}, {errRead.get(), POLLIN, 0}};
    int openStreams = 2;
    while (openStreams > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            ::kill(pid, SIGKILL);
            waitForChild(pid);
            if (request.stdoutFile) {
                stdoutSink.close();
            }
            return std::unexpected(timeoutError(request));
        }

        int ready = ::poll(fds, 2, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::kill(pid, SIGKILL);
            waitForChild(pid);
            return std::unexpected(BackupError::io("poll", std::error_code(errno, std::generic_category())));
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t count = ::read(fds[i].fd, buf, sizeof(buf));
            if (count < 0 && errno == EINTR) {
                continue;
            }
            if (count <= 0) {
                fds[i].fd = -1;
                --openStreams;
                continue;
            }
            if (i == 1) {
                result.stderrText.append(buf, static_cast<std::size_t>(count));
            } else if (request.stdoutFile) {
                stdoutSink.write(buf, count);
                writeFailed = writeFailed || !stdoutSink;
            } else {
                result.stdoutText.append(buf, static_cast<std::size_t>(count));
            }
        }
    }

    // The child may close both streams and keep running.
    auto exitCode = waitForChildUntil(pid, deadline);
    if (!exitCode) {
        ::kill(pid, SIGKILL);
        waitForChild(pid);
        if (request.stdoutFile) {
            stdoutSink.close();
        }
        return std::unexpected(timeoutError(request));
    }
    result.exitCode = *exitCode;

    if (request.stdoutFile) {
        stdoutSink.close();
        if (writeFailed || stdoutSink.fail()) {
            return std::unexpected(BackupError::io(fmt::format("Failed to write output file: {}", request.stdoutFile->string())));
        }
    }
    return result;
}

std::string describeCommand(const ProcessRequest& request) {
    std::string line = request.program;
    for (const auto& arg : request.args) {
        line += ' ';
        if (arg.starts_with("--password=")) {
            line += "--password=****";
        } else {
            line += arg;
        }
    }
    return line;
}
