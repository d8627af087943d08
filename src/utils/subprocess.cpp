/**
 * @file subprocess.cpp
 * @brief fork/exec based child processes with poll-driven pipe I/O
 *
 * **Spawn Protocol**:
 * ```
 * parent                              child
 *   pipe2(O_CLOEXEC) x4                 dup2 pipes onto 0/1/2
 *   fork ─────────────────────────────► execvp(argv)
 *   read(exec_error pipe)               on failure: write errno, _exit(127)
 *     EOF      → exec succeeded
 *     4 bytes  → exec failed, reap, throw
 * ```
 * The exec-error pipe is close-on-exec, so a successful exec closes it and
 * the parent reads end-of-file.
 *
 * @date 2025
 */

#include "eggshell/utils/subprocess.hpp"
#include "eggshell/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace eggshell {
namespace utils {

namespace {

constexpr std::size_t kReadChunkSize = 64 * 1024;

std::once_flag g_sigpipe_once;

// Writing to a pipe whose reader died must fail with EPIPE, not kill us
void IgnoreSigpipe() {
    std::call_once(g_sigpipe_once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

std::string ErrnoMessage(const std::string& what, int error) {
    return what + ": " + std::strerror(error);
}

void CloseFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int read_end{-1};
    int write_end{-1};

    Pipe() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw core::IoError(ErrnoMessage("failed to create pipe", errno));
        }
        read_end = fds[0];
        write_end = fds[1];
    }

    ~Pipe() {
        CloseFd(read_end);
        CloseFd(write_end);
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int ReleaseRead() noexcept { int fd = read_end; read_end = -1; return fd; }
    int ReleaseWrite() noexcept { int fd = write_end; write_end = -1; return fd; }
};

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Read up to one chunk from fd; returns false on end of file
bool ReadChunk(int fd, std::string& data) {
    std::array<char, kReadChunkSize> buffer;
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            data.assign(buffer.data(), static_cast<std::size_t>(n));
            return true;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            data.clear();
            return true;
        }
        throw core::IoError(ErrnoMessage("failed to read from child process", errno));
    }
}

} // anonymous namespace

// ============================================================================
// SPAWN / DESTROY
// ============================================================================

Subprocess::Subprocess(const std::vector<std::string>& argv, bool pipe_stdin) {
    if (argv.empty()) {
        throw core::IoError("cannot spawn empty command");
    }
    IgnoreSigpipe();
    program_ = argv[0];

    // Everything the child touches is prepared before fork
    std::vector<char*> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    Pipe stdout_pipe;
    Pipe stderr_pipe;
    Pipe exec_error;
    std::optional<Pipe> stdin_pipe;
    if (pipe_stdin) {
        stdin_pipe.emplace();
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        throw core::IoError(ErrnoMessage("fork failed", errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        int stdin_source = stdin_pipe ? stdin_pipe->read_end : ::open("/dev/null", O_RDONLY);
        if (stdin_source < 0 ||
            ::dup2(stdin_source, STDIN_FILENO) < 0 ||
            ::dup2(stdout_pipe.write_end, STDOUT_FILENO) < 0 ||
            ::dup2(stderr_pipe.write_end, STDERR_FILENO) < 0) {
            int error = errno;
            (void)!::write(exec_error.write_end, &error, sizeof(error));
            ::_exit(127);
        }

        ::execvp(child_argv[0], child_argv.data());

        int error = errno;
        (void)!::write(exec_error.write_end, &error, sizeof(error));
        ::_exit(127);
    }

    pid_ = pid;
    CloseFd(exec_error.write_end);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_error.read_end, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        reaped_ = true;
        throw core::IoError(ErrnoMessage("failed to execute " + program_, child_errno));
    }

    stdout_fd_ = stdout_pipe.ReleaseRead();
    stderr_fd_ = stderr_pipe.ReleaseRead();
    if (stdin_pipe) {
        stdin_fd_ = stdin_pipe->ReleaseWrite();
        ::fcntl(stdin_fd_, F_SETFL, ::fcntl(stdin_fd_, F_GETFL) | O_NONBLOCK);
    }

    spdlog::debug("Spawned {} (pid {})", program_, pid_);
}

Subprocess::~Subprocess() {
    CloseStdin();
    CloseOutputs();

    bool running;
    {
        std::lock_guard<std::mutex> lock(reap_mutex_);
        running = !reaped_;
    }
    if (running) {
        Kill(SIGKILL);
        Wait();
    }
}

// ============================================================================
// I/O
// ============================================================================

Subprocess::ReadStatus Subprocess::Read(OutputStream& origin, std::string& data,
                                        std::chrono::milliseconds timeout) {
    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        std::array<pollfd, 2> fds{};
        fds[0] = {stdout_fd_, POLLIN, 0};
        fds[1] = {stderr_fd_, POLLIN, 0};

        int ready = ::poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw core::IoError(ErrnoMessage("poll failed", errno));
        }
        if (ready == 0) {
            return ReadStatus::TIMEOUT;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            int& fd = (i == 0) ? stdout_fd_ : stderr_fd_;
            if (ReadChunk(fd, data)) {
                if (data.empty()) {
                    continue;
                }
                origin = (i == 0) ? OutputStream::STDOUT : OutputStream::STDERR;
                return ReadStatus::DATA;
            }
            CloseFd(fd);
        }
    }
    return ReadStatus::END;
}

void Subprocess::Communicate(std::istream* input, const OutputCallback& on_output,
                             const CancellationToken& token) {
    std::string pending;
    std::size_t pending_offset = 0;
    bool input_done = (input == nullptr);

    if (input_done) {
        CloseStdin();
    }

    while (stdout_fd_ >= 0 || stderr_fd_ >= 0 || stdin_fd_ >= 0) {
        if (token.IsCancelled()) {
            Kill(SIGKILL);
            Wait();
            throw core::CancelledError(program_ + " cancelled");
        }

        // Refill the stdin buffer from the input stream
        if (!input_done && pending_offset == pending.size()) {
            std::array<char, kReadChunkSize> buffer;
            input->read(buffer.data(), buffer.size());
            std::streamsize got = input->gcount();
            if (input->bad()) {
                throw core::IoError("failed to read input for " + program_);
            }
            pending.assign(buffer.data(), static_cast<std::size_t>(got));
            pending_offset = 0;
            if (got == 0) {
                input_done = true;
                CloseStdin();
            }
        }

        std::array<pollfd, 3> fds{};
        fds[0] = {stdout_fd_, POLLIN, 0};
        fds[1] = {stderr_fd_, POLLIN, 0};
        fds[2] = {stdin_fd_, POLLOUT, 0};

        int ready = ::poll(fds.data(), fds.size(),
                           static_cast<int>(kCancellationPollInterval.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw core::IoError(ErrnoMessage("poll failed", errno));
        }
        if (ready == 0) {
            continue;
        }

        for (std::size_t i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            int& fd = (i == 0) ? stdout_fd_ : stderr_fd_;
            std::string data;
            if (ReadChunk(fd, data)) {
                if (!data.empty() && on_output) {
                    on_output(i == 0 ? OutputStream::STDOUT : OutputStream::STDERR, data);
                }
            } else {
                CloseFd(fd);
            }
        }

        if (fds[2].fd >= 0 && fds[2].revents != 0) {
            if (fds[2].revents & (POLLERR | POLLHUP)) {
                // Child stopped reading; remaining input is dropped
                input_done = true;
                CloseStdin();
                continue;
            }
            ssize_t n = ::write(stdin_fd_, pending.data() + pending_offset,
                                pending.size() - pending_offset);
            if (n > 0) {
                pending_offset += static_cast<std::size_t>(n);
            } else if (n < 0 && errno == EPIPE) {
                input_done = true;
                CloseStdin();
            } else if (n < 0 && errno != EINTR && errno != EAGAIN) {
                throw core::IoError(ErrnoMessage("failed to write to " + program_, errno));
            }
        }
    }
}

// ============================================================================
// PROCESS CONTROL
// ============================================================================

int Subprocess::Wait() {
    {
        std::lock_guard<std::mutex> lock(reap_mutex_);
        if (reaped_) {
            return exit_code_;
        }
    }

    // Block until exit without reaping, so Kill() never targets a recycled pid
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0) {
        if (errno != EINTR) {
            break;
        }
    }

    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (!reaped_) {
        int status = 0;
        pid_t result;
        do {
            result = ::waitpid(pid_, &status, 0);
        } while (result < 0 && errno == EINTR);

        exit_code_ = (result == pid_) ? DecodeWaitStatus(status) : -1;
        reaped_ = true;
        spdlog::debug("{} (pid {}) exited with {}", program_, pid_, exit_code_);
    }
    return exit_code_;
}

bool Subprocess::Kill(int signal) noexcept {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (reaped_ || pid_ <= 0) {
        return false;
    }
    return ::kill(pid_, signal) == 0;
}

void Subprocess::CloseStdin() noexcept {
    CloseFd(stdin_fd_);
}

void Subprocess::CloseOutputs() noexcept {
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
}

// ============================================================================
// CONVENIENCE
// ============================================================================

CommandResult RunCommand(const std::vector<std::string>& argv,
                         const CancellationToken& token,
                         std::istream* input) {
    Subprocess child(argv, input != nullptr);
    CommandResult result;

    child.Communicate(input, [&result](OutputStream origin, std::string_view data) {
        if (origin == OutputStream::STDOUT) {
            result.stdout_output.append(data.data(), data.size());
        } else {
            result.stderr_output.append(data.data(), data.size());
        }
    }, token);

    result.exit_code = child.Wait();
    return result;
}

} // namespace utils
} // namespace eggshell
