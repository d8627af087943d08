/**
 * @file subprocess.hpp
 * @brief Child processes with piped standard streams
 *
 * Runs a program from an argv vector (no shell involved) with its stdout and
 * stderr connected to pipes and, optionally, its stdin fed from a stream.
 * Waits are cancellation-aware: a fired CancellationToken kills the child.
 *
 * **Thread Safety**: Kill() may be called from any thread while another
 * thread reads or waits. Everything else belongs to the owning thread.
 *
 * @date 2025
 */

#pragma once

#include "eggshell/utils/cancellation.hpp"

#include <sys/types.h>

#include <chrono>
#include <csignal>
#include <functional>
#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eggshell {
namespace utils {

/**
 * @enum OutputStream
 * @brief Which standard stream a chunk of child output came from
 */
enum class OutputStream {
    STDOUT,
    STDERR
};

/**
 * @struct CommandResult
 * @brief Outcome of a command run to completion
 */
struct CommandResult {
    int exit_code{0};           ///< Exit status, or 128 + signal number
    std::string stdout_output;  ///< Captured standard output
    std::string stderr_output;  ///< Captured standard error

    bool success() const { return exit_code == 0; }
};

/**
 * @class Subprocess
 * @brief A spawned child process and the parent ends of its pipes
 *
 * **Usage Example**:
 * @code
 * Subprocess child({"docker", "logs", "--follow", id});
 * OutputStream origin;
 * std::string chunk;
 * while (child.Read(origin, chunk, std::chrono::milliseconds(50)) !=
 *        Subprocess::ReadStatus::END) {
 *     ...
 * }
 * int status = child.Wait();
 * @endcode
 */
class Subprocess {
public:
    /// Result of one Read() call
    enum class ReadStatus {
        DATA,     ///< A chunk was read
        TIMEOUT,  ///< Nothing arrived within the timeout
        END       ///< Both stdout and stderr reached end of file
    };

    using OutputCallback = std::function<void(OutputStream, std::string_view)>;

    /**
     * @brief Spawn a child process
     * @param argv Program and arguments; argv[0] is looked up in PATH
     * @param pipe_stdin Connect stdin to a pipe (otherwise /dev/null)
     *
     * @throws eggshell::core::IoError if pipes cannot be created, fork fails,
     *         or the program cannot be executed
     */
    explicit Subprocess(const std::vector<std::string>& argv, bool pipe_stdin = false);

    /// Kills and reaps the child if it is still running
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    /**
     * @brief Read the next chunk from stdout or stderr
     * @param origin Set to the stream the chunk came from
     * @param data Replaced with the chunk
     * @param timeout Maximum time to wait for data
     *
     * @throws eggshell::core::IoError on read failure
     */
    ReadStatus Read(OutputStream& origin, std::string& data,
                    std::chrono::milliseconds timeout);

    /**
     * @brief Feed @p input to stdin and pass all output to @p on_output
     *
     * Returns once both output streams are closed. stdin is closed after
     * @p input is exhausted. Fires of @p token kill the child.
     *
     * @throws eggshell::core::CancelledError if @p token fires
     * @throws eggshell::core::IoError on pipe failures or input read errors
     */
    void Communicate(std::istream* input, const OutputCallback& on_output,
                     const CancellationToken& token);

    /**
     * @brief Wait for the child to exit and reap it
     * @return Exit status, or 128 + signal number if it was killed
     */
    int Wait();

    /**
     * @brief Send a signal to the child if it has not been reaped yet
     * @return true if the signal was delivered
     */
    bool Kill(int signal = SIGKILL) noexcept;

    /// Close the parent end of stdin, signalling end of input
    void CloseStdin() noexcept;

    pid_t pid() const { return pid_; }
    const std::string& program() const { return program_; }

private:
    pid_t pid_{-1};
    std::string program_;
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};

    std::mutex reap_mutex_;
    bool reaped_{false};
    int exit_code_{0};

    void CloseOutputs() noexcept;
};

/**
 * @brief Run a command to completion and capture its output
 * @param argv Program and arguments
 * @param token Cancellation token
 * @param input Optional data for the child's stdin
 * @return Exit status and captured output
 *
 * @throws eggshell::core::IoError if the command cannot be run
 * @throws eggshell::core::CancelledError if @p token fires
 */
CommandResult RunCommand(const std::vector<std::string>& argv,
                         const CancellationToken& token,
                         std::istream* input = nullptr);

} // namespace utils
} // namespace eggshell
