/**
 * @file command_runner.hpp
 * @brief Child process execution with concurrent output draining and deadlines
 *
 * Every external tool (buildah, skopeo, krunvm) is reached through the
 * CommandRunner interface. The production implementation, ProcessRunner,
 * spawns the child in its own process group, drains stdout and stderr on two
 * dedicated threads while the calling thread polls for exit, and kills the
 * whole group when a deadline elapses.
 *
 * **Supervision model**:
 * ```
 * caller thread ── poll waitpid(WNOHANG) every 25 ms ── deadline? ── SIGKILL group
 * reader thread ── stdout pipe → buffer (until EOF)
 * reader thread ── stderr pipe → buffer (until EOF)
 * ```
 * Both readers are joined on every path, including the forced-kill path, so
 * the output produced up to the kill is always returned.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace flashvm {
namespace utils {

/**
 * @struct CommandResult
 * @brief Captured outcome of one child process
 */
struct CommandResult {
    int exit_code{-1};                       ///< Exit status, 128+N for signal N, 124 on timeout
    std::string stdout_output;               ///< Captured stdout (UTF-8, invalid bytes replaced)
    std::string stderr_output;               ///< Captured stderr (UTF-8, invalid bytes replaced)
    std::chrono::milliseconds duration{0};   ///< Wall-clock time until exit or kill
    bool success{false};                     ///< exit_code == 0 and not timed out
    bool timed_out{false};                   ///< Killed because the deadline elapsed
};

/**
 * @struct CommandOptions
 * @brief Per-invocation supervision settings
 */
struct CommandOptions {
    std::optional<std::chrono::milliseconds> deadline;          ///< Hard wall-clock limit (unset = none)
    std::chrono::milliseconds poll_interval{25};                ///< Exit polling period
    std::chrono::milliseconds drain_grace{std::chrono::seconds(2)};  ///< Max wait for pipes to close after exit
};

/**
 * @class CommandRunner
 * @brief Seam between the engine and the operating system
 *
 * Tests substitute a scripted implementation; production code uses
 * ProcessRunner.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run @p argv to completion (or deadline) and capture its output
     * @throws core::ExecutionError if the program cannot be started
     */
    virtual CommandResult Run(const std::vector<std::string>& argv,
                              const CommandOptions& options = CommandOptions{}) = 0;

    /**
     * @brief True if @p name resolves to an executable on PATH
     */
    virtual bool CommandExists(const std::string& name) const = 0;
};

/**
 * @class ProcessRunner
 * @brief fork/exec implementation of CommandRunner (POSIX)
 *
 * Thread-safe: concurrent Run() calls share no state. Pipes are created
 * close-on-exec so one child never inherits another's descriptors.
 */
class ProcessRunner : public CommandRunner {
public:
    CommandResult Run(const std::vector<std::string>& argv,
                      const CommandOptions& options = CommandOptions{}) override;

    bool CommandExists(const std::string& name) const override;
};

} // namespace utils
} // namespace flashvm
