/**
 * @file command_runner.cpp
 * @brief fork/exec child supervision with two draining threads and a deadline
 *
 * Failing to drain both pipes lets the child block on a full pipe buffer
 * while the parent waits on the other stream or on exit. Each pipe therefore
 * gets its own reader thread for the whole lifetime of the child, and the
 * calling thread only polls for exit and enforces the deadline.
 *
 * On deadline the child's process group receives SIGKILL (the child calls
 * setpgid(0, 0) before exec, so shell pipelines and tool helpers die with
 * it). Descendants that escaped the group may keep a pipe open; readers are
 * therefore abandoned after a bounded drain grace instead of blocking on EOF
 * forever.
 *
 * @date 2025
 */

#include "flashvm/utils/command_runner.hpp"
#include "flashvm/utils/shell_utils.hpp"
#include "flashvm/utils/string_utils.hpp"
#include "flashvm/core/errors.hpp"
#include "flashvm/core/types.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace flashvm {
namespace utils {

namespace {

// ============================================================================
// FILE DESCRIPTOR HELPERS
// ============================================================================

class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { Close(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            Close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int Get() const { return fd_; }

    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    Fd read_end;
    Fd write_end;
};

Pipe MakePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw core::ExecutionError(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    return Pipe{Fd(fds[0]), Fd(fds[1])};
}

/**
 * Reads @p fd into @p buffer until EOF, a read error, or @p abandon.
 * Bytes are appended verbatim; decoding happens once on the full buffer.
 */
void DrainPipe(int fd, std::string& buffer, const std::atomic<bool>& abandon,
               std::atomic<bool>& done) {
    char chunk[8192];

    while (true) {
        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 20);

        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        if (ready == 0) {
            if (abandon.load()) {
                break;
            }
            continue;
        }

        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<std::size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR && errno != EAGAIN) {
            break;
        }
    }

    done.store(true);
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void KillProcessGroup(pid_t pid) {
    // Negative pid addresses the whole group created by setpgid in the child
    if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::warn("kill(-{}) failed: {}", pid, std::strerror(errno));
    }
    ::kill(pid, SIGKILL);
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

CommandResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 const CommandOptions& options) {
    if (argv.empty()) {
        throw core::ExecutionError("Cannot execute an empty command");
    }

    spdlog::debug("Executing: {}", ShellJoin(argv));

    // Everything the child touches is prepared before fork
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    Pipe out = MakePipe();
    Pipe err = MakePipe();
    Pipe exec_status = MakePipe();

    int dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (dev_null < 0) {
        throw core::ExecutionError(std::string("Failed to open /dev/null: ") + std::strerror(errno));
    }
    Fd stdin_fd(dev_null);

    auto start = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw core::ExecutionError(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(stdin_fd.Get(), STDIN_FILENO);
        ::dup2(out.write_end.Get(), STDOUT_FILENO);
        ::dup2(err.write_end.Get(), STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);

        ::execvp(c_argv[0], c_argv.data());

        int exec_errno = errno;
        ssize_t ignored = ::write(exec_status.write_end.Get(), &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    // Parent keeps only the read ends
    out.write_end.Close();
    err.write_end.Close();
    exec_status.write_end.Close();
    stdin_fd.Close();

    // exec_status closes on successful exec (O_CLOEXEC) or carries errno
    int exec_errno = 0;
    ssize_t status_bytes;
    do {
        status_bytes = ::read(exec_status.read_end.Get(), &exec_errno, sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);

    if (status_bytes == sizeof(exec_errno)) {
        int ignored_status = 0;
        ::waitpid(pid, &ignored_status, 0);
        throw core::ExecutionError("Failed to execute '" + argv[0] + "': " +
                                   std::strerror(exec_errno));
    }

    std::string stdout_buffer;
    std::string stderr_buffer;
    std::atomic<bool> abandon{false};
    std::atomic<bool> stdout_done{false};
    std::atomic<bool> stderr_done{false};

    std::thread stdout_reader;
    std::thread stderr_reader;
    try {
        stdout_reader = std::thread(DrainPipe, out.read_end.Get(), std::ref(stdout_buffer),
                                    std::cref(abandon), std::ref(stdout_done));
        stderr_reader = std::thread(DrainPipe, err.read_end.Get(), std::ref(stderr_buffer),
                                    std::cref(abandon), std::ref(stderr_done));
    }
    catch (const std::system_error& e) {
        // The child is already running: kill and reap it before unwinding
        KillProcessGroup(pid);
        int reaped_status = 0;
        while (::waitpid(pid, &reaped_status, 0) < 0 && errno == EINTR) {
        }
        abandon.store(true);
        if (stdout_reader.joinable()) {
            stdout_reader.join();
        }
        throw core::ExecutionError("Failed to start output readers for '" + argv[0] +
                                   "': " + e.what());
    }

    CommandResult result;
    int status = 0;

    // Supervising poll loop
    while (true) {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);

        if (waited == pid) {
            result.exit_code = DecodeWaitStatus(status);
            break;
        }

        if (waited < 0 && errno != EINTR) {
            spdlog::error("waitpid({}) failed: {}", pid, std::strerror(errno));
            KillProcessGroup(pid);
            result.exit_code = -1;
            break;
        }

        if (options.deadline &&
            std::chrono::steady_clock::now() - start >= *options.deadline) {
            spdlog::warn("Deadline of {} ms reached, killing '{}' (pid {})",
                         options.deadline->count(), argv[0], pid);
            KillProcessGroup(pid);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            result.timed_out = true;
            result.exit_code = core::kTimeoutExitCode;
            break;
        }

        std::this_thread::sleep_for(options.poll_interval);
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    // Readers run until EOF; give straggling descendants a bounded window
    auto drain_deadline = std::chrono::steady_clock::now() + options.drain_grace;
    while (!(stdout_done.load() && stderr_done.load()) &&
           std::chrono::steady_clock::now() < drain_deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (!(stdout_done.load() && stderr_done.load())) {
        spdlog::warn("Output pipes of '{}' still open after exit, abandoning readers", argv[0]);
        if (result.timed_out) {
            KillProcessGroup(pid);
        }
    }
    abandon.store(true);

    stdout_reader.join();
    stderr_reader.join();

    result.stdout_output = StringUtils::ToValidUtf8(stdout_buffer);
    result.stderr_output = StringUtils::ToValidUtf8(stderr_buffer);
    result.success = !result.timed_out && result.exit_code == 0;

    spdlog::debug("'{}' finished: exit={} timed_out={} duration={}ms",
                  argv[0], result.exit_code, result.timed_out, result.duration.count());

    return result;
}

bool ProcessRunner::CommandExists(const std::string& name) const {
    if (name.empty()) {
        return false;
    }

    auto is_executable = [](const std::string& path) {
        struct stat st;
        return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
               ::access(path.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        return is_executable(name);
    }

    const char* path_env = std::getenv("PATH");
    std::string search_path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    for (const auto& dir : StringUtils::Split(search_path, ':')) {
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
        if (is_executable(candidate)) {
            return true;
        }
    }
    return false;
}

} // namespace utils
} // namespace flashvm
