/**
 * @file process_utils.cpp
 * @brief Implementation of host child process execution
 *
 * **Pipe Layout**:
 * ```
 * parent                      child
 *   stdin_pipe.write  ──────▶  fd 0
 *   stdout_pipe.read  ◀──────  fd 1
 *   stderr_pipe.read  ◀──────  fd 2
 * ```
 *
 * Parent ends are non-blocking and serviced by a single poll() loop, so a
 * child producing large stderr while we are still writing stdin cannot
 * deadlock the exchange.
 *
 * @date 2026
 */

#include "sandkit/utils/process_utils.hpp"
#include "sandkit/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandkit {
namespace utils {

namespace {

// ============================================================================
// PIPE HANDLING
// ============================================================================

class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe2 failed");
        }
    }

    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int ReadEnd() const { return fds_[0]; }
    int WriteEnd() const { return fds_[1]; }

    void CloseRead() { Close(fds_[0]); }
    void CloseWrite() { Close(fds_[1]); }

private:
    static void Close(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    int fds_[2]{-1, -1};
};

void SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw std::system_error(errno, std::generic_category(), "fcntl(O_NONBLOCK) failed");
    }
}

void IgnoreSigpipe() {
    static std::once_flag flag;
    std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
}

// Returns false once the descriptor reached EOF or failed
bool DrainInto(int fd, std::string& sink) {
    std::array<char, 65536> buffer;
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
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

int WaitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid failed");
        }
    }
    return status;
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult ProcessUtils::Run(const std::vector<std::string>& argv,
                                const std::string& stdin_data,
                                std::optional<std::chrono::milliseconds> timeout) {
    if (argv.empty()) {
        throw std::invalid_argument("ProcessUtils::Run requires a program name");
    }

    IgnoreSigpipe();

    // Everything the child touches is prepared before fork()
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    Pipe stdin_pipe;
    Pipe stdout_pipe;
    Pipe stderr_pipe;

    spdlog::debug("Spawning: {}", StringUtils::Truncate(FormatCommandLine(argv), 200));

    const auto start_time = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork failed");
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(stdin_pipe.ReadEnd(), STDIN_FILENO);
        ::dup2(stdout_pipe.WriteEnd(), STDOUT_FILENO);
        ::dup2(stderr_pipe.WriteEnd(), STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());

        static const char kExecFailed[] = "exec failed: program not found or not executable\n";
        ssize_t ignored = ::write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    stdin_pipe.CloseRead();
    stdout_pipe.CloseWrite();
    stderr_pipe.CloseWrite();

    ProcessResult result;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout) {
        deadline = start_time + *timeout;
    }

    try {
        SetNonBlocking(stdin_pipe.WriteEnd());
        SetNonBlocking(stdout_pipe.ReadEnd());
        SetNonBlocking(stderr_pipe.ReadEnd());
    } catch (...) {
        ::kill(pid, SIGKILL);
        WaitForChild(pid);
        throw;
    }

    std::size_t written = 0;
    bool stdin_open = true;
    bool stdout_open = true;
    bool stderr_open = true;

    if (stdin_data.empty()) {
        stdin_pipe.CloseWrite();
        stdin_open = false;
    }

    while (stdout_open || stderr_open) {
        int wait_ms = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        std::vector<pollfd> fds;
        if (stdin_open) fds.push_back({stdin_pipe.WriteEnd(), POLLOUT, 0});
        if (stdout_open) fds.push_back({stdout_pipe.ReadEnd(), POLLIN, 0});
        if (stderr_open) fds.push_back({stderr_pipe.ReadEnd(), POLLIN, 0});

        int rc = ::poll(fds.data(), fds.size(), wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved_errno = errno;
            ::kill(pid, SIGKILL);
            WaitForChild(pid);
            throw std::system_error(saved_errno, std::generic_category(), "poll failed");
        }
        if (rc == 0) {
            continue;  // Deadline re-checked at loop head
        }

        for (const auto& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }

            if (stdin_open && entry.fd == stdin_pipe.WriteEnd()) {
                if (entry.revents & (POLLERR | POLLHUP)) {
                    stdin_pipe.CloseWrite();
                    stdin_open = false;
                    continue;
                }
                ssize_t n = ::write(entry.fd, stdin_data.data() + written,
                                    stdin_data.size() - written);
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    // Child closed its stdin early (EPIPE); stop feeding it
                    written = stdin_data.size();
                }
                if (written >= stdin_data.size()) {
                    stdin_pipe.CloseWrite();
                    stdin_open = false;
                }
            } else if (stdout_open && entry.fd == stdout_pipe.ReadEnd()) {
                if (!DrainInto(entry.fd, result.stdout_output)) {
                    stdout_pipe.CloseRead();
                    stdout_open = false;
                }
            } else if (stderr_open && entry.fd == stderr_pipe.ReadEnd()) {
                if (!DrainInto(entry.fd, result.stderr_output)) {
                    stderr_pipe.CloseRead();
                    stderr_open = false;
                }
            }
        }
    }

    // Output closed but the child may still be alive; honor the deadline here too
    if (!result.timed_out && deadline) {
        int status = 0;
        while (true) {
            pid_t done = ::waitpid(pid, &status, WNOHANG);
            if (done == pid) {
                result.exit_code = DecodeWaitStatus(status);
                result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start_time);
                return result;
            }
            if (done < 0 && errno != EINTR) {
                throw std::system_error(errno, std::generic_category(), "waitpid failed");
            }
            if (std::chrono::steady_clock::now() >= *deadline) {
                result.timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    if (result.timed_out) {
        spdlog::warn("Killing {} (pid {}) after {} ms deadline",
                     argv[0], pid, timeout ? timeout->count() : 0);
        ::kill(pid, SIGKILL);
    }

    result.exit_code = DecodeWaitStatus(WaitForChild(pid));
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return result;
}

std::string ProcessUtils::FormatCommandLine(const std::vector<std::string>& argv) {
    std::vector<std::string> quoted;
    quoted.reserve(argv.size());
    for (const auto& arg : argv) {
        bool plain = !arg.empty() &&
                     arg.find_first_of(" \t\n'\"\\$`&|;<>()*?![]{}~#") == std::string::npos;
        quoted.push_back(plain ? arg : StringUtils::ShellQuote(arg));
    }
    return StringUtils::Join(quoted, " ");
}

} // namespace utils
} // namespace sandkit
