/**
 * @file process_utils.hpp
 * @brief Host-side child process execution with separated output capture
 *
 * Runs a program on the host (typically the container engine's client),
 * feeding it a binary-safe stdin payload and capturing stdout and stderr
 * separately. An optional deadline kills the child so that a blocked
 * client can never pin the calling thread forever.
 *
 * @date 2026
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace sandkit {
namespace utils {

/**
 * @struct ProcessResult
 * @brief Outcome of a host child process
 */
struct ProcessResult {
    int exit_code{0};                       ///< Exit status, 128+N when killed by signal N
    std::string stdout_output;              ///< Captured standard output (raw bytes)
    std::string stderr_output;              ///< Captured standard error (raw bytes)
    bool timed_out{false};                  ///< Killed because the deadline passed
    std::chrono::milliseconds duration{0};  ///< Wall-clock runtime
};

/**
 * @class ProcessUtils
 * @brief fork/exec wrapper with poll-driven pipe handling
 *
 * **Behavior**:
 * - argv[0] is resolved through PATH (execvp)
 * - stdin receives stdin_data and is then closed (empty payload: closed immediately)
 * - an exec failure is reported as exit code 127 with a message on stderr
 * - SIGPIPE is ignored process-wide on first use so a child that stops reading
 *   stdin cannot terminate the host process
 *
 * **Thread Safety**: Safe to call concurrently; pipes are created close-on-exec
 * so concurrently spawned children never inherit each other's descriptors.
 *
 * @code
 * auto result = ProcessUtils::Run({"docker", "cp", "-", id + ":/workspace"},
 *                                 tar_bytes, std::chrono::seconds(30));
 * if (result.exit_code != 0) {
 *     spdlog::error("docker cp failed: {}", result.stderr_output);
 * }
 * @endcode
 */
class ProcessUtils {
public:
    /**
     * @brief Run a program to completion
     * @param argv Program and arguments (must not be empty)
     * @param stdin_data Bytes written to the child's stdin
     * @param timeout Kill the child with SIGKILL after this long
     * @return Process result
     * @throws std::invalid_argument if argv is empty
     * @throws std::system_error if pipes cannot be created or fork fails
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const std::string& stdin_data = "",
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Render argv as a shell-quoted command line for logging
     */
    static std::string FormatCommandLine(const std::vector<std::string>& argv);
};

} // namespace utils
} // namespace sandkit
