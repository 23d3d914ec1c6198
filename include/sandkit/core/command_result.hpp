/**
 * @file command_result.hpp
 * @brief Outcome of one command executed inside a sandbox
 *
 * @date 2026
 */

#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace sandkit {
namespace core {

/**
 * @class CommandResult
 * @brief Immutable exit code and captured output of a sandboxed command
 *
 * A non-zero exit code is a normal result, not an error. A command that
 * exceeded its timeout is reported as a distinguished result: exit code
 * kTimedOutExitCode and stderr beginning with "Command timed out after".
 *
 * stdout and stderr hold the raw bytes produced by the command; they are
 * not required to be valid UTF-8.
 *
 * **Usage Example**:
 * @code
 * CommandResult result = sandbox.RunCommand("ls", "/workspace", 30s, {}).get();
 * if (result.IsTimedOut()) {
 *     spdlog::warn("{}", result.GetStderr());
 * } else if (!result.IsSuccess()) {
 *     spdlog::error("exit {}: {}", result.GetExitCode(), result.GetStderr());
 * }
 * @endcode
 */
class CommandResult {
public:
    /// Exit code reserved for the timed-out result
    static constexpr int kTimedOutExitCode = -1;

    CommandResult() = default;
    CommandResult(int exit_code, std::string stdout_output, std::string stderr_output);

    /**
     * @brief Build the distinguished timed-out result
     * @param timeout Timeout that was exceeded (reported in stderr)
     * @param partial_stdout Output captured before termination
     * @param partial_stderr Error output captured before termination, appended
     *        after the timeout message
     */
    static CommandResult TimedOut(std::chrono::seconds timeout,
                                  const std::string& partial_stdout = "",
                                  const std::string& partial_stderr = "");

    int GetExitCode() const { return exit_code_; }
    const std::string& GetStdout() const { return stdout_; }
    const std::string& GetStderr() const { return stderr_; }

    /// exit_code == 0
    bool IsSuccess() const { return exit_code_ == 0; }

    /// The distinguished timed-out result
    bool IsTimedOut() const;

    /**
     * @brief {"exit_code", "stdout", "stderr", "success"}
     */
    nlohmann::json ToJson() const;

private:
    int exit_code_{0};
    std::string stdout_;
    std::string stderr_;
};

} // namespace core
} // namespace sandkit
