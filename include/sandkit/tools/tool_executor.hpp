/**
 * @file tool_executor.hpp
 * @brief Shared execution layer beneath the sandbox tools
 *
 * Every tool works through one SandboxToolExecutor, so all tools see the
 * same sandbox and the same file-system state. The executor bounds what
 * flows back to the caller (output truncation) and what reaches the
 * sandbox (path validation).
 *
 * @date 2026
 */

#pragma once

#include "sandkit/core/sandbox.hpp"
#include "sandkit/core/workspace.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace sandkit {
namespace tools {

/**
 * @class SandboxToolExecutor
 * @brief Sandbox reference plus output and path policy
 *
 * The sandbox is borrowed; it must outlive the executor and every tool
 * created from it.
 *
 * **Usage Example**:
 * @code
 * SandboxToolExecutor executor(sandbox, 8000);
 *
 * auto path = executor.ValidatePath("/workspace/output/../report.md");
 * // "/workspace/report.md"
 *
 * executor.ValidatePath("/workspace2/x");   // throws PathViolationError
 * @endcode
 */
class SandboxToolExecutor {
public:
    /// Roughly 4000 tokens of returned output
    static constexpr std::size_t kDefaultMaxOutputChars = 16000;

    /**
     * @param sandbox Sandbox every tool runs against
     * @param max_output_chars Cap on returned stdout/stderr/file content
     * @param default_timeout Timeout for commands issued by the tools
     * @param allowed_roots Absolute directories file tools may touch
     */
    explicit SandboxToolExecutor(
        core::Sandbox& sandbox,
        std::size_t max_output_chars = kDefaultMaxOutputChars,
        std::chrono::seconds default_timeout = core::workspace::kDefaultCommandTimeout,
        std::vector<std::string> allowed_roots = {core::workspace::kRoot});

    core::Sandbox& GetSandbox() const { return sandbox_; }
    std::size_t GetMaxOutputChars() const { return max_output_chars_; }
    std::chrono::seconds GetDefaultTimeout() const { return default_timeout_; }
    const std::vector<std::string>& GetAllowedRoots() const { return allowed_roots_; }

    /**
     * @brief Bound text to max_output_chars with a truncation marker
     */
    std::string Truncate(const std::string& text) const;

    /**
     * @brief List files in the output directory
     *
     * Blocks until the listing command completes.
     *
     * @return Absolute paths; empty (with the failure logged) if the
     *         listing could not be produced
     */
    std::vector<std::string> ListGeneratedFiles() const;

    /**
     * @brief Normalize a path and check it against the allowed roots
     * @param path Absolute path ("." and ".." components are resolved)
     * @return Normalized path
     * @throws core::PathViolationError if the path is relative or outside
     *         every allowed root
     */
    std::string ValidatePath(const std::string& path) const;

private:
    core::Sandbox& sandbox_;
    std::size_t max_output_chars_;
    std::chrono::seconds default_timeout_;
    std::vector<std::string> allowed_roots_;
};

} // namespace tools
} // namespace sandkit
