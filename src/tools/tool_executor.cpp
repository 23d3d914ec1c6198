/**
 * @file tool_executor.cpp
 * @brief Implementation of the shared tool execution layer
 *
 * @date 2026
 */

#include "sandkit/tools/tool_executor.hpp"
#include "sandkit/core/errors.hpp"
#include "sandkit/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace sandkit {
namespace tools {

using utils::StringUtils;

SandboxToolExecutor::SandboxToolExecutor(core::Sandbox& sandbox,
                                         std::size_t max_output_chars,
                                         std::chrono::seconds default_timeout,
                                         std::vector<std::string> allowed_roots)
    : sandbox_(sandbox),
      max_output_chars_(max_output_chars),
      default_timeout_(default_timeout) {
    for (const auto& root : allowed_roots) {
        if (!StringUtils::StartsWith(root, "/")) {
            throw std::invalid_argument("Allowed root must be absolute: '" + root + "'");
        }
        allowed_roots_.push_back(StringUtils::NormalizePosixPath(root));
    }
}

std::string SandboxToolExecutor::Truncate(const std::string& text) const {
    return StringUtils::TruncateOutput(text, max_output_chars_);
}

std::vector<std::string> SandboxToolExecutor::ListGeneratedFiles() const {
    const std::string output_dir = core::workspace::kOutputDir;
    std::vector<std::string> files;

    try {
        auto result = sandbox_.RunCommand("ls -1 " + output_dir, core::workspace::kRoot,
                                          default_timeout_, {}).get();
        if (!result.IsSuccess()) {
            spdlog::error("Failed to list generated files: exit_code={}, stderr={}",
                          result.GetExitCode(), StringUtils::Trim(result.GetStderr()));
            return files;
        }

        for (const auto& line : StringUtils::Split(result.GetStdout(), '\n')) {
            auto name = StringUtils::Trim(line);
            if (!name.empty()) {
                files.push_back(output_dir + "/" + name);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Exception while listing generated files: {}", e.what());
        files.clear();
    }

    return files;
}

std::string SandboxToolExecutor::ValidatePath(const std::string& path) const {
    if (!StringUtils::StartsWith(path, "/")) {
        throw core::PathViolationError("Path must be absolute, got: '" + path + "'");
    }

    const std::string normalized = StringUtils::NormalizePosixPath(path);
    for (const auto& root : allowed_roots_) {
        if (StringUtils::IsWithinRoot(normalized, root)) {
            return normalized;
        }
    }

    throw core::PathViolationError("Path '" + path + "' is outside allowed directories. "
                                   "Allowed: [" + StringUtils::Join(allowed_roots_, ", ") + "]");
}

} // namespace tools
} // namespace sandkit
