/**
 * @file file_tools.cpp
 * @brief file_read and file_write tools
 *
 * Both validate the path before the sandbox is touched; a rejected path
 * never reaches the backend.
 *
 * @date 2026
 */

#include "sandkit/tools/sandbox_tools.hpp"
#include "sandkit/core/errors.hpp"
#include "sandkit/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace sandkit {
namespace tools {

json ReadSandboxFile(const SandboxToolExecutor& executor, const std::string& path) {
    spdlog::info("Reading file: {}", path);

    try {
        auto validated = executor.ValidatePath(path);
        auto content = executor.GetSandbox().ReadFile(validated).get();
        return {
            {"status", "success"},
            {"content", executor.Truncate(content)},
            {"path", validated}
        };
    } catch (const core::NotFoundError&) {
        spdlog::error("File not found: {}", path);
        return MakeErrorResult("File not found: " + path);
    } catch (const core::SandboxError& e) {
        spdlog::error("Failed to read {}: {}", path, e.what());
        return MakeErrorResult(e.what());
    }
}

json WriteSandboxFile(const SandboxToolExecutor& executor,
                      const std::string& path,
                      const std::string& content) {
    spdlog::info("Writing file: {} ({} chars)", path, content.size());

    try {
        auto validated = executor.ValidatePath(path);
        executor.GetSandbox().WriteFile(validated, content).get();
        return {
            {"status", "success"},
            {"path", validated},
            {"size", content.size()},
            {"sha256", utils::HashUtils::ComputeSHA256(content)}
        };
    } catch (const core::SandboxError& e) {
        spdlog::error("Failed to write {}: {}", path, e.what());
        return MakeErrorResult(e.what());
    }
}

// ============================================================================
// TOOL DEFINITIONS
// ============================================================================

Tool CreateFileReadTool(const SandboxToolExecutor& executor) {
    Tool tool;
    tool.name = "file_read";
    tool.description =
        "Read the contents of a file from the sandbox. "
        "Returns the file content as text.";
    tool.parameters = {
        {"type", "object"},
        {"properties", {
            {"path", {{"type", "string"},
                      {"description", "Path to the file to read in the sandbox."}}}
        }},
        {"required", {"path"}}
    };
    tool.handler = [&executor](const json& params) {
        return ReadSandboxFile(executor, params.at("path").get<std::string>());
    };
    return tool;
}

Tool CreateFileWriteTool(const SandboxToolExecutor& executor) {
    Tool tool;
    tool.name = "file_write";
    tool.description =
        "Write content to a file in the sandbox. "
        "Parent directories are created automatically if needed.";
    tool.parameters = {
        {"type", "object"},
        {"properties", {
            {"path", {{"type", "string"},
                      {"description", "Path where the file should be written."}}},
            {"content", {{"type", "string"},
                         {"description", "Content to write to the file."}}}
        }},
        {"required", {"path", "content"}}
    };
    tool.handler = [&executor](const json& params) {
        return WriteSandboxFile(executor,
                                params.at("path").get<std::string>(),
                                params.at("content").get<std::string>());
    };
    return tool;
}

} // namespace tools
} // namespace sandkit
