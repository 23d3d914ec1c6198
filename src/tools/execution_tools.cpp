/**
 * @file execution_tools.cpp
 * @brief shell and python tools
 *
 * @date 2026
 */

#include "sandkit/tools/sandbox_tools.hpp"
#include "sandkit/core/errors.hpp"
#include "sandkit/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace sandkit {
namespace tools {

using utils::StringUtils;

json ExecuteShell(const SandboxToolExecutor& executor,
                  const std::string& command,
                  const std::string& working_dir,
                  std::optional<std::chrono::seconds> timeout) {
    spdlog::info("Executing shell command: {}... ({} chars)",
                 StringUtils::Truncate(command, 20, ""), command.size());

    core::CommandResult result;
    try {
        result = executor.GetSandbox()
                     .RunCommand(command, working_dir.empty() ? core::workspace::kRoot : working_dir,
                                 timeout.value_or(executor.GetDefaultTimeout()), {})
                     .get();
    } catch (const core::SandboxError& e) {
        spdlog::error("Shell command failed: {}", e.what());
        return MakeErrorResult(e.what());
    }

    return {
        {"status", result.IsSuccess() ? "success" : "error"},
        {"stdout", executor.Truncate(result.GetStdout())},
        {"stderr", executor.Truncate(result.GetStderr())},
        {"exit_code", result.GetExitCode()}
    };
}

json ExecutePython(const SandboxToolExecutor& executor,
                   const std::string& code,
                   std::optional<std::chrono::seconds> timeout) {
    spdlog::info("Executing Python code ({} chars)", code.size());

    auto& sandbox = executor.GetSandbox();
    const std::string script_path = core::workspace::kPythonScriptPath;

    try {
        sandbox.WriteFile(script_path, code).get();
    } catch (const core::SandboxError& e) {
        spdlog::error("Failed to write script file: {}", e.what());
        return {
            {"status", "error"},
            {"stdout", ""},
            {"stderr", executor.Truncate(e.what())},
            {"generated_files", json::array()}
        };
    }

    core::CommandResult result;
    try {
        result = sandbox.RunCommand(std::string("cd ") + core::workspace::kRoot +
                                        " && python3 " + script_path,
                                    core::workspace::kRoot,
                                    timeout.value_or(executor.GetDefaultTimeout()), {})
                     .get();
    } catch (const core::SandboxError& e) {
        spdlog::error("Python execution failed: {}", e.what());
        return {
            {"status", "error"},
            {"stdout", ""},
            {"stderr", executor.Truncate(e.what())},
            {"generated_files", json::array()}
        };
    }

    return {
        {"status", result.IsSuccess() ? "success" : "error"},
        {"stdout", executor.Truncate(result.GetStdout())},
        {"stderr", executor.Truncate(result.GetStderr())},
        {"exit_code", result.GetExitCode()},
        {"generated_files", executor.ListGeneratedFiles()}
    };
}

// ============================================================================
// TOOL DEFINITIONS
// ============================================================================

Tool CreateShellTool(const SandboxToolExecutor& executor) {
    Tool tool;
    tool.name = "shell";
    tool.description =
        "Execute bash/shell commands for SYSTEM OPERATIONS: "
        "file management (ls, cp, mv, rm, mkdir, chmod), "
        "package installation (pip install, apt-get), "
        "downloads (curl, wget), "
        "process management (ps, kill), "
        "git operations. "
        "Do NOT use for data processing - use python instead.";
    tool.parameters = {
        {"type", "object"},
        {"properties", {
            {"command", {{"type", "string"},
                         {"description", "The shell command to execute in the sandbox."}}},
            {"working_dir", {{"type", "string"},
                             {"description", "Working directory for the command."},
                             {"default", core::workspace::kRoot}}}
        }},
        {"required", {"command"}}
    };
    tool.handler = [&executor](const json& params) {
        return ExecuteShell(executor,
                            params.at("command").get<std::string>(),
                            params.value("working_dir", std::string(core::workspace::kRoot)));
    };
    return tool;
}

Tool CreatePythonTool(const SandboxToolExecutor& executor) {
    Tool tool;
    tool.name = "python";
    tool.description =
        "Execute Python code for DATA PROCESSING and COMPUTATION: "
        "data analysis (pandas, numpy), "
        "calculations and math, "
        "file parsing (JSON, CSV, XML), "
        "API calls (requests), "
        "text processing (regex). "
        "Generated files should be saved to /workspace/output/. "
        "Do NOT use for simple system commands - use shell instead.";
    tool.parameters = {
        {"type", "object"},
        {"properties", {
            {"code", {{"type", "string"},
                      {"description", "Python code to execute in the sandbox."}}}
        }},
        {"required", {"code"}}
    };
    tool.handler = [&executor](const json& params) {
        return ExecutePython(executor, params.at("code").get<std::string>());
    };
    return tool;
}

} // namespace tools
} // namespace sandkit
