/**
 * @file sandbox_tools.hpp
 * @brief Named operations exposed to an orchestration collaborator
 *
 * Every tool takes a JSON parameter object and returns a JSON result with
 * at least a "status" field ("success" or "error"). Per-operation failures
 * (missing file, rejected path, unreachable engine) are returned as
 * `{"status": "error", "error": ...}`; they never escape as exceptions.
 *
 * **Tools**:
 * ```
 * shell       {command, working_dir?}  → {status, stdout, stderr, exit_code}
 * python      {code}                   → {status, stdout, stderr, exit_code, generated_files}
 * file_read   {path}                   → {status, content, path}
 * file_write  {path, content}          → {status, path, size, sha256}
 * web_browse  {url, selector?}         → {status, url, title, content}
 * ```
 *
 * @date 2026
 */

#pragma once

#include "sandkit/tools/tool_executor.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sandkit {
namespace tools {

/// Seconds a browse script may run
inline constexpr std::chrono::seconds kBrowseTimeout{60};

/**
 * @struct Tool
 * @brief One independently invocable operation
 */
struct Tool {
    std::string name;                                        ///< Name exposed to the caller
    std::string description;                                 ///< When to use it
    nlohmann::json parameters;                               ///< JSON schema of the parameters
    std::function<nlohmann::json(const nlohmann::json&)> handler;  ///< Runs the operation
};

/// {"status": "error", "error": message}
nlohmann::json MakeErrorResult(const std::string& message);

// ============================================================================
// OPERATIONS
// ============================================================================

/**
 * @brief Run a shell command
 * @param timeout Defaults to the executor's default timeout
 */
nlohmann::json ExecuteShell(const SandboxToolExecutor& executor,
                            const std::string& command,
                            const std::string& working_dir = core::workspace::kRoot,
                            std::optional<std::chrono::seconds> timeout = std::nullopt);

/**
 * @brief Write code to the script path, run it with python3, list outputs
 */
nlohmann::json ExecutePython(const SandboxToolExecutor& executor,
                             const std::string& code,
                             std::optional<std::chrono::seconds> timeout = std::nullopt);

nlohmann::json ReadSandboxFile(const SandboxToolExecutor& executor, const std::string& path);

nlohmann::json WriteSandboxFile(const SandboxToolExecutor& executor,
                                const std::string& path,
                                const std::string& content);

/**
 * @brief Load a page in a headless browser inside the sandbox
 * @param selector CSS selector restricting the extracted text
 */
nlohmann::json WebBrowse(const SandboxToolExecutor& executor,
                         const std::string& url,
                         const std::optional<std::string>& selector = std::nullopt);

/**
 * @brief Escape a CSS selector for a double-quoted Python string literal
 *
 * Backslashes and double quotes are escaped; CR and LF become spaces.
 */
std::string EscapeSelector(const std::string& selector);

/**
 * @brief Generate the Playwright script run by WebBrowse()
 *
 * The script prints one JSON object on stdout.
 */
std::string BuildBrowserScript(const std::string& url,
                               const std::optional<std::string>& selector,
                               std::size_t max_content_chars);

// ============================================================================
// TOOL SET
// ============================================================================

Tool CreateShellTool(const SandboxToolExecutor& executor);
Tool CreatePythonTool(const SandboxToolExecutor& executor);
Tool CreateFileReadTool(const SandboxToolExecutor& executor);
Tool CreateFileWriteTool(const SandboxToolExecutor& executor);
Tool CreateWebBrowseTool(const SandboxToolExecutor& executor);

/**
 * @brief Names of every tool, in creation order
 */
const std::vector<std::string>& GetAvailableToolNames();

/**
 * @brief Create the tool set
 * @param include_tools Names to include (empty selects all)
 * @throws std::invalid_argument for an unknown name
 */
std::vector<Tool> CreateSandboxTools(const SandboxToolExecutor& executor,
                                     const std::vector<std::string>& include_tools = {});

/**
 * @brief "Available tools:" followed by one line per tool
 */
std::string GetToolDescriptions();

/**
 * @brief Serialize a tool result, replacing invalid UTF-8 sequences
 * @param indent -1 for a single line
 */
std::string DumpToolResult(const nlohmann::json& result, int indent = -1);

/**
 * @class ToolRegistry
 * @brief Dispatches calls by tool name
 *
 * **Usage Example**:
 * @code
 * SandboxToolExecutor executor(sandbox);
 * ToolRegistry registry(CreateSandboxTools(executor));
 *
 * auto result = registry.Invoke("shell", {{"command", "ls /workspace"}});
 * std::cout << DumpToolResult(result) << std::endl;
 * @endcode
 */
class ToolRegistry {
public:
    explicit ToolRegistry(std::vector<Tool> tools);

    /**
     * @brief Validate parameters against the tool's schema and run it
     * @return Tool result, or an error payload for an unknown tool or
     *         missing/mistyped parameters
     */
    nlohmann::json Invoke(const std::string& name, const nlohmann::json& params) const;

    /**
     * @brief Invoke() on a background thread
     */
    std::future<nlohmann::json> InvokeAsync(const std::string& name,
                                            nlohmann::json params) const;

    bool HasTool(const std::string& name) const;
    std::vector<std::string> GetToolNames() const;
    const std::vector<Tool>& GetTools() const { return tools_; }

    /**
     * @brief [{name, description, parameters}] for every registered tool
     */
    nlohmann::json GetToolSchemas() const;

private:
    const Tool* FindTool(const std::string& name) const;

    std::vector<Tool> tools_;
};

} // namespace tools
} // namespace sandkit
