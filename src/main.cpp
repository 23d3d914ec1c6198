/**
 * @file main.cpp
 * @brief sandkit - Command-line interface
 *
 * Starts one sandbox from a JSON configuration and serves tool calls
 * against it: a single call given on the command line, or newline-delimited
 * JSON requests read from stdin.
 *
 * **Request Line**:
 * ```json
 * {"tool": "shell", "params": {"command": "ls -la /workspace"}}
 * ```
 *
 * Results are written to stdout, one JSON object per line. Logs go to
 * stderr.
 *
 * @date 2026
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "sandkit/core/errors.hpp"
#include "sandkit/core/sandbox_factory.hpp"
#include "sandkit/tools/sandbox_tools.hpp"
#include "sandkit/utils/string_utils.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace sandkit;

/*******************************************************************************
 * Request Handling
 ******************************************************************************/

json HandleRequestLine(const tools::ToolRegistry& registry, const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        spdlog::error("Malformed request: {}", e.what());
        return tools::MakeErrorResult(std::string("Malformed request: ") + e.what());
    }

    if (!request.is_object() || !request.contains("tool") || !request["tool"].is_string()) {
        return tools::MakeErrorResult("Request must be an object with a string \"tool\" field");
    }

    json params = request.value("params", json::object());
    return registry.Invoke(request["tool"].get<std::string>(), params);
}

int ServeStdin(const tools::ToolRegistry& registry) {
    std::string line;
    std::size_t handled = 0;

    while (std::getline(std::cin, line)) {
        if (utils::StringUtils::Trim(line).empty()) {
            continue;
        }
        std::cout << tools::DumpToolResult(HandleRequestLine(registry, line)) << std::endl;
        ++handled;
    }

    spdlog::info("Input closed after {} request(s)", handled);
    return 0;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sandkit - isolated command and code execution"};

    std::string config_path;
    std::string tool_name;
    std::string tool_params = "{}";
    std::vector<std::string> include_tools;
    std::size_t max_output = tools::SandboxToolExecutor::kDefaultMaxOutputChars;
    int timeout_seconds = static_cast<int>(core::workspace::kDefaultCommandTimeout.count());
    bool list_tools = false;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "Sandbox configuration (JSON)")
        ->check(CLI::ExistingFile);
    app.add_option("--tool", tool_name, "Run a single tool call and exit");
    app.add_option("--params", tool_params, "Tool parameters as a JSON object")
        ->needs("--tool");
    app.add_option("--include-tools", include_tools, "Comma-separated tools to enable")
        ->delimiter(',');
    app.add_option("--max-output", max_output, "Maximum characters of returned output")
        ->check(CLI::PositiveNumber);
    app.add_option("--timeout", timeout_seconds, "Default command timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_flag("--list-tools", list_tools, "Print the available tools and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // stdout carries results only
    spdlog::set_default_logger(spdlog::stderr_color_mt("sandkit"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (list_tools) {
        std::cout << tools::GetToolDescriptions() << std::endl;
        return 0;
    }

    json params;
    if (!tool_name.empty()) {
        try {
            params = json::parse(tool_params);
        } catch (const json::parse_error& e) {
            spdlog::error("Invalid --params: {}", e.what());
            return 1;
        }
    }

    std::unique_ptr<core::Sandbox> sandbox;
    try {
        core::SandboxConfig config = config_path.empty()
                                         ? core::SandboxConfig(core::DockerSandboxConfig{})
                                         : core::LoadSandboxConfig(config_path);
        sandbox = core::CreateSandbox(config);
    } catch (const core::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 1;
    }

    try {
        core::ScopedSandbox scoped(std::move(sandbox));

        tools::SandboxToolExecutor executor(scoped.Get(), max_output,
                                            std::chrono::seconds(timeout_seconds));
        tools::ToolRegistry registry(tools::CreateSandboxTools(executor, include_tools));

        spdlog::info("Sandbox ready ({}); tools: {}", scoped->GetBackendName(),
                     utils::StringUtils::Join(registry.GetToolNames(), ", "));

        int status = 0;
        if (!tool_name.empty()) {
            std::cout << tools::DumpToolResult(registry.Invoke(tool_name, params), 2) << std::endl;
        } else {
            status = ServeStdin(registry);
        }

        scoped.Release();
        return status;

    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const core::SandboxError& e) {
        spdlog::error("Sandbox error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
