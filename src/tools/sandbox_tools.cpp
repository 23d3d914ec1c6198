/**
 * @file sandbox_tools.cpp
 * @brief Tool set assembly and name-based dispatch
 *
 * @date 2026
 */

#include "sandkit/tools/sandbox_tools.hpp"
#include "sandkit/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

using json = nlohmann::json;

namespace sandkit {
namespace tools {

using utils::StringUtils;

namespace {

using ToolCreator = Tool (*)(const SandboxToolExecutor&);

struct ToolEntry {
    const char* name;
    const char* summary;
    ToolCreator create;
};

const std::vector<ToolEntry>& ToolTable() {
    static const std::vector<ToolEntry> table = {
        {"shell", "Execute bash commands for system operations", &CreateShellTool},
        {"python", "Execute Python code for data processing and analysis", &CreatePythonTool},
        {"file_read", "Read file contents from the sandbox", &CreateFileReadTool},
        {"file_write", "Write content to a file in the sandbox", &CreateFileWriteTool},
        {"web_browse", "Browse webpages and extract content", &CreateWebBrowseTool},
    };
    return table;
}

/**
 * @brief Check params against a tool's schema
 * @return Error message, empty when the parameters are acceptable
 */
std::string CheckParameters(const Tool& tool, const json& params) {
    if (!params.is_object()) {
        return "Parameters for '" + tool.name + "' must be a JSON object";
    }

    const json required_names = tool.parameters.value("required", json::array());
    for (const auto& required : required_names) {
        const auto name = required.get<std::string>();
        auto it = params.find(name);
        if (it == params.end() || it->is_null()) {
            return "Missing required parameter '" + name + "' for tool '" + tool.name + "'";
        }
    }

    const json properties = tool.parameters.value("properties", json::object());
    for (const auto& property : properties.items()) {
        const std::string& name = property.key();
        auto it = params.find(name);
        if (it == params.end() || it->is_null()) {
            continue;
        }
        if (property.value().value("type", "") == "string" && !it->is_string()) {
            return "Parameter '" + name + "' for tool '" + tool.name + "' must be a string";
        }
    }

    return "";
}

} // anonymous namespace

json MakeErrorResult(const std::string& message) {
    return {{"status", "error"}, {"error", message}};
}

const std::vector<std::string>& GetAvailableToolNames() {
    static const std::vector<std::string> names = []() {
        std::vector<std::string> result;
        for (const auto& entry : ToolTable()) {
            result.emplace_back(entry.name);
        }
        return result;
    }();
    return names;
}

std::vector<Tool> CreateSandboxTools(const SandboxToolExecutor& executor,
                                     const std::vector<std::string>& include_tools) {
    std::vector<Tool> tools;

    if (include_tools.empty()) {
        for (const auto& entry : ToolTable()) {
            tools.push_back(entry.create(executor));
        }
        return tools;
    }

    for (const auto& name : include_tools) {
        const ToolEntry* found = nullptr;
        for (const auto& entry : ToolTable()) {
            if (name == entry.name) {
                found = &entry;
                break;
            }
        }
        if (found == nullptr) {
            throw std::invalid_argument("Unknown tool '" + name + "'. Available: " +
                                        StringUtils::Join(GetAvailableToolNames(), ", "));
        }
        tools.push_back(found->create(executor));
    }

    spdlog::debug("Created {} sandbox tool(s)", tools.size());
    return tools;
}

std::string GetToolDescriptions() {
    std::string text = "Available tools:";
    for (const auto& entry : ToolTable()) {
        text += "\n  - ";
        text += entry.name;
        text += ": ";
        text += entry.summary;
    }
    return text;
}

std::string DumpToolResult(const json& result, int indent) {
    return result.dump(indent, ' ', false, json::error_handler_t::replace);
}

// ============================================================================
// TOOL REGISTRY
// ============================================================================

ToolRegistry::ToolRegistry(std::vector<Tool> tools) : tools_(std::move(tools)) {
    for (std::size_t i = 0; i < tools_.size(); ++i) {
        for (std::size_t j = i + 1; j < tools_.size(); ++j) {
            if (tools_[i].name == tools_[j].name) {
                throw std::invalid_argument("Duplicate tool '" + tools_[i].name + "'");
            }
        }
    }
}

const Tool* ToolRegistry::FindTool(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return FindTool(name) != nullptr;
}

std::vector<std::string> ToolRegistry::GetToolNames() const {
    std::vector<std::string> names;
    for (const auto& tool : tools_) {
        names.push_back(tool.name);
    }
    return names;
}

json ToolRegistry::GetToolSchemas() const {
    json schemas = json::array();
    for (const auto& tool : tools_) {
        schemas.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"parameters", tool.parameters}
        });
    }
    return schemas;
}

json ToolRegistry::Invoke(const std::string& name, const json& params) const {
    const Tool* tool = FindTool(name);
    if (tool == nullptr) {
        spdlog::error("Unknown tool requested: {}", name);
        return MakeErrorResult("Unknown tool '" + name + "'. Available: " +
                               StringUtils::Join(GetToolNames(), ", "));
    }

    auto problem = CheckParameters(*tool, params);
    if (!problem.empty()) {
        spdlog::error("{}", problem);
        return MakeErrorResult(problem);
    }

    try {
        return tool->handler(params);
    } catch (const json::exception& e) {
        spdlog::error("Tool '{}' rejected its parameters: {}", name, e.what());
        return MakeErrorResult(std::string("Invalid parameters for tool '") + name + "': " +
                               e.what());
    }
}

std::future<json> ToolRegistry::InvokeAsync(const std::string& name, json params) const {
    return std::async(std::launch::async, [this, name, params = std::move(params)]() {
        return Invoke(name, params);
    });
}

} // namespace tools
} // namespace sandkit
