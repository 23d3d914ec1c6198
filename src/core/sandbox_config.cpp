/**
 * @file sandbox_config.cpp
 * @brief Parsing and validation of backend configurations
 *
 * @date 2026
 */

#include "sandkit/core/sandbox_config.hpp"
#include "sandkit/core/errors.hpp"
#include "sandkit/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <regex>
#include <set>
#include <type_traits>

using json = nlohmann::json;

namespace sandkit {
namespace core {

namespace {

const std::set<std::string> kDockerKeys = {
    "type", "image", "memory_limit", "cpu_limit", "network_enabled", "work_dir",
    "auto_remove", "environment", "pass_env_vars", "volumes", "container_name"
};

const std::set<std::string> kCloudKeys = {
    "type", "api_key", "server_url", "target", "image", "cpu", "memory", "disk",
    "auto_stop_interval"
};

void RejectUnknownKeys(const json& j, const std::set<std::string>& allowed,
                       const std::string& backend) {
    for (const auto& item : j.items()) {
        if (allowed.count(item.key()) == 0) {
            throw ConfigError("Unknown key '" + item.key() + "' for " + backend + " sandbox");
        }
    }
}

// Absent and null keys keep the default already in target
template <typename T>
void ReadField(const json& j, const std::string& key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }

    if constexpr (std::is_same_v<T, int>) {
        if (!it->is_number_integer()) {
            throw ConfigError("Invalid value for '" + key + "': expected an integer");
        }
    }

    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError("Invalid value for '" + key + "': " + e.what());
    }
}

DockerSandboxConfig ParseDockerConfig(const json& j) {
    RejectUnknownKeys(j, kDockerKeys, "docker");

    DockerSandboxConfig config;
    ReadField(j, "image", config.image);
    ReadField(j, "memory_limit", config.memory_limit);
    ReadField(j, "cpu_limit", config.cpu_limit);
    ReadField(j, "network_enabled", config.network_enabled);
    ReadField(j, "work_dir", config.work_dir);
    ReadField(j, "auto_remove", config.auto_remove);
    ReadField(j, "environment", config.environment);
    ReadField(j, "pass_env_vars", config.pass_env_vars);
    ReadField(j, "volumes", config.volumes);
    ReadField(j, "container_name", config.container_name);
    return config;
}

CloudSandboxConfig ParseCloudConfig(const json& j) {
    RejectUnknownKeys(j, kCloudKeys, "daytona");

    CloudSandboxConfig config;
    ReadField(j, "api_key", config.api_key);
    ReadField(j, "server_url", config.server_url);
    ReadField(j, "target", config.target);
    ReadField(j, "image", config.image);
    ReadField(j, "cpu", config.cpu);
    ReadField(j, "memory", config.memory);
    ReadField(j, "disk", config.disk);
    ReadField(j, "auto_stop_interval", config.auto_stop_interval);

    while (utils::StringUtils::EndsWith(config.server_url, "/")) {
        config.server_url.pop_back();
    }
    return config;
}

struct BackendTypeVisitor {
    std::string operator()(const DockerSandboxConfig&) const { return "docker"; }
    std::string operator()(const CloudSandboxConfig&) const { return "daytona"; }
};

} // anonymous namespace

// ============================================================================
// PARSING
// ============================================================================

SandboxConfig ParseSandboxConfig(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Sandbox configuration must be a JSON object");
    }

    std::string type = "docker";
    ReadField(j, "type", type);
    type = utils::StringUtils::ToLower(type);

    SandboxConfig config;
    if (type == "docker") {
        config = ParseDockerConfig(j);
    } else if (type == "daytona" || type == "cloud") {
        config = ParseCloudConfig(j);
    } else {
        throw ConfigError("Unsupported sandbox type: '" + type + "' (expected docker or daytona)");
    }

    ValidateConfig(config);
    return config;
}

SandboxConfig LoadSandboxConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed configuration file " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return ParseSandboxConfig(j);
}

// ============================================================================
// VALIDATION
// ============================================================================

void ValidateConfig(const DockerSandboxConfig& config) {
    if (config.image.empty()) {
        throw ConfigError("docker: image must not be empty");
    }

    static const std::regex memory_regex(R"(^[0-9]+[bkmgBKMG]?$)");
    if (!std::regex_match(config.memory_limit, memory_regex)) {
        throw ConfigError("docker: invalid memory_limit '" + config.memory_limit +
                          "' (expected e.g. 512m, 2g)");
    }

    if (!(config.cpu_limit > 0)) {
        throw ConfigError("docker: cpu_limit must be positive");
    }

    if (!utils::StringUtils::StartsWith(config.work_dir, "/")) {
        throw ConfigError("docker: work_dir must be an absolute path");
    }

    for (const auto& [host_path, container_path] : config.volumes) {
        if (host_path.empty() || !utils::StringUtils::StartsWith(container_path, "/")) {
            throw ConfigError("docker: volume '" + host_path + "' needs an absolute container path");
        }
    }

    for (const auto& [key, value] : config.environment) {
        if (key.empty() || utils::StringUtils::Contains(key, "=")) {
            throw ConfigError("docker: invalid environment variable name '" + key + "'");
        }
    }
}

void ValidateConfig(const CloudSandboxConfig& config) {
    if (config.api_key.empty()) {
        throw ConfigError("daytona: api_key is required");
    }

    if (!utils::StringUtils::StartsWith(config.server_url, "http://") &&
        !utils::StringUtils::StartsWith(config.server_url, "https://")) {
        throw ConfigError("daytona: server_url must be an http(s) URL");
    }

    if (config.target.empty() || config.image.empty()) {
        throw ConfigError("daytona: target and image must not be empty");
    }

    if (config.cpu <= 0 || config.memory <= 0 || config.disk <= 0) {
        throw ConfigError("daytona: cpu, memory and disk must be positive");
    }

    if (config.auto_stop_interval < 0) {
        throw ConfigError("daytona: auto_stop_interval must be >= 0");
    }
}

void ValidateConfig(const SandboxConfig& config) {
    std::visit([](const auto& backend_config) { ValidateConfig(backend_config); }, config);
}

std::string GetBackendType(const SandboxConfig& config) {
    return std::visit(BackendTypeVisitor{}, config);
}

// ============================================================================
// ENVIRONMENT PASS-THROUGH
// ============================================================================

std::optional<std::string> HostEnvLookup(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::map<std::string, std::string> BuildEnvironment(const DockerSandboxConfig& config,
                                                    const EnvLookup& lookup) {
    auto env = config.environment;

    for (const auto& name : config.pass_env_vars) {
        if (env.count(name)) {
            continue;  // Explicit values win
        }
        auto value = lookup(name);
        if (value && !value->empty()) {
            env[name] = *value;
            spdlog::debug("Passing host variable {} into sandbox", name);
        }
    }

    return env;
}

} // namespace core
} // namespace sandkit
