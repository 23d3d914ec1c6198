/**
 * @file sandbox_config.hpp
 * @brief Declarative backend configuration (closed tagged union)
 *
 * Configuration arrives as JSON tagged by "type" and is parsed into exactly
 * one of the backend parameter sets. Validation is eager: a configuration
 * that parses is one every backend constructor can accept without any
 * engine or network call.
 *
 * **JSON Example**:
 * ```json
 * {
 *   "type": "docker",
 *   "image": "python:3.12-slim",
 *   "memory_limit": "1g",
 *   "network_enabled": false,
 *   "environment": {"PYTHONUNBUFFERED": "1"}
 * }
 * ```
 *
 * @date 2026
 */

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace sandkit {
namespace core {

/// Host variables copied into a Docker sandbox when no list is configured
inline const std::vector<std::string> kDefaultPassEnvVars = {"TAVILY_API_KEY"};

/**
 * @struct DockerSandboxConfig
 * @brief Local container backend parameters
 */
struct DockerSandboxConfig {
    std::string image{"python:3.12-slim"};           ///< Container image
    std::string memory_limit{"512m"};                ///< Digits with optional b/k/m/g unit
    double cpu_limit{1.0};                           ///< CPU cores (> 0)
    bool network_enabled{true};                      ///< bridge when true, none otherwise
    std::string work_dir{"/workspace"};              ///< Default working directory (absolute)
    bool auto_remove{false};                         ///< Engine removes the container on exit
    std::map<std::string, std::string> environment;  ///< Explicit environment
    std::vector<std::string> pass_env_vars{kDefaultPassEnvVars};  ///< Host pass-through allow-list
    std::map<std::string, std::string> volumes;      ///< host path -> container path (rw)
    std::string container_name;                      ///< Generated when empty
};

/**
 * @struct CloudSandboxConfig
 * @brief Remote workspace backend parameters
 */
struct CloudSandboxConfig {
    std::string api_key;                               ///< Bearer credential (required)
    std::string server_url{"https://api.daytona.io"};  ///< API endpoint
    std::string target{"us"};                          ///< Region
    std::string image{"daytonaio/workspace:latest"};   ///< Workspace image
    int cpu{2};                                        ///< CPU cores
    int memory{4};                                     ///< Memory (GB)
    int disk{10};                                      ///< Disk (GB)
    int auto_stop_interval{30};                        ///< Minutes, 0 disables
};

using SandboxConfig = std::variant<DockerSandboxConfig, CloudSandboxConfig>;

/// Returns a host environment variable, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Parse a JSON configuration
 * @throws ConfigError for an unknown "type", an unknown key, a wrongly typed
 *         value, or a value that fails validation
 */
SandboxConfig ParseSandboxConfig(const nlohmann::json& j);

/**
 * @brief Read and parse a JSON configuration file
 * @throws ConfigError if the file cannot be read or parsed
 */
SandboxConfig LoadSandboxConfig(const std::filesystem::path& path);

/// @throws ConfigError describing the first invalid field
void ValidateConfig(const DockerSandboxConfig& config);
void ValidateConfig(const CloudSandboxConfig& config);
void ValidateConfig(const SandboxConfig& config);

/**
 * @brief Backend type tag of a configuration ("docker" or "daytona")
 */
std::string GetBackendType(const SandboxConfig& config);

/**
 * @brief std::getenv-backed lookup; empty values count as unset
 */
std::optional<std::string> HostEnvLookup(const std::string& name);

/**
 * @brief Explicit environment plus allow-listed host variables
 *
 * A variable named in pass_env_vars is copied from the host only when it is
 * set, non-empty, and not already present in the explicit environment.
 */
std::map<std::string, std::string> BuildEnvironment(const DockerSandboxConfig& config,
                                                    const EnvLookup& lookup = HostEnvLookup);

/**
 * @class DockerSandboxBuilder
 * @brief Fluent API for constructing Docker sandbox configurations
 *
 * **Usage Example**:
 * @code
 * auto config = DockerSandboxBuilder()
 *     .WithImage("python:3.12-slim")
 *     .WithMemoryLimit("1g")
 *     .WithNetwork(false)
 *     .WithEnvironment("PYTHONUNBUFFERED", "1")
 *     .Build();
 *
 * auto sandbox = CreateSandbox(config);
 * @endcode
 */
class DockerSandboxBuilder {
public:
    DockerSandboxBuilder& WithImage(const std::string& image) {
        config_.image = image;
        return *this;
    }

    DockerSandboxBuilder& WithMemoryLimit(const std::string& limit) {
        config_.memory_limit = limit;
        return *this;
    }

    DockerSandboxBuilder& WithCPULimit(double cpus) {
        config_.cpu_limit = cpus;
        return *this;
    }

    /**
     * @brief Enable or disable network access
     * @param enabled bridge network when true, no network otherwise
     * @return Reference to builder for chaining
     */
    DockerSandboxBuilder& WithNetwork(bool enabled) {
        config_.network_enabled = enabled;
        return *this;
    }

    DockerSandboxBuilder& WithWorkDir(const std::string& dir) {
        config_.work_dir = dir;
        return *this;
    }

    DockerSandboxBuilder& WithAutoRemove(bool auto_remove = true) {
        config_.auto_remove = auto_remove;
        return *this;
    }

    DockerSandboxBuilder& WithEnvironment(const std::string& key, const std::string& value) {
        config_.environment[key] = value;
        return *this;
    }

    /**
     * @brief Replace the host pass-through allow-list
     * @param names Variable names (empty disables pass-through)
     * @return Reference to builder for chaining
     */
    DockerSandboxBuilder& WithPassEnvVars(const std::vector<std::string>& names) {
        config_.pass_env_vars = names;
        return *this;
    }

    DockerSandboxBuilder& WithVolume(const std::string& host_path,
                                     const std::string& container_path) {
        config_.volumes[host_path] = container_path;
        return *this;
    }

    DockerSandboxBuilder& WithContainerName(const std::string& name) {
        config_.container_name = name;
        return *this;
    }

    DockerSandboxConfig Build() const {
        return config_;
    }

private:
    DockerSandboxConfig config_;  ///< Configuration being built
};

} // namespace core
} // namespace sandkit
