/**
 * @file container_utils.hpp
 * @brief Container engine access for the local sandbox backend
 *
 * Provides the container lifecycle and file-transfer primitives the local
 * backend needs: image presence and pull, creation with resource limits,
 * exec with per-call environment and working directory, tar streaming in
 * and out of the container filesystem, and removal.
 *
 * ContainerEngine is the seam; DockerCli implements it by driving the
 * `docker` command-line client, and tests substitute their own engine.
 *
 * @date 2026
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandkit {
namespace utils {

/**
 * @enum NetworkMode
 * @brief Container network isolation modes
 */
enum class NetworkMode {
    NONE,    ///< No network access
    BRIDGE   ///< Default bridge network
};

/**
 * @struct ContainerConfig
 * @brief Parameters for creating a persistent exec-target container
 */
struct ContainerConfig {
    std::string name;                                     ///< Container name
    std::string image{"python:3.12-slim"};                ///< Base image
    std::string memory_limit{"512m"};                     ///< Engine memory limit (e.g. "512m")
    double cpu_limit{1.0};                                ///< CPU quota in cores
    NetworkMode network_mode{NetworkMode::BRIDGE};        ///< Network mode
    std::string working_dir{"/workspace"};                ///< Default working directory
    bool auto_remove{false};                              ///< Remove when the idle command exits
    std::map<std::string, std::string> environment_vars;  ///< Container environment
    std::map<std::string, std::string> volumes;           ///< host path -> container path (rw)
    std::vector<std::string> idle_command{"/bin/bash"};   ///< Keeps the container alive (-i -t)
};

/**
 * @struct ExecRequest
 * @brief One command to run inside a running container
 */
struct ExecRequest {
    std::vector<std::string> command;                         ///< argv inside the container
    std::string working_dir;                                  ///< Empty: container default
    std::map<std::string, std::string> environment;           ///< Extra variables for this exec
    std::optional<std::chrono::milliseconds> client_timeout;  ///< Kill the engine client after this
};

/**
 * @struct ContainerExecResult
 * @brief Result of command execution in container
 */
struct ContainerExecResult {
    int exit_code{0};                       ///< Exit code
    std::string stdout_output;              ///< Standard output
    std::string stderr_output;              ///< Standard error
    std::chrono::milliseconds duration{0};  ///< Execution duration
    bool success{false};                    ///< exit_code == 0
    bool client_timed_out{false};           ///< Engine client killed at client_timeout
};

/**
 * @class ContainerError
 * @brief The engine could not be reached or rejected an operation
 */
class ContainerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ContainerPathNotFoundError
 * @brief A path requested from the container filesystem does not exist
 */
class ContainerPathNotFoundError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

/**
 * @class ContainerEngine
 * @brief Synchronous container engine interface
 *
 * Every method blocks until the engine answers and throws ContainerError
 * on engine or transport failure. A command that runs and exits non-zero
 * is not a failure of ExecuteCommand.
 */
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    /**
     * @brief Confirm the engine daemon is reachable
     * @return Server version string
     */
    virtual std::string GetVersion() = 0;

    virtual bool ImageExists(const std::string& image) = 0;
    virtual void PullImage(const std::string& image) = 0;

    /**
     * @brief Create (but do not start) a container
     * @return Container ID
     */
    virtual std::string CreateContainer(const ContainerConfig& config) = 0;

    virtual void StartContainer(const std::string& container_id) = 0;

    /**
     * @brief Remove a container; an already-removed container is not an error
     */
    virtual void RemoveContainer(const std::string& container_id, bool force) = 0;

    virtual ContainerExecResult ExecuteCommand(const std::string& container_id,
                                               const ExecRequest& request) = 0;

    /**
     * @brief Extract a tar stream into a directory of the container
     */
    virtual void PutArchive(const std::string& container_id,
                            const std::string& dest_dir,
                            const std::string& tar_data) = 0;

    /**
     * @brief Fetch a path of the container as a tar stream
     * @throws ContainerPathNotFoundError if the path does not exist
     */
    virtual std::string GetArchive(const std::string& container_id,
                                   const std::string& path) = 0;
};

/**
 * @class DockerCli
 * @brief ContainerEngine driving the `docker` command-line client
 *
 * **Usage Example**:
 * @code
 * DockerCli docker;
 * docker.GetVersion();
 *
 * auto config = ContainerBuilder()
 *     .WithName(DockerCli::GenerateContainerName("sandbox"))
 *     .WithImage("python:3.12-slim")
 *     .WithMemoryLimit("512m")
 *     .WithNetwork(NetworkMode::NONE)
 *     .Build();
 *
 * std::string id = docker.CreateContainer(config);
 * docker.StartContainer(id);
 *
 * ExecRequest request;
 * request.command = {"/bin/bash", "-c", "echo hello"};
 * auto result = docker.ExecuteCommand(id, request);
 *
 * docker.RemoveContainer(id, true);
 * @endcode
 */
class DockerCli : public ContainerEngine {
public:
    /**
     * @param binary Client executable (resolved through PATH)
     * @param command_timeout Bound on management commands (create, cp, rm, ...)
     * @param pull_timeout Bound on image pulls
     */
    explicit DockerCli(std::string binary = "docker",
                       std::chrono::seconds command_timeout = std::chrono::seconds(120),
                       std::chrono::seconds pull_timeout = std::chrono::seconds(900));

    std::string GetVersion() override;
    bool ImageExists(const std::string& image) override;
    void PullImage(const std::string& image) override;
    std::string CreateContainer(const ContainerConfig& config) override;
    void StartContainer(const std::string& container_id) override;
    void RemoveContainer(const std::string& container_id, bool force) override;
    ContainerExecResult ExecuteCommand(const std::string& container_id,
                                       const ExecRequest& request) override;
    void PutArchive(const std::string& container_id,
                    const std::string& dest_dir,
                    const std::string& tar_data) override;
    std::string GetArchive(const std::string& container_id,
                           const std::string& path) override;

    /**
     * @brief Arguments of `docker create` for a configuration (binary excluded)
     */
    static std::vector<std::string> BuildCreateCommand(const ContainerConfig& config);

    /**
     * @brief Arguments of `docker exec` for a request (binary excluded)
     */
    static std::vector<std::string> BuildExecCommand(const std::string& container_id,
                                                     const ExecRequest& request);

    /**
     * @brief Random container name: "<prefix>_<8 hex digits>"
     */
    static std::string GenerateContainerName(const std::string& prefix = "sandbox");

private:
    ContainerExecResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                             const std::string& stdin_data,
                                             std::chrono::milliseconds timeout) const;

    std::string binary_;
    std::chrono::seconds command_timeout_;
    std::chrono::seconds pull_timeout_;
};

/**
 * @class ContainerBuilder
 * @brief Fluent API for building container configurations
 */
class ContainerBuilder {
public:
    ContainerBuilder& WithName(const std::string& name);
    ContainerBuilder& WithImage(const std::string& image);
    ContainerBuilder& WithMemoryLimit(const std::string& limit);
    ContainerBuilder& WithCPULimit(double cpus);
    ContainerBuilder& WithNetwork(NetworkMode mode);
    ContainerBuilder& WithWorkingDir(const std::string& dir);
    ContainerBuilder& WithMount(const std::string& host, const std::string& container);
    ContainerBuilder& WithEnvironment(const std::string& key, const std::string& value);
    ContainerBuilder& WithAutoRemove(bool auto_remove = true);

    ContainerConfig Build() const;

private:
    ContainerConfig config_;  ///< Configuration being built
};

} // namespace utils
} // namespace sandkit
