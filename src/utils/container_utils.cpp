/**
 * @file container_utils.cpp
 * @brief Implementation of the docker CLI container engine
 *
 * Every engine operation is one invocation of the `docker` client, run
 * with ProcessUtils so stdout and stderr stay separate and binary-safe and
 * every invocation is bounded by a deadline.
 *
 * **Container Lifecycle**:
 * ```
 * version → image inspect → [pull] → create → start → exec/cp ... → rm -f
 * ```
 *
 * **Failure Classification**:
 * The client reports its own failures on stderr with recognizable prefixes
 * ("Error response from daemon", "Cannot connect to the Docker daemon").
 * Those become ContainerError; anything else produced by `docker exec` is
 * the in-container command's own output and exit status.
 *
 * @date 2026
 */

#include "sandkit/utils/container_utils.hpp"
#include "sandkit/utils/process_utils.hpp"
#include "sandkit/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace sandkit {
namespace utils {

namespace {

bool IsClientFailure(const std::string& stderr_output) {
    const std::string text = StringUtils::Trim(stderr_output);
    return StringUtils::StartsWith(text, "Error response from daemon") ||
           StringUtils::StartsWith(text, "Cannot connect to the Docker daemon") ||
           StringUtils::StartsWith(text, "Error: No such container") ||
           // Emitted by ProcessUtils when the client binary cannot be executed
           StringUtils::StartsWith(text, "exec failed:");
}

bool IsMissingContainer(const std::string& stderr_output) {
    return StringUtils::Contains(stderr_output, "No such container") ||
           StringUtils::Contains(stderr_output, "is already in progress");
}

bool IsMissingPath(const std::string& stderr_output) {
    return StringUtils::Contains(stderr_output, "No such container:path") ||
           StringUtils::Contains(stderr_output, "Could not find the file");
}

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerCli::DockerCli(std::string binary,
                     std::chrono::seconds command_timeout,
                     std::chrono::seconds pull_timeout)
    : binary_(std::move(binary)),
      command_timeout_(command_timeout),
      pull_timeout_(pull_timeout) {
}

ContainerExecResult DockerCli::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                    const std::string& stdin_data,
                                                    std::chrono::milliseconds timeout) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    auto process = ProcessUtils::Run(argv, stdin_data, timeout);

    ContainerExecResult result;
    result.exit_code = process.exit_code;
    result.stdout_output = std::move(process.stdout_output);
    result.stderr_output = std::move(process.stderr_output);
    result.duration = process.duration;
    result.client_timed_out = process.timed_out;
    result.success = !process.timed_out && process.exit_code == 0;
    return result;
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

std::string DockerCli::GetVersion() {
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"}, "",
                                       command_timeout_);
    if (!result.success) {
        std::string reason = result.client_timed_out ? "timed out" : StringUtils::Trim(result.stderr_output);
        throw ContainerError("Docker daemon not reachable: " + reason);
    }

    std::string version = StringUtils::Trim(result.stdout_output);
    spdlog::debug("Docker server version: {}", version);
    return version;
}

// ============================================================================
// IMAGES
// ============================================================================

bool DockerCli::ImageExists(const std::string& image) {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image}, "",
                                       command_timeout_);
    if (result.success) {
        return true;
    }
    if (StringUtils::ContainsIgnoreCase(result.stderr_output, "no such image")) {
        return false;
    }
    throw ContainerError("Failed to inspect image " + image + ": " +
                         StringUtils::Trim(result.stderr_output));
}

void DockerCli::PullImage(const std::string& image) {
    spdlog::info("Pulling image: {}", image);

    auto result = ExecuteDockerCommand({"pull", image}, "", pull_timeout_);
    if (!result.success) {
        std::string reason = result.client_timed_out
            ? "pull timed out after " + std::to_string(pull_timeout_.count()) + "s"
            : StringUtils::Trim(result.stderr_output);
        spdlog::error("Failed to pull image {}: {}", image, reason);
        throw ContainerError("Failed to pull image " + image + ": " + reason);
    }

    spdlog::info("Image pulled: {}", image);
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::string DockerCli::CreateContainer(const ContainerConfig& config) {
    spdlog::info("Creating container: {}", config.name);

    auto result = ExecuteDockerCommand(BuildCreateCommand(config), "", command_timeout_);
    if (!result.success) {
        spdlog::error("Failed to create container: {}", StringUtils::Trim(result.stderr_output));
        throw ContainerError("Failed to create container " + config.name + ": " +
                             StringUtils::Trim(result.stderr_output));
    }

    std::string container_id = StringUtils::Trim(result.stdout_output);
    spdlog::info("Container created: {}", container_id.substr(0, 12));
    return container_id;
}

void DockerCli::StartContainer(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"start", container_id}, "", command_timeout_);
    if (!result.success) {
        spdlog::error("Failed to start container: {}", StringUtils::Trim(result.stderr_output));
        throw ContainerError("Failed to start container " + container_id + ": " +
                             StringUtils::Trim(result.stderr_output));
    }
    spdlog::debug("Container started: {}", container_id.substr(0, 12));
}

void DockerCli::RemoveContainer(const std::string& container_id, bool force) {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args, "", command_timeout_);
    if (result.success) {
        spdlog::info("Container removed: {}", container_id.substr(0, 12));
        return;
    }

    if (IsMissingContainer(result.stderr_output)) {
        spdlog::debug("Container {} already removed", container_id.substr(0, 12));
        return;
    }

    throw ContainerError("Failed to remove container " + container_id + ": " +
                         StringUtils::Trim(result.stderr_output));
}

// ============================================================================
// CONTAINER COMMAND EXECUTION
// ============================================================================

ContainerExecResult DockerCli::ExecuteCommand(const std::string& container_id,
                                              const ExecRequest& request) {
    if (request.command.empty()) {
        throw ContainerError("exec request has no command");
    }

    auto timeout = request.client_timeout.value_or(
        std::chrono::duration_cast<std::chrono::milliseconds>(command_timeout_));
    auto result = ExecuteDockerCommand(BuildExecCommand(container_id, request), "", timeout);

    if (result.client_timed_out) {
        // The in-container process is bounded separately; only the client was stuck
        spdlog::warn("docker exec client killed after {} ms", timeout.count());
        return result;
    }

    if (result.exit_code != 0 && IsClientFailure(result.stderr_output)) {
        throw ContainerError("docker exec failed: " + StringUtils::Trim(result.stderr_output));
    }

    return result;
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================
// `docker cp` with "-" streams a tar archive through stdin/stdout

void DockerCli::PutArchive(const std::string& container_id,
                           const std::string& dest_dir,
                           const std::string& tar_data) {
    auto result = ExecuteDockerCommand({"cp", "-", container_id + ":" + dest_dir}, tar_data,
                                       command_timeout_);
    if (!result.success) {
        throw ContainerError("Failed to copy archive into " + dest_dir + ": " +
                             StringUtils::Trim(result.stderr_output));
    }
}

std::string DockerCli::GetArchive(const std::string& container_id, const std::string& path) {
    auto result = ExecuteDockerCommand({"cp", container_id + ":" + path, "-"}, "",
                                       command_timeout_);
    if (result.success) {
        return std::move(result.stdout_output);
    }

    if (IsMissingPath(result.stderr_output)) {
        throw ContainerPathNotFoundError("No such file in container: " + path);
    }

    throw ContainerError("Failed to copy " + path + " from container: " +
                         StringUtils::Trim(result.stderr_output));
}

// ============================================================================
// COMMAND BUILDING
// ============================================================================

std::vector<std::string> DockerCli::BuildCreateCommand(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("create");
    args.push_back("-i");  // Keep stdin open so the idle shell never exits
    args.push_back("-t");

    // Container name
    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Working directory
    args.push_back("-w");
    args.push_back(config.working_dir);

    // Memory limit
    if (!config.memory_limit.empty()) {
        args.push_back("--memory");
        args.push_back(config.memory_limit);
    }

    // CPU limit
    if (config.cpu_limit > 0) {
        args.push_back("--cpus");
        args.push_back(FormatCpus(config.cpu_limit));
    }

    // Network mode
    args.push_back("--network");
    args.push_back(config.network_mode == NetworkMode::BRIDGE ? "bridge" : "none");

    // Auto-remove on exit
    if (config.auto_remove) {
        args.push_back("--rm");
    }

    // Environment variables
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    // Volume mounts
    for (const auto& [host_path, container_path] : config.volumes) {
        args.push_back("-v");
        args.push_back(host_path + ":" + container_path + ":rw");
    }

    // Image (must be last before command)
    args.push_back(config.image);
    args.insert(args.end(), config.idle_command.begin(), config.idle_command.end());

    return args;
}

std::vector<std::string> DockerCli::BuildExecCommand(const std::string& container_id,
                                                     const ExecRequest& request) {
    std::vector<std::string> args = {"exec", "-i"};

    if (!request.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(request.working_dir);
    }

    for (const auto& [key, value] : request.environment) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    args.push_back(container_id);
    args.insert(args.end(), request.command.begin(), request.command.end());

    return args;
}

std::string DockerCli::GenerateContainerName(const std::string& prefix) {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::mutex gen_mutex;

    std::uint32_t value;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        value = static_cast<std::uint32_t>(gen());
    }

    std::ostringstream oss;
    oss << prefix << "_" << std::hex << std::setw(8) << std::setfill('0') << value;
    return oss.str();
}

// ============================================================================
// CONTAINER BUILDER IMPLEMENTATION (FLUENT API)
// ============================================================================

ContainerBuilder& ContainerBuilder::WithName(const std::string& name) {
    config_.name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithImage(const std::string& image) {
    config_.image = image;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMemoryLimit(const std::string& limit) {
    config_.memory_limit = limit;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCPULimit(double cpus) {
    config_.cpu_limit = cpus;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithNetwork(NetworkMode mode) {
    config_.network_mode = mode;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithWorkingDir(const std::string& dir) {
    config_.working_dir = dir;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMount(const std::string& host,
                                              const std::string& container) {
    config_.volumes[host] = container;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithEnvironment(const std::string& key,
                                                    const std::string& value) {
    config_.environment_vars[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithAutoRemove(bool auto_remove) {
    config_.auto_remove = auto_remove;
    return *this;
}

ContainerConfig ContainerBuilder::Build() const {
    return config_;
}

} // namespace utils
} // namespace sandkit
