/**
 * @file docker_sandbox.cpp
 * @brief Implementation of the local container sandbox
 *
 * **State Machine**:
 * ```
 * UNINITIALIZED ──Start()──▶ STARTING ──ok──▶ RUNNING ──Cleanup()──▶ CLEANING_UP ──▶ DESTROYED
 *       ▲                        │
 *       └────────failure─────────┘  (partial container removed, client released)
 * ```
 *
 * **Error Translation**:
 * - engine unreachable during Start()          → TransportError
 * - image/create/start/init failure            → ProvisioningError
 * - `docker cp` reports a missing path         → NotFoundError
 * - any other engine failure after Start()     → TransportError
 *
 * @date 2026
 */

#include "sandkit/backends/docker_sandbox.hpp"
#include "sandkit/core/errors.hpp"
#include "sandkit/core/workspace.hpp"
#include "sandkit/utils/string_utils.hpp"
#include "sandkit/utils/tar_archive.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace sandkit {
namespace backends {

using core::CommandResult;
using utils::StringUtils;

namespace {

constexpr std::size_t kBridgeWorkers = 4;
constexpr std::chrono::seconds kSetupCommandTimeout{60};

std::string ShortId(const std::string& container_id) {
    return container_id.substr(0, 12);
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

DockerSandbox::DockerSandbox(core::DockerSandboxConfig config,
                             ContainerEngineFactory engine_factory)
    : config_(std::move(config)),
      engine_factory_(std::move(engine_factory)),
      container_name_(config_.container_name.empty()
                          ? utils::DockerCli::GenerateContainerName("sandbox")
                          : config_.container_name),
      bridge_(kBridgeWorkers, "docker") {
}

DockerSandbox::~DockerSandbox() {
    if (state_.load() != SandboxState::RUNNING) {
        return;
    }

    spdlog::warn("Docker sandbox {} destroyed while running; cleaning up", container_name_);
    try {
        Cleanup().get();
    } catch (const std::exception& e) {
        spdlog::error("Cleanup during destruction failed: {}", e.what());
    }
}

ContainerEngineFactory DockerSandbox::DefaultEngineFactory() {
    return []() { return std::make_shared<utils::DockerCli>(); };
}

std::string DockerSandbox::GetContainerId() const {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    return container_id_;
}

std::pair<std::shared_ptr<utils::ContainerEngine>, std::string>
DockerSandbox::SnapshotHandle() const {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    return {engine_, container_id_};
}

void DockerSandbox::RequireRunning(const char* operation) const {
    auto state = state_.load();
    if (state != SandboxState::RUNNING) {
        throw core::NotStartedError(std::string("Docker sandbox not started (") + operation +
                                    " called while " + StateToString(state) + ")");
    }
}

std::string DockerSandbox::ResolvePath(const std::string& path) const {
    if (StringUtils::StartsWith(path, "/")) {
        return path;
    }
    return StringUtils::NormalizePosixPath(config_.work_dir + "/" + path);
}

// ============================================================================
// CONFIGURATION MAPPING
// ============================================================================

utils::ContainerConfig DockerSandbox::BuildContainerConfig() const {
    utils::ContainerBuilder builder;
    builder.WithName(container_name_)
        .WithImage(config_.image)
        .WithMemoryLimit(config_.memory_limit)
        .WithCPULimit(config_.cpu_limit)
        .WithNetwork(config_.network_enabled ? utils::NetworkMode::BRIDGE
                                             : utils::NetworkMode::NONE)
        .WithWorkingDir(config_.work_dir)
        .WithAutoRemove(config_.auto_remove);

    for (const auto& [key, value] : config_.environment) {
        builder.WithEnvironment(key, value);
    }
    for (const auto& [host_path, container_path] : config_.volumes) {
        builder.WithMount(host_path, container_path);
    }

    return builder.Build();
}

utils::ExecRequest DockerSandbox::BuildExecRequest(const std::string& command,
                                                   const std::string& working_dir,
                                                   std::chrono::seconds timeout,
                                                   const core::EnvMap& env) {
    // `timeout 0` would disable the limit entirely
    auto seconds = std::max<std::chrono::seconds::rep>(timeout.count(), 1);

    utils::ExecRequest request;
    request.command = {
        "timeout",
        "--kill-after=" + std::to_string(kKillAfterSeconds),
        std::to_string(seconds),
        "/bin/bash", "-c", command
    };
    request.working_dir = working_dir;
    request.environment = env;
    request.client_timeout = std::chrono::seconds(seconds + kClientKillGraceSeconds);
    return request;
}

CommandResult DockerSandbox::TranslateExecResult(const utils::ContainerExecResult& result,
                                                 std::chrono::seconds timeout) {
    const bool timed_out =
        result.client_timed_out ||
        result.exit_code == 124 ||
        (result.exit_code == 137 && result.duration >= timeout);

    if (timed_out) {
        return CommandResult::TimedOut(timeout, result.stdout_output, result.stderr_output);
    }
    return CommandResult(result.exit_code, result.stdout_output, result.stderr_output);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

std::future<void> DockerSandbox::Start() {
    auto expected = SandboxState::UNINITIALIZED;
    if (!state_.compare_exchange_strong(expected, SandboxState::STARTING)) {
        return utils::MakeFailedFuture<void>(std::make_exception_ptr(core::ProvisioningError(
            "Docker sandbox " + container_name_ + " cannot start while " + StateToString(expected))));
    }

    try {
        return bridge_.Submit([this]() { Provision(); });
    } catch (const std::exception&) {
        state_ = SandboxState::UNINITIALIZED;
        throw;
    }
}

void DockerSandbox::Provision() {
    spdlog::info("Starting Docker sandbox: {} (image: {})", container_name_, config_.image);

    std::shared_ptr<utils::ContainerEngine> engine;
    try {
        engine = engine_factory_();
        engine->GetVersion();
    } catch (const std::exception& e) {
        spdlog::error("Docker engine unavailable: {}", e.what());
        state_ = SandboxState::UNINITIALIZED;
        throw core::TransportError(std::string("Docker engine unavailable: ") + e.what());
    }

    std::string container_id;
    try {
        if (!engine->ImageExists(config_.image)) {
            engine->PullImage(config_.image);
        }

        if (!config_.volumes.empty()) {
            spdlog::info("Mounting {} volume(s)", config_.volumes.size());
        }

        container_id = engine->CreateContainer(BuildContainerConfig());
        engine->StartContainer(container_id);

        // Runs before the state is RUNNING, so it goes to the engine directly
        auto init = engine->ExecuteCommand(
            container_id,
            BuildExecRequest(core::workspace::kInitCommand, "/", kSetupCommandTimeout, {}));
        if (init.exit_code != 0) {
            throw utils::ContainerError("workspace initialization failed (exit " +
                                        std::to_string(init.exit_code) + "): " +
                                        StringUtils::Trim(init.stderr_output));
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to start Docker sandbox: {}", e.what());

        if (!container_id.empty()) {
            try {
                engine->RemoveContainer(container_id, true);
            } catch (const std::exception& remove_error) {
                spdlog::warn("Could not remove partially started container {}: {}",
                             ShortId(container_id), remove_error.what());
            }
        }

        engine.reset();
        state_ = SandboxState::UNINITIALIZED;
        throw core::ProvisioningError(std::string("Failed to start Docker sandbox: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(handle_mutex_);
        engine_ = std::move(engine);
        container_id_ = container_id;
    }
    state_ = SandboxState::RUNNING;

    spdlog::info("Docker sandbox started: {} ({})", container_name_, ShortId(container_id));
}

std::future<void> DockerSandbox::Cleanup() {
    auto state = state_.load();

    if (state == SandboxState::DESTROYED || state == SandboxState::UNINITIALIZED) {
        spdlog::debug("Docker sandbox {} cleanup: nothing to do ({})", container_name_,
                      StateToString(state));
        return utils::MakeReadyFuture();
    }

    if (state == SandboxState::STARTING) {
        spdlog::warn("Docker sandbox {} cleanup requested while starting; ignored",
                     container_name_);
        return utils::MakeReadyFuture();
    }

    auto expected = SandboxState::RUNNING;
    if (!state_.compare_exchange_strong(expected, SandboxState::CLEANING_UP)) {
        // Another Cleanup() won the race
        return utils::MakeReadyFuture();
    }

    return bridge_.Submit([this]() { Teardown(); });
}

void DockerSandbox::Teardown() {
    std::shared_ptr<utils::ContainerEngine> engine;
    std::string container_id;
    {
        std::lock_guard<std::mutex> lock(handle_mutex_);
        engine = std::move(engine_);
        container_id = std::move(container_id_);
        engine_.reset();
        container_id_.clear();
    }
    state_ = SandboxState::DESTROYED;

    spdlog::info("Cleaning up Docker sandbox: {}", container_name_);

    try {
        engine->RemoveContainer(container_id, true);
    } catch (const std::exception& e) {
        spdlog::error("Failed to cleanup Docker sandbox {}: {}", container_name_, e.what());
        throw core::TransportError("Failed to remove container " + ShortId(container_id) +
                                   ": " + e.what());
    }
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

std::future<CommandResult> DockerSandbox::RunCommand(const std::string& command,
                                                     const std::string& working_dir,
                                                     std::chrono::seconds timeout,
                                                     const core::EnvMap& env) {
    RequireRunning("run_command");
    auto [engine, container_id] = SnapshotHandle();

    spdlog::debug("Executing command: {}", StringUtils::Truncate(command, 100));

    auto effective_timeout =
        std::chrono::seconds(std::max<std::chrono::seconds::rep>(timeout.count(), 1));
    auto request = BuildExecRequest(command,
                                    working_dir.empty() ? config_.work_dir : working_dir,
                                    effective_timeout, env);
    auto deadline = effective_timeout + std::chrono::seconds(kOuterTimeoutGraceSeconds);
    auto preview = StringUtils::Truncate(command, 50);

    return bridge_.SubmitWithDeadline(
        [engine = engine, container_id = container_id, request, effective_timeout, preview]() {
            utils::ContainerExecResult raw;
            try {
                raw = engine->ExecuteCommand(container_id, request);
            } catch (const std::exception& e) {
                throw core::TransportError(std::string("Command dispatch failed: ") + e.what());
            }

            auto result = TranslateExecResult(raw, effective_timeout);
            if (result.IsTimedOut()) {
                spdlog::warn("Command timed out after {}s: {}", effective_timeout.count(), preview);
            }
            return result;
        },
        deadline,
        [effective_timeout, preview]() {
            spdlog::warn("Command timed out after {}s (engine did not answer): {}",
                         effective_timeout.count(), preview);
            return CommandResult::TimedOut(effective_timeout);
        });
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================

std::future<std::string> DockerSandbox::ReadFile(const std::string& path) {
    RequireRunning("read_file");
    auto [engine, container_id] = SnapshotHandle();
    auto resolved = ResolvePath(path);

    return bridge_.Submit([engine = engine, container_id = container_id, resolved]() {
        std::string tar_data;
        try {
            tar_data = engine->GetArchive(container_id, resolved);
        } catch (const utils::ContainerPathNotFoundError&) {
            throw core::NotFoundError("File not found: " + resolved);
        } catch (const std::exception& e) {
            spdlog::error("Failed to read file {}: {}", resolved, e.what());
            throw core::TransportError("Failed to read file " + resolved + ": " + e.what());
        }

        try {
            return utils::TarArchive::ExtractSingleFile(tar_data).content;
        } catch (const utils::ArchiveError& e) {
            spdlog::error("Failed to read file {}: {}", resolved, e.what());
            throw core::SandboxError("Failed to read file " + resolved + ": " + e.what());
        }
    });
}

std::future<void> DockerSandbox::WriteFile(const std::string& path, const std::string& content) {
    RequireRunning("write_file");
    auto [engine, container_id] = SnapshotHandle();
    auto resolved = ResolvePath(path);

    return bridge_.Submit([engine = engine, container_id = container_id, resolved, content]() {
        const std::string dir_path = StringUtils::ParentPath(resolved);
        const std::string file_name = StringUtils::BaseName(resolved);
        if (file_name.empty() || file_name == "." || file_name == "..") {
            throw core::SandboxError("Invalid file path: " + resolved);
        }

        std::string tar_data;
        try {
            tar_data = utils::TarArchive::PackSingleFile(file_name, content);
        } catch (const utils::ArchiveError& e) {
            throw core::SandboxError("Failed to write file " + resolved + ": " + e.what());
        }

        try {
            auto mkdir = engine->ExecuteCommand(
                container_id,
                BuildExecRequest("mkdir -p " + StringUtils::ShellQuote(dir_path), "/",
                                 kSetupCommandTimeout, {}));
            if (mkdir.exit_code != 0) {
                throw core::SandboxError("Cannot create directory " + dir_path + ": " +
                                         StringUtils::Trim(mkdir.stderr_output));
            }

            engine->PutArchive(container_id, dir_path, tar_data);
        } catch (const core::SandboxError&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::error("Failed to write file {}: {}", resolved, e.what());
            throw core::TransportError("Failed to write file " + resolved + ": " + e.what());
        }

        spdlog::debug("Wrote {} bytes to {}", content.size(), resolved);
    });
}

} // namespace backends
} // namespace sandkit
