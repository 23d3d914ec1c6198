/**
 * @file cloud_sandbox.cpp
 * @brief Implementation of the remote workspace sandbox
 *
 * **Error Translation**:
 * - create or init failure during Start()      → ProvisioningError
 * - download of a missing path                  → NotFoundError
 * - any other API failure after Start()         → TransportError
 *
 * @date 2026
 */

#include "sandkit/backends/cloud_sandbox.hpp"
#include "sandkit/core/errors.hpp"
#include "sandkit/core/workspace.hpp"
#include "sandkit/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sandkit {
namespace backends {

using core::CommandResult;
using utils::StringUtils;

namespace {

constexpr std::size_t kBridgeWorkers = 4;
constexpr std::chrono::seconds kSetupCommandTimeout{60};

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

CloudSandbox::CloudSandbox(core::CloudSandboxConfig config, WorkspaceApiFactory api_factory)
    : config_(std::move(config)),
      api_factory_(std::move(api_factory)),
      bridge_(kBridgeWorkers, "daytona") {
    if (!api_factory_) {
        api_factory_ = DefaultApiFactory();
    }
}

CloudSandbox::~CloudSandbox() {
    if (state_.load() != SandboxState::RUNNING) {
        return;
    }

    spdlog::warn("Cloud sandbox {} destroyed while running; cleaning up", GetWorkspaceId());
    try {
        Cleanup().get();
    } catch (const std::exception& e) {
        spdlog::error("Cleanup during destruction failed: {}", e.what());
    }
}

WorkspaceApiFactory CloudSandbox::DefaultApiFactory() const {
    return [server_url = config_.server_url, api_key = config_.api_key]() {
        return std::make_shared<cloud::HttpWorkspaceClient>(server_url, api_key);
    };
}

std::string CloudSandbox::GetWorkspaceId() const {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    return workspace_id_;
}

std::pair<std::shared_ptr<cloud::WorkspaceApi>, std::string>
CloudSandbox::SnapshotHandle() const {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    return {client_, workspace_id_};
}

void CloudSandbox::RequireRunning(const char* operation) const {
    auto state = state_.load();
    if (state != SandboxState::RUNNING) {
        throw core::NotStartedError(std::string("Cloud sandbox not started (") + operation +
                                    " called while " + StateToString(state) + ")");
    }
}

std::string CloudSandbox::ResolvePath(const std::string& path) const {
    if (StringUtils::StartsWith(path, "/")) {
        return path;
    }
    return StringUtils::NormalizePosixPath(std::string(core::workspace::kRoot) + "/" + path);
}

cloud::WorkspaceSpec CloudSandbox::BuildWorkspaceSpec() const {
    cloud::WorkspaceSpec spec;
    spec.image = config_.image;
    spec.target = config_.target;
    spec.cpu = config_.cpu;
    spec.memory = config_.memory;
    spec.disk = config_.disk;
    spec.auto_stop_interval = config_.auto_stop_interval;
    return spec;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

std::future<void> CloudSandbox::Start() {
    auto expected = SandboxState::UNINITIALIZED;
    if (!state_.compare_exchange_strong(expected, SandboxState::STARTING)) {
        return utils::MakeFailedFuture<void>(std::make_exception_ptr(core::ProvisioningError(
            "Cloud sandbox cannot start while " + StateToString(expected))));
    }

    try {
        return bridge_.Submit([this]() { Provision(); });
    } catch (const std::exception&) {
        state_ = SandboxState::UNINITIALIZED;
        throw;
    }
}

void CloudSandbox::Provision() {
    spdlog::info("Starting cloud sandbox (image: {}, target: {})", config_.image, config_.target);

    std::shared_ptr<cloud::WorkspaceApi> client;
    std::string workspace_id;
    try {
        client = api_factory_();
        workspace_id = client->CreateWorkspace(BuildWorkspaceSpec());
        spdlog::info("Created workspace: {}", workspace_id);

        cloud::ProcessRequest init;
        init.command = core::workspace::kInitCommand;
        init.cwd = "/";
        init.timeout = kSetupCommandTimeout;

        auto result = cloud::AdaptExecResponse(client->ExecuteProcess(workspace_id, init));
        if (!result.IsSuccess()) {
            throw core::SandboxError("workspace initialization failed (exit " +
                                     std::to_string(result.GetExitCode()) + "): " +
                                     StringUtils::Trim(result.GetStderr()));
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to start cloud sandbox: {}", e.what());

        if (client && !workspace_id.empty()) {
            try {
                client->DeleteWorkspace(workspace_id);
            } catch (const std::exception& delete_error) {
                spdlog::warn("Could not delete partially started workspace {}: {}",
                             workspace_id, delete_error.what());
            }
        }

        client.reset();
        state_ = SandboxState::UNINITIALIZED;
        throw core::ProvisioningError(std::string("Failed to start cloud sandbox: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(handle_mutex_);
        client_ = std::move(client);
        workspace_id_ = workspace_id;
    }
    state_ = SandboxState::RUNNING;

    spdlog::info("Cloud sandbox started: {}", workspace_id);
}

std::future<void> CloudSandbox::Cleanup() {
    auto state = state_.load();

    if (state == SandboxState::DESTROYED || state == SandboxState::UNINITIALIZED) {
        spdlog::debug("Cloud sandbox cleanup: nothing to do ({})", StateToString(state));
        return utils::MakeReadyFuture();
    }

    if (state == SandboxState::STARTING) {
        spdlog::warn("Cloud sandbox cleanup requested while starting; ignored");
        return utils::MakeReadyFuture();
    }

    auto expected = SandboxState::RUNNING;
    if (!state_.compare_exchange_strong(expected, SandboxState::CLEANING_UP)) {
        return utils::MakeReadyFuture();
    }

    return bridge_.Submit([this]() { Teardown(); });
}

void CloudSandbox::Teardown() {
    std::shared_ptr<cloud::WorkspaceApi> client;
    std::string workspace_id;
    {
        // The handle is released whether or not the remote delete succeeds
        std::lock_guard<std::mutex> lock(handle_mutex_);
        client = std::move(client_);
        workspace_id = std::move(workspace_id_);
        client_.reset();
        workspace_id_.clear();
    }
    state_ = SandboxState::DESTROYED;

    spdlog::info("Deleting cloud workspace: {}", workspace_id);

    try {
        client->DeleteWorkspace(workspace_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to cleanup cloud sandbox {}: {}", workspace_id, e.what());
        throw core::TransportError("Failed to delete workspace " + workspace_id + ": " + e.what());
    }
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

std::future<CommandResult> CloudSandbox::RunCommand(const std::string& command,
                                                    const std::string& working_dir,
                                                    std::chrono::seconds timeout,
                                                    const core::EnvMap& env) {
    RequireRunning("run_command");
    auto [client, workspace_id] = SnapshotHandle();

    spdlog::debug("Executing command: {}", StringUtils::Truncate(command, 100));

    auto effective_timeout =
        std::chrono::seconds(std::max<std::chrono::seconds::rep>(timeout.count(), 1));

    cloud::ProcessRequest request;
    request.command = command;
    request.cwd = working_dir.empty() ? core::workspace::kRoot : working_dir;
    request.env = env;
    request.timeout = effective_timeout;

    auto preview = StringUtils::Truncate(command, 50);

    return bridge_.SubmitWithDeadline(
        [client = client, workspace_id = workspace_id, request]() {
            nlohmann::json response;
            try {
                response = client->ExecuteProcess(workspace_id, request);
            } catch (const core::SandboxError&) {
                throw;
            } catch (const std::exception& e) {
                throw core::TransportError(std::string("Command dispatch failed: ") + e.what());
            }
            return cloud::AdaptExecResponse(response);
        },
        effective_timeout,
        [effective_timeout, preview]() {
            // The remote process is not killed; it runs on until the workspace stops
            spdlog::warn("Command timed out after {}s: {}", effective_timeout.count(), preview);
            return CommandResult::TimedOut(effective_timeout);
        });
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================

std::future<std::string> CloudSandbox::ReadFile(const std::string& path) {
    RequireRunning("read_file");
    auto [client, workspace_id] = SnapshotHandle();
    auto resolved = ResolvePath(path);

    return bridge_.Submit([client = client, workspace_id = workspace_id, resolved]() {
        try {
            return client->DownloadFile(workspace_id, resolved);
        } catch (const core::NotFoundError&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::error("Failed to read file {}: {}", resolved, e.what());
            throw core::TransportError("Failed to read file " + resolved + ": " + e.what());
        }
    });
}

std::future<void> CloudSandbox::WriteFile(const std::string& path, const std::string& content) {
    RequireRunning("write_file");
    auto [client, workspace_id] = SnapshotHandle();
    auto resolved = ResolvePath(path);

    return bridge_.Submit([client = client, workspace_id = workspace_id, resolved, content]() {
        const std::string dir_path = StringUtils::ParentPath(resolved);
        const std::string file_name = StringUtils::BaseName(resolved);
        if (file_name.empty() || file_name == "." || file_name == "..") {
            throw core::SandboxError("Invalid file path: " + resolved);
        }

        try {
            cloud::ProcessRequest mkdir;
            mkdir.command = "mkdir -p " + StringUtils::ShellQuote(dir_path);
            mkdir.cwd = "/";
            mkdir.timeout = kSetupCommandTimeout;

            auto result = cloud::AdaptExecResponse(client->ExecuteProcess(workspace_id, mkdir));
            if (!result.IsSuccess()) {
                throw core::SandboxError("Cannot create directory " + dir_path + ": " +
                                         StringUtils::Trim(result.GetStderr()));
            }

            client->UploadFile(workspace_id, resolved, content);
        } catch (const core::TransportError& e) {
            spdlog::error("Failed to write file {}: {}", resolved, e.what());
            throw;
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
