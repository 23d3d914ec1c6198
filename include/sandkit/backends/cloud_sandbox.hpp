/**
 * @file cloud_sandbox.hpp
 * @brief Remote workspace sandbox backend
 *
 * One sandbox is one remote workspace created from an image/region/sizing
 * spec. Every API call is blocking and goes through the sandbox's own
 * BlockingBridge.
 *
 * **Timeout Limitation**: the command timeout is passed to the server only
 * as a hint and enforced on the caller side by the bridge deadline. A
 * timed-out remote process may keep running until the workspace is deleted
 * or auto-stopped; GuaranteesTimeoutTermination() reports this.
 *
 * @date 2026
 */

#pragma once

#include "sandkit/backends/sandbox_state.hpp"
#include "sandkit/cloud/workspace_client.hpp"
#include "sandkit/core/sandbox.hpp"
#include "sandkit/core/sandbox_config.hpp"
#include "sandkit/utils/blocking_bridge.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace sandkit {
namespace backends {

/// Creates the API client when Start() runs
using WorkspaceApiFactory = std::function<std::shared_ptr<cloud::WorkspaceApi>()>;

/**
 * @class CloudSandbox
 * @brief Sandbox backed by a remote workspace service
 *
 * **Usage Example**:
 * @code
 * core::CloudSandboxConfig config;
 * config.api_key = key;
 *
 * CloudSandbox sandbox(config);
 * sandbox.Start().get();
 * auto result = sandbox.RunCommand("python3 --version", "/workspace",
 *                                  std::chrono::seconds(30), {}).get();
 * sandbox.Cleanup().get();
 * @endcode
 */
class CloudSandbox : public core::Sandbox {
public:
    /**
     * @param config Backend configuration (validated by the caller)
     * @param api_factory Creates the API client on Start()
     */
    explicit CloudSandbox(core::CloudSandboxConfig config,
                          WorkspaceApiFactory api_factory = WorkspaceApiFactory());

    ~CloudSandbox() override;

    CloudSandbox(const CloudSandbox&) = delete;
    CloudSandbox& operator=(const CloudSandbox&) = delete;

    std::future<void> Start() override;
    std::future<void> Cleanup() override;
    std::future<core::CommandResult> RunCommand(const std::string& command,
                                                const std::string& working_dir,
                                                std::chrono::seconds timeout,
                                                const core::EnvMap& env) override;
    std::future<std::string> ReadFile(const std::string& path) override;
    std::future<void> WriteFile(const std::string& path, const std::string& content) override;

    bool GuaranteesTimeoutTermination() const override { return false; }
    std::string GetBackendName() const override { return "daytona"; }
    bool IsRunning() const override { return state_.load() == SandboxState::RUNNING; }

    SandboxState GetState() const { return state_.load(); }
    std::string GetWorkspaceId() const;

    /**
     * @brief Creation request derived from the configuration
     */
    cloud::WorkspaceSpec BuildWorkspaceSpec() const;

    /// HttpWorkspaceClient for the configured server and key
    WorkspaceApiFactory DefaultApiFactory() const;

private:
    void Provision();
    void Teardown();
    void RequireRunning(const char* operation) const;
    std::string ResolvePath(const std::string& path) const;
    std::pair<std::shared_ptr<cloud::WorkspaceApi>, std::string> SnapshotHandle() const;

    core::CloudSandboxConfig config_;
    WorkspaceApiFactory api_factory_;

    mutable std::mutex handle_mutex_;
    std::shared_ptr<cloud::WorkspaceApi> client_;  ///< Created in Start(), cleared in Cleanup()
    std::string workspace_id_;

    std::atomic<SandboxState> state_{SandboxState::UNINITIALIZED};

    // Declared last: destroyed first, joining tasks that still use this object
    utils::BlockingBridge bridge_;
};

} // namespace backends
} // namespace sandkit
