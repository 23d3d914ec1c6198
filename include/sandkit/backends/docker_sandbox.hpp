/**
 * @file docker_sandbox.hpp
 * @brief Local container sandbox backend
 *
 * One sandbox is one long-lived container running an idle shell; commands
 * are `docker exec` calls into it and files cross the boundary as tar
 * streams.
 *
 * **Timeout Enforcement** (two layers):
 * ```
 * caller ──future (deadline N+5s)──▶ bridge worker ──docker exec (killed at N+10s)──▶
 *     container: timeout --kill-after=2 N /bin/bash -c '<command>'
 * ```
 * The in-container `timeout` guarantees the process is actually terminated;
 * the outer deadline guarantees the caller is released even if the engine
 * stops answering.
 *
 * @date 2026
 */

#pragma once

#include "sandkit/core/sandbox.hpp"
#include "sandkit/core/sandbox_config.hpp"
#include "sandkit/backends/sandbox_state.hpp"
#include "sandkit/utils/blocking_bridge.hpp"
#include "sandkit/utils/container_utils.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace sandkit {
namespace backends {

/// Creates the engine client when Start() runs
using ContainerEngineFactory = std::function<std::shared_ptr<utils::ContainerEngine>()>;

/**
 * @class DockerSandbox
 * @brief Sandbox backed by a local container engine
 *
 * **Usage Example**:
 * @code
 * auto config = core::DockerSandboxBuilder()
 *     .WithMemoryLimit("256m")
 *     .WithNetwork(false)
 *     .Build();
 *
 * DockerSandbox sandbox(config);
 * sandbox.Start().get();
 *
 * sandbox.WriteFile("/workspace/a/b/c.txt", "x").get();
 * auto result = sandbox.RunCommand("cat a/b/c.txt", "/workspace",
 *                                  std::chrono::seconds(10), {}).get();
 *
 * sandbox.Cleanup().get();
 * @endcode
 */
class DockerSandbox : public core::Sandbox {
public:
    /// Seconds the caller-side deadline exceeds the in-container timeout
    static constexpr int kOuterTimeoutGraceSeconds = 5;
    /// Seconds after which the `docker exec` client process itself is killed
    static constexpr int kClientKillGraceSeconds = 10;
    /// Grace between SIGTERM and SIGKILL inside the container
    static constexpr int kKillAfterSeconds = 2;

    /**
     * @param config Backend configuration; its environment is used as-is
     * @param engine_factory Creates the engine client on Start()
     */
    explicit DockerSandbox(core::DockerSandboxConfig config,
                           ContainerEngineFactory engine_factory = DefaultEngineFactory());

    ~DockerSandbox() override;

    DockerSandbox(const DockerSandbox&) = delete;
    DockerSandbox& operator=(const DockerSandbox&) = delete;

    std::future<void> Start() override;
    std::future<void> Cleanup() override;
    std::future<core::CommandResult> RunCommand(const std::string& command,
                                                const std::string& working_dir,
                                                std::chrono::seconds timeout,
                                                const core::EnvMap& env) override;
    std::future<std::string> ReadFile(const std::string& path) override;
    std::future<void> WriteFile(const std::string& path, const std::string& content) override;

    bool GuaranteesTimeoutTermination() const override { return true; }
    std::string GetBackendName() const override { return "docker"; }
    bool IsRunning() const override { return state_.load() == SandboxState::RUNNING; }

    SandboxState GetState() const { return state_.load(); }
    const std::string& GetContainerName() const { return container_name_; }
    std::string GetContainerId() const;

    /**
     * @brief Engine configuration derived from the sandbox configuration
     */
    utils::ContainerConfig BuildContainerConfig() const;

    /**
     * @brief Exec request wrapping command with the in-container timeout
     */
    static utils::ExecRequest BuildExecRequest(const std::string& command,
                                               const std::string& working_dir,
                                               std::chrono::seconds timeout,
                                               const core::EnvMap& env);

    /**
     * @brief Map a raw exec result onto CommandResult, detecting timeouts
     */
    static core::CommandResult TranslateExecResult(const utils::ContainerExecResult& result,
                                                   std::chrono::seconds timeout);

    static ContainerEngineFactory DefaultEngineFactory();

private:
    void Provision();
    void Teardown();
    void RequireRunning(const char* operation) const;
    std::string ResolvePath(const std::string& path) const;
    std::pair<std::shared_ptr<utils::ContainerEngine>, std::string> SnapshotHandle() const;

    core::DockerSandboxConfig config_;
    ContainerEngineFactory engine_factory_;
    std::string container_name_;

    mutable std::mutex handle_mutex_;
    std::shared_ptr<utils::ContainerEngine> engine_;  ///< Created in Start(), released in Cleanup()
    std::string container_id_;

    std::atomic<SandboxState> state_{SandboxState::UNINITIALIZED};

    // Declared last: destroyed first, joining tasks that still use this object
    utils::BlockingBridge bridge_;
};

} // namespace backends
} // namespace sandkit
