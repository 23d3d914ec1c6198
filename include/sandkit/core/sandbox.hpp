/**
 * @file sandbox.hpp
 * @brief Abstract sandbox contract and scoped acquisition
 *
 * Every backend (local container, cloud workspace) implements Sandbox.
 * All operations that talk to an engine or remote API return futures so
 * the issuing thread is never blocked by the engine call itself.
 *
 * **Lifecycle**:
 * ```
 * construct ──Start()──▶ running ──Cleanup()──▶ destroyed
 *                          │
 *                          ├─ RunCommand()
 *                          ├─ ReadFile()
 *                          └─ WriteFile()
 * ```
 *
 * @date 2026
 */

#pragma once

#include "sandkit/core/command_result.hpp"

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <string>

namespace sandkit {
namespace core {

/// Extra environment variables for one command
using EnvMap = std::map<std::string, std::string>;

/**
 * @class Sandbox
 * @brief Capability set every isolated-environment backend provides
 *
 * **Errors**:
 * - RunCommand/ReadFile/WriteFile throw NotStartedError synchronously when
 *   the sandbox is not running
 * - Start() delivers ProvisioningError (or TransportError when the engine is
 *   unreachable) through its future
 * - ReadFile() delivers NotFoundError for a missing path
 * - execution failures (engine unreachable, malformed response) are
 *   delivered as TransportError; a failing command is a normal result
 *
 * **Thread Safety**: The contract performs no internal locking. Concurrent
 * callers sharing one instance must synchronize externally.
 */
class Sandbox {
public:
    virtual ~Sandbox() = default;

    /**
     * @brief Provision the environment and its workspace layout
     *
     * Not idempotent: calling Start() on a running sandbox fails.
     */
    virtual std::future<void> Start() = 0;

    /**
     * @brief Destroy the environment irrecoverably
     *
     * Safe after a partially failed Start() and safe to call twice (the
     * second call is a no-op). Host-side client handles are released even
     * when remote deletion fails; that failure is still reported.
     */
    virtual std::future<void> Cleanup() = 0;

    /**
     * @brief Execute a shell command inside the environment
     * @param command Shell command line
     * @param working_dir Working directory inside the environment
     * @param timeout Exceeding it yields CommandResult::TimedOut()
     * @param env Additional environment variables
     */
    virtual std::future<CommandResult> RunCommand(const std::string& command,
                                                  const std::string& working_dir,
                                                  std::chrono::seconds timeout,
                                                  const EnvMap& env) = 0;

    /**
     * @brief Read one file's bytes
     */
    virtual std::future<std::string> ReadFile(const std::string& path) = 0;

    /**
     * @brief Write one file's bytes, creating missing parent directories
     */
    virtual std::future<void> WriteFile(const std::string& path, const std::string& content) = 0;

    /**
     * @brief Whether a timed-out command is guaranteed to be terminated
     *        inside the environment (not merely abandoned by the caller)
     */
    virtual bool GuaranteesTimeoutTermination() const = 0;

    virtual std::string GetBackendName() const = 0;
    virtual bool IsRunning() const = 0;
};

/**
 * @class ScopedSandbox
 * @brief Starts a sandbox on construction and cleans it up on destruction
 *
 * If Start() fails, Cleanup() runs before the constructor rethrows. The
 * destructor cannot report a cleanup failure beyond logging it; call
 * Release() to clean up with errors propagated.
 *
 * **Usage Example**:
 * @code
 * ScopedSandbox scoped(CreateSandbox(config));
 * auto result = scoped->RunCommand("python3 --version", "/workspace",
 *                                  std::chrono::seconds(30), {}).get();
 * scoped.Release();
 * @endcode
 */
class ScopedSandbox {
public:
    explicit ScopedSandbox(std::unique_ptr<Sandbox> sandbox);
    ~ScopedSandbox();

    ScopedSandbox(const ScopedSandbox&) = delete;
    ScopedSandbox& operator=(const ScopedSandbox&) = delete;

    Sandbox& Get() { return *sandbox_; }
    Sandbox* operator->() { return sandbox_.get(); }

    /**
     * @brief Clean up now, propagating any failure
     *
     * Later calls and the destructor do nothing.
     */
    void Release();

private:
    std::unique_ptr<Sandbox> sandbox_;
    bool released_{false};
};

} // namespace core
} // namespace sandkit
