/**
 * @file test_helpers.hpp
 * @brief Shared mocks and future helpers for the unit tests
 *
 * @date 2026
 */

#pragma once

#include "sandkit/core/sandbox.hpp"
#include "sandkit/utils/container_utils.hpp"
#include "sandkit/utils/blocking_bridge.hpp"

#include <gmock/gmock.h>

#include <exception>
#include <future>
#include <string>

namespace sandkit {
namespace testing {

class MockSandbox : public core::Sandbox {
public:
    MOCK_METHOD(std::future<void>, Start, (), (override));
    MOCK_METHOD(std::future<void>, Cleanup, (), (override));
    MOCK_METHOD(std::future<core::CommandResult>, RunCommand,
                (const std::string& command, const std::string& working_dir,
                 std::chrono::seconds timeout, const core::EnvMap& env),
                (override));
    MOCK_METHOD(std::future<std::string>, ReadFile, (const std::string& path), (override));
    MOCK_METHOD(std::future<void>, WriteFile,
                (const std::string& path, const std::string& content), (override));
    MOCK_METHOD(bool, GuaranteesTimeoutTermination, (), (const, override));
    MOCK_METHOD(std::string, GetBackendName, (), (const, override));
    MOCK_METHOD(bool, IsRunning, (), (const, override));
};

class MockContainerEngine : public utils::ContainerEngine {
public:
    MOCK_METHOD(std::string, GetVersion, (), (override));
    MOCK_METHOD(bool, ImageExists, (const std::string& image), (override));
    MOCK_METHOD(void, PullImage, (const std::string& image), (override));
    MOCK_METHOD(std::string, CreateContainer, (const utils::ContainerConfig& config), (override));
    MOCK_METHOD(void, StartContainer, (const std::string& container_id), (override));
    MOCK_METHOD(void, RemoveContainer, (const std::string& container_id, bool force), (override));
    MOCK_METHOD(utils::ContainerExecResult, ExecuteCommand,
                (const std::string& container_id, const utils::ExecRequest& request),
                (override));
    MOCK_METHOD(void, PutArchive,
                (const std::string& container_id, const std::string& dest_dir,
                 const std::string& tar_data),
                (override));
    MOCK_METHOD(std::string, GetArchive,
                (const std::string& container_id, const std::string& path), (override));
};

inline utils::ContainerExecResult ExecOutput(int exit_code,
                                             const std::string& stdout_output = "",
                                             const std::string& stderr_output = "") {
    utils::ContainerExecResult result;
    result.exit_code = exit_code;
    result.stdout_output = stdout_output;
    result.stderr_output = stderr_output;
    result.success = exit_code == 0;
    return result;
}

template <typename T>
std::future<T> ReadyFuture(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

inline std::future<void> ReadyFuture() {
    return utils::MakeReadyFuture();
}

template <typename T, typename E>
std::future<T> FailedFuture(E error) {
    return utils::MakeFailedFuture<T>(std::make_exception_ptr(std::move(error)));
}

} // namespace testing
} // namespace sandkit
