/**
 * @file test_sandbox_factory.cpp
 * @brief Unit tests for backend selection
 *
 * @date 2026
 */

#include "sandkit/core/errors.hpp"
#include "sandkit/core/sandbox_factory.hpp"

#include <gtest/gtest.h>

using namespace sandkit;
using json = nlohmann::json;

namespace {

core::SandboxFactoryOptions IsolatedOptions() {
    core::SandboxFactoryOptions options;
    options.env_lookup = [](const std::string& name) -> std::optional<std::string> {
        if (name == "TAVILY_API_KEY") return std::string("from-host");
        return std::nullopt;
    };
    return options;
}

} // anonymous namespace

TEST(SandboxFactoryTest, DockerConfigYieldsDockerSandbox) {
    auto sandbox = core::CreateSandbox(core::DockerSandboxConfig{}, IsolatedOptions());

    ASSERT_NE(sandbox, nullptr);
    EXPECT_EQ(sandbox->GetBackendName(), "docker");
    EXPECT_TRUE(sandbox->GuaranteesTimeoutTermination());
    EXPECT_FALSE(sandbox->IsRunning());
    EXPECT_NE(dynamic_cast<backends::DockerSandbox*>(sandbox.get()), nullptr);
}

TEST(SandboxFactoryTest, CloudConfigYieldsCloudSandbox) {
    core::CloudSandboxConfig config;
    config.api_key = "key";

    auto sandbox = core::CreateSandbox(config, IsolatedOptions());

    ASSERT_NE(sandbox, nullptr);
    EXPECT_EQ(sandbox->GetBackendName(), "daytona");
    EXPECT_FALSE(sandbox->GuaranteesTimeoutTermination());
    EXPECT_NE(dynamic_cast<backends::CloudSandbox*>(sandbox.get()), nullptr);
}

TEST(SandboxFactoryTest, HostEnvironmentPassedToContainer) {
    core::DockerSandboxConfig config;
    config.environment = {{"MODE", "test"}};

    auto sandbox = core::CreateSandbox(config, IsolatedOptions());
    auto* docker = dynamic_cast<backends::DockerSandbox*>(sandbox.get());
    ASSERT_NE(docker, nullptr);

    auto container = docker->BuildContainerConfig();
    EXPECT_EQ(container.environment_vars.at("MODE"), "test");
    EXPECT_EQ(container.environment_vars.at("TAVILY_API_KEY"), "from-host");
}

TEST(SandboxFactoryTest, InvalidConfigRejectedBeforeConstruction) {
    core::DockerSandboxConfig docker;
    docker.cpu_limit = -1;
    EXPECT_THROW(core::CreateSandbox(docker, IsolatedOptions()), core::ConfigError);

    core::CloudSandboxConfig cloud;
    EXPECT_THROW(core::CreateSandbox(cloud, IsolatedOptions()), core::ConfigError);
}

TEST(SandboxFactoryTest, FromJson) {
    auto sandbox = core::CreateSandboxFromJson(
        json{{"type", "Daytona"}, {"api_key", "key"}}, IsolatedOptions());
    EXPECT_EQ(sandbox->GetBackendName(), "daytona");

    EXPECT_THROW(core::CreateSandboxFromJson(json{{"type", "vm"}}, IsolatedOptions()),
                 core::ConfigError);
}

TEST(SandboxFactoryTest, ContractOperationsRequireStart) {
    auto sandbox = core::CreateSandbox(core::DockerSandboxConfig{}, IsolatedOptions());

    EXPECT_THROW(sandbox->RunCommand("true", "/workspace", std::chrono::seconds(5), {}),
                 core::NotStartedError);
    EXPECT_THROW(sandbox->ReadFile("/workspace/x"), core::NotStartedError);
    EXPECT_THROW(sandbox->WriteFile("/workspace/x", "y"), core::NotStartedError);
    EXPECT_NO_THROW(sandbox->Cleanup().get());
}
