/**
 * @file test_sandbox_config.cpp
 * @brief Unit tests for configuration parsing and environment pass-through
 *
 * @date 2026
 */

#include "sandkit/core/errors.hpp"
#include "sandkit/core/sandbox_config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace sandkit::core;
using json = nlohmann::json;

TEST(SandboxConfigTest, EmptyObjectIsDefaultDocker) {
    auto config = ParseSandboxConfig(json::object());

    ASSERT_TRUE(std::holds_alternative<DockerSandboxConfig>(config));
    const auto& docker = std::get<DockerSandboxConfig>(config);
    EXPECT_EQ(docker.image, "python:3.12-slim");
    EXPECT_EQ(docker.memory_limit, "512m");
    EXPECT_DOUBLE_EQ(docker.cpu_limit, 1.0);
    EXPECT_TRUE(docker.network_enabled);
    EXPECT_EQ(docker.work_dir, "/workspace");
    EXPECT_FALSE(docker.auto_remove);
    EXPECT_EQ(docker.pass_env_vars, kDefaultPassEnvVars);
    EXPECT_EQ(GetBackendType(config), "docker");
}

TEST(SandboxConfigTest, DockerFields) {
    auto config = ParseSandboxConfig(json::parse(R"({
        "type": "docker",
        "image": "python:3.11",
        "memory_limit": "1g",
        "cpu_limit": 0.5,
        "network_enabled": false,
        "environment": {"A": "1"},
        "pass_env_vars": [],
        "volumes": {"/data": "/workspace/input"},
        "container_name": "fixed"
    })"));

    const auto& docker = std::get<DockerSandboxConfig>(config);
    EXPECT_EQ(docker.image, "python:3.11");
    EXPECT_EQ(docker.memory_limit, "1g");
    EXPECT_DOUBLE_EQ(docker.cpu_limit, 0.5);
    EXPECT_FALSE(docker.network_enabled);
    EXPECT_EQ(docker.environment.at("A"), "1");
    EXPECT_TRUE(docker.pass_env_vars.empty());
    EXPECT_EQ(docker.volumes.at("/data"), "/workspace/input");
    EXPECT_EQ(docker.container_name, "fixed");
}

TEST(SandboxConfigTest, CloudFieldsAndAlias) {
    auto config = ParseSandboxConfig(json::parse(R"({
        "type": "cloud",
        "api_key": "k",
        "server_url": "https://example.test/api/",
        "auto_stop_interval": 0
    })"));

    ASSERT_TRUE(std::holds_alternative<CloudSandboxConfig>(config));
    const auto& cloud = std::get<CloudSandboxConfig>(config);
    EXPECT_EQ(cloud.api_key, "k");
    EXPECT_EQ(cloud.server_url, "https://example.test/api");
    EXPECT_EQ(cloud.target, "us");
    EXPECT_EQ(cloud.cpu, 2);
    EXPECT_EQ(cloud.memory, 4);
    EXPECT_EQ(cloud.disk, 10);
    EXPECT_EQ(cloud.auto_stop_interval, 0);
    EXPECT_EQ(GetBackendType(config), "daytona");
}

TEST(SandboxConfigTest, CloudWithoutCredentialsRejected) {
    EXPECT_THROW(ParseSandboxConfig(json{{"type", "daytona"}}), ConfigError);
    EXPECT_THROW(ParseSandboxConfig(json{{"type", "daytona"}, {"api_key", ""}}), ConfigError);
}

TEST(SandboxConfigTest, UnknownTypeRejected) {
    EXPECT_THROW(ParseSandboxConfig(json{{"type", "e2b"}}), ConfigError);
}

TEST(SandboxConfigTest, UnknownKeyNamed) {
    try {
        ParseSandboxConfig(json{{"type", "docker"}, {"api_key", "k"}});
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("api_key"), std::string::npos);
    }
}

TEST(SandboxConfigTest, InvalidValuesRejected) {
    EXPECT_THROW(ParseSandboxConfig(json{{"memory_limit", "lots"}}), ConfigError);
    EXPECT_THROW(ParseSandboxConfig(json{{"cpu_limit", 0}}), ConfigError);
    EXPECT_THROW(ParseSandboxConfig(json{{"work_dir", "workspace"}}), ConfigError);
    EXPECT_THROW(ParseSandboxConfig(json{{"network_enabled", "yes"}}), ConfigError);
    EXPECT_THROW(ParseSandboxConfig(json{{"volumes", {{"/data", "relative"}}}}), ConfigError);
    EXPECT_THROW(ParseSandboxConfig(json{{"type", "daytona"}, {"api_key", "k"}, {"cpu", 1.5}}),
                 ConfigError);
    EXPECT_THROW(ParseSandboxConfig(json{{"type", "daytona"}, {"api_key", "k"},
                                         {"auto_stop_interval", -1}}),
                 ConfigError);
    EXPECT_THROW(ParseSandboxConfig(json{{"type", "daytona"}, {"api_key", "k"},
                                         {"server_url", "ftp://x"}}),
                 ConfigError);
    EXPECT_THROW(ParseSandboxConfig(json::array()), ConfigError);
}

TEST(SandboxConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "sandkit_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"type": "docker", "memory_limit": "64m"})";
    }

    auto config = LoadSandboxConfig(path);
    EXPECT_EQ(std::get<DockerSandboxConfig>(config).memory_limit, "64m");

    {
        std::ofstream out(path);
        out << "{not json";
    }
    EXPECT_THROW(LoadSandboxConfig(path), ConfigError);

    std::filesystem::remove(path);
    EXPECT_THROW(LoadSandboxConfig(path), ConfigError);
}

TEST(SandboxConfigTest, BuilderProducesValidConfig) {
    auto config = DockerSandboxBuilder()
        .WithMemoryLimit("256m")
        .WithNetwork(false)
        .WithEnvironment("PYTHONUNBUFFERED", "1")
        .WithVolume("/data", "/workspace/input")
        .Build();

    EXPECT_NO_THROW(ValidateConfig(config));
    EXPECT_EQ(config.memory_limit, "256m");
    EXPECT_FALSE(config.network_enabled);
}

// ============================================================================
// Environment pass-through
// ============================================================================

TEST(BuildEnvironmentTest, CopiesOnlyAllowListedNonEmptyHostValues) {
    DockerSandboxConfig config;
    config.pass_env_vars = {"TAVILY_API_KEY", "EMPTY", "UNSET"};

    EnvLookup lookup = [](const std::string& name) -> std::optional<std::string> {
        if (name == "TAVILY_API_KEY") return std::string("secret");
        if (name == "EMPTY") return std::string("");
        if (name == "HOME") return std::string("/root");
        return std::nullopt;
    };

    auto env = BuildEnvironment(config, lookup);
    EXPECT_EQ(env.size(), 1u);
    EXPECT_EQ(env.at("TAVILY_API_KEY"), "secret");
}

TEST(BuildEnvironmentTest, ExplicitValueWins) {
    DockerSandboxConfig config;
    config.environment = {{"TAVILY_API_KEY", "explicit"}};

    auto env = BuildEnvironment(config, [](const std::string&) {
        return std::optional<std::string>("host");
    });
    EXPECT_EQ(env.at("TAVILY_API_KEY"), "explicit");
}

TEST(BuildEnvironmentTest, EmptyAllowListDisablesPassThrough) {
    DockerSandboxConfig config;
    config.pass_env_vars.clear();

    auto env = BuildEnvironment(config, [](const std::string&) {
        return std::optional<std::string>("host");
    });
    EXPECT_TRUE(env.empty());
}
