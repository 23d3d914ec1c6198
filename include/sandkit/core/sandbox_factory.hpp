/**
 * @file sandbox_factory.hpp
 * @brief Construction of sandboxes from declarative configuration
 *
 * The configuration variant is resolved exactly once here into a
 * contract-typed instance. No engine or network call happens during
 * construction; those start with Sandbox::Start().
 *
 * @date 2026
 */

#pragma once

#include "sandkit/backends/cloud_sandbox.hpp"
#include "sandkit/backends/docker_sandbox.hpp"
#include "sandkit/core/sandbox.hpp"
#include "sandkit/core/sandbox_config.hpp"

#include <memory>

#include <nlohmann/json.hpp>

namespace sandkit {
namespace core {

/**
 * @struct SandboxFactoryOptions
 * @brief Injection points for engine clients and the host environment
 *
 * Empty factories select the production clients.
 */
struct SandboxFactoryOptions {
    backends::ContainerEngineFactory engine_factory;  ///< Docker engine client
    backends::WorkspaceApiFactory api_factory;        ///< Remote API client
    EnvLookup env_lookup{HostEnvLookup};              ///< Host environment for pass-through
};

/**
 * @brief Validate a configuration and construct its backend
 *
 * For the Docker backend the allow-listed host variables are merged into
 * the environment here (explicit values win).
 *
 * @throws ConfigError if the configuration is invalid
 */
std::unique_ptr<Sandbox> CreateSandbox(const SandboxConfig& config,
                                       const SandboxFactoryOptions& options = {});

/**
 * @brief Parse a JSON configuration and construct its backend
 * @throws ConfigError if the configuration cannot be parsed or is invalid
 */
std::unique_ptr<Sandbox> CreateSandboxFromJson(const nlohmann::json& j,
                                               const SandboxFactoryOptions& options = {});

} // namespace core
} // namespace sandkit
