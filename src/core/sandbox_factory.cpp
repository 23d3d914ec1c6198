/**
 * @file sandbox_factory.cpp
 * @brief Backend selection and environment pass-through
 *
 * @date 2026
 */

#include "sandkit/core/sandbox_factory.hpp"

#include <spdlog/spdlog.h>

#include <variant>

namespace sandkit {
namespace core {

namespace {

/**
 * @brief Exhaustive over the closed configuration set
 */
struct BackendBuilder {
    const SandboxFactoryOptions& options;

    std::unique_ptr<Sandbox> operator()(const DockerSandboxConfig& config) const {
        DockerSandboxConfig resolved = config;
        resolved.environment = BuildEnvironment(
            config, options.env_lookup ? options.env_lookup : EnvLookup(HostEnvLookup));

        auto engine_factory = options.engine_factory
                                  ? options.engine_factory
                                  : backends::DockerSandbox::DefaultEngineFactory();
        return std::make_unique<backends::DockerSandbox>(std::move(resolved),
                                                         std::move(engine_factory));
    }

    std::unique_ptr<Sandbox> operator()(const CloudSandboxConfig& config) const {
        return std::make_unique<backends::CloudSandbox>(config, options.api_factory);
    }
};

} // anonymous namespace

std::unique_ptr<Sandbox> CreateSandbox(const SandboxConfig& config,
                                       const SandboxFactoryOptions& options) {
    ValidateConfig(config);

    spdlog::debug("Creating {} sandbox", GetBackendType(config));
    return std::visit(BackendBuilder{options}, config);
}

std::unique_ptr<Sandbox> CreateSandboxFromJson(const nlohmann::json& j,
                                               const SandboxFactoryOptions& options) {
    return CreateSandbox(ParseSandboxConfig(j), options);
}

} // namespace core
} // namespace sandkit
