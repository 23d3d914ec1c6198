/**
 * @file sandbox.cpp
 * @brief Scoped sandbox acquisition
 *
 * @date 2026
 */

#include "sandkit/core/sandbox.hpp"
#include "sandkit/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace sandkit {
namespace core {

ScopedSandbox::ScopedSandbox(std::unique_ptr<Sandbox> sandbox)
    : sandbox_(std::move(sandbox)) {
    if (!sandbox_) {
        throw SandboxError("ScopedSandbox requires a sandbox instance");
    }

    try {
        sandbox_->Start().get();
    } catch (const std::exception& e) {
        spdlog::error("{} sandbox failed to start: {}", sandbox_->GetBackendName(), e.what());
        released_ = true;
        try {
            sandbox_->Cleanup().get();
        } catch (const std::exception& cleanup_error) {
            spdlog::error("Cleanup after failed start also failed: {}", cleanup_error.what());
        }
        throw;
    }
}

ScopedSandbox::~ScopedSandbox() {
    if (released_) {
        return;
    }

    try {
        sandbox_->Cleanup().get();
    } catch (const std::exception& e) {
        spdlog::error("{} sandbox cleanup failed: {}", sandbox_->GetBackendName(), e.what());
    }
}

void ScopedSandbox::Release() {
    if (released_) {
        return;
    }
    released_ = true;
    sandbox_->Cleanup().get();
}

} // namespace core
} // namespace sandkit
