/**
 * @file errors.hpp
 * @brief Exception taxonomy of the sandbox core
 *
 * Lifecycle failures (Start/Cleanup) propagate to the caller. Per-operation
 * failures (RunCommand/ReadFile/WriteFile) are converted into error payloads
 * by the tool layer. A timed-out command is never an exception; see
 * CommandResult::TimedOut().
 *
 * @date 2026
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sandkit {
namespace core {

/// Base of every sandbox failure
class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid or missing configuration, raised before any engine or network call
class ConfigError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// The isolated environment could not be created
class ProvisioningError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Operation attempted before Start() completed or after Cleanup() began
class NotStartedError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// File path absent inside the isolated environment
class NotFoundError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Path outside the allowed roots
class PathViolationError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Engine or API unreachable, or it rejected the call
class TransportError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

} // namespace core
} // namespace sandkit
