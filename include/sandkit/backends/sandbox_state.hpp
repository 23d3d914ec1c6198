/**
 * @file sandbox_state.hpp
 * @brief Lifecycle states shared by the sandbox backends
 *
 * @date 2026
 */

#pragma once

#include <string>

namespace sandkit {
namespace backends {

/**
 * @enum SandboxState
 * @brief Backend lifecycle
 */
enum class SandboxState {
    UNINITIALIZED,  ///< Constructed, or a Start() attempt failed
    STARTING,       ///< Start() in progress
    RUNNING,        ///< Accepting operations
    CLEANING_UP,    ///< Cleanup() in progress
    DESTROYED       ///< Environment removed; terminal
};

std::string StateToString(SandboxState state);

} // namespace backends
} // namespace sandkit
