/**
 * @file sandbox_state.cpp
 * @brief Lifecycle state names
 *
 * @date 2026
 */

#include "sandkit/backends/sandbox_state.hpp"

namespace sandkit {
namespace backends {

std::string StateToString(SandboxState state) {
    switch (state) {
        case SandboxState::UNINITIALIZED: return "uninitialized";
        case SandboxState::STARTING: return "starting";
        case SandboxState::RUNNING: return "running";
        case SandboxState::CLEANING_UP: return "cleaning_up";
        case SandboxState::DESTROYED: return "destroyed";
        default: return "unknown";
    }
}

} // namespace backends
} // namespace sandkit
