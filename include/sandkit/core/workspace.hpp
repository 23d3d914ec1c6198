/**
 * @file workspace.hpp
 * @brief Fixed directory layout inside every isolated environment
 *
 * ```
 * /workspace
 *   ├─ input/
 *   ├─ output/      generated artifacts
 *   ├─ temp/        generated scripts
 *   └─ downloads/
 * ```
 *
 * @date 2026
 */

#pragma once

#include <chrono>

namespace sandkit {
namespace core {
namespace workspace {

inline constexpr const char* kRoot = "/workspace";
inline constexpr const char* kInputDir = "/workspace/input";
inline constexpr const char* kOutputDir = "/workspace/output";
inline constexpr const char* kTempDir = "/workspace/temp";
inline constexpr const char* kDownloadsDir = "/workspace/downloads";

/// Run by every backend before Start() returns
inline constexpr const char* kInitCommand =
    "mkdir -p /workspace/input /workspace/output /workspace/temp /workspace/downloads";

inline constexpr const char* kPythonScriptPath = "/workspace/temp/_script.py";
inline constexpr const char* kBrowserScriptPath = "/workspace/temp/_browser_script.py";

inline constexpr std::chrono::seconds kDefaultCommandTimeout{120};

} // namespace workspace
} // namespace core
} // namespace sandkit
