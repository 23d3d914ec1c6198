/**
 * @file command_result.cpp
 * @brief Implementation of the command result value type
 *
 * @date 2026
 */

#include "sandkit/core/command_result.hpp"

namespace sandkit {
namespace core {

namespace {
constexpr const char* kTimedOutPrefix = "Command timed out after ";
}

CommandResult::CommandResult(int exit_code, std::string stdout_output, std::string stderr_output)
    : exit_code_(exit_code),
      stdout_(std::move(stdout_output)),
      stderr_(std::move(stderr_output)) {
}

CommandResult CommandResult::TimedOut(std::chrono::seconds timeout,
                                      const std::string& partial_stdout,
                                      const std::string& partial_stderr) {
    std::string message = kTimedOutPrefix + std::to_string(timeout.count()) + " seconds";
    if (!partial_stderr.empty()) {
        message += "\n" + partial_stderr;
    }
    return CommandResult(kTimedOutExitCode, partial_stdout, message);
}

bool CommandResult::IsTimedOut() const {
    return exit_code_ == kTimedOutExitCode && stderr_.rfind(kTimedOutPrefix, 0) == 0;
}

nlohmann::json CommandResult::ToJson() const {
    return {
        {"exit_code", exit_code_},
        {"stdout", stdout_},
        {"stderr", stderr_},
        {"success", IsSuccess()}
    };
}

} // namespace core
} // namespace sandkit
