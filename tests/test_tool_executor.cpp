/**
 * @file test_tool_executor.cpp
 * @brief Unit tests for path validation, output bounding and file listing
 *
 * @date 2026
 */

#include "sandkit/core/errors.hpp"
#include "sandkit/tools/tool_executor.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace sandkit;
using sandkit::testing::FailedFuture;
using sandkit::testing::MockSandbox;
using sandkit::testing::ReadyFuture;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class ToolExecutorTest : public ::testing::Test {
protected:
    NiceMock<MockSandbox> sandbox_;
};

TEST_F(ToolExecutorTest, Defaults) {
    tools::SandboxToolExecutor executor(sandbox_);
    EXPECT_EQ(executor.GetMaxOutputChars(), 16000u);
    EXPECT_EQ(executor.GetDefaultTimeout(), std::chrono::seconds(120));
    EXPECT_EQ(executor.GetAllowedRoots(), std::vector<std::string>{"/workspace"});
}

TEST_F(ToolExecutorTest, RelativeRootRejected) {
    EXPECT_THROW(tools::SandboxToolExecutor(sandbox_, 100, std::chrono::seconds(5), {"workspace"}),
                 std::invalid_argument);
}

TEST_F(ToolExecutorTest, ValidatePathAcceptsPathsUnderRoot) {
    tools::SandboxToolExecutor executor(sandbox_);

    EXPECT_EQ(executor.ValidatePath("/workspace"), "/workspace");
    EXPECT_EQ(executor.ValidatePath("/workspace/output/a.csv"), "/workspace/output/a.csv");
    EXPECT_EQ(executor.ValidatePath("/workspace/temp/../output/./b"), "/workspace/output/b");
}

TEST_F(ToolExecutorTest, ValidatePathRejectsEscapes) {
    tools::SandboxToolExecutor executor(sandbox_);

    EXPECT_THROW(executor.ValidatePath("/etc/passwd"), core::PathViolationError);
    EXPECT_THROW(executor.ValidatePath("/workspace2/x"), core::PathViolationError);
    EXPECT_THROW(executor.ValidatePath("/workspace/../etc/passwd"), core::PathViolationError);

    try {
        executor.ValidatePath("/tmp/x");
        FAIL() << "Expected PathViolationError";
    } catch (const core::PathViolationError& e) {
        EXPECT_THAT(e.what(), HasSubstr("outside allowed directories"));
        EXPECT_THAT(e.what(), HasSubstr("[/workspace]"));
    }
}

TEST_F(ToolExecutorTest, ValidatePathRejectsRelative) {
    tools::SandboxToolExecutor executor(sandbox_);

    try {
        executor.ValidatePath("output/a.txt");
        FAIL() << "Expected PathViolationError";
    } catch (const core::PathViolationError& e) {
        EXPECT_THAT(e.what(), HasSubstr("must be absolute"));
    }
}

TEST_F(ToolExecutorTest, ValidatePathWithSeveralRoots) {
    tools::SandboxToolExecutor executor(sandbox_, 100, std::chrono::seconds(5),
                                        {"/workspace/output/", "/data"});

    EXPECT_EQ(executor.ValidatePath("/data/in.txt"), "/data/in.txt");
    EXPECT_EQ(executor.ValidatePath("/workspace/output/x"), "/workspace/output/x");
    EXPECT_THROW(executor.ValidatePath("/workspace/temp/x"), core::PathViolationError);
}

TEST_F(ToolExecutorTest, TruncateBoundsOutput) {
    tools::SandboxToolExecutor executor(sandbox_, 10);

    EXPECT_EQ(executor.Truncate("short"), "short");
    EXPECT_EQ(executor.Truncate(std::string(25, 'a')),
              std::string(10, 'a') + "\n... (truncated, 25 total chars)");
}

TEST_F(ToolExecutorTest, ListGeneratedFiles) {
    EXPECT_CALL(sandbox_, RunCommand("ls -1 /workspace/output", "/workspace", _, _))
        .WillOnce(Return(ReadyFuture(core::CommandResult(0, "chart.png\nreport.csv\n\n", ""))));

    tools::SandboxToolExecutor executor(sandbox_);
    std::vector<std::string> expected = {"/workspace/output/chart.png",
                                         "/workspace/output/report.csv"};
    EXPECT_EQ(executor.ListGeneratedFiles(), expected);
}

TEST_F(ToolExecutorTest, ListGeneratedFilesFailureIsEmpty) {
    EXPECT_CALL(sandbox_, RunCommand(_, _, _, _))
        .WillOnce(Return(ReadyFuture(core::CommandResult(2, "", "No such file or directory"))))
        .WillOnce(Return(FailedFuture<core::CommandResult>(core::TransportError("gone"))));

    tools::SandboxToolExecutor executor(sandbox_);
    EXPECT_TRUE(executor.ListGeneratedFiles().empty());
    EXPECT_TRUE(executor.ListGeneratedFiles().empty());
}

TEST_F(ToolExecutorTest, ListGeneratedFilesBeforeStartIsEmpty) {
    EXPECT_CALL(sandbox_, RunCommand(_, _, _, _))
        .WillOnce([](const std::string&, const std::string&, std::chrono::seconds,
                     const core::EnvMap&) -> std::future<core::CommandResult> {
            throw core::NotStartedError("not started");
        });

    tools::SandboxToolExecutor executor(sandbox_);
    EXPECT_TRUE(executor.ListGeneratedFiles().empty());
}
