/**
 * @file test_sandbox_tools.cpp
 * @brief Unit tests for the tool functions and the tool registry
 *
 * @date 2026
 */

#include "sandkit/core/errors.hpp"
#include "sandkit/tools/sandbox_tools.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace sandkit;
using json = nlohmann::json;
using sandkit::testing::FailedFuture;
using sandkit::testing::MockSandbox;
using sandkit::testing::ReadyFuture;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using std::chrono::seconds;

namespace {

core::CommandResult Output(int exit_code, const std::string& out, const std::string& err = "") {
    return core::CommandResult(exit_code, out, err);
}

class SandboxToolsTest : public ::testing::Test {
protected:
    SandboxToolsTest() : executor_(sandbox_, 100, seconds(30)) {}

    NiceMock<MockSandbox> sandbox_;
    tools::SandboxToolExecutor executor_;
};

} // anonymous namespace

// ============================================================================
// shell
// ============================================================================

TEST_F(SandboxToolsTest, ShellSuccess) {
    EXPECT_CALL(sandbox_, RunCommand("ls -la", "/workspace", seconds(30), _))
        .WillOnce(Return(ReadyFuture(Output(0, "total 0\n"))));

    auto result = tools::ExecuteShell(executor_, "ls -la");
    EXPECT_EQ(result["status"], "success");
    EXPECT_EQ(result["stdout"], "total 0\n");
    EXPECT_EQ(result["stderr"], "");
    EXPECT_EQ(result["exit_code"], 0);
}

TEST_F(SandboxToolsTest, ShellNonZeroExitIsError) {
    EXPECT_CALL(sandbox_, RunCommand("false", "/tmp", seconds(5), _))
        .WillOnce(Return(ReadyFuture(Output(1, "", "boom"))));

    auto result = tools::ExecuteShell(executor_, "false", "/tmp", seconds(5));
    EXPECT_EQ(result["status"], "error");
    EXPECT_EQ(result["exit_code"], 1);
    EXPECT_EQ(result["stderr"], "boom");
}

TEST_F(SandboxToolsTest, ShellOutputTruncated) {
    EXPECT_CALL(sandbox_, RunCommand(_, _, _, _))
        .WillOnce(Return(ReadyFuture(Output(0, std::string(500, 'x')))));

    auto result = tools::ExecuteShell(executor_, "yes | head -c 500");
    EXPECT_THAT(result["stdout"].get<std::string>(), HasSubstr("(truncated, 500 total chars)"));
}

TEST_F(SandboxToolsTest, ShellTimeoutReportedAsError) {
    EXPECT_CALL(sandbox_, RunCommand(_, _, _, _))
        .WillOnce(Return(ReadyFuture(core::CommandResult::TimedOut(seconds(30)))));

    auto result = tools::ExecuteShell(executor_, "sleep 100");
    EXPECT_EQ(result["status"], "error");
    EXPECT_EQ(result["exit_code"], -1);
    EXPECT_THAT(result["stderr"].get<std::string>(), HasSubstr("Command timed out after 30"));
}

TEST_F(SandboxToolsTest, ShellSandboxFailureBecomesPayload) {
    EXPECT_CALL(sandbox_, RunCommand(_, _, _, _))
        .WillOnce(Return(FailedFuture<core::CommandResult>(core::TransportError("lost"))));

    auto result = tools::ExecuteShell(executor_, "ls");
    EXPECT_EQ(result["status"], "error");
    EXPECT_EQ(result["error"], "lost");
}

// ============================================================================
// python
// ============================================================================

TEST_F(SandboxToolsTest, PythonWritesScriptRunsAndListsOutputs) {
    {
        ::testing::InSequence sequence;
        EXPECT_CALL(sandbox_, WriteFile("/workspace/temp/_script.py", "print(1)"))
            .WillOnce(Return(ReadyFuture()));
        EXPECT_CALL(sandbox_, RunCommand("cd /workspace && python3 /workspace/temp/_script.py",
                                         "/workspace", seconds(30), _))
            .WillOnce(Return(ReadyFuture(Output(0, "1\n"))));
        EXPECT_CALL(sandbox_, RunCommand("ls -1 /workspace/output", _, _, _))
            .WillOnce(Return(ReadyFuture(Output(0, "plot.png\n"))));
    }

    auto result = tools::ExecutePython(executor_, "print(1)");
    EXPECT_EQ(result["status"], "success");
    EXPECT_EQ(result["stdout"], "1\n");
    EXPECT_EQ(result["exit_code"], 0);
    EXPECT_EQ(result["generated_files"], json::array({"/workspace/output/plot.png"}));
}

TEST_F(SandboxToolsTest, PythonScriptWriteFailure) {
    EXPECT_CALL(sandbox_, WriteFile(_, _))
        .WillOnce(Return(FailedFuture<void>(core::TransportError("disk full"))));
    EXPECT_CALL(sandbox_, RunCommand(_, _, _, _)).Times(0);

    auto result = tools::ExecutePython(executor_, "print(1)");
    EXPECT_EQ(result["status"], "error");
    EXPECT_EQ(result["stdout"], "");
    EXPECT_EQ(result["stderr"], "disk full");
    EXPECT_TRUE(result["generated_files"].empty());
}

// ============================================================================
// file_read / file_write
// ============================================================================

TEST_F(SandboxToolsTest, ReadFile) {
    EXPECT_CALL(sandbox_, ReadFile("/workspace/output/a.txt"))
        .WillOnce(Return(ReadyFuture(std::string("hello"))));

    auto result = tools::ReadSandboxFile(executor_, "/workspace/temp/../output/a.txt");
    EXPECT_EQ(result["status"], "success");
    EXPECT_EQ(result["content"], "hello");
    EXPECT_EQ(result["path"], "/workspace/output/a.txt");
}

TEST_F(SandboxToolsTest, ReadMissingFile) {
    EXPECT_CALL(sandbox_, ReadFile(_))
        .WillOnce(Return(FailedFuture<std::string>(core::NotFoundError("missing"))));

    auto result = tools::ReadSandboxFile(executor_, "/workspace/nope.txt");
    EXPECT_EQ(result["status"], "error");
    EXPECT_EQ(result["error"], "File not found: /workspace/nope.txt");
}

TEST_F(SandboxToolsTest, RejectedPathNeverReachesSandbox) {
    EXPECT_CALL(sandbox_, ReadFile(_)).Times(0);
    EXPECT_CALL(sandbox_, WriteFile(_, _)).Times(0);

    auto read = tools::ReadSandboxFile(executor_, "/etc/passwd");
    EXPECT_EQ(read["status"], "error");
    EXPECT_THAT(read["error"].get<std::string>(), HasSubstr("outside allowed directories"));

    auto write = tools::WriteSandboxFile(executor_, "/workspace/../root/.bashrc", "x");
    EXPECT_EQ(write["status"], "error");

    auto relative = tools::WriteSandboxFile(executor_, "output/a.txt", "x");
    EXPECT_THAT(relative["error"].get<std::string>(), HasSubstr("must be absolute"));
}

TEST_F(SandboxToolsTest, WriteFileReportsSizeAndDigest) {
    EXPECT_CALL(sandbox_, WriteFile("/workspace/output/hello.txt", "hello"))
        .WillOnce(Return(ReadyFuture()));

    auto result = tools::WriteSandboxFile(executor_, "/workspace/output/hello.txt", "hello");
    EXPECT_EQ(result["status"], "success");
    EXPECT_EQ(result["size"], 5);
    EXPECT_EQ(result["sha256"],
              "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

// ============================================================================
// web_browse
// ============================================================================

TEST(BrowserScriptTest, EscapeSelector) {
    EXPECT_EQ(tools::EscapeSelector("div.content"), "div.content");
    EXPECT_EQ(tools::EscapeSelector(R"(a[href="x"])"), R"(a[href=\"x\"])");
    EXPECT_EQ(tools::EscapeSelector("a\\b"), "a\\\\b");
    EXPECT_EQ(tools::EscapeSelector("h1\nh2"), "h1 h2");
}

TEST(BrowserScriptTest, UrlEmbeddedAsStringLiteral) {
    auto script = tools::BuildBrowserScript("https://example.com/\"); import os; (\"",
                                            std::nullopt, 5000);

    EXPECT_THAT(script, HasSubstr(R"(page.goto("https://example.com/\"); import os; (\"", wait_until)"));
    EXPECT_THAT(script, HasSubstr("content[:5000]"));
    EXPECT_THAT(script, HasSubstr("page.text_content(\"body\")"));
}

TEST(BrowserScriptTest, SelectorSelectsElements) {
    auto script = tools::BuildBrowserScript("https://example.com", std::string("h1"), 100);
    EXPECT_THAT(script, HasSubstr("query_selector_all(\"h1\")"));
}

TEST_F(SandboxToolsTest, WebBrowseReturnsScriptJson) {
    EXPECT_CALL(sandbox_, WriteFile("/workspace/temp/_browser_script.py", _))
        .WillOnce(Return(ReadyFuture()));
    EXPECT_CALL(sandbox_, RunCommand("python3 /workspace/temp/_browser_script.py", _,
                                     seconds(60), _))
        .WillOnce(Return(ReadyFuture(Output(
            0, "{\"status\": \"success\", \"url\": \"https://example.com/\", "
               "\"title\": \"Example\", \"content\": \"Hi\"}\n"))));

    auto result = tools::WebBrowse(executor_, "https://example.com");
    EXPECT_EQ(result["status"], "success");
    EXPECT_EQ(result["title"], "Example");
}

TEST_F(SandboxToolsTest, WebBrowseFailures) {
    EXPECT_CALL(sandbox_, WriteFile(_, _)).WillRepeatedly([](const std::string&, const std::string&) {
        return ReadyFuture();
    });
    EXPECT_CALL(sandbox_, RunCommand(_, _, _, _))
        .WillOnce(Return(ReadyFuture(Output(1, "", "ModuleNotFoundError: playwright"))))
        .WillOnce(Return(ReadyFuture(Output(0, "not json"))));

    auto missing = tools::WebBrowse(executor_, "https://example.com");
    EXPECT_EQ(missing["status"], "error");
    EXPECT_THAT(missing["error"].get<std::string>(), HasSubstr("playwright"));

    auto garbled = tools::WebBrowse(executor_, "https://example.com");
    EXPECT_EQ(garbled["error"], "Browser operation failed");
}

// ============================================================================
// Tool set and registry
// ============================================================================

TEST_F(SandboxToolsTest, CreateAllTools) {
    auto created = tools::CreateSandboxTools(executor_);
    ASSERT_EQ(created.size(), 5u);
    EXPECT_EQ(created[0].name, "shell");
    EXPECT_EQ(created[4].name, "web_browse");
    for (const auto& tool : created) {
        EXPECT_FALSE(tool.description.empty());
        EXPECT_EQ(tool.parameters["type"], "object");
        EXPECT_TRUE(static_cast<bool>(tool.handler));
    }
}

TEST_F(SandboxToolsTest, CreateSelectedTools) {
    auto created = tools::CreateSandboxTools(executor_, {"python", "file_read"});
    ASSERT_EQ(created.size(), 2u);
    EXPECT_EQ(created[0].name, "python");
    EXPECT_EQ(created[1].name, "file_read");

    try {
        tools::CreateSandboxTools(executor_, {"shell", "email"});
        FAIL() << "Expected invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_THAT(e.what(), HasSubstr("email"));
        EXPECT_THAT(e.what(), HasSubstr("shell, python, file_read, file_write, web_browse"));
    }
}

TEST(ToolDescriptionsTest, ListsEveryTool) {
    auto text = tools::GetToolDescriptions();
    EXPECT_THAT(text, HasSubstr("Available tools:"));
    for (const auto& name : tools::GetAvailableToolNames()) {
        EXPECT_THAT(text, HasSubstr("  - " + name + ": "));
    }
}

TEST_F(SandboxToolsTest, RegistryDispatchesByName) {
    EXPECT_CALL(sandbox_, RunCommand("pwd", "/workspace/input", _, _))
        .WillOnce(Return(ReadyFuture(Output(0, "/workspace/input\n"))));

    tools::ToolRegistry registry(tools::CreateSandboxTools(executor_));
    EXPECT_TRUE(registry.HasTool("shell"));
    EXPECT_FALSE(registry.HasTool("email"));

    auto result = registry.Invoke("shell", {{"command", "pwd"}, {"working_dir", "/workspace/input"}});
    EXPECT_EQ(result["status"], "success");
    EXPECT_EQ(registry.GetToolSchemas().size(), 5u);
}

TEST_F(SandboxToolsTest, RegistryRejectsBadCalls) {
    EXPECT_CALL(sandbox_, RunCommand(_, _, _, _)).Times(0);
    tools::ToolRegistry registry(tools::CreateSandboxTools(executor_, {"shell"}));

    auto unknown = registry.Invoke("python", {{"code", "1"}});
    EXPECT_EQ(unknown["status"], "error");
    EXPECT_THAT(unknown["error"].get<std::string>(), HasSubstr("Unknown tool 'python'"));

    auto missing = registry.Invoke("shell", json::object());
    EXPECT_THAT(missing["error"].get<std::string>(), HasSubstr("Missing required parameter 'command'"));

    auto wrong_type = registry.Invoke("shell", {{"command", 42}});
    EXPECT_THAT(wrong_type["error"].get<std::string>(), HasSubstr("must be a string"));

    auto not_object = registry.Invoke("shell", json::array());
    EXPECT_EQ(not_object["status"], "error");
}

TEST_F(SandboxToolsTest, RegistryRejectsDuplicates) {
    auto created = tools::CreateSandboxTools(executor_, {"shell", "shell"});
    EXPECT_THROW(tools::ToolRegistry registry(std::move(created)), std::invalid_argument);
}

TEST_F(SandboxToolsTest, InvokeAsync) {
    EXPECT_CALL(sandbox_, ReadFile("/workspace/a"))
        .WillOnce(Return(ReadyFuture(std::string("A"))));

    tools::ToolRegistry registry(tools::CreateSandboxTools(executor_));
    auto result = registry.InvokeAsync("file_read", {{"path", "/workspace/a"}}).get();
    EXPECT_EQ(result["content"], "A");
}

TEST(DumpToolResultTest, InvalidUtf8Replaced) {
    json result = {{"status", "success"}, {"content", std::string("ok\xff\xfe")}};

    std::string dumped;
    ASSERT_NO_THROW(dumped = tools::DumpToolResult(result));
    EXPECT_THAT(dumped, HasSubstr("ok\xEF\xBF\xBD"));
    EXPECT_NO_THROW(json::parse(dumped));
}
