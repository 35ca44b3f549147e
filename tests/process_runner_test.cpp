#include "lib/process_runner.hpp"
#include "lib/errors.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using TestHelpers::ScopedEnv;

class ProcessRunnerTest : public TestHelpers::ScratchTest {};

TEST_F(ProcessRunnerTest, CapturesOutputAndStatus) {
    ProcessRunner::Command command;
    command.argv = {"/bin/sh", "-c", "echo out; echo err >&2; exit 4"};
    
    ProcessRunner::Result result = ProcessRunner::run(command);
    
    EXPECT_EQ(result.exitStatus, 4);
    EXPECT_NE(result.output.find("out"), std::string::npos);
    EXPECT_NE(result.output.find("err"), std::string::npos);
}

TEST_F(ProcessRunnerTest, FeedsInputAndWorkingDirectory) {
    ProcessRunner::Command command;
    command.argv = {"/bin/sh", "-c", "read -r line; echo \"$(pwd):$line\""};
    command.workingDirectory = dir().string();
    command.input = "hello";
    command.hasInput = true;
    
    ProcessRunner::Result result = ProcessRunner::run(command);
    
    EXPECT_EQ(result.exitStatus, 0);
    EXPECT_EQ(result.output, fs::canonical(dir()).string() + ":hello\n");
}

TEST_F(ProcessRunnerTest, StdinIsEmptyWithoutInput) {
    ProcessRunner::Command command;
    command.argv = {"/bin/sh", "-c", "cat | wc -c"};
    
    ProcessRunner::Result result = ProcessRunner::run(command);
    
    EXPECT_EQ(result.exitStatus, 0);
    EXPECT_EQ(std::stoi(result.output), 0);
}

TEST_F(ProcessRunnerTest, RunCheckedThrowsWithStatus) {
    ProcessRunner::Command command;
    command.argv = {"/bin/sh", "-c", "exit 3"};
    
    try {
        ProcessRunner::runChecked(command, "Step failed");
        FAIL() << "expected ProcessError";
    } catch (const ProcessError& e) {
        EXPECT_EQ(e.getStatus(), 3);
        EXPECT_EQ(e.getTool(), "/bin/sh");
        EXPECT_NE(std::string(e.what()).find("Step failed"), std::string::npos);
    }
}

TEST_F(ProcessRunnerTest, MissingBinaryIsProcessError) {
    ProcessRunner::Command command;
    command.argv = {(dir() / "no-such-tool").string()};
    
    EXPECT_THROW(ProcessRunner::runChecked(command, "Step failed"), ProcessError);
}

TEST_F(ProcessRunnerTest, EmptyCommandIsRejected) {
    ProcessRunner::Command command;
    EXPECT_THROW(ProcessRunner::run(command), InvalidArgumentError);
}

TEST_F(ProcessRunnerTest, ToolPathHonoursEnvironment) {
    {
        ScopedEnv env("INJECTISO_TEST_TOOL", "/opt/bin/tool");
        EXPECT_EQ(ProcessRunner::toolPath("INJECTISO_TEST_TOOL", "tool"), "/opt/bin/tool");
    }
    {
        ScopedEnv env("INJECTISO_TEST_TOOL", "");
        EXPECT_EQ(ProcessRunner::toolPath("INJECTISO_TEST_TOOL", "tool"), "tool");
    }
}

TEST_F(ProcessRunnerTest, IsAvailable) {
    fs::path script = dir() / "tool";
    TestHelpers::writeScript(script, "exit 0\n");
    
    EXPECT_TRUE(ProcessRunner::isAvailable(script.string()));
    EXPECT_TRUE(ProcessRunner::isAvailable("sh"));
    EXPECT_FALSE(ProcessRunner::isAvailable((dir() / "absent").string()));
    
    ScopedEnv path("PATH", dir().string());
    EXPECT_TRUE(ProcessRunner::isAvailable("tool"));
}

TEST_F(ProcessRunnerTest, FormatCommandQuotes) {
    EXPECT_EQ(ProcessRunner::formatCommand({"xorriso", "-V", "My Disk", ""}), "xorriso -V 'My Disk' ''");
}
