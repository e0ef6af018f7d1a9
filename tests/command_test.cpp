#include "command.h"
#include "error.h"
#include "test_util.h"

class CommandRunnerTest : public TempDirTest {};

TEST_F(CommandRunnerTest, ArgumentsAreNotShellInterpreted) {
    CommandRunner runner(dir);
    auto result = runner.run("echo", {"$HOME;", "a b", "*"});
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(read_output(result), "$HOME; a b *\n");
}

TEST_F(CommandRunnerTest, CapturesStdoutAndStderrSeparately) {
    CommandRunner runner(dir);
    auto result = runner.run("sh", {"-c", "echo out; echo err >&2"});
    EXPECT_EQ(slurp(result.stdout_log), "out\n");
    EXPECT_EQ(slurp(result.stderr_log), "err\n");
    EXPECT_EQ(result.stdout_log.parent_path(), dir);
}

TEST_F(CommandRunnerTest, NonZeroExitRaisesWithResult) {
    CommandRunner runner(dir);
    try {
        runner.run("sh", {"-c", "echo partial; echo broken >&2; exit 3"});
        FAIL() << "ExternalToolError expected";
    }
    catch (const ExternalToolError& ex) {
        EXPECT_EQ(ex.result().exit_status, 3);
        EXPECT_EQ(ex.result().command.front(), "sh");
        EXPECT_EQ(slurp(ex.result().stdout_log), "partial\n");
        EXPECT_EQ(slurp(ex.result().stderr_log), "broken\n");
        EXPECT_NE(std::string(ex.what()).find(ex.result().stderr_log.string()), std::string::npos);
    }
}

TEST_F(CommandRunnerTest, MissingProgramReportsStatus127) {
    CommandRunner runner(dir);
    try {
        runner.run("/nonexistent/program");
        FAIL() << "ExternalToolError expected";
    }
    catch (const ExternalToolError& ex) {
        EXPECT_EQ(ex.result().exit_status, 127);
        EXPECT_NE(slurp(ex.result().stderr_log).find("exec failed"), std::string::npos);
    }
}

TEST_F(CommandRunnerTest, CreatesTwoLogFilesPerInvocation) {
    CommandRunner runner(dir);
    auto first = runner.run("true");
    auto second = runner.run("/bin/true");
    EXPECT_EQ(first.stdout_log.filename(), "0001-true.stdout");
    EXPECT_EQ(first.stderr_log.filename(), "0001-true.stderr");
    EXPECT_EQ(second.stdout_log.filename(), "0002-true.stdout");

    size_t files = 0;
    for (const auto& entry:std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) files++;
    }
    EXPECT_EQ(files, 4u);
}

TEST(ShellQuoteTest, QuotesOnlyWhatNeedsIt) {
    EXPECT_EQ(shell_quote({"qemu-img", "create", "-f", "raw", "/tmp/x.img", "50M"}),
        "qemu-img create -f raw /tmp/x.img 50M");
    EXPECT_EQ(shell_quote({"echo", "a b", "", "it's", "--x=1"}),
        "echo 'a b' '' 'it'\\''s' --x=1");
}
