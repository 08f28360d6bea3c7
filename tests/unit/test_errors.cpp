#include <claude_code/errors.hpp>
#include <gtest/gtest.h>

using namespace claude_code;

TEST(ErrorsTest, AllErrorsDeriveFromClaudeCodeError)
{
    EXPECT_THROW(throw CLINotFoundError("missing"), ClaudeCodeError);
    EXPECT_THROW(throw CLIConnectionError("refused"), ClaudeCodeError);
    EXPECT_THROW(throw ProcessError(1, ""), ClaudeCodeError);
    EXPECT_THROW(throw CLIJSONDecodeError("bad"), ClaudeCodeError);
    EXPECT_THROW(throw IOError("broken pipe"), ClaudeCodeError);
    EXPECT_THROW(throw ClaudeCodeError("base"), std::runtime_error);
}

TEST(ErrorsTest, ProcessErrorCarriesExitCodeAndStderr)
{
    ProcessError error(2, "fatal: no credentials\n");

    EXPECT_EQ(error.exit_code(), 2);
    EXPECT_EQ(error.stderr_output(), "fatal: no credentials\n");
    EXPECT_STREQ(error.what(), "Process failed with exit code 2: fatal: no credentials\n");
}

TEST(ErrorsTest, DecodeErrorKeepsLine)
{
    CLIJSONDecodeError with_line("unknown message type: x", "{\"type\":\"x\"}");
    EXPECT_EQ(with_line.line(), "{\"type\":\"x\"}");
    EXPECT_STREQ(with_line.what(), "Failed to decode JSON response: unknown message type: x");

    CLIJSONDecodeError without_line("oops");
    EXPECT_TRUE(without_line.line().empty());
}

TEST(ErrorsTest, MessagePrefixes)
{
    EXPECT_STREQ(CLIConnectionError("spawn failed").what(), "CLI connection error: spawn failed");
    EXPECT_STREQ(IOError("read failed").what(), "I/O error: read failed");
    EXPECT_STREQ(CLINotFoundError("not here").what(), "not here");
}
