#include "../../src/internal/transport/cli_verification.hpp"
#include "../../src/internal/transport/subprocess_transport.hpp"
#include "../test_utils.hpp"

#include <algorithm>
#include <cctype>
#include <claude_code/errors.hpp>
#include <claude_code/transport.hpp>
#include <claude_code/types.hpp>
#include <gtest/gtest.h>

using namespace claude_code;
using claude_code::internal::SubprocessTransport;
using claude_code::test::TempDir;
using claude_code::test::write_fake_cli;

namespace
{

bool has_flag_value(const std::vector<std::string>& args, const std::string& flag,
                    const std::string& value)
{
    auto it = std::find(args.begin(), args.end(), flag);
    return it != args.end() && std::next(it) != args.end() && *std::next(it) == value;
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag)
{
    return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string digest_of(const std::string& path)
{
    auto digest = internal::compute_file_sha256(path);
    if (!digest)
        throw std::runtime_error("cannot hash " + path);
    return *digest;
}

} // namespace

TEST(TransportCliPathTest, InvalidCliPathRaisesError)
{
    ClaudeCodeOptions opts;
    opts.cli_path = "/this/path/does/not/exist/claude";

    auto transport = create_subprocess_transport("hello", opts);
    EXPECT_THROW(transport->connect(), CLINotFoundError);
    EXPECT_FALSE(transport->is_ready());
}

TEST(TransportCliPathTest, ExplicitPathIsUsed)
{
    TempDir dir;
    ClaudeCodeOptions opts;
    opts.cli_path = write_fake_cli(dir, "exit 0");

    SubprocessTransport transport("hello", opts);
    EXPECT_EQ(transport.find_cli(), opts.cli_path);
}

TEST(TransportCliPathTest, AllowlistRejectsOtherPaths)
{
    TempDir dir;
    ClaudeCodeOptions opts;
    opts.cli_path = write_fake_cli(dir, "exit 0");
    opts.allowed_cli_paths = {(dir.path() / "some-other-cli").string()};

    SubprocessTransport transport("hello", opts);
    EXPECT_THROW(transport.find_cli(), CLINotFoundError);

    opts.allowed_cli_paths.push_back(opts.cli_path);
    SubprocessTransport allowed("hello", opts);
    EXPECT_EQ(allowed.find_cli(), opts.cli_path);
}

TEST(TransportCliPathTest, HashMismatchRejectsCli)
{
    TempDir dir;
    ClaudeCodeOptions opts;
    opts.cli_path = write_fake_cli(dir, "exit 0");
    opts.cli_hash_sha256 = std::string(64, '0');

    SubprocessTransport transport("hello", opts);
    try
    {
        transport.find_cli();
        FAIL() << "Expected CLINotFoundError";
    }
    catch (const CLINotFoundError& e)
    {
        EXPECT_NE(std::string(e.what()).find("integrity check failed"), std::string::npos);
    }
}

TEST(TransportCliPathTest, MatchingHashIsAcceptedCaseInsensitively)
{
    TempDir dir;
    ClaudeCodeOptions opts;
    opts.cli_path = write_fake_cli(dir, "exit 0");

    std::string digest = digest_of(opts.cli_path);
    ASSERT_EQ(digest.size(), 64);
    for (auto& c : digest)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    opts.cli_hash_sha256 = digest;

    SubprocessTransport transport("hello", opts);
    EXPECT_EQ(transport.find_cli(), opts.cli_path);
}

TEST(TransportCliPathTest, MalformedHashIsRejected)
{
    TempDir dir;
    std::string cli = write_fake_cli(dir, "exit 0");

    std::string error;
    EXPECT_FALSE(internal::verify_cli_hash(cli, std::string("abc"), error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_TRUE(internal::verify_cli_hash(cli, std::nullopt, error));
    EXPECT_TRUE(error.empty());
}

TEST(TransportCliPathTest, Sha256OfKnownContent)
{
    TempDir dir;
    std::string path = (dir.path() / "abc.txt").string();
    {
        std::ofstream out(path);
        out << "abc";
    }

    EXPECT_EQ(internal::compute_file_sha256(path).value_or(""),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_FALSE(internal::compute_file_sha256(dir.path() / "missing").has_value());
}

TEST(TransportCliPathTest, ReadBeforeConnectFails)
{
    SubprocessTransport transport("hello", ClaudeCodeOptions{});
    char buffer[16];
    EXPECT_THROW(transport.read(buffer, sizeof(buffer)), CLIConnectionError);
    EXPECT_THROW(transport.wait_for_exit(), CLIConnectionError);
    EXPECT_EQ(transport.get_pid(), 0);

    // Closing an unconnected transport is a no-op
    transport.close();
    transport.close();
}

TEST(TransportCliPathTest, CwdMustBeADirectory)
{
    TempDir dir;
    ClaudeCodeOptions opts;
    opts.cli_path = write_fake_cli(dir, "exit 0");
    opts.cwd = (dir.path() / "missing-dir").string();

    SubprocessTransport transport("hello", opts);
    EXPECT_THROW(transport.connect(), CLIConnectionError);
}

TEST(BuildCommandTest, DefaultArguments)
{
    SubprocessTransport transport("What is 2+2?", ClaudeCodeOptions{});
    auto args = transport.build_command();

    std::vector<std::string> expected = {"--output-format", "stream-json", "--verbose",
                                         "--print",         "--",          "What is 2+2?"};
    EXPECT_EQ(args, expected);
}

TEST(BuildCommandTest, OptionsMapToFlags)
{
    ClaudeCodeOptions opts;
    opts.system_prompt = "Be terse";
    opts.append_system_prompt = "Use metric units";
    opts.allowed_tools = {"Read", "Write"};
    opts.disallowed_tools = {"Bash"};
    opts.max_turns = 3;
    opts.model = "claude-sonnet-4-5";
    opts.permission_mode = PermissionMode::AcceptEdits;
    opts.extra_args = {{"debug-to-stderr", ""}, {"--settings", "/tmp/s.json"}};

    SubprocessTransport transport("-starts with a dash", opts);
    auto args = transport.build_command();

    EXPECT_TRUE(has_flag_value(args, "--system-prompt", "Be terse"));
    EXPECT_TRUE(has_flag_value(args, "--append-system-prompt", "Use metric units"));
    EXPECT_TRUE(has_flag_value(args, "--allowedTools", "Read,Write"));
    EXPECT_TRUE(has_flag_value(args, "--disallowedTools", "Bash"));
    EXPECT_TRUE(has_flag_value(args, "--max-turns", "3"));
    EXPECT_TRUE(has_flag_value(args, "--model", "claude-sonnet-4-5"));
    EXPECT_TRUE(has_flag_value(args, "--permission-mode", "acceptEdits"));
    EXPECT_TRUE(has_flag(args, "--debug-to-stderr"));
    EXPECT_TRUE(has_flag_value(args, "--settings", "/tmp/s.json"));

    // Prompt goes last, after the option terminator
    ASSERT_GE(args.size(), 2);
    EXPECT_EQ(args[args.size() - 2], "--");
    EXPECT_EQ(args.back(), "-starts with a dash");
}

TEST(BuildCommandTest, DefaultPermissionModeAddsNoFlag)
{
    SubprocessTransport transport("hi", ClaudeCodeOptions{});
    EXPECT_FALSE(has_flag(transport.build_command(), "--permission-mode"));
}

TEST(BuildCommandTest, StdinPromptMode)
{
    ClaudeCodeOptions opts;
    opts.prompt_mode = PromptMode::Stdin;

    SubprocessTransport transport("hello", opts);
    auto args = transport.build_command();

    EXPECT_TRUE(has_flag_value(args, "--input-format", "stream-json"));
    EXPECT_FALSE(has_flag(args, "--print"));
    EXPECT_EQ(std::find(args.begin(), args.end(), "hello"), args.end());
}
