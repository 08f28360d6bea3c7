#include "subprocess_transport.hpp"

#include "../warnings.hpp"
#include "cli_verification.hpp"
#include "subprocess_env.hpp"

#include <algorithm>
#include <cerrno>
#include <claude_code/errors.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <thread>

namespace claude_code
{
namespace internal
{

namespace
{
constexpr const char* CLI_NOT_FOUND_MESSAGE =
    "Claude Code CLI not found. Please install it with: npm install -g @anthropic-ai/claude-code";

// Executable names searched on PATH, in order
constexpr const char* CLI_NAMES[] = {"claude", "claude-code"};

std::string join(const std::vector<std::string>& items, const char* separator)
{
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
            joined += separator;
        joined += items[i];
    }
    return joined;
}
} // namespace

SubprocessTransport::SubprocessTransport(const std::string& prompt,
                                         const ClaudeCodeOptions& options)
    : options_(options), prompt_(prompt)
{
}

SubprocessTransport::~SubprocessTransport()
{
    close();
}

void SubprocessTransport::connect()
{
    if (process_)
        return; // Already connected

    std::string cli_path = find_cli();
    auto args = build_command();

    subprocess::ProcessOptions proc_opts;
    proc_opts.redirect_stdin = true;
    proc_opts.redirect_stdout = true;
    proc_opts.redirect_stderr = true;

    if (options_.cwd)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(*options_.cwd, ec))
            throw CLIConnectionError("Working directory does not exist: " + *options_.cwd);
        proc_opts.working_directory = *options_.cwd;
    }

    apply_sdk_environment(proc_opts, options_);

    auto process = std::make_unique<subprocess::Process>();
    try
    {
        process->spawn(cli_path, args, proc_opts);
    }
    catch (const subprocess::SpawnError& e)
    {
        int error_number = e.code().value();
        if (e.stage() == subprocess::SpawnStage::Exec &&
            (error_number == ENOENT || error_number == ENOTDIR))
        {
            throw CLINotFoundError(std::string(CLI_NOT_FOUND_MESSAGE) + " (" + e.what() + ")");
        }
        throw CLIConnectionError(std::string("Failed to spawn CLI process: ") + e.what());
    }

    process_ = std::move(process);

    try
    {
        send_prompt();
    }
    catch (const std::system_error& e)
    {
        close();
        throw CLIConnectionError(std::string("Failed to send prompt to CLI: ") + e.what());
    }

    ready_ = true;
}

void SubprocessTransport::send_prompt()
{
    auto& stdin_pipe = process_->stdin_pipe();

    if (options_.prompt_mode == PromptMode::Stdin)
    {
        json user_msg = {{"type", "user"},
                         {"message", {{"role", "user"}, {"content", prompt_}}},
                         {"parent_tool_use_id", nullptr},
                         {"session_id", ""}};
        stdin_pipe.write(user_msg.dump() + "\n");
    }

    // One prompt per process: the CLI sees EOF on stdin right away
    stdin_pipe.close();
}

size_t SubprocessTransport::read(char* buffer, size_t size)
{
    if (!process_)
        throw CLIConnectionError("Transport is not connected");

    auto& out = process_->stdout_pipe();
    auto& err = process_->stderr_pipe();

    try
    {
        while (out.is_open())
        {
            auto ready = subprocess::wait_readable({&out, &err}, -1);

            if (std::find(ready.begin(), ready.end(), &err) != ready.end())
                drain_stderr();

            if (std::find(ready.begin(), ready.end(), &out) != ready.end())
            {
                size_t n = out.read(buffer, size);
                if (n == 0)
                    out.close(); // EOF
                return n;
            }
        }
    }
    catch (const std::system_error& e)
    {
        throw IOError(std::string("reading CLI output: ") + e.what());
    }

    return 0;
}

int SubprocessTransport::wait_for_exit()
{
    if (!process_)
        throw CLIConnectionError("Transport is not connected");

    auto& err = process_->stderr_pipe();

    try
    {
        // Keep draining stderr while waiting: a CLI blocked on a full pipe never exits
        while (err.is_open())
        {
            if (err.has_data(100))
            {
                drain_stderr();
                continue;
            }
            if (process_->try_wait())
                break;
        }

        // Whatever is left after exit (a grandchild may still hold the pipe)
        while (err.is_open() && err.has_data(0))
            drain_stderr();

        int exit_code = process_->wait();
        emit_stderr_lines(true);
        return exit_code;
    }
    catch (const std::system_error& e)
    {
        throw IOError(std::string("waiting for CLI exit: ") + e.what());
    }
}

std::string SubprocessTransport::stderr_output() const
{
    return stderr_buffer_;
}

void SubprocessTransport::close()
{
    ready_ = false;

    if (!process_)
        return;

    try
    {
        if (process_->has_stdin())
            process_->stdin_pipe().close();
        process_->stdout_pipe().close();

        if (process_->is_running())
        {
            process_->terminate();

            auto deadline = std::chrono::steady_clock::now() + TERMINATE_GRACE_PERIOD;
            while (!process_->try_wait() && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(10));

            if (!process_->try_wait())
                process_->kill();
        }

        process_->wait();
    }
    catch (const std::system_error& e)
    {
        std::cerr << "Warning: failed to reap CLI process " << process_->pid() << ": " << e.what()
                  << std::endl;
    }

    if (process_->has_stderr())
        process_->stderr_pipe().close();
    emit_stderr_lines(true);

    process_.reset();
}

bool SubprocessTransport::is_ready() const
{
    return ready_ && process_ != nullptr;
}

bool SubprocessTransport::is_running() const
{
    return process_ && process_->is_running();
}

long SubprocessTransport::get_pid() const
{
    if (process_)
        return static_cast<long>(process_->pid());
    return 0;
}

void SubprocessTransport::drain_stderr()
{
    char buffer[4096];
    size_t n = process_->stderr_pipe().read(buffer, sizeof(buffer));
    if (n == 0)
    {
        process_->stderr_pipe().close();
        emit_stderr_lines(true);
        return;
    }

    stderr_buffer_.append(buffer, n);
    if (options_.stderr_callback.has_value())
        stderr_pending_.append(buffer, n);
    emit_stderr_lines(false);
}

void SubprocessTransport::emit_stderr_lines(bool flush_partial)
{
    size_t start = 0;
    size_t newline;
    while ((newline = stderr_pending_.find('\n', start)) != std::string::npos)
    {
        std::string line = stderr_pending_.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            invoke_stderr_callback(options_, line);
        start = newline + 1;
    }
    stderr_pending_.erase(0, start);

    if (flush_partial && !stderr_pending_.empty())
    {
        invoke_stderr_callback(options_, stderr_pending_);
        stderr_pending_.clear();
    }
}

std::vector<std::string> SubprocessTransport::build_command() const
{
    std::vector<std::string> args;

    // Output format - always stream-json (one JSON object per line)
    args.push_back("--output-format");
    args.push_back("stream-json");

    // Required when using stream-json output format
    args.push_back("--verbose");

    if (options_.prompt_mode == PromptMode::Stdin)
    {
        args.push_back("--input-format");
        args.push_back("stream-json");
    }

    if (options_.system_prompt)
    {
        args.push_back("--system-prompt");
        args.push_back(*options_.system_prompt);
    }

    if (options_.append_system_prompt)
    {
        args.push_back("--append-system-prompt");
        args.push_back(*options_.append_system_prompt);
    }

    if (!options_.allowed_tools.empty())
    {
        args.push_back("--allowedTools");
        args.push_back(join(options_.allowed_tools, ","));
    }

    if (!options_.disallowed_tools.empty())
    {
        args.push_back("--disallowedTools");
        args.push_back(join(options_.disallowed_tools, ","));
    }

    if (options_.max_turns)
    {
        args.push_back("--max-turns");
        args.push_back(std::to_string(*options_.max_turns));
    }

    if (options_.model)
    {
        args.push_back("--model");
        args.push_back(*options_.model);
    }

    // The CLI's own default needs no flag
    if (options_.permission_mode != PermissionMode::Default)
    {
        args.push_back("--permission-mode");
        args.push_back(to_string(options_.permission_mode));
    }

    for (const auto& [flag, value] : options_.extra_args)
    {
        if (flag.empty())
            continue;

        args.push_back(flag.rfind("--", 0) == 0 ? flag : "--" + flag);
        if (!value.empty())
            args.push_back(value);
    }

    // Prompt last; "--" keeps a prompt starting with '-' from reading as a flag
    if (options_.prompt_mode == PromptMode::Argument)
    {
        args.push_back("--print");
        args.push_back("--");
        args.push_back(prompt_);
    }

    return args;
}

std::string SubprocessTransport::find_cli() const
{
    auto validate_cli_path = [this](const std::string& path) -> std::string
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            throw CLINotFoundError("CLI path does not exist: " + path);

        if (!verify_cli_path_allowed(path, options_.allowed_cli_paths))
            throw CLINotFoundError("CLI path not in allowlist: " + path);

        std::string error_msg;
        if (!verify_cli_hash(path, options_.cli_hash_sha256, error_msg))
            throw CLINotFoundError("CLI integrity check failed: " + error_msg);

        return path;
    };

    // Explicit path wins
    if (!options_.cli_path.empty())
        return validate_cli_path(options_.cli_path);

    // Environment override: CLAUDE_CLI_PATH
    if (const char* env_cli = std::getenv("CLAUDE_CLI_PATH"); env_cli && env_cli[0] != '\0')
        return validate_cli_path(env_cli);

    for (const char* name : CLI_NAMES)
        if (auto result = subprocess::find_executable(name))
            return validate_cli_path(*result);

    // Local installation
    if (const char* home = std::getenv("HOME"))
    {
        std::filesystem::path local_cli = std::filesystem::path(home) / ".claude" / "local" / "claude";
        std::error_code ec;
        if (std::filesystem::exists(local_cli, ec))
            return validate_cli_path(local_cli.string());
    }

    throw CLINotFoundError(CLI_NOT_FOUND_MESSAGE);
}

} // namespace internal

// Factory functions
std::unique_ptr<Transport> create_subprocess_transport(const std::string& prompt,
                                                       const ClaudeCodeOptions& options)
{
    return std::make_unique<internal::SubprocessTransport>(prompt, options);
}

} // namespace claude_code
