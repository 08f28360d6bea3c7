// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace claude_code
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

namespace
{

// Written by the child to the status pipe when it cannot exec
struct ChildFailure
{
    int stage;
    int error_number;
};

std::system_error errno_error(const std::string& what)
{
    return std::system_error(errno, std::generic_category(), what);
}

void close_fd(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

void close_pair(int fds[2])
{
    close_fd(fds[0]);
    close_fd(fds[1]);
}

void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Reap the child if it has exited. Returns true once the exit code is known.
bool reap(ProcessHandle& handle, bool block)
{
    if (handle.pid == 0 || !handle.running)
        return true;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(handle.pid, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle.pid)
    {
        handle.exit_code = decode_status(status);
        handle.running = false;
        return true;
    }
    if (result == 0)
        return false; // Still running

    throw errno_error("waitpid failed");
}

// Inherited environment with the overrides applied, as NAME=value entries
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides)
{
    std::vector<std::string> entries;
    for (char** env = environ; env && *env; ++env)
    {
        std::string entry(*env);
        auto eq = entry.find('=');
        if (eq != std::string::npos && overrides.count(entry.substr(0, eq)))
            continue;
        entries.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides)
        entries.push_back(key + "=" + value);
    return entries;
}

// Child side of spawn: report the failing step to the parent and exit
[[noreturn]] void child_fail(int status_fd, SpawnStage stage)
{
    ChildFailure failure{static_cast<int>(stage), errno};
    ssize_t ignored = ::write(status_fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

} // namespace

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::system_error(EBADF, std::generic_category(), "Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
        throw errno_error("Read failed");

    return static_cast<size_t>(bytes_read);
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;
    return !wait_readable({this}, timeout_ms).empty();
}

void ReadPipe::close()
{
    if (handle_)
        close_fd(handle_->fd);
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

std::vector<ReadPipe*> wait_readable(const std::vector<ReadPipe*>& pipes, int timeout_ms)
{
    std::vector<ReadPipe*> ready;

    // Descriptors may lie above FD_SETSIZE, so this cannot use select()
    std::vector<pollfd> fds;
    std::vector<ReadPipe*> polled;
    for (ReadPipe* pipe : pipes)
    {
        if (pipe && pipe->is_open())
        {
            fds.push_back(pollfd{pipe->handle_->fd, POLLIN, 0});
            polled.push_back(pipe);
        }
    }
    if (fds.empty())
        return ready;

    int result =
        ::poll(fds.data(), static_cast<nfds_t>(fds.size()), timeout_ms < 0 ? -1 : timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return ready; // Caller loops
        throw errno_error("poll failed");
    }

    // Hang-up and error count as readable: the next read() reports EOF or the error
    for (size_t i = 0; i < fds.size(); ++i)
        if (fds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL))
            ready.push_back(polled[i]);

    return ready;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

void WritePipe::write(const std::string& data)
{
    if (!is_open())
        throw std::system_error(EBADF, std::generic_category(), "Pipe is not open");

    size_t offset = 0;
    while (offset < data.size())
    {
        ssize_t written = ::write(handle_->fd, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw errno_error("Broken pipe (process closed stdin)");
            throw errno_error("Write failed");
        }
        offset += static_cast<size_t>(written);
    }
}

void WritePipe::close()
{
    if (handle_)
        close_fd(handle_->fd);
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        kill();
        try
        {
            wait();
        }
        catch (const std::system_error&)
        {
            // Child already reaped elsewhere (ECHILD)
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (handle_->running)
        throw std::logic_error("Process already spawned");

    // Everything the child needs is prepared here: between fork and exec it
    // may only make async-signal-safe calls
    std::string program = executable;
    if (executable.find('/') == std::string::npos)
    {
        auto resolved = find_executable(executable);
        if (!resolved)
            throw SpawnError(SpawnStage::Exec, ENOENT, "Failed to execute " + executable);
        program = std::filesystem::absolute(*resolved).string();
    }

    std::vector<std::string> env_entries = build_environment(options.environment);
    std::vector<char*> envp;
    for (auto& entry : env_entries)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&]
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
    };

    auto make_pipe = [&](int fds[2], const char* name)
    {
        if (pipe(fds) != 0)
        {
            int error_number = errno;
            close_all();
            throw SpawnError(SpawnStage::Pipe, error_number,
                             std::string("Failed to create ") + name + " pipe");
        }
    };

    if (options.redirect_stdin)
        make_pipe(stdin_pipe, "stdin");
    if (options.redirect_stdout)
        make_pipe(stdout_pipe, "stdout");
    if (options.redirect_stderr)
        make_pipe(stderr_pipe, "stderr");
    make_pipe(status_pipe, "status");

    // Parent ends must not leak into this or any other child
    set_cloexec(status_pipe[0]);
    set_cloexec(status_pipe[1]);
    if (options.redirect_stdin)
        set_cloexec(stdin_pipe[1]);
    if (options.redirect_stdout)
        set_cloexec(stdout_pipe[0]);
    if (options.redirect_stderr)
        set_cloexec(stderr_pipe[0]);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        int error_number = errno;
        close_all();
        throw SpawnError(SpawnStage::Fork, error_number, "Failed to fork process");
    }

    if (pid == 0)
    {
        // Child process
        int status_fd = status_pipe[1];

        if (options.redirect_stdin && dup2(stdin_pipe[0], STDIN_FILENO) < 0)
            child_fail(status_fd, SpawnStage::Pipe);
        if (options.redirect_stdout && dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
            child_fail(status_fd, SpawnStage::Pipe);
        if (options.redirect_stderr && dup2(stderr_pipe[1], STDERR_FILENO) < 0)
            child_fail(status_fd, SpawnStage::Pipe);

        // The child's ends were dup'd onto 0/1/2; the originals are no longer needed
        for (int fd : {stdin_pipe[0], stdout_pipe[1], stderr_pipe[1]})
            if (fd > STDERR_FILENO)
                ::close(fd);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            child_fail(status_fd, SpawnStage::Chdir);

        execve(program.c_str(), argv.data(), envp.data());

        // If execve returns, it failed
        child_fail(status_fd, SpawnStage::Exec);
    }

    // Parent process
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on successful exec (CLOEXEC) and carries a
    // ChildFailure otherwise
    ChildFailure failure{};
    ssize_t status_bytes;
    do
    {
        status_bytes = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (status_bytes == static_cast<ssize_t>(sizeof(failure)))
    {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        close_all();

        auto stage = static_cast<SpawnStage>(failure.stage);
        std::string what = stage == SpawnStage::Chdir
                               ? "Failed to enter working directory " + options.working_directory
                               : "Failed to execute " + executable;
        throw SpawnError(stage, failure.error_number, what);
    }

    if (options.redirect_stdin)
    {
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (options.redirect_stdout)
    {
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::logic_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::logic_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::logic_error("stderr not redirected");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0)
        return false;

    // waitpid instead of kill(pid, 0): a zombie child still answers to signal 0
    return !reap(*handle_, false);
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return std::nullopt;

    if (reap(*handle_, false))
        return handle_->exit_code;
    return std::nullopt;
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        throw std::logic_error("Process was never spawned");

    reap(*handle_, true);
    return handle_->exit_code;
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// ============================================================================
// Helper functions
// ============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& path)
    {
        std::error_code ec;
        return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
    };

    if (name.empty())
        return std::nullopt;

    // Absolute or relative path: check it directly
    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    // Split PATH by colon; an empty entry means the current directory
    std::string path_str(path_env);
    size_t start = 0;
    while (true)
    {
        size_t end = path_str.find(':', start);
        std::string dir = path_str.substr(start, end == std::string::npos ? end : end - start);
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
        if (is_executable(candidate))
            return candidate.string();

        if (end == std::string::npos)
            break;
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace claude_code
