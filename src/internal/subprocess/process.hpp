#ifndef CLAUDE_CODE_SUBPROCESS_PROCESS_HPP
#define CLAUDE_CODE_SUBPROCESS_PROCESS_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace claude_code
{
namespace subprocess
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

// Step of Process::spawn that failed
enum class SpawnStage
{
    Pipe,  // creating the stdio pipes
    Fork,  // creating the child
    Chdir, // entering the working directory (in the child)
    Exec   // replacing the child image
};

// Thrown by Process::spawn. code() carries the errno reported by the failing step.
class SpawnError : public std::system_error
{
  public:
    SpawnError(SpawnStage stage, int error_number, const std::string& what)
        : std::system_error(error_number, std::generic_category(), what), stage_(stage)
    {
    }

    SpawnStage stage() const
    {
        return stage_;
    }

  private:
    SpawnStage stage_;
};

// Pipe for reading from subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    // No copy, move only
    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Read up to size bytes, blocking until at least one byte or EOF.
    // Returns 0 on EOF, throws std::system_error on error.
    size_t read(char* buffer, size_t size);

    // Check if data (or EOF) is available without blocking
    bool has_data(int timeout_ms = 0);

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    friend std::vector<ReadPipe*> wait_readable(const std::vector<ReadPipe*>& pipes,
                                                int timeout_ms);
    std::unique_ptr<PipeHandle> handle_;
};

// Pipe for writing to subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    // No copy, move only
    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // Write all of data, throws std::system_error on error
    void write(const std::string& data);

    // Close the pipe (the child sees EOF on stdin)
    void close();

    // Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Block until at least one of the open pipes is readable (data or EOF) or the
// timeout expires (-1 waits forever). Returns the readable subset, in input order.
std::vector<ReadPipe*> wait_readable(const std::vector<ReadPipe*>& pipes, int timeout_ms);

// Process configuration
struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment; // Applied on top of the inherited one
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = true;
};

// Main Process class
class Process
{
  public:
    Process();
    ~Process();

    // No copy, move only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Spawn a process. A name without '/' is looked up in PATH. Throws
    // SpawnError; returns only once the child has successfully exec'd.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Get pipes (only valid if redirected)
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();
    bool has_stdin() const
    {
        return static_cast<bool>(stdin_);
    }
    bool has_stderr() const
    {
        return static_cast<bool>(stderr_);
    }

    // Process control
    bool is_running() const;
    std::optional<int> try_wait(); // Non-blocking wait, returns exit code if done
    int wait();                    // Blocking wait, returns exit code
    void terminate();              // Graceful termination (SIGTERM)
    void kill();                   // Forceful kill (SIGKILL)

    // Process ID
    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// Helper function to find executable in PATH
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace claude_code

#endif // CLAUDE_CODE_SUBPROCESS_PROCESS_HPP
