#ifndef CLAUDE_CODE_INTERNAL_SUBPROCESS_TRANSPORT_HPP
#define CLAUDE_CODE_INTERNAL_SUBPROCESS_TRANSPORT_HPP

#include "../subprocess/process.hpp"

#include <chrono>
#include <claude_code/transport.hpp>
#include <claude_code/types.hpp>
#include <memory>
#include <string>
#include <vector>

namespace claude_code
{
namespace internal
{

// How long close() lets a running CLI react to SIGTERM before SIGKILL
constexpr std::chrono::milliseconds TERMINATE_GRACE_PERIOD{1000};

/**
 * Subprocess transport implementation using Claude Code CLI.
 *
 * Runs the CLI for one prompt and reads its line-delimited JSON output.
 * All I/O happens on the calling thread: stdout and stderr are multiplexed
 * with poll(), so a CLI blocked on a full stderr pipe cannot stall the
 * stdout reader. stderr is accumulated for ProcessError and forwarded line
 * by line to the stderr callback.
 */
class SubprocessTransport : public Transport
{
  public:
    SubprocessTransport(const std::string& prompt, const ClaudeCodeOptions& options);
    ~SubprocessTransport() override;

    SubprocessTransport(const SubprocessTransport&) = delete;
    SubprocessTransport& operator=(const SubprocessTransport&) = delete;

    // Transport interface
    void connect() override;
    size_t read(char* buffer, size_t size) override;
    int wait_for_exit() override;
    std::string stderr_output() const override;
    void close() override;
    bool is_ready() const override;
    bool is_running() const override;
    long get_pid() const override;

    // CLI arguments (excluding the executable) for the configured prompt and options
    std::vector<std::string> build_command() const;

    // Find CLI executable (honors options_.cli_path when provided)
    std::string find_cli() const;

  private:
    // Read one chunk of stderr into the capture buffer; closes the pipe at EOF
    void drain_stderr();

    // Hand complete stderr lines to the callback
    void emit_stderr_lines(bool flush_partial);

    void send_prompt();

    const ClaudeCodeOptions options_;
    const std::string prompt_;

    // Process management
    std::unique_ptr<subprocess::Process> process_;
    bool ready_ = false;

    // Captured stderr (append-only) and the not yet forwarded partial line
    std::string stderr_buffer_;
    std::string stderr_pending_;
};

} // namespace internal
} // namespace claude_code

#endif // CLAUDE_CODE_INTERNAL_SUBPROCESS_TRANSPORT_HPP
