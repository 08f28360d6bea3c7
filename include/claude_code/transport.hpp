#ifndef CLAUDE_CODE_TRANSPORT_HPP
#define CLAUDE_CODE_TRANSPORT_HPP

#include <claude_code/types.hpp>
#include <cstddef>
#include <memory>
#include <string>

namespace claude_code
{

/**
 * Abstract transport interface for one CLI query.
 *
 * A transport owns the raw byte channel to the CLI. MessageStream pulls bytes
 * from it on demand and turns them into messages; the transport never
 * interprets what it reads.
 *
 * Lifecycle: connect() once, read() until it returns 0, then
 * wait_for_exit(). close() may be called at any point and must leave no
 * process or pipe behind.
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Start the CLI and hand it the prompt.
     * @throws CLINotFoundError if the executable cannot be located
     * @throws CLIConnectionError if it cannot be started
     */
    virtual void connect() = 0;

    /**
     * Read the next chunk of the CLI's standard output.
     * Blocks until at least one byte is available or the output ends.
     * @return Number of bytes stored in buffer; 0 means end of output
     * @throws IOError on a pipe failure
     */
    virtual size_t read(char* buffer, size_t size) = 0;

    /**
     * Wait for the CLI to exit once its output has ended.
     * @return Exit code (128 + signal number if killed by a signal)
     */
    virtual int wait_for_exit() = 0;

    /**
     * Everything the CLI has written to stderr so far.
     */
    virtual std::string stderr_output() const = 0;

    /**
     * Release everything: close pipes and, if the CLI is still running,
     * terminate it and reap it. Safe to call repeatedly.
     */
    virtual void close() = 0;

    /**
     * Check if transport is ready for reading.
     */
    virtual bool is_ready() const = 0;

    /**
     * Check if the CLI process is still running.
     */
    virtual bool is_running() const = 0;

    /**
     * Get the process ID for subprocess transports.
     * Returns 0 for non-subprocess transports.
     */
    virtual long get_pid() const
    {
        return 0;
    }
};

// Transport that runs the Claude Code CLI as a child process for a single prompt
std::unique_ptr<Transport> create_subprocess_transport(const std::string& prompt,
                                                       const ClaudeCodeOptions& options);

} // namespace claude_code

#endif // CLAUDE_CODE_TRANSPORT_HPP
