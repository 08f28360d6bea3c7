#ifndef CLAUDE_CODE_ERRORS_HPP
#define CLAUDE_CODE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace claude_code
{

// Base exception
class ClaudeCodeError : public std::runtime_error
{
  public:
    explicit ClaudeCodeError(const std::string& message) : std::runtime_error(message) {}
};

// CLI executable could not be located (or failed an integrity check)
class CLINotFoundError : public ClaudeCodeError
{
  public:
    explicit CLINotFoundError(const std::string& message) : ClaudeCodeError(message) {}
};

// CLI process could not be spawned or the transport is not connected
class CLIConnectionError : public ClaudeCodeError
{
  public:
    explicit CLIConnectionError(const std::string& message)
        : ClaudeCodeError("CLI connection error: " + message)
    {
    }
};

// CLI exited with a non-zero status
class ProcessError : public ClaudeCodeError
{
  public:
    ProcessError(int exit_code, const std::string& stderr_output)
        : ClaudeCodeError("Process failed with exit code " + std::to_string(exit_code) + ": " +
                          stderr_output),
          exit_code_(exit_code), stderr_(stderr_output)
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }

    // Everything the process wrote to stderr during the run
    const std::string& stderr_output() const
    {
        return stderr_;
    }

  private:
    int exit_code_;
    std::string stderr_;
};

// One line of CLI output could not be decoded into a known message shape.
// Recoverable: the stream keeps going after it is reported.
class CLIJSONDecodeError : public ClaudeCodeError
{
  public:
    explicit CLIJSONDecodeError(const std::string& message)
        : ClaudeCodeError("Failed to decode JSON response: " + message)
    {
    }

    CLIJSONDecodeError(const std::string& message, const std::string& line)
        : ClaudeCodeError("Failed to decode JSON response: " + message), line_(line)
    {
    }

    // Offending line (possibly truncated), empty when not line-related
    const std::string& line() const
    {
        return line_;
    }

  private:
    std::string line_;
};

// Low-level read/write failure on the process pipes
class IOError : public ClaudeCodeError
{
  public:
    explicit IOError(const std::string& message) : ClaudeCodeError("I/O error: " + message) {}
};

} // namespace claude_code

#endif // CLAUDE_CODE_ERRORS_HPP
