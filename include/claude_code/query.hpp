#ifndef CLAUDE_CODE_QUERY_HPP
#define CLAUDE_CODE_QUERY_HPP

#include <claude_code/transport.hpp>
#include <claude_code/types.hpp>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace claude_code
{

// Lifecycle of one query
enum class StreamState
{
    Starting,  // CLI being launched
    Streaming, // Reading stdout line by line
    Draining,  // stdout ended, waiting for the process to exit
    Closed,    // Clean exit, sequence finished
    Failed     // Terminal error or cancellation
};

const char* to_string(StreamState state);

/**
 * Lazily pulled sequence of messages produced by one CLI run.
 *
 * Nothing is read ahead: each next() performs at most the reads needed to
 * produce one item. Errors are part of the sequence and are thrown from
 * next() in the position they occurred; after a CLIJSONDecodeError (with the
 * default DecodeErrorPolicy::Surface) the stream stays usable.
 *
 * Destroying the stream, or calling cancel(), terminates a CLI that is still
 * running.
 */
class MessageStream
{
  public:
    // Input iterator for range-for consumption; errors propagate from
    // begin() and operator++ like from next().
    // The iterator refers to the stream object itself: do not move the
    // stream while iterating over it.
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Message;
        using difference_type = std::ptrdiff_t;
        using pointer = const Message*;
        using reference = const Message&;

        Iterator() = default;
        explicit Iterator(MessageStream* stream);

        reference operator*() const;
        pointer operator->() const;
        Iterator& operator++();

        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const;

      private:
        MessageStream* stream_ = nullptr; // nullptr marks the end iterator
        std::optional<Message> current_;
    };

    MessageStream(std::unique_ptr<Transport> transport, const ClaudeCodeOptions& options);
    ~MessageStream();

    MessageStream(MessageStream&& other) noexcept;
    MessageStream& operator=(MessageStream&& other) noexcept;
    MessageStream(const MessageStream&) = delete;
    MessageStream& operator=(const MessageStream&) = delete;

    /**
     * Pull the next message.
     * @return The message, or std::nullopt once the sequence has ended
     * @throws CLIJSONDecodeError for a line that could not be decoded
     * @throws ProcessError when the CLI exited with a non-zero code
     * @throws IOError on a pipe failure
     */
    std::optional<Message> next();

    // Stop the CLI (if still running) and end the sequence
    void cancel();

    StreamState state() const;

    Iterator begin();
    Iterator end();

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Run one prompt through the Claude Code CLI.
 *
 * Returns as soon as the CLI has been launched; messages are read as the
 * stream is consumed.
 *
 * @throws ClaudeCodeError for an empty prompt or invalid options
 * @throws CLINotFoundError if the CLI cannot be located
 * @throws CLIConnectionError if the CLI cannot be started
 */
MessageStream query(const std::string& prompt,
                    const ClaudeCodeOptions& options = ClaudeCodeOptions{});

// Same, over a caller-supplied transport (already bound to its prompt)
MessageStream query(const std::string& prompt, const ClaudeCodeOptions& options,
                    std::unique_ptr<Transport> transport);

} // namespace claude_code

#endif // CLAUDE_CODE_QUERY_HPP
