#include "internal/line_decoder.hpp"
#include "internal/message_parser.hpp"
#include "internal/warnings.hpp"

#include <cctype>
#include <claude_code/errors.hpp>
#include <claude_code/query.hpp>
#include <deque>
#include <stdexcept>
#include <vector>

namespace claude_code
{

namespace
{
bool is_blank(const std::string& line)
{
    for (unsigned char c : line)
        if (!std::isspace(c))
            return false;
    return true;
}
} // namespace

const char* to_string(StreamState state)
{
    switch (state)
    {
    case StreamState::Starting:
        return "starting";
    case StreamState::Streaming:
        return "streaming";
    case StreamState::Draining:
        return "draining";
    case StreamState::Closed:
        return "closed";
    case StreamState::Failed:
        return "failed";
    }
    return "unknown";
}

// MessageStream::Impl

class MessageStream::Impl
{
  public:
    Impl(std::unique_ptr<Transport> transport, const ClaudeCodeOptions& options)
        : options_(options), transport_(std::move(transport)), decoder_(options.max_line_size),
          chunk_(options.read_chunk_size > 0 ? options.read_chunk_size : DEFAULT_READ_CHUNK_SIZE)
    {
    }

    ~Impl()
    {
        if (transport_)
            transport_->close();
    }

    void start()
    {
        try
        {
            transport_->connect();
        }
        catch (const ClaudeCodeError&)
        {
            fail();
            throw;
        }
        state_ = StreamState::Streaming;
    }

    std::optional<Message> next();

    void cancel()
    {
        if (state_ == StreamState::Closed || state_ == StreamState::Failed)
            return;
        fail();
    }

    StreamState state() const
    {
        return state_;
    }

  private:
    void read_chunk();
    std::optional<Message> finish_process();
    void handle_decode_error(const CLIJSONDecodeError& error);

    void fail()
    {
        state_ = StreamState::Failed;
        pending_.clear();
        transport_->close();
    }

    const ClaudeCodeOptions options_;
    std::unique_ptr<Transport> transport_;
    protocol::LineDecoder decoder_;
    std::deque<protocol::RawLine> pending_;
    std::vector<char> chunk_;
    StreamState state_ = StreamState::Starting;
    bool result_seen_ = false;
};

std::optional<Message> MessageStream::Impl::next()
{
    while (true)
    {
        if (state_ == StreamState::Closed || state_ == StreamState::Failed)
            return std::nullopt;

        if (pending_.empty())
        {
            if (state_ == StreamState::Streaming)
            {
                read_chunk();
                continue;
            }
            return finish_process();
        }

        protocol::RawLine line = std::move(pending_.front());
        pending_.pop_front();

        if (line.truncated)
        {
            handle_decode_error(CLIJSONDecodeError(
                "line exceeded maximum size of " + std::to_string(options_.max_line_size) +
                    " bytes",
                protocol::MessageParser::error_fragment(line.text)));
            continue;
        }

        if (is_blank(line.text))
            continue;

        Message msg;
        try
        {
            msg = protocol::MessageParser::parse_message(line.text);
        }
        catch (const CLIJSONDecodeError& e)
        {
            handle_decode_error(e);
            continue;
        }

        if (result_seen_)
            internal::report_warning(options_, "CLI produced output after its result message");
        if (is_result_message(msg))
            result_seen_ = true;

        return msg;
    }
}

void MessageStream::Impl::read_chunk()
{
    size_t n = 0;
    try
    {
        n = transport_->read(chunk_.data(), chunk_.size());
    }
    catch (const ClaudeCodeError&)
    {
        fail();
        throw;
    }

    if (n == 0)
    {
        // End of stdout: an unterminated last line is still a line
        if (auto rest = decoder_.finish())
            pending_.push_back(std::move(*rest));
        state_ = StreamState::Draining;
        return;
    }

    for (auto& line : decoder_.feed(chunk_.data(), n))
        pending_.push_back(std::move(line));
}

std::optional<Message> MessageStream::Impl::finish_process()
{
    int exit_code = 0;
    try
    {
        exit_code = transport_->wait_for_exit();
    }
    catch (const ClaudeCodeError&)
    {
        fail();
        throw;
    }

    if (exit_code == 0)
    {
        state_ = StreamState::Closed;
        transport_->close();
        return std::nullopt;
    }

    std::string stderr_output = transport_->stderr_output();
    fail();
    throw ProcessError(exit_code, stderr_output);
}

void MessageStream::Impl::handle_decode_error(const CLIJSONDecodeError& error)
{
    switch (options_.decode_error_policy)
    {
    case DecodeErrorPolicy::Skip:
        internal::report_warning(options_, std::string("skipping undecodable line: ") + error.what());
        return;
    case DecodeErrorPolicy::Abort:
        fail();
        throw error;
    case DecodeErrorPolicy::Surface:
        break;
    }
    throw error;
}

// MessageStream

MessageStream::MessageStream(std::unique_ptr<Transport> transport, const ClaudeCodeOptions& options)
{
    if (!transport)
        throw std::invalid_argument("MessageStream requires a transport");
    impl_ = std::make_unique<Impl>(std::move(transport), options);
    impl_->start();
}

MessageStream::~MessageStream() = default;

MessageStream::MessageStream(MessageStream&& other) noexcept = default;

MessageStream& MessageStream::operator=(MessageStream&& other) noexcept = default;

std::optional<Message> MessageStream::next()
{
    if (!impl_)
        return std::nullopt; // Moved-from
    return impl_->next();
}

void MessageStream::cancel()
{
    if (impl_)
        impl_->cancel();
}

StreamState MessageStream::state() const
{
    if (!impl_)
        return StreamState::Closed;
    return impl_->state();
}

MessageStream::Iterator MessageStream::begin()
{
    return Iterator(this);
}

MessageStream::Iterator MessageStream::end()
{
    return Iterator();
}

// MessageStream::Iterator

MessageStream::Iterator::Iterator(MessageStream* stream) : stream_(stream)
{
    ++(*this);
}

MessageStream::Iterator::reference MessageStream::Iterator::operator*() const
{
    if (!current_)
        throw std::out_of_range("Iterator out of range");
    return *current_;
}

MessageStream::Iterator::pointer MessageStream::Iterator::operator->() const
{
    return &(operator*());
}

MessageStream::Iterator& MessageStream::Iterator::operator++()
{
    if (!stream_)
        return *this;

    current_ = stream_->next();
    if (!current_)
        stream_ = nullptr; // Became the end iterator
    return *this;
}

bool MessageStream::Iterator::operator==(const Iterator& other) const
{
    // Input iterator: all live iterators of a stream share its single position
    return stream_ == other.stream_;
}

bool MessageStream::Iterator::operator!=(const Iterator& other) const
{
    return !(*this == other);
}

// Main query function

MessageStream query(const std::string& prompt, const ClaudeCodeOptions& options)
{
    if (prompt.empty())
        throw ClaudeCodeError("Prompt cannot be empty");

    return query(prompt, options, create_subprocess_transport(prompt, options));
}

MessageStream query(const std::string& prompt, const ClaudeCodeOptions& options,
                    std::unique_ptr<Transport> transport)
{
    if (prompt.empty())
        throw ClaudeCodeError("Prompt cannot be empty");

    if (options.max_turns && *options.max_turns <= 0)
        throw ClaudeCodeError("max_turns must be a positive integer, got " +
                              std::to_string(*options.max_turns));

    return MessageStream(std::move(transport), options);
}

} // namespace claude_code
