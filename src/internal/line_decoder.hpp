#ifndef CLAUDE_CODE_INTERNAL_LINE_DECODER_HPP
#define CLAUDE_CODE_INTERNAL_LINE_DECODER_HPP

#include <claude_code/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace claude_code
{
namespace protocol
{

// One complete line of CLI output, newline (and trailing CR) stripped
struct RawLine
{
    std::string text;
    bool truncated = false; // Line exceeded the size limit; text holds the prefix
};

/**
 * Splits a byte stream into lines.
 *
 * Bytes are only interpreted after splitting on '\n', so a multi-byte UTF-8
 * character cut by a chunk boundary is reassembled before anyone decodes it.
 * At most one partial line is buffered, capped at max_line_size; the excess of
 * an over-long line is dropped up to its newline.
 */
class LineDecoder
{
  public:
    explicit LineDecoder(size_t max_line_size = DEFAULT_MAX_LINE_SIZE);

    // Append a chunk and return every line it completed, in order
    std::vector<RawLine> feed(const char* data, size_t size);
    std::vector<RawLine> feed(const std::string& data)
    {
        return feed(data.data(), data.size());
    }

    // Source reached end-of-stream: returns the unterminated leftover, if any.
    // The decoder accepts no input afterwards.
    std::optional<RawLine> finish();

    bool has_buffered_data() const
    {
        return !buffer_.empty() || discarding_;
    }

    bool finished() const
    {
        return finished_;
    }

  private:
    RawLine take_line();

    std::string buffer_;
    size_t max_line_size_;
    bool discarding_ = false; // Dropping the tail of a truncated line
    bool finished_ = false;
};

} // namespace protocol
} // namespace claude_code

#endif // CLAUDE_CODE_INTERNAL_LINE_DECODER_HPP
