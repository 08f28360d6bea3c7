#include "line_decoder.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace claude_code
{
namespace protocol
{

LineDecoder::LineDecoder(size_t max_line_size)
    : max_line_size_(max_line_size == 0 ? DEFAULT_MAX_LINE_SIZE : max_line_size)
{
}

std::vector<RawLine> LineDecoder::feed(const char* data, size_t size)
{
    if (finished_)
        throw std::logic_error("LineDecoder received data after end of stream");

    std::vector<RawLine> lines;
    size_t pos = 0;

    while (pos < size)
    {
        const void* newline = std::memchr(data + pos, '\n', size - pos);
        size_t end = newline ? static_cast<size_t>(static_cast<const char*>(newline) - data) : size;
        size_t segment = end - pos;

        if (!discarding_)
        {
            size_t room = max_line_size_ - buffer_.size();
            buffer_.append(data + pos, std::min(segment, room));
            if (segment > room)
                discarding_ = true;
        }

        if (!newline)
            break;

        lines.push_back(take_line());
        pos = end + 1;
    }

    return lines;
}

std::optional<RawLine> LineDecoder::finish()
{
    if (finished_)
        return std::nullopt;
    finished_ = true;

    if (buffer_.empty() && !discarding_)
        return std::nullopt;
    return take_line();
}

RawLine LineDecoder::take_line()
{
    RawLine line;
    line.truncated = discarding_;
    line.text.swap(buffer_);
    if (!line.truncated && !line.text.empty() && line.text.back() == '\r')
        line.text.pop_back();

    buffer_.clear();
    discarding_ = false;
    return line;
}

} // namespace protocol
} // namespace claude_code
