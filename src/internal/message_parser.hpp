#ifndef CLAUDE_CODE_INTERNAL_MESSAGE_PARSER_HPP
#define CLAUDE_CODE_INTERNAL_MESSAGE_PARSER_HPP

#include <claude_code/types.hpp>
#include <string>

namespace claude_code
{
namespace protocol
{

// Longest prefix of an offending line quoted in decode errors
constexpr size_t MAX_ERROR_FRAGMENT = 200;

// Turns single lines of CLI output into typed messages.
// Every failure is reported as CLIJSONDecodeError.
class MessageParser
{
  public:
    // Parse one complete line
    static Message parse_message(const std::string& line);
    static Message parse_message(const char* line)
    {
        return parse_message(std::string(line));
    }

    // Build a message from an already-parsed JSON value
    static Message parse_message(const json& j);

    // Parse content block from JSON. Unrecognized block types become UnknownBlock.
    static ContentBlock parse_content_block(const json& j);

    // First MAX_ERROR_FRAGMENT characters of line, with "..." appended when cut
    static std::string error_fragment(const std::string& line);

  private:
    static Message build_message(const json& j);
    static ContentBlock build_content_block(const json& j);
    static std::vector<ContentBlock> parse_content_array(const json& content, const char* context);

    // Parse specific message types
    static UserMessage parse_user_message(const json& j);
    static AssistantMessage parse_assistant_message(const json& j);
    static SystemMessage parse_system_message(const json& j);
    static ResultMessage parse_result_message(const json& j);
};

} // namespace protocol
} // namespace claude_code

#endif // CLAUDE_CODE_INTERNAL_MESSAGE_PARSER_HPP
