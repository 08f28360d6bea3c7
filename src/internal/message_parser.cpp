#include "message_parser.hpp"

#include <claude_code/errors.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace claude_code
{
namespace protocol
{

namespace
{

// Structural problem inside an otherwise valid JSON value. Converted to
// CLIJSONDecodeError at the public boundary, where the source line is known.
class FieldError : public std::runtime_error
{
  public:
    explicit FieldError(const std::string& message) : std::runtime_error(message) {}
};

// Absent and explicit null are treated the same
const json* find_field(const json& j, const char* field)
{
    auto it = j.find(field);
    if (it == j.end() || it->is_null())
        return nullptr;
    return &*it;
}

[[noreturn]] void wrong_type(const char* context, const char* field, const char* expected)
{
    throw FieldError(std::string(context) + " field '" + field + "' must be " + expected);
}

std::string required_string(const json& j, const char* field, const char* context)
{
    const json* value = find_field(j, field);
    if (!value)
        throw FieldError(std::string(context) + " missing required field '" + field + "'");
    if (!value->is_string())
        wrong_type(context, field, "a string");
    return value->get<std::string>();
}

std::optional<std::string> optional_string(const json& j, const char* field, const char* context)
{
    const json* value = find_field(j, field);
    if (!value)
        return std::nullopt;
    if (!value->is_string())
        wrong_type(context, field, "a string");
    return value->get<std::string>();
}

std::optional<int> optional_int(const json& j, const char* field, const char* context)
{
    const json* value = find_field(j, field);
    if (!value)
        return std::nullopt;
    if (!value->is_number_integer())
        wrong_type(context, field, "an integer");
    bool in_range = value->is_number_unsigned()
                        ? value->get<std::uint64_t>() <=
                              static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                        : value->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                              value->get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range)
        wrong_type(context, field, "an integer in the range of int");
    return value->get<int>();
}

std::optional<double> optional_number(const json& j, const char* field, const char* context)
{
    const json* value = find_field(j, field);
    if (!value)
        return std::nullopt;
    if (!value->is_number())
        wrong_type(context, field, "a number");
    return value->get<double>();
}

std::optional<bool> optional_bool(const json& j, const char* field, const char* context)
{
    const json* value = find_field(j, field);
    if (!value)
        return std::nullopt;
    if (!value->is_boolean())
        wrong_type(context, field, "a boolean");
    return value->get<bool>();
}

// The CLI wraps the API message in a "message" field; older output is flat
const json& message_body(const json& j)
{
    const json* message = find_field(j, "message");
    if (message && message->is_object())
        return *message;
    return j;
}

} // namespace

std::string MessageParser::error_fragment(const std::string& line)
{
    if (line.size() <= MAX_ERROR_FRAGMENT)
        return line;
    return line.substr(0, MAX_ERROR_FRAGMENT) + "...";
}

Message MessageParser::parse_message(const std::string& line)
{
    json j;
    try
    {
        j = json::parse(line);
    }
    catch (const json::parse_error& e)
    {
        std::string fragment = error_fragment(line);
        throw CLIJSONDecodeError("invalid JSON (" + std::string(e.what()) + "): " + fragment,
                                 fragment);
    }

    try
    {
        return build_message(j);
    }
    catch (const FieldError& e)
    {
        throw CLIJSONDecodeError(e.what(), error_fragment(line));
    }
    catch (const json::exception& e)
    {
        throw CLIJSONDecodeError(e.what(), error_fragment(line));
    }
}

Message MessageParser::parse_message(const json& j)
{
    try
    {
        return build_message(j);
    }
    catch (const FieldError& e)
    {
        throw CLIJSONDecodeError(e.what());
    }
    catch (const json::exception& e)
    {
        throw CLIJSONDecodeError(e.what());
    }
}

ContentBlock MessageParser::parse_content_block(const json& j)
{
    try
    {
        return build_content_block(j);
    }
    catch (const FieldError& e)
    {
        throw CLIJSONDecodeError(e.what());
    }
}

Message MessageParser::build_message(const json& j)
{
    if (!j.is_object())
        throw FieldError("message must be a JSON object");

    const json* type_field = find_field(j, "type");
    if (!type_field || !type_field->is_string())
        throw FieldError("message missing 'type' discriminator");

    std::string type = type_field->get<std::string>();

    if (type == "assistant")
        return parse_assistant_message(j);
    if (type == "user")
        return parse_user_message(j);
    if (type == "system")
        return parse_system_message(j);
    if (type == "result")
        return parse_result_message(j);

    // No safe default exists for an unknown top-level message
    throw FieldError("unknown message type: " + type);
}

ContentBlock MessageParser::build_content_block(const json& j)
{
    if (!j.is_object())
        throw FieldError("content block must be a JSON object");

    std::string type = required_string(j, "type", "content block");

    if (type == "text")
    {
        TextBlock block;
        block.text = required_string(j, "text", "text block");
        return block;
    }
    else if (type == "thinking")
    {
        ThinkingBlock block;
        block.thinking = required_string(j, "thinking", "thinking block");
        block.signature = optional_string(j, "signature", "thinking block").value_or("");
        return block;
    }
    else if (type == "tool_use")
    {
        ToolUseBlock block;
        block.id = required_string(j, "id", "tool_use block");
        block.name = required_string(j, "name", "tool_use block");
        if (!j.contains("input"))
            throw FieldError("tool_use block missing required field 'input'");
        block.input = j.at("input");
        return block;
    }
    else if (type == "tool_result")
    {
        ToolResultBlock block;
        block.tool_use_id = required_string(j, "tool_use_id", "tool_result block");
        // Content can be: string, array of content blocks, or null
        if (const json* content = find_field(j, "content"))
            block.content = *content;
        block.is_error = optional_bool(j, "is_error", "tool_result block").value_or(false);
        return block;
    }

    // Newer CLI block kind: keep it instead of failing the whole message
    UnknownBlock block;
    block.type = type;
    block.raw = j;
    return block;
}

std::vector<ContentBlock> MessageParser::parse_content_array(const json& content,
                                                             const char* context)
{
    std::vector<ContentBlock> blocks;
    blocks.reserve(content.size());
    for (const auto& entry : content)
    {
        try
        {
            blocks.push_back(build_content_block(entry));
        }
        catch (const FieldError& e)
        {
            throw FieldError(std::string(context) + " content[" + std::to_string(blocks.size()) +
                             "]: " + e.what());
        }
    }
    return blocks;
}

UserMessage MessageParser::parse_user_message(const json& j)
{
    UserMessage msg;
    msg.raw_json = j;
    msg.parent_tool_use_id = optional_string(j, "parent_tool_use_id", "user message");

    const json& body = message_body(j);
    msg.role = optional_string(body, "role", "user message").value_or("user");

    const json* content = find_field(body, "content");
    if (!content)
        throw FieldError("user message missing required field 'content'");

    if (content->is_string())
    {
        TextBlock text;
        text.text = content->get<std::string>();
        msg.content.push_back(std::move(text));
    }
    else if (content->is_array())
    {
        msg.content = parse_content_array(*content, "user message");
    }
    else
    {
        wrong_type("user message", "content", "a string or an array");
    }

    return msg;
}

AssistantMessage MessageParser::parse_assistant_message(const json& j)
{
    AssistantMessage msg;
    msg.raw_json = j;
    msg.parent_tool_use_id = optional_string(j, "parent_tool_use_id", "assistant message");

    const json& body = message_body(j);
    msg.role = optional_string(body, "role", "assistant message").value_or("assistant");
    msg.model = optional_string(body, "model", "assistant message").value_or("");

    const json* content = find_field(body, "content");
    if (!content)
        throw FieldError("assistant message missing required field 'content'");
    if (!content->is_array())
        wrong_type("assistant message", "content", "an array");

    msg.content = parse_content_array(*content, "assistant message");
    return msg;
}

SystemMessage MessageParser::parse_system_message(const json& j)
{
    SystemMessage msg;
    msg.raw_json = j;
    msg.subtype = optional_string(j, "subtype", "system message").value_or("");

    msg.data = json::object();
    for (auto it = j.begin(); it != j.end(); ++it)
        if (it.key() != "type" && it.key() != "subtype")
            msg.data[it.key()] = it.value();

    return msg;
}

ResultMessage MessageParser::parse_result_message(const json& j)
{
    constexpr const char* context = "result message";

    ResultMessage msg;
    msg.raw_json = j;

    msg.subtype = optional_string(j, "subtype", context).value_or("");
    msg.exit_code = optional_int(j, "exit_code", context);
    msg.error = optional_string(j, "error", context);
    msg.result = optional_string(j, "result", context);
    if (!msg.result)
        msg.result = optional_string(j, "content", context);
    msg.session_id = optional_string(j, "session_id", context);
    msg.canceled = optional_bool(j, "canceled", context);

    // Cost is total_cost_usd on current CLIs, cost_usd on older ones
    msg.total_cost_usd = optional_number(j, "total_cost_usd", context);
    if (!msg.total_cost_usd)
        msg.total_cost_usd = optional_number(j, "cost_usd", context);

    if (const json* usage = find_field(j, "usage"))
    {
        if (!usage->is_object())
            wrong_type(context, "usage", "an object");

        constexpr const char* usage_context = "result usage";
        UsageInfo info;
        info.input_tokens = optional_int(*usage, "input_tokens", usage_context).value_or(0);
        info.output_tokens = optional_int(*usage, "output_tokens", usage_context).value_or(0);
        info.cache_creation_input_tokens =
            optional_int(*usage, "cache_creation_input_tokens", usage_context).value_or(0);
        info.cache_read_input_tokens =
            optional_int(*usage, "cache_read_input_tokens", usage_context).value_or(0);
        msg.usage = info;
    }
    else if (j.contains("tokens_input") || j.contains("tokens_output"))
    {
        UsageInfo info;
        info.input_tokens = optional_int(j, "tokens_input", context).value_or(0);
        info.output_tokens = optional_int(j, "tokens_output", context).value_or(0);
        msg.usage = info;
    }

    msg.duration_ms = optional_int(j, "duration_ms", context).value_or(0);
    msg.duration_api_ms = optional_int(j, "duration_api_ms", context).value_or(0);
    msg.num_turns = optional_int(j, "num_turns", context).value_or(0);

    if (auto is_error = optional_bool(j, "is_error", context))
        msg.is_error = *is_error;
    else
        msg.is_error = msg.subtype.rfind("error", 0) == 0;

    return msg;
}

} // namespace protocol
} // namespace claude_code
