#include <claude_code/errors.hpp>
#include <claude_code/types.hpp>

namespace claude_code
{

std::string get_text_content(const std::vector<ContentBlock>& content)
{
    std::string result;

    for (const auto& block : content)
    {
        if (auto* text_block = std::get_if<TextBlock>(&block))
        {
            result += text_block->text;
        }
    }

    return result;
}

std::string to_string(PermissionMode mode)
{
    switch (mode)
    {
    case PermissionMode::AcceptEdits:
        return "acceptEdits";
    case PermissionMode::BypassPermissions:
        return "bypassPermissions";
    case PermissionMode::Default:
    default:
        return "default";
    }
}

PermissionMode permission_mode_from_string(const std::string& value)
{
    if (value == "default")
        return PermissionMode::Default;
    if (value == "acceptEdits" || value == "accept_edits")
        return PermissionMode::AcceptEdits;
    if (value == "bypassPermissions" || value == "bypass_permissions")
        return PermissionMode::BypassPermissions;
    throw ClaudeCodeError("Unknown permission mode: " + value);
}

json to_json(const ContentBlock& block)
{
    if (auto* text = std::get_if<TextBlock>(&block))
        return json{{"type", "text"}, {"text", text->text}};

    if (auto* thinking = std::get_if<ThinkingBlock>(&block))
    {
        json j = {{"type", "thinking"}, {"thinking", thinking->thinking}};
        if (!thinking->signature.empty())
            j["signature"] = thinking->signature;
        return j;
    }

    if (auto* tool_use = std::get_if<ToolUseBlock>(&block))
    {
        return json{{"type", "tool_use"},
                    {"id", tool_use->id},
                    {"name", tool_use->name},
                    {"input", tool_use->input.is_null() ? json::object() : tool_use->input}};
    }

    if (auto* tool_result = std::get_if<ToolResultBlock>(&block))
    {
        json j = {{"type", "tool_result"}, {"tool_use_id", tool_result->tool_use_id}};
        if (!tool_result->content.is_null())
            j["content"] = tool_result->content;
        if (tool_result->is_error)
            j["is_error"] = true;
        return j;
    }

    const auto& unknown = std::get<UnknownBlock>(block);
    if (unknown.raw.is_object())
        return unknown.raw;
    return json{{"type", unknown.type}};
}

namespace
{
json content_to_json(const std::vector<ContentBlock>& content)
{
    json blocks = json::array();
    for (const auto& block : content)
        blocks.push_back(to_json(block));
    return blocks;
}

json usage_to_json(const UsageInfo& usage)
{
    return json{{"input_tokens", usage.input_tokens},
                {"output_tokens", usage.output_tokens},
                {"cache_creation_input_tokens", usage.cache_creation_input_tokens},
                {"cache_read_input_tokens", usage.cache_read_input_tokens}};
}
} // namespace

json to_json(const Message& msg)
{
    if (auto* user = std::get_if<UserMessage>(&msg))
    {
        json j = {{"type", "user"},
                  {"message", {{"role", user->role}, {"content", content_to_json(user->content)}}}};
        if (user->parent_tool_use_id)
            j["parent_tool_use_id"] = *user->parent_tool_use_id;
        return j;
    }

    if (auto* assistant = std::get_if<AssistantMessage>(&msg))
    {
        json message = {{"role", assistant->role},
                        {"content", content_to_json(assistant->content)}};
        if (!assistant->model.empty())
            message["model"] = assistant->model;

        json j = {{"type", "assistant"}, {"message", message}};
        if (assistant->parent_tool_use_id)
            j["parent_tool_use_id"] = *assistant->parent_tool_use_id;
        return j;
    }

    if (auto* system = std::get_if<SystemMessage>(&msg))
    {
        json j = system->data.is_object() ? system->data : json::object();
        j["type"] = "system";
        if (!system->subtype.empty())
            j["subtype"] = system->subtype;
        return j;
    }

    const auto& result = std::get<ResultMessage>(msg);
    json j = {{"type", "result"},
              {"is_error", result.is_error},
              {"duration_ms", result.duration_ms},
              {"duration_api_ms", result.duration_api_ms},
              {"num_turns", result.num_turns}};
    if (!result.subtype.empty())
        j["subtype"] = result.subtype;
    if (result.exit_code)
        j["exit_code"] = *result.exit_code;
    if (result.error)
        j["error"] = *result.error;
    if (result.result)
        j["result"] = *result.result;
    if (result.session_id)
        j["session_id"] = *result.session_id;
    if (result.total_cost_usd)
        j["total_cost_usd"] = *result.total_cost_usd;
    if (result.usage)
        j["usage"] = usage_to_json(*result.usage);
    if (result.canceled)
        j["canceled"] = *result.canceled;
    return j;
}

} // namespace claude_code
