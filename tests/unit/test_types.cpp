#include "../../src/internal/message_parser.hpp"

#include <claude_code/errors.hpp>
#include <claude_code/types.hpp>
#include <gtest/gtest.h>

using namespace claude_code;
using claude_code::protocol::MessageParser;

TEST(TypesTest, BlockDefaults)
{
    EXPECT_EQ(TextBlock{}.type, "text");
    EXPECT_EQ(ThinkingBlock{}.type, "thinking");
    EXPECT_EQ(ToolUseBlock{}.type, "tool_use");
    EXPECT_EQ(ToolResultBlock{}.type, "tool_result");
    EXPECT_FALSE(ToolResultBlock{}.is_error);
}

TEST(TypesTest, MessageDiscriminators)
{
    Message user = UserMessage{};
    Message assistant = AssistantMessage{};
    Message system = SystemMessage{};
    Message result = ResultMessage{};

    EXPECT_TRUE(is_user_message(user));
    EXPECT_TRUE(is_assistant_message(assistant));
    EXPECT_TRUE(is_system_message(system));
    EXPECT_TRUE(is_result_message(result));
    EXPECT_FALSE(is_result_message(assistant));
    EXPECT_TRUE(std::get<SystemMessage>(system).data.is_object());
}

TEST(TypesTest, GetTextContentConcatenatesTextOnly)
{
    std::vector<ContentBlock> content;

    TextBlock first;
    first.text = "Hello, ";
    content.push_back(first);

    ToolUseBlock tool;
    tool.id = "t1";
    tool.name = "Bash";
    content.push_back(tool);

    TextBlock second;
    second.text = "world";
    content.push_back(second);

    EXPECT_EQ(get_text_content(content), "Hello, world");
    EXPECT_EQ(get_text_content({}), "");
}

TEST(TypesTest, PermissionModeStrings)
{
    EXPECT_EQ(to_string(PermissionMode::Default), "default");
    EXPECT_EQ(to_string(PermissionMode::AcceptEdits), "acceptEdits");
    EXPECT_EQ(to_string(PermissionMode::BypassPermissions), "bypassPermissions");

    EXPECT_EQ(permission_mode_from_string("acceptEdits"), PermissionMode::AcceptEdits);
    EXPECT_EQ(permission_mode_from_string("accept_edits"), PermissionMode::AcceptEdits);
    EXPECT_EQ(permission_mode_from_string("bypass_permissions"), PermissionMode::BypassPermissions);
    EXPECT_EQ(permission_mode_from_string("default"), PermissionMode::Default);
    EXPECT_THROW(permission_mode_from_string("yolo"), ClaudeCodeError);
}

TEST(TypesTest, OptionsDefaults)
{
    ClaudeCodeOptions opts;
    EXPECT_EQ(opts.permission_mode, PermissionMode::Default);
    EXPECT_EQ(opts.prompt_mode, PromptMode::Argument);
    EXPECT_EQ(opts.decode_error_policy, DecodeErrorPolicy::Surface);
    EXPECT_EQ(opts.max_line_size, DEFAULT_MAX_LINE_SIZE);
    EXPECT_EQ(opts.read_chunk_size, DEFAULT_READ_CHUNK_SIZE);
    EXPECT_FALSE(opts.max_turns.has_value());
    EXPECT_FALSE(opts.stderr_callback.has_value());
}

TEST(TypesTest, ContentBlockToJson)
{
    ThinkingBlock thinking;
    thinking.thinking = "hmm";
    EXPECT_EQ(to_json(thinking), (json{{"type", "thinking"}, {"thinking", "hmm"}}));

    ToolUseBlock tool;
    tool.id = "t1";
    tool.name = "Read";
    EXPECT_EQ(to_json(tool)["input"], json::object());

    ToolResultBlock result;
    result.tool_use_id = "t1";
    EXPECT_EQ(to_json(result), (json{{"type", "tool_result"}, {"tool_use_id", "t1"}}));

    UnknownBlock unknown;
    unknown.type = "image";
    unknown.raw = {{"type", "image"}, {"source", "abc"}};
    EXPECT_EQ(to_json(unknown), unknown.raw);
}

// Serializing a parsed message and parsing it again reproduces the same message
TEST(TypesTest, MessageJsonRoundTrip)
{
    const char* lines[] = {
        R"({"type":"assistant","message":{"role":"assistant","model":"m","content":[{"type":"text","text":"hi"},{"type":"thinking","thinking":"t","signature":"s"},{"type":"tool_use","id":"a","name":"Bash","input":{"command":"ls"}},{"type":"mystery","payload":[1]}]},"parent_tool_use_id":"p"})",
        R"({"type":"user","message":{"role":"user","content":[{"type":"tool_result","tool_use_id":"a","content":[{"type":"text","text":"out"}],"is_error":true}]}})",
        R"({"type":"system","subtype":"init","cwd":"/tmp","tools":["Read"]})",
        R"({"type":"result","subtype":"success","is_error":false,"result":"4","session_id":"s","total_cost_usd":0.25,"duration_ms":10,"duration_api_ms":5,"num_turns":2,"usage":{"input_tokens":1,"output_tokens":2,"cache_creation_input_tokens":3,"cache_read_input_tokens":4},"exit_code":0,"canceled":false})",
    };

    for (const char* line : lines)
    {
        Message parsed = MessageParser::parse_message(line);
        json encoded = to_json(parsed);
        Message reparsed = MessageParser::parse_message(encoded);

        EXPECT_EQ(parsed.index(), reparsed.index()) << line;
        EXPECT_EQ(to_json(reparsed), encoded) << line;
    }
}

TEST(TypesTest, ResultMessageToJsonKeepsOptionalFieldsOut)
{
    ResultMessage result;
    result.subtype = "success";

    json j = to_json(Message{result});
    EXPECT_EQ(j["type"], "result");
    EXPECT_EQ(j["is_error"], false);
    EXPECT_FALSE(j.contains("total_cost_usd"));
    EXPECT_FALSE(j.contains("usage"));
    EXPECT_FALSE(j.contains("exit_code"));
}

TEST(TypesTest, DumpRawJson)
{
    AssistantMessage empty;
    EXPECT_EQ(dump_raw_json(empty), "{}");

    Message msg = MessageParser::parse_message(R"({"type":"system","subtype":"init"})");
    const auto& system = std::get<SystemMessage>(msg);
    EXPECT_EQ(json::parse(dump_raw_json(system, -1)), system.raw_json);
}
