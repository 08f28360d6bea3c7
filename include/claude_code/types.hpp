#ifndef CLAUDE_CODE_TYPES_HPP
#define CLAUDE_CODE_TYPES_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace claude_code
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Content blocks
// ============================================================================

struct TextBlock
{
    std::string type = "text";
    std::string text;
};

struct ThinkingBlock
{
    std::string type = "thinking";
    std::string thinking;
    std::string signature; // Cryptographic signature for thinking block integrity
};

struct ToolUseBlock
{
    std::string type = "tool_use";
    std::string id;
    std::string name;
    json input;
};

struct ToolResultBlock
{
    std::string type = "tool_result";
    std::string tool_use_id;
    json content; // Can be string, array of content blocks, or null
    bool is_error = false;
};

// Block kind emitted by a newer CLI than this library knows about.
// Kept verbatim so callers can still inspect it.
struct UnknownBlock
{
    std::string type;
    json raw;
};

// Content block variant
using ContentBlock =
    std::variant<TextBlock, ThinkingBlock, ToolUseBlock, ToolResultBlock, UnknownBlock>;

// ============================================================================
// Messages
// ============================================================================

struct UserMessage
{
    std::string type = "user";
    std::string role = "user";
    std::vector<ContentBlock> content;
    std::optional<std::string> parent_tool_use_id;
    json raw_json; // Original JSON from CLI (optional, for debugging)
};

struct AssistantMessage
{
    std::string type = "assistant";
    std::string role = "assistant";
    std::vector<ContentBlock> content;
    std::string model; // Model used for this turn (empty if the CLI did not say)
    std::optional<std::string> parent_tool_use_id;
    json raw_json;
};

struct SystemMessage
{
    std::string type = "system";
    std::string subtype;
    json data = json::object(); // Every field except "type" and "subtype"
    json raw_json;
};

struct UsageInfo
{
    int input_tokens = 0;
    int output_tokens = 0;
    int cache_creation_input_tokens = 0;
    int cache_read_input_tokens = 0;
};

struct ResultMessage
{
    std::string type = "result";
    std::string subtype; // "success" | "error_*" (empty if absent)
    bool is_error = false;
    std::optional<int> exit_code;
    std::optional<std::string> error;
    std::optional<std::string> result; // Final text answer
    std::optional<std::string> session_id;
    std::optional<double> total_cost_usd;
    std::optional<UsageInfo> usage;
    int duration_ms = 0;
    int duration_api_ms = 0;
    int num_turns = 0;
    std::optional<bool> canceled;
    json raw_json;
};

// Main message variant
using Message = std::variant<UserMessage, AssistantMessage, SystemMessage, ResultMessage>;

// ============================================================================
// Configuration
// ============================================================================

enum class PermissionMode
{
    Default,          // CLI prompts for dangerous tools
    AcceptEdits,      // Auto-accept file edits
    BypassPermissions // Allow all tools
};

// How the prompt reaches the CLI
enum class PromptMode
{
    Argument, // --print -- <prompt>, stdin closed immediately
    Stdin     // --input-format stream-json, prompt written to stdin as a user message
};

// What the stream does with a line it cannot decode
enum class DecodeErrorPolicy
{
    Surface, // Report it as one item, keep streaming
    Skip,    // Log it and keep streaming
    Abort    // Report it as the terminal item and stop the process
};

/// Callback invoked when the CLI process writes to stderr.
/// @param line Single line of stderr output (without trailing newline)
using StderrCallback = std::function<void(const std::string& line)>;

// Default maximum size of a single output line (1MB)
constexpr std::size_t DEFAULT_MAX_LINE_SIZE = 1024 * 1024;

// Default number of bytes requested per stdout read
constexpr std::size_t DEFAULT_READ_CHUNK_SIZE = 4096;

// Configuration options. Copied when a query starts and never modified afterwards.
struct ClaudeCodeOptions
{
    std::optional<std::string> cwd;
    std::vector<std::string> allowed_tools;
    std::vector<std::string> disallowed_tools;
    PermissionMode permission_mode = PermissionMode::Default;
    std::optional<std::string> system_prompt;
    std::optional<std::string> append_system_prompt;
    std::optional<int> max_turns; // Unset means no cap
    std::optional<std::string> model;
    std::optional<std::string> api_key; // Exported to the CLI as ANTHROPIC_API_KEY
    std::map<std::string, std::string> environment;

    /// Arbitrary CLI flags to pass through
    /// Maps flag name -> value (or empty string for boolean flags)
    std::map<std::string, std::string> extra_args;

    PromptMode prompt_mode = PromptMode::Argument;

    // Optional explicit path to the CLI executable.
    // If empty, CLAUDE_CLI_PATH, PATH and ~/.claude/local are searched.
    std::string cli_path;
    // If non-empty, the resolved CLI must be one of these paths
    std::vector<std::string> allowed_cli_paths;
    // If set, the resolved CLI file must hash to this hex SHA-256
    std::optional<std::string> cli_hash_sha256;

    DecodeErrorPolicy decode_error_policy = DecodeErrorPolicy::Surface;

    /// Lines longer than this are truncated and reported as decode errors.
    std::size_t max_line_size = DEFAULT_MAX_LINE_SIZE;
    std::size_t read_chunk_size = DEFAULT_READ_CHUNK_SIZE;

    /// Callback invoked for every stderr line of the CLI. stderr is captured
    /// for ProcessError regardless of this setting.
    /// Note: Executes on the thread pulling messages.
    std::optional<StderrCallback> stderr_callback;
};

// ============================================================================
// Helpers
// ============================================================================

inline bool is_user_message(const Message& msg)
{
    return std::holds_alternative<UserMessage>(msg);
}

inline bool is_assistant_message(const Message& msg)
{
    return std::holds_alternative<AssistantMessage>(msg);
}

inline bool is_result_message(const Message& msg)
{
    return std::holds_alternative<ResultMessage>(msg);
}

inline bool is_system_message(const Message& msg)
{
    return std::holds_alternative<SystemMessage>(msg);
}

// Helper to get text from content blocks
std::string get_text_content(const std::vector<ContentBlock>& content);

// CLI spelling of a permission mode ("default", "acceptEdits", "bypassPermissions")
std::string to_string(PermissionMode mode);

// Accepts the CLI spelling and the snake_case spelling; throws ClaudeCodeError otherwise
PermissionMode permission_mode_from_string(const std::string& value);

// Encode to the JSON line form the CLI emits
json to_json(const ContentBlock& block);
json to_json(const Message& msg);

// Helper to dump raw JSON from messages (for debugging)
template <typename T>
std::string dump_raw_json(const T& msg, int indent = 2)
{
    if (msg.raw_json.empty())
        return "{}";
    return msg.raw_json.dump(indent);
}

} // namespace claude_code

#endif // CLAUDE_CODE_TYPES_HPP
