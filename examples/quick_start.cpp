#include <chrono>
#include <claude_code/claude_code.hpp>
#include <iostream>
#include <optional>
#include <vector>

constexpr bool TIMING = true;
constexpr bool VERBOSE = false;
constexpr bool DUMP_JSON = false; // Enable to see raw JSON responses

int main(int argc, char** argv)
{
    std::cout << "Claude Code SDK version: " << claude_code::version_string() << "\n\n";

    claude_code::ClaudeCodeOptions opts;
    opts.max_turns = 1;
    opts.stderr_callback = [](const std::string& line) { std::cerr << "[cli] " << line << "\n"; };

    std::vector<std::string> prompts = {"What is 2+2? Be very brief.", "Name a primary color."};
    if (argc > 1)
        prompts.assign(argv + 1, argv + argc);

    for (size_t i = 0; i < prompts.size(); ++i)
    {
        std::cout << "Query " << (i + 1) << ": " << prompts[i] << "\n";
        auto start = std::chrono::steady_clock::now();

        int message_count = 0;
        std::string response;
        std::optional<double> cost;

        try
        {
            auto stream = claude_code::query(prompts[i], opts);

            while (true)
            {
                std::optional<claude_code::Message> msg;
                try
                {
                    msg = stream.next();
                }
                catch (const claude_code::CLIJSONDecodeError& e)
                {
                    // One bad line; the stream carries on with the next one
                    std::cerr << "Skipping line: " << e.what() << "\n";
                    continue;
                }
                if (!msg)
                    break;

                message_count++;

                if (claude_code::is_assistant_message(*msg))
                {
                    const auto& assistant = std::get<claude_code::AssistantMessage>(*msg);
                    response += claude_code::get_text_content(assistant.content);
                    if (DUMP_JSON)
                        std::cout << claude_code::dump_raw_json(assistant) << "\n";
                }
                else if (claude_code::is_result_message(*msg))
                {
                    const auto& result = std::get<claude_code::ResultMessage>(*msg);
                    cost = result.total_cost_usd;
                    if (DUMP_JSON)
                        std::cout << claude_code::dump_raw_json(result) << "\n";
                }
                else if (VERBOSE && claude_code::is_system_message(*msg))
                {
                    const auto& system = std::get<claude_code::SystemMessage>(*msg);
                    std::cout << "  System: " << system.subtype << "\n";
                }
            }
        }
        catch (const claude_code::CLINotFoundError& e)
        {
            std::cerr << "Error: Claude CLI not found - " << e.what() << "\n";
            return 1;
        }
        catch (const claude_code::ProcessError& e)
        {
            std::cerr << "Error: CLI exited with code " << e.exit_code() << "\n"
                      << e.stderr_output() << "\n";
            return 1;
        }
        catch (const claude_code::ClaudeCodeError& e)
        {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        std::cout << "Response: " << response << "\n";
        if (cost)
            std::cout << "Cost: $" << *cost << "\n";
        if (TIMING)
            std::cout << "Time: " << duration.count() << " ms (" << message_count << " messages)\n";
        std::cout << "\n";
    }

    return 0;
}
