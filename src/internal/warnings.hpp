#ifndef CLAUDE_CODE_INTERNAL_WARNINGS_HPP
#define CLAUDE_CODE_INTERNAL_WARNINGS_HPP

#include <claude_code/types.hpp>
#include <exception>
#include <iostream>
#include <string>

namespace claude_code::internal
{

// Invoke the user's stderr callback; a throwing callback is reported, never propagated
inline bool invoke_stderr_callback(const ClaudeCodeOptions& options, const std::string& line)
{
    if (!options.stderr_callback.has_value())
        return false;

    try
    {
        (*options.stderr_callback)(line);
        return true;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Warning: stderr callback threw: " << e.what() << std::endl;
        return false;
    }
}

// SDK-side warnings go where the CLI's stderr goes: the callback if set, std::cerr otherwise
inline void report_warning(const ClaudeCodeOptions& options, const std::string& message)
{
    std::string warning = "Warning: " + message;
    if (!invoke_stderr_callback(options, warning))
        std::cerr << warning << std::endl;
}

} // namespace claude_code::internal

#endif // CLAUDE_CODE_INTERNAL_WARNINGS_HPP
