#ifndef CLAUDE_CODE_INTERNAL_TRANSPORT_SUBPROCESS_ENV_HPP
#define CLAUDE_CODE_INTERNAL_TRANSPORT_SUBPROCESS_ENV_HPP

#include "../subprocess/process.hpp"

#include <claude_code/types.hpp>
#include <claude_code/version.hpp>

namespace claude_code::internal
{

constexpr const char* SDK_ENTRYPOINT = "sdk-cpp";

// Caller-supplied variables first, SDK identification last so it always wins
inline void apply_sdk_environment(subprocess::ProcessOptions& proc_opts,
                                  const ClaudeCodeOptions& options)
{
    for (const auto& [key, value] : options.environment)
        proc_opts.environment[key] = value;

    if (options.api_key)
        proc_opts.environment["ANTHROPIC_API_KEY"] = *options.api_key;

    proc_opts.environment["CLAUDE_CODE_ENTRYPOINT"] = SDK_ENTRYPOINT;
    proc_opts.environment["CLAUDE_CODE_SDK_VERSION"] = version_string();
}

} // namespace claude_code::internal

#endif // CLAUDE_CODE_INTERNAL_TRANSPORT_SUBPROCESS_ENV_HPP
