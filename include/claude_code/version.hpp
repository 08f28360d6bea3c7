#ifndef CLAUDE_CODE_VERSION_HPP
#define CLAUDE_CODE_VERSION_HPP

#include <string>

namespace claude_code
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace claude_code

#endif // CLAUDE_CODE_VERSION_HPP
