#ifndef CLAUDE_CODE_HPP
#define CLAUDE_CODE_HPP

// Main header that includes everything

#include <claude_code/errors.hpp>
#include <claude_code/query.hpp>
#include <claude_code/transport.hpp>
#include <claude_code/types.hpp>
#include <claude_code/version.hpp>

#endif // CLAUDE_CODE_HPP
