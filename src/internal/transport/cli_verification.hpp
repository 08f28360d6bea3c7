#ifndef CLAUDE_CODE_INTERNAL_CLI_VERIFICATION_HPP
#define CLAUDE_CODE_INTERNAL_CLI_VERIFICATION_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace claude_code
{
namespace internal
{

/// Hex-encoded SHA-256 of a file (64 lowercase characters), std::nullopt if unreadable
std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path);

/// True if allowed_paths is empty or contains cli_path (compared after canonicalization)
bool verify_cli_path_allowed(const std::string& cli_path,
                             const std::vector<std::string>& allowed_paths);

/// True if no hash is expected or the file hashes to expected_hash (case-insensitive).
/// On failure error_message says why.
bool verify_cli_hash(const std::filesystem::path& cli_path,
                     const std::optional<std::string>& expected_hash, std::string& error_message);

} // namespace internal
} // namespace claude_code

#endif // CLAUDE_CODE_INTERNAL_CLI_VERIFICATION_HPP
