#include "cli_verification.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <openssl/evp.h>

namespace claude_code
{
namespace internal
{

namespace
{
struct DigestContextDeleter
{
    void operator()(EVP_MD_CTX* ctx) const
    {
        EVP_MD_CTX_free(ctx);
    }
};

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
} // namespace

std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        return std::nullopt;

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0)
    {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1)
            return std::nullopt;
    }
    if (file.bad())
        return std::nullopt;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1)
        return std::nullopt;

    static const char* hex_digits = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i)
    {
        hex.push_back(hex_digits[digest[i] >> 4]);
        hex.push_back(hex_digits[digest[i] & 0x0f]);
    }
    return hex;
}

bool verify_cli_path_allowed(const std::string& cli_path,
                             const std::vector<std::string>& allowed_paths)
{
    if (allowed_paths.empty())
        return true;

    namespace fs = std::filesystem;
    auto normalize = [](const std::string& path)
    {
        std::error_code ec;
        fs::path canonical = fs::canonical(path, ec);
        return ec ? fs::path(path).lexically_normal() : canonical;
    };

    fs::path normalized_cli = normalize(cli_path);
    return std::any_of(allowed_paths.begin(), allowed_paths.end(),
                       [&](const std::string& allowed)
                       { return normalize(allowed) == normalized_cli; });
}

bool verify_cli_hash(const std::filesystem::path& cli_path,
                     const std::optional<std::string>& expected_hash, std::string& error_message)
{
    if (!expected_hash)
        return true;

    if (expected_hash->length() != 64 ||
        !std::all_of(expected_hash->begin(), expected_hash->end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; }))
    {
        error_message = "Invalid hash format: expected 64-character hex string";
        return false;
    }

    auto actual_hash = compute_file_sha256(cli_path);
    if (!actual_hash)
    {
        error_message = "Failed to compute hash of " + cli_path.string();
        return false;
    }

    std::string expected = to_lower(*expected_hash);
    if (expected != *actual_hash)
    {
        error_message = "CLI hash mismatch: expected " + expected + " but got " + *actual_hash;
        return false;
    }

    return true;
}

} // namespace internal
} // namespace claude_code
