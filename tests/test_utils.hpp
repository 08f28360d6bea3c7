#pragma once

#include "../src/internal/subprocess/process.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace claude_code::test
{

inline bool is_ci_environment()
{
    const char* ci_vars[] = {
        "CI",                 // Generic (GitHub Actions, GitLab CI, etc.)
        "GITHUB_ACTIONS",     // GitHub Actions
        "GITLAB_CI",          // GitLab CI
        "TRAVIS",             // Travis CI
        "CIRCLECI",           // CircleCI
        "JENKINS_URL",        // Jenkins
        "BUILDKITE",          // Buildkite
        "CODEBUILD_BUILD_ID", // AWS CodeBuild
    };

    for (const char* var : ci_vars)
    {
        const char* value = std::getenv(var);
        if (value != nullptr && value[0] != '\0')
            return true;
    }
    return false;
}

inline bool has_env_flag(const char* name)
{
    const char* value = std::getenv(name);
    return value != nullptr && value[0] != '\0' && std::string(value) != "0";
}

inline bool is_claude_cli_available()
{
    if (const char* cli_path = std::getenv("CLAUDE_CLI_PATH");
        cli_path != nullptr && cli_path[0] != '\0')
        return true;

    return claude_code::subprocess::find_executable("claude").has_value();
}

inline bool should_run_live_tests()
{
    if (is_ci_environment())
        return false;

    if (!has_env_flag("CLAUDE_CODE_SDK_RUN_LIVE_TESTS"))
        return false;

    return is_claude_cli_available();
}

// Scratch directory removed when the test ends
class TempDir
{
  public:
    TempDir()
    {
        std::string pattern =
            (std::filesystem::temp_directory_path() / "claude_code_test_XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr)
            throw std::runtime_error("mkdtemp failed for " + pattern);
        path_ = pattern;
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const
    {
        return path_;
    }

  private:
    std::filesystem::path path_;
};

// Write an executable /bin/sh script standing in for the CLI; returns its path
inline std::string write_fake_cli(const TempDir& dir, const std::string& body,
                                  const std::string& name = "claude")
{
    std::filesystem::path script = dir.path() / name;
    {
        std::ofstream out(script);
        out << "#!/bin/sh\n" << body;
        if (!body.empty() && body.back() != '\n')
            out << "\n";
    }
    ::chmod(script.c_str(), 0755);
    return script.string();
}

} // namespace claude_code::test

#define SKIP_IN_CI()                                                                               \
    do                                                                                             \
    {                                                                                              \
        if (!claude_code::test::should_run_live_tests())                                           \
        {                                                                                          \
            GTEST_SKIP() << "Skipped live CLI/API test (set "                                      \
                            "CLAUDE_CODE_SDK_RUN_LIVE_TESTS=1 and ensure `claude` "                \
                            "is in PATH or set CLAUDE_CLI_PATH)";                                  \
        }                                                                                          \
    } while (0)
