#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>

// Runs external tool command lines. Every instance-affecting call in the
// engine goes through execute(); callers must inspect the result.
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    // Returns trimmed stdout, or "ok" when stdout is empty. Non-zero exit
    // and timeout fail with ErrorKind::Execution.
    virtual Result<std::string> execute(const std::string& command_line,
                                        int timeout_secs) = 0;

    Result<std::string> execute(const std::string& command_line) {
        return execute(command_line, default_timeout());
    }

    virtual int default_timeout() const { return DEFAULT_COMMAND_TIMEOUT_SECS; }
};

// Spawns real child processes. The leading "lxc" word of a command line is
// replaced with the resolved tool path.
class ProcessCommandExecutor : public CommandExecutor {
public:
    ProcessCommandExecutor(std::filesystem::path tool_path, int default_timeout_secs);

    // Resolve the configured tool (explicit path or name on PATH).
    static Result<std::filesystem::path> resolve_tool(const std::string& tool);

    using CommandExecutor::execute;
    Result<std::string> execute(const std::string& command_line,
                                int timeout_secs) override;

    int default_timeout() const override { return default_timeout_; }
    const std::filesystem::path& tool_path() const { return tool_path_; }

private:
    std::filesystem::path tool_path_;
    int default_timeout_;
};
