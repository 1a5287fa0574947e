#include "command_executor.hpp"
#include "log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

ProcessCommandExecutor::ProcessCommandExecutor(std::filesystem::path tool_path,
                                               int default_timeout_secs)
    : tool_path_(std::move(tool_path)),
      default_timeout_(default_timeout_secs) {}

Result<std::filesystem::path> ProcessCommandExecutor::resolve_tool(const std::string& tool) {
    auto found = platform::find_executable(tool);
    if (!found) {
        return Result<std::filesystem::path>::Err(ErrorKind::Execution,
            fmt::format("management tool '{}' not found or not executable", tool));
    }
    return Result<std::filesystem::path>::Ok(*found);
}

Result<std::string> ProcessCommandExecutor::execute(const std::string& command_line,
                                                    int timeout_secs) {
    auto words = split_command_line(command_line);
    if (!words || words->empty()) {
        return Result<std::string>::Err(ErrorKind::Execution,
            fmt::format("cannot parse command line: {}", command_line));
    }

    std::string program = (*words)[0];
    if (program == TOOL_TOKEN) {
        program = tool_path_.string();
    }
    std::vector<std::string> args(words->begin() + 1, words->end());

    CommandOutput r = platform::run_captured(program, args, timeout_secs * 1000);
    warden_log_cmd("exec", command_line, r);

    if (r.timed_out) {
        return Result<std::string>::Err(ErrorKind::Execution,
            fmt::format("timed out after {}s", timeout_secs));
    }
    if (r.exit_code != 0) {
        std::string err = r.stderr_data;
        trim(err);
        if (err.empty()) {
            err = fmt::format("command failed with exit code {}", r.exit_code);
        }
        return Result<std::string>::Err(ErrorKind::Execution, err);
    }

    std::string out = r.stdout_data;
    trim(out);
    if (out.empty()) out = "ok";
    return Result<std::string>::Ok(out);
}
