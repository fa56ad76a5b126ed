#pragma once

#include <pyres/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace pyres {

class CancelToken;

struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

struct CommandOptions {
    std::string working_dir;
    int timeout_seconds = 60;
    // Added to (or overriding) the inherited environment
    std::map<std::string, std::string> env;
    const CancelToken* cancel = nullptr;
};

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure, timeout or cancellation.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& opts = {});

} // namespace pyres
