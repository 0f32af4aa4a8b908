#ifndef DAZIBAO_PLATFORM_COMMAND_EXECUTOR_HPP
#define DAZIBAO_PLATFORM_COMMAND_EXECUTOR_HPP

#include <string>

namespace dazibao {
namespace shell {
std::string build_shell_command(const std::string& command);
std::string trim_output(const std::string& text);
std::string describe_wait_status(int status);
}

struct ExecutionResult {
    bool success = false;
    std::string output;
    std::string error;
};

// "Error: <cause>" for failures, the trimmed output otherwise.
std::string format_output(const ExecutionResult& result);

class CommandExecutor {
public:
    // Variable references ("%name") are resolved in-process; everything else
    // runs under bash with stdout and stderr combined.
    ExecutionResult execute(const std::string& command) const;

private:
    ExecutionResult run_shell(const std::string& command) const;
};
}  // namespace dazibao

#endif
