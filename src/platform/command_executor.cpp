#include "platform/command_executor.hpp"

#include "platform/variable_resolver.hpp"

#include <glibmm/shell.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>

namespace dazibao {
namespace {
bool run_capture(const std::string& cmd, std::string& output, int& status, int& spawn_errno) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        spawn_errno = errno;
        return false;
    }

    char buffer[4096];
    size_t count = 0;
    while ((count = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, count);
    }

    status = pclose(pipe);
    if (status == -1) {
        spawn_errno = errno;
        return false;
    }
    return true;
}
}  // namespace

std::string shell::build_shell_command(const std::string& command) {
    return "bash -c " + Glib::shell_quote(command) + " </dev/null 2>&1";
}

std::string shell::trim_output(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::string shell::describe_wait_status(int status) {
    if (WIFEXITED(status)) {
        return "exit status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return std::string("signal: ") + strsignal(WTERMSIG(status));
    }
    return "unexpected wait status " + std::to_string(status);
}

std::string format_output(const ExecutionResult& result) {
    if (result.success) {
        return result.output;
    }
    return "Error: " + result.error;
}

ExecutionResult CommandExecutor::execute(const std::string& command) const {
    if (variables::is_variable_reference(command)) {
        ExecutionResult result;
        result.success = true;
        result.output = variables::resolve(command);
        return result;
    }
    return run_shell(command);
}

ExecutionResult CommandExecutor::run_shell(const std::string& command) const {
    ExecutionResult result;
    std::string raw;
    int status = 0;
    int spawn_errno = 0;

    if (!run_capture(shell::build_shell_command(command), raw, status, spawn_errno)) {
        result.error = std::string("failed to start shell: ") + std::strerror(spawn_errno);
        return result;
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        result.error = shell::describe_wait_status(status);
        return result;
    }

    result.success = true;
    result.output = shell::trim_output(raw);
    return result;
}
}  // namespace dazibao
