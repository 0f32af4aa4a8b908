#include "platform/command_executor.hpp"
#include "platform/variable_resolver.hpp"

#include <glibmm/init.h>

#include <cassert>
#include <string>

int main() {
    Glib::init();
    dazibao::CommandExecutor executor;

    {
        auto result = executor.execute("echo hi");
        assert(result.success);
        assert(result.output == "hi");
        assert(dazibao::format_output(result) == "hi");
    }

    {
        auto result = executor.execute("false");
        assert(!result.success);
        assert(result.error == "exit status 1");
        assert(dazibao::format_output(result).rfind("Error:", 0) == 0);
    }

    {
        auto result = executor.execute("echo partial; exit 3");
        assert(!result.success);
        assert(result.error == "exit status 3");
        assert(result.output.empty());
    }

    {
        auto result = executor.execute("echo out; echo err 1>&2");
        assert(result.success);
        assert(result.output == "out\nerr");
    }

    {
        auto result = executor.execute("printf '\\n  padded value \\n\\n'");
        assert(result.success);
        assert(result.output == "padded value");
    }

    {
        auto result = executor.execute("echo 'single quoted' \"double\" $((1 + 2))");
        assert(result.success);
        assert(result.output == "single quoted double 3");
    }

    {
        // stdin is /dev/null, so a reader finishes immediately.
        auto result = executor.execute("cat");
        assert(result.success);
        assert(result.output.empty());
    }

    {
        auto result = executor.execute("%date");
        assert(result.success);
        assert(result.output == dazibao::variables::resolve("%date"));
    }

    {
        auto result = executor.execute("%not_a_variable");
        assert(result.success);
        assert(result.output == "Unknown variable");
    }

    {
        assert(dazibao::shell::build_shell_command("echo hi").rfind("bash -c ", 0) == 0);
        assert(dazibao::shell::trim_output(" \t\n") == "");
        assert(dazibao::shell::trim_output("a b") == "a b");
        assert(dazibao::shell::describe_wait_status(0) == "exit status 0");
    }

    return 0;
}
