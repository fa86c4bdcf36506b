#include "service_restarter.hpp"
#include "command_runner.hpp"
#include "test_support.hpp"

#include <sys/wait.h>

#include <cassert>
#include <string>
#include <vector>

using gamemode::RestartSettings;
using gamemode::ServiceRestarter;
using gamemode_test::FakeCommandRunner;

using Argv = std::vector<std::string>;

int main() {
    {
        FakeCommandRunner runner;
        ServiceRestarter r(runner, RestartSettings{});
        assert(r.restart_login_service());
        assert(runner.calls.size() == 1);
        assert(runner.calls[0] == (Argv{"sudo", "-n", "systemctl", "restart", "greetd"}));
    }

    {
        FakeCommandRunner runner;
        RestartSettings s;
        s.use_sudo = false;
        s.service_name = "lightdm";
        ServiceRestarter r(runner, s);
        assert(r.restart_command() == (Argv{"systemctl", "restart", "lightdm"}));
        assert(r.restart_login_service());
        assert(runner.calls.size() == 1);
    }

    {
        // chvt follows a successful restart when enabled.
        FakeCommandRunner runner;
        RestartSettings s;
        s.switch_vt = true;
        s.vt = 2;
        ServiceRestarter r(runner, s);
        assert(r.restart_login_service());
        assert(runner.calls.size() == 2);
        assert(runner.calls[1] == (Argv{"sudo", "-n", "chvt", "2"}));
    }

    {
        // Failed restart: reported, no chvt attempted.
        FakeCommandRunner runner;
        runner.succeed = false;
        RestartSettings s;
        s.switch_vt = true;
        ServiceRestarter r(runner, s);
        assert(!r.restart_login_service());
        assert(runner.calls.size() == 1);
    }

    {
        // chvt disabled by vt 0.
        FakeCommandRunner runner;
        RestartSettings s;
        s.switch_vt = true;
        s.vt = 0;
        ServiceRestarter r(runner, s);
        assert(r.switch_console());
        assert(runner.calls.empty());
    }

    {
        gamemode::SystemCommandRunner sys;
        assert(sys.run({"true"}, "true"));
        assert(!sys.run({"false"}, "false"));
        assert(!sys.run({"/nonexistent/game-mode-test-binary"}, "missing"));
        assert(!sys.run({}, "empty"));
        // Arguments reach the child byte for byte, spaces included.
        assert(sys.run({"sh", "-c", "test \"$1\" = \"a b\" && test \"$2\" = \"\"", "sh", "a b", ""}, "argv"));
        assert(!sys.run({"sh", "-c", "test \"$1\" = \"a b\"", "sh", "a", "b"}, "argv split"));
    }

    {
        assert(gamemode::check_exit_status(0, "ok"));
        assert(!gamemode::check_exit_status(1 << 8, "exit 1"));
    }

    return 0;
}
