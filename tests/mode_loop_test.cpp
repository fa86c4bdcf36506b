#include "button_edge.hpp"
#include "mode_loop.hpp"
#include "mode_switch.hpp"
#include "reconcile.hpp"
#include "service_restarter.hpp"
#include "test_support.hpp"

#include <linux/input.h>

#include <cassert>
#include <string>
#include <vector>

using gamemode::ButtonEdgeDetector;
using gamemode::Mode;
using gamemode::ModeLoop;
using gamemode::ModeSwitch;
using gamemode::RestartSettings;
using gamemode::ServiceRestarter;
using gamemode_test::FakeCommandRunner;
using gamemode_test::FixedGuard;
using gamemode_test::GreetdTree;
using gamemode_test::ScriptedSource;

namespace {
int drain(ModeLoop& loop, ScriptedSource& src) {
    int toggles = 0;
    while (!src.batches.empty()) toggles += loop.run_once(0);
    return toggles;
}
}  // namespace

int main() {
    {
        // One press/release on pad A switches to game and restarts once.
        GreetdTree tree;
        FakeCommandRunner runner;
        ServiceRestarter restarter(runner, RestartSettings{});
        ModeSwitch ms(tree.paths, restarter);
        assert(gamemode::reconcile(ms));
        ButtonEdgeDetector detector;
        ScriptedSource src;
        ModeLoop loop(src, detector, ms);

        src.press(1);
        src.release(1);
        assert(drain(loop, src) == 1);
        assert(ms.current() == Mode::GAME);
        assert(tree.link_target() == tree.paths.game_config_path());
        assert(runner.calls.size() == 1);
        const std::vector<std::string> expected = {"sudo", "-n", "systemctl", "restart", "greetd"};
        assert(runner.calls[0] == expected);
    }

    {
        // Pads A and B in quick succession: two toggles, back to desktop.
        GreetdTree tree;
        FakeCommandRunner runner;
        ServiceRestarter restarter(runner, RestartSettings{});
        ModeSwitch ms(tree.paths, restarter);
        ButtonEdgeDetector detector;
        ScriptedSource src;
        ModeLoop loop(src, detector, ms);

        src.batches.push_back({{1, EV_KEY, BTN_MODE, 1}, {1, EV_KEY, BTN_MODE, 0},
                               {2, EV_KEY, BTN_MODE, 1}, {2, EV_KEY, BTN_MODE, 0}});
        assert(drain(loop, src) == 2);
        assert(ms.current() == Mode::DESKTOP);
        assert(tree.link_target() == tree.paths.desktop_config_path());
        assert(runner.calls.size() == 2);
    }

    {
        // Held across many poll ticks: one toggle.
        GreetdTree tree;
        FakeCommandRunner runner;
        ServiceRestarter restarter(runner, RestartSettings{});
        ModeSwitch ms(tree.paths, restarter);
        ButtonEdgeDetector detector;
        ScriptedSource src;
        ModeLoop loop(src, detector, ms);

        src.press(1);
        for (int i = 0; i < 10; ++i) {
            src.batches.push_back({});
            src.batches.push_back({{1, EV_KEY, BTN_MODE, 2}, {1, EV_ABS, ABS_X, 1200}});
        }
        src.release(1);
        assert(drain(loop, src) == 1);
        assert(ms.current() == Mode::GAME);
    }

    {
        // Pad unplugged mid-press: no toggle from its stale state.
        GreetdTree tree;
        FakeCommandRunner runner;
        ServiceRestarter restarter(runner, RestartSettings{});
        ModeSwitch ms(tree.paths, restarter);
        ButtonEdgeDetector detector;
        ScriptedSource src;
        ModeLoop loop(src, detector, ms);

        src.press(1);
        assert(loop.run_once(0) == 0);
        src.disconnected.push_back(1);
        assert(loop.run_once(0) == 0);
        assert(!detector.is_pressed(1));
        src.release(1);
        assert(drain(loop, src) == 0);
        assert(ms.current() == Mode::DESKTOP);
        assert(runner.calls.empty());
    }

    {
        // Press and read error in the same poll: the queued press must not
        // outlive the disconnect.
        GreetdTree tree;
        FakeCommandRunner runner;
        ServiceRestarter restarter(runner, RestartSettings{});
        ModeSwitch ms(tree.paths, restarter);
        ButtonEdgeDetector detector;
        ScriptedSource src;
        ModeLoop loop(src, detector, ms);

        src.press(1);
        src.disconnected.push_back(1);
        assert(loop.run_once(0) == 0);
        assert(!detector.is_pressed(1));
        src.release(1);
        assert(drain(loop, src) == 0);
        assert(ms.current() == Mode::DESKTOP);

        // A full press/release queued before the error still counts.
        src.batches.push_back({{2, EV_KEY, BTN_MODE, 1}, {2, EV_KEY, BTN_MODE, 0}});
        src.disconnected.push_back(2);
        assert(loop.run_once(0) == 1);
        assert(!detector.is_pressed(2));
        assert(ms.current() == Mode::GAME);
    }

    {
        // No devices at all: polls return nothing, nothing happens.
        GreetdTree tree;
        FakeCommandRunner runner;
        ServiceRestarter restarter(runner, RestartSettings{});
        ModeSwitch ms(tree.paths, restarter);
        ButtonEdgeDetector detector;
        ScriptedSource src;
        ModeLoop loop(src, detector, ms);
        for (int i = 0; i < 5; ++i) assert(loop.run_once(0) == 0);
        assert(ms.current() == Mode::DESKTOP);
    }

    {
        // Failed write: no mode change counted, state stays desktop.
        GreetdTree tree;
        std::filesystem::remove(tree.paths.game_config_path());
        FakeCommandRunner runner;
        ServiceRestarter restarter(runner, RestartSettings{});
        ModeSwitch ms(tree.paths, restarter);
        ButtonEdgeDetector detector;
        ScriptedSource src;
        ModeLoop loop(src, detector, ms);
        src.press(1);
        src.release(1);
        assert(drain(loop, src) == 0);
        assert(ms.current() == Mode::DESKTOP);
        assert(runner.calls.empty());
    }

    {
        // A logged-in user on the greeter tty owns the gamepads.
        GreetdTree tree;
        FakeCommandRunner runner;
        ServiceRestarter restarter(runner, RestartSettings{});
        ModeSwitch ms(tree.paths, restarter);
        ButtonEdgeDetector detector;
        ScriptedSource src;
        FixedGuard guard;
        guard.logged_in = true;
        ModeLoop loop(src, detector, ms, &guard);

        src.press(1);
        src.release(1);
        assert(drain(loop, src) == 0);
        assert(ms.current() == Mode::DESKTOP);

        // Press seen while guarded must not pair with a release seen after.
        src.press(1);
        assert(loop.run_once(0) == 0);
        guard.logged_in = false;
        src.release(1);
        assert(drain(loop, src) == 0);

        src.press(1);
        src.release(1);
        assert(drain(loop, src) == 1);
        assert(ms.current() == Mode::GAME);
    }

    return 0;
}
