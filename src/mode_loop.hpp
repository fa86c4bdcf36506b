#ifndef GAMEMODE_MODE_LOOP_HPP
#define GAMEMODE_MODE_LOOP_HPP

#include "button_edge.hpp"
#include "gamepad_source.hpp"
#include "mode_switch.hpp"
#include "session_guard.hpp"

#include <atomic>
#include <vector>

namespace gamemode {

// Poll, feed the detector, switch on each edge. Everything runs on the
// calling thread; a toggle (restart included) finishes before the next poll.
class ModeLoop {
public:
    ModeLoop(GamepadSource& source, ButtonEdgeDetector& detector, ModeSwitch& modes,
             const SessionGuard* guard = nullptr);

    // One cycle. Returns the number of mode changes it made.
    int run_once(int timeout_ms);
    void run(const std::atomic<bool>& running, int timeout_ms);

private:
    int dispatch(const std::vector<InputEvent>& events);

    GamepadSource& source_;
    ButtonEdgeDetector& detector_;
    ModeSwitch& modes_;
    const SessionGuard* guard_;
    bool guarded_ = false;
};

}  // namespace gamemode

#endif
