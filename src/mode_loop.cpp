#include "mode_loop.hpp"

#include "log.hpp"

namespace gamemode {

ModeLoop::ModeLoop(GamepadSource& source, ButtonEdgeDetector& detector, ModeSwitch& modes,
                   const SessionGuard* guard)
    : source_(source), detector_(detector), modes_(modes), guard_(guard) {}

int ModeLoop::run_once(int timeout_ms) {
    std::vector<InputEvent> events = source_.poll(timeout_ms);
    int toggles = dispatch(events);
    // A pad that errored out mid-poll still had its events queued; drop its
    // state only after they were seen.
    for (int handle : source_.take_disconnected()) {
        detector_.forget(handle);
    }
    return toggles;
}

int ModeLoop::dispatch(const std::vector<InputEvent>& events) {
    if (events.empty()) return 0;

    if (guard_ && guard_->user_logged_in()) {
        if (!guarded_) log_info("loop") << "user session active, ignoring gamepads";
        guarded_ = true;
        detector_.reset();
        return 0;
    }
    if (guarded_) {
        log_info("loop") << "greeter idle again, listening";
        guarded_ = false;
    }

    int toggles = 0;
    for (const auto& ev : events) {
        if (!detector_.observe(ev)) continue;
        Mode before = modes_.current();
        Mode after = modes_.toggle();
        if (after != before) ++toggles;
    }
    return toggles;
}

void ModeLoop::run(const std::atomic<bool>& running, int timeout_ms) {
    log_info("loop") << "waiting for gamepad input";
    while (running) {
        run_once(timeout_ms);
    }
    log_info("loop") << "stopped";
}

}  // namespace gamemode
