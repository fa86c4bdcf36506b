#include "button_edge.hpp"

#include "log.hpp"

#include <linux/input.h>

namespace gamemode {

ButtonEdgeDetector::ButtonEdgeDetector(int extra_mode_code) : extra_mode_code_(extra_mode_code) {}

Button ButtonEdgeDetector::canonical_button(uint16_t code) const {
    // KEY_HOMEPAGE is what Xbox pads send for the guide button over Bluetooth.
    if (code == BTN_MODE || code == KEY_HOMEPAGE) return Button::MODE;
    if (extra_mode_code_ >= 0 && code == extra_mode_code_) return Button::MODE;
    return Button::OTHER;
}

bool ButtonEdgeDetector::observe(int handle, uint16_t type, uint16_t code, int32_t value) {
    if (type != EV_KEY || canonical_button(code) != Button::MODE) return false;

    bool& down = pressed_[handle];
    if (value == 1) {
        if (!down) log_info("button") << "mode pressed on pad " << handle;
        down = true;
        return false;
    }
    if (value == 0) {
        bool fire = down;
        down = false;
        if (fire) log_info("button") << "mode released on pad " << handle;
        return fire;
    }
    return false;
}

void ButtonEdgeDetector::forget(int handle) { pressed_.erase(handle); }

bool ButtonEdgeDetector::is_pressed(int handle) const {
    auto it = pressed_.find(handle);
    return it != pressed_.end() && it->second;
}

}  // namespace gamemode
