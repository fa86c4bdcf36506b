#ifndef GAMEMODE_BUTTON_EDGE_HPP
#define GAMEMODE_BUTTON_EDGE_HPP

#include "input_event.hpp"

#include <cstdint>
#include <map>

namespace gamemode {

enum class Button { MODE, OTHER };

// Fires once per press/release of the Mode button, on the release, per
// handle. Autorepeat (value 2) counts as still held.
class ButtonEdgeDetector {
public:
    ButtonEdgeDetector() = default;
    // Extra vendor code to treat as Mode, e.g. from --mode-button.
    explicit ButtonEdgeDetector(int extra_mode_code);

    Button canonical_button(uint16_t code) const;

    bool observe(int handle, uint16_t type, uint16_t code, int32_t value);
    bool observe(const InputEvent& ev) { return observe(ev.handle, ev.type, ev.code, ev.value); }

    void forget(int handle);
    void reset() { pressed_.clear(); }
    bool is_pressed(int handle) const;

private:
    int extra_mode_code_ = -1;
    std::map<int, bool> pressed_;
};

}  // namespace gamemode

#endif
