#ifndef GAMEMODE_GAMEPAD_SOURCE_HPP
#define GAMEMODE_GAMEPAD_SOURCE_HPP

#include "input_event.hpp"

#include <vector>

namespace gamemode {

// Where the loop gets its events from. DeviceMonitor reads real evdev nodes;
// tests script the sequence.
class GamepadSource {
public:
    virtual ~GamepadSource() = default;
    // Waits at most timeout_ms. An empty result is not an error.
    virtual std::vector<InputEvent> poll(int timeout_ms) = 0;
    // Handles detached since the previous call.
    virtual std::vector<int> take_disconnected() = 0;
};

}  // namespace gamemode

#endif
