#ifndef GAMEMODE_INPUT_EVENT_HPP
#define GAMEMODE_INPUT_EVENT_HPP

#include <cstdint>

namespace gamemode {

// Raw evdev triple tagged with the monitor's handle for the device.
struct InputEvent {
    int handle;
    uint16_t type;
    uint16_t code;
    int32_t value;
};

}  // namespace gamemode

#endif
