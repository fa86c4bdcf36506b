#ifndef GAMEMODE_MODE_HPP
#define GAMEMODE_MODE_HPP

#include <string>

namespace gamemode {

enum class Mode { DESKTOP, GAME };

inline std::string mode_name(Mode m) {
    switch (m) {
        case Mode::GAME:
            return "game";
        default:
            return "desktop";
    }
}

inline Mode other_mode(Mode m) { return m == Mode::GAME ? Mode::DESKTOP : Mode::GAME; }

}  // namespace gamemode

#endif
