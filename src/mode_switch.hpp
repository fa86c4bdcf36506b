#ifndef GAMEMODE_MODE_SWITCH_HPP
#define GAMEMODE_MODE_SWITCH_HPP

#include "mode.hpp"
#include "paths.hpp"
#include "service_restarter.hpp"

#include <filesystem>

namespace gamemode {

// GAME if the active pointer resolves to the game config, DESKTOP otherwise
// (including a missing pointer or a plain file).
Mode detect_active_mode(const Paths& paths);

// Replaces `link` with a symlink to the absolute form of `target` via
// symlink + rename, so readers see either the old or the new target and never
// a missing file.
bool repoint_symlink(const std::filesystem::path& link, const std::filesystem::path& target);

// Owns the current mode. The on-disk pointer and current() agree after every
// call: a failed write leaves the previous mode in place.
class ModeSwitch {
public:
    ModeSwitch(Paths paths, ServiceRestarter& restarter);

    Mode current() const { return mode_; }

    // Flips the mode, repoints the config and restarts the login service.
    // A failed restart keeps the new mode; a failed write keeps the old one.
    Mode toggle();

    // Sets the mode without restarting anything. No write if already there.
    bool force(Mode m);

    const Paths& paths() const { return paths_; }

private:
    bool points_at(Mode m) const;

    Paths paths_;
    ServiceRestarter& restarter_;
    Mode mode_;
};

}  // namespace gamemode

#endif
