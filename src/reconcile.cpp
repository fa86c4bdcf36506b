#include "reconcile.hpp"

#include "log.hpp"

namespace gamemode {

bool reconcile(ModeSwitch& ms) {
    Mode found = ms.current();
    if (!ms.force(Mode::DESKTOP)) {
        log_error("startup") << "cannot reset " << ms.paths().config_path().string() << " to desktop mode";
        return false;
    }
    if (found != Mode::DESKTOP) {
        log_info("startup") << "left over " << mode_name(found) << " mode reset to desktop";
    }
    return true;
}

}  // namespace gamemode
