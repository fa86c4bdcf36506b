#ifndef GAMEMODE_RECONCILE_HPP
#define GAMEMODE_RECONCILE_HPP

#include "mode_switch.hpp"

namespace gamemode {

// Run once before the poll loop: whatever the last run left behind, boot the
// greeter in desktop mode. Never restarts the service.
bool reconcile(ModeSwitch& ms);

}  // namespace gamemode

#endif
