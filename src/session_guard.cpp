#include "session_guard.hpp"

#include "log.hpp"

#include <utmpx.h>

#include <cstring>
#include <utility>

namespace gamemode {

UtmpSessionGuard::UtmpSessionGuard(int vt, std::string greeter_user)
    : tty_("tty" + std::to_string(vt)), greeter_user_(std::move(greeter_user)) {}

bool UtmpSessionGuard::user_logged_in() const {
    bool found = false;
    setutxent();
    while (utmpx* ent = getutxent()) {
        if (ent->ut_type != USER_PROCESS) continue;
        std::string line(ent->ut_line, strnlen(ent->ut_line, sizeof(ent->ut_line)));
        if (line != tty_) continue;
        std::string user(ent->ut_user, strnlen(ent->ut_user, sizeof(ent->ut_user)));
        if (user == greeter_user_) continue;
        log_debug("session") << user << " logged in on " << tty_;
        found = true;
        break;
    }
    endutxent();
    return found;
}

}  // namespace gamemode
