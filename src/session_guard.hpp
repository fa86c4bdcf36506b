#ifndef GAMEMODE_SESSION_GUARD_HPP
#define GAMEMODE_SESSION_GUARD_HPP

#include <string>

namespace gamemode {

constexpr const char* DEFAULT_GREETER_USER = "greeter";
constexpr int DEFAULT_VT = 1;

class SessionGuard {
public:
    virtual ~SessionGuard() = default;
    // True while somebody other than the greeter is logged in on the greeter's
    // terminal; gamepad input then belongs to their session.
    virtual bool user_logged_in() const = 0;
};

// Reads the utmp database.
class UtmpSessionGuard : public SessionGuard {
public:
    UtmpSessionGuard(int vt, std::string greeter_user);
    bool user_logged_in() const override;

    const std::string& tty() const { return tty_; }

private:
    std::string tty_;
    std::string greeter_user_;
};

}  // namespace gamemode

#endif
