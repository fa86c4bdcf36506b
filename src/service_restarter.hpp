#ifndef GAMEMODE_SERVICE_RESTARTER_HPP
#define GAMEMODE_SERVICE_RESTARTER_HPP

#include "command_runner.hpp"

#include <string>
#include <vector>

namespace gamemode {

constexpr const char* DEFAULT_SERVICE_NAME = "greetd";

struct RestartSettings {
    std::string service_name = DEFAULT_SERVICE_NAME;
    // Prefix commands with "sudo -n"; the sudoers rule is installed out of band.
    bool use_sudo = true;
    bool switch_vt = false;
    int vt = 1;
};

class ServiceRestarter {
public:
    ServiceRestarter(CommandRunner& runner, RestartSettings settings);

    // systemctl restart <unit>; blocks until the command exits.
    bool restart_login_service();
    // chvt <vt>, only when enabled. Returns true when disabled.
    bool switch_console();

    std::vector<std::string> restart_command() const;
    std::vector<std::string> chvt_command() const;

private:
    std::vector<std::string> privileged(std::vector<std::string> argv) const;

    CommandRunner& runner_;
    RestartSettings settings_;
};

}  // namespace gamemode

#endif
