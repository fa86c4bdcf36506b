#include "service_restarter.hpp"

#include "log.hpp"

#include <utility>

namespace gamemode {

ServiceRestarter::ServiceRestarter(CommandRunner& runner, RestartSettings settings)
    : runner_(runner), settings_(std::move(settings)) {}

std::vector<std::string> ServiceRestarter::privileged(std::vector<std::string> argv) const {
    if (!settings_.use_sudo) return argv;
    std::vector<std::string> out = {"sudo", "-n"};
    out.insert(out.end(), argv.begin(), argv.end());
    return out;
}

std::vector<std::string> ServiceRestarter::restart_command() const {
    return privileged({"systemctl", "restart", settings_.service_name});
}

std::vector<std::string> ServiceRestarter::chvt_command() const {
    return privileged({"chvt", std::to_string(settings_.vt)});
}

bool ServiceRestarter::restart_login_service() {
    log_info("restart") << "restarting " << settings_.service_name;
    if (!runner_.run(restart_command(), "systemctl restart")) {
        log_error("restart") << "restart of " << settings_.service_name
                             << " failed; new config applies on next start";
        return false;
    }
    if (!switch_console()) {
        log_error("restart") << "console switch to vt " << settings_.vt << " failed";
    }
    return true;
}

bool ServiceRestarter::switch_console() {
    if (!settings_.switch_vt || settings_.vt <= 0) return true;
    return runner_.run(chvt_command(), "chvt");
}

}  // namespace gamemode
