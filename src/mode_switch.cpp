#include "mode_switch.hpp"

#include "log.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <string>
#include <system_error>
#include <utility>

namespace gamemode {

namespace fs = std::filesystem;

namespace {
bool same_target(const fs::path& link, const fs::path& target) {
    std::error_code ec;
    if (!fs::is_symlink(fs::symlink_status(link, ec))) return false;
    fs::path current = fs::read_symlink(link, ec);
    if (ec) return false;
    // Resolve the way the kernel does: relative link text is taken from the
    // link's own directory, not from our working directory.
    if (current.is_relative()) current = link.parent_path() / current;
    return fs::equivalent(current, target, ec) && !ec;
}
}  // namespace

Mode detect_active_mode(const Paths& paths) {
    return same_target(paths.config_path(), paths.game_config_path()) ? Mode::GAME : Mode::DESKTOP;
}

bool repoint_symlink(const fs::path& link, const fs::path& target_in) {
    std::error_code ec;
    fs::path target = fs::absolute(target_in, ec);
    if (ec) {
        log_error("switch") << "cannot resolve " << target_in.string() << ": " << ec.message();
        return false;
    }
    if (!fs::exists(target, ec)) {
        log_error("switch") << "target missing: " << target.string();
        return false;
    }

    fs::path tmp = link;
    tmp += ".tmp-" + std::to_string(getpid());
    fs::remove(tmp, ec);

    if (symlink(target.c_str(), tmp.c_str()) != 0) {
        log_error("switch") << "symlink " << tmp.string() << ": " << errno_text(errno);
        return false;
    }
    if (std::rename(tmp.c_str(), link.c_str()) != 0) {
        log_error("switch") << "rename " << tmp.string() << " -> " << link.string() << ": " << errno_text(errno);
        fs::remove(tmp, ec);
        return false;
    }
    log_debug("switch") << link.string() << " -> " << target.string();
    return true;
}

ModeSwitch::ModeSwitch(Paths paths, ServiceRestarter& restarter)
    : paths_(std::move(paths)), restarter_(restarter), mode_(detect_active_mode(paths_)) {}

bool ModeSwitch::points_at(Mode m) const { return same_target(paths_.config_path(), paths_.target_for(m)); }

Mode ModeSwitch::toggle() {
    Mode previous = mode_;
    Mode next = other_mode(previous);
    if (!repoint_symlink(paths_.config_path(), paths_.target_for(next))) {
        log_error("switch") << "staying in " << mode_name(previous) << " mode";
        return mode_;
    }
    mode_ = next;
    log_info("switch") << mode_name(previous) << " -> " << mode_name(next);
    if (!restarter_.restart_login_service()) {
        log_info("switch") << "keeping " << mode_name(next) << " config on disk";
    }
    return mode_;
}

bool ModeSwitch::force(Mode m) {
    if (points_at(m)) {
        mode_ = m;
        log_debug("switch") << "already in " << mode_name(m) << " mode";
        return true;
    }
    if (!repoint_symlink(paths_.config_path(), paths_.target_for(m))) {
        return false;
    }
    mode_ = m;
    log_info("switch") << "forced " << mode_name(m) << " mode";
    return true;
}

}  // namespace gamemode
