#include "options.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>

namespace gamemode {

namespace {
bool parse_int_strict(const std::string& s, int& out) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-') ? 1 : 0;
    if (start == s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}
}  // namespace

std::string Options::log_path() const {
    if (!log_file.empty()) return log_file;
    return paths.default_log_path().string();
}

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n\n"
              << "Toggle greetd between desktop and game mode with the gamepad Mode button.\n\n"
              << "Options:\n"
              << "  --root <dir>             Prefix for all greetd paths (default /)\n"
              << "  --greetd-dir <dir>       greetd config directory (default /etc/greetd)\n"
              << "  --config <name>          Active config symlink (default config.toml)\n"
              << "  --desktop-config <name>  Desktop mode config (default config_default.toml)\n"
              << "  --game-config <name>     Game mode config (default game_mode_login.toml)\n"
              << "  --service <unit>         Unit to restart after a switch (default greetd)\n"
              << "  --no-sudo                Run systemctl/chvt without sudo -n\n"
              << "  --vt <N>                 Greeter virtual terminal, 0 disables the session check (default 1)\n"
              << "  --greeter-user <name>    Login ignored by the session check (default greeter)\n"
              << "  --chvt                   Switch console to --vt after a restart\n"
              << "  --mode-button <code>     Extra EV_KEY code to treat as the Mode button\n"
              << "  --input-dir <dir>        evdev device directory (default /dev/input)\n"
              << "  --poll-ms <N>            Poll wait in milliseconds (default 50)\n"
              << "  --log-file <path>        Log file (default <greetd-dir>/logs/game-mode.log)\n"
              << "  --list-devices           List connected gamepads and exit\n"
              << "\nSet GAME_MODE_LOG=debug to trace every input event.\n"
              << std::endl;
}

bool parse_options(int argc, char** argv, Options& out, std::string& error) {
    Options a;
    auto need_value = [&](int i, const std::string& flag) {
        if (i + 1 >= argc) {
            error = flag + " needs a value";
            return false;
        }
        return true;
    };
    auto int_value = [&](const std::string& flag, const char* text, int& dst) {
        if (!parse_int_strict(text, dst)) {
            error = "invalid number for " + flag + ": " + text;
            return false;
        }
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--root" || arg == "--greetd-dir" || arg == "--config" || arg == "--desktop-config" ||
            arg == "--game-config" || arg == "--service" || arg == "--greeter-user" || arg == "--input-dir" ||
            arg == "--log-file") {
            if (!need_value(i, arg)) return false;
            std::string v = argv[++i];
            if (arg == "--root") a.paths.root = v;
            else if (arg == "--greetd-dir") a.paths.greetd_dir = v;
            else if (arg == "--config") a.paths.config_file = v;
            else if (arg == "--desktop-config") a.paths.desktop_config = v;
            else if (arg == "--game-config") a.paths.game_config = v;
            else if (arg == "--service") a.restart.service_name = v;
            else if (arg == "--greeter-user") a.greeter_user = v;
            else if (arg == "--input-dir") a.input_dir = v;
            else a.log_file = v;
        } else if (arg == "--vt") {
            if (!need_value(i, arg) || !int_value(arg, argv[++i], a.restart.vt)) return false;
            if (a.restart.vt < 0) {
                error = "--vt must not be negative";
                return false;
            }
        } else if (arg == "--mode-button") {
            if (!need_value(i, arg) || !int_value(arg, argv[++i], a.mode_button)) return false;
        } else if (arg == "--poll-ms") {
            if (!need_value(i, arg) || !int_value(arg, argv[++i], a.poll_ms)) return false;
            if (a.poll_ms <= 0) {
                error = "--poll-ms must be positive";
                return false;
            }
        } else if (arg == "--no-sudo") {
            a.restart.use_sudo = false;
        } else if (arg == "--chvt") {
            a.restart.switch_vt = true;
        } else if (arg == "--list-devices") {
            a.list_devices = true;
        } else if (arg == "--help" || arg == "-h") {
            a.help = true;
        } else {
            error = "unknown option: " + arg;
            return false;
        }
    }
    out = a;
    return true;
}

}  // namespace gamemode
