#ifndef GAMEMODE_OPTIONS_HPP
#define GAMEMODE_OPTIONS_HPP

#include "device_monitor.hpp"
#include "paths.hpp"
#include "service_restarter.hpp"
#include "session_guard.hpp"

#include <string>

namespace gamemode {

struct Options {
    Paths paths;
    RestartSettings restart;
    std::string greeter_user = DEFAULT_GREETER_USER;
    std::string input_dir = DEFAULT_INPUT_DIR;
    std::string log_file;  // empty: <greetd>/logs/game-mode.log
    int mode_button = -1;
    int poll_ms = DEFAULT_POLL_MS;
    bool list_devices = false;
    bool help = false;

    std::string log_path() const;
};

void usage(const char* prog);

// Fills `out` from argv. On a bad flag or value returns false with a reason
// in `error`.
bool parse_options(int argc, char** argv, Options& out, std::string& error);

}  // namespace gamemode

#endif
