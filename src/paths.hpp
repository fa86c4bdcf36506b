#ifndef GAMEMODE_PATHS_HPP
#define GAMEMODE_PATHS_HPP

#include "mode.hpp"

#include <filesystem>
#include <string>

namespace gamemode {

constexpr const char* DEFAULT_ROOT = "/";
constexpr const char* DEFAULT_GREETD_DIR = "/etc/greetd";
constexpr const char* DEFAULT_CONFIG_FILE = "config.toml";
constexpr const char* DEFAULT_DESKTOP_CONFIG = "config_default.toml";
constexpr const char* DEFAULT_GAME_CONFIG = "game_mode_login.toml";
constexpr const char* DEFAULT_LOG_NAME = "game-mode.log";

// Locations of the greetd files. Every path hangs off root so the daemon can
// run against a scratch tree.
struct Paths {
    std::string root = DEFAULT_ROOT;
    std::string greetd_dir = DEFAULT_GREETD_DIR;
    std::string config_file = DEFAULT_CONFIG_FILE;
    std::string desktop_config = DEFAULT_DESKTOP_CONFIG;
    std::string game_config = DEFAULT_GAME_CONFIG;

    std::filesystem::path greetd_path() const;
    std::filesystem::path config_path() const;
    std::filesystem::path desktop_config_path() const;
    std::filesystem::path game_config_path() const;
    std::filesystem::path target_for(Mode m) const;
    std::filesystem::path default_log_path() const;
};

}  // namespace gamemode

#endif
