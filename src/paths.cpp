#include "paths.hpp"

namespace gamemode {

std::filesystem::path Paths::greetd_path() const {
    std::filesystem::path dir(greetd_dir);
    // "/etc/greetd" under root "/tmp/x" must become "/tmp/x/etc/greetd"
    return std::filesystem::path(root) / dir.relative_path();
}

std::filesystem::path Paths::config_path() const { return greetd_path() / config_file; }

std::filesystem::path Paths::desktop_config_path() const { return greetd_path() / desktop_config; }

std::filesystem::path Paths::game_config_path() const { return greetd_path() / game_config; }

std::filesystem::path Paths::target_for(Mode m) const {
    return m == Mode::GAME ? game_config_path() : desktop_config_path();
}

std::filesystem::path Paths::default_log_path() const { return greetd_path() / "logs" / DEFAULT_LOG_NAME; }

}  // namespace gamemode
