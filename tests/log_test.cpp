#include "log.hpp"

#include <stdlib.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {
std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}
}  // namespace

int main() {
    char tmpl[] = "/tmp/game-mode-log-XXXXXX";
    char* dir = mkdtemp(tmpl);
    assert(dir);
    fs::path file = fs::path(dir) / "logs" / "game-mode.log";

    unsetenv("GAME_MODE_LOG");
    assert(gamemode::init_logging(file.string()));
    assert(!gamemode::debug_enabled());
    gamemode::log_info("test") << "switched to " << 2 << " pads";
    gamemode::log_debug("test") << "hidden detail";
    gamemode::log_error("test") << "restart failed";

    std::string text = slurp(file);
    assert(text.find("INFO [test] switched to 2 pads") != std::string::npos);
    assert(text.find("ERROR [test] restart failed") != std::string::npos);
    assert(text.find("hidden detail") == std::string::npos);

    setenv("GAME_MODE_LOG", "debug", 1);
    assert(gamemode::init_logging(file.string()));
    assert(gamemode::debug_enabled());
    gamemode::log_debug("test") << "event trace";
    text = slurp(file);
    // Append mode: earlier lines survive reopening.
    assert(text.find("switched to 2 pads") != std::string::npos);
    assert(text.find("DEBUG [test] event trace") != std::string::npos);

    // A log file under a regular file cannot be created.
    assert(!gamemode::init_logging((file / "nested.log").string()));

    std::error_code ec;
    fs::remove_all(dir, ec);
    return 0;
}
