#include "log.hpp"

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace gamemode {

namespace {
LogLevel g_level = LogLevel::INFO;
std::ofstream g_file;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::DEBUG:
            return "DEBUG";
        default:
            return "INFO";
    }
}

std::string utc_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}
}  // namespace

bool init_logging(const std::string& path) {
    namespace fs = std::filesystem;

    const char* env = std::getenv("GAME_MODE_LOG");
    if (env && std::string(env) == "debug") {
        g_level = LogLevel::DEBUG;
    } else {
        g_level = LogLevel::INFO;
    }

    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "cannot create log directory " << parent.string() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    if (g_file.is_open()) g_file.close();
    g_file.clear();
    g_file.open(path, std::ios::out | std::ios::app);
    if (!g_file) {
        std::cerr << "cannot open log file " << path << std::endl;
        return false;
    }
    return true;
}

void set_log_level(LogLevel level) { g_level = level; }

bool debug_enabled() { return g_level == LogLevel::DEBUG; }

LogLine::LogLine(LogLevel level, const char* tag)
    : level_(level), enabled_(static_cast<int>(level) <= static_cast<int>(g_level)) {
    if (enabled_) buf_ << "[" << tag << "] ";
}

LogLine::~LogLine() {
    if (!enabled_) return;
    std::string line = utc_timestamp() + " " + level_name(level_) + " " + buf_.str();
    if (g_file.is_open()) {
        g_file << line << std::endl;
    }
    std::cerr << line << std::endl;
}

std::string errno_text(int err) { return std::strerror(err); }

}  // namespace gamemode
