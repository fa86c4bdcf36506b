#ifndef GAMEMODE_LOG_HPP
#define GAMEMODE_LOG_HPP

#include <sstream>
#include <string>

namespace gamemode {

enum class LogLevel { ERROR, INFO, DEBUG };

// Opens the append-only log file and reads GAME_MODE_LOG ("debug" enables
// per-event tracing). Returns false if the file cannot be opened.
bool init_logging(const std::string& path);
void set_log_level(LogLevel level);
bool debug_enabled();

// One log line, written when the object goes out of scope.
class LogLine {
public:
    LogLine(LogLevel level, const char* tag);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& v) {
        if (enabled_) buf_ << v;
        return *this;
    }

private:
    LogLevel level_;
    bool enabled_;
    std::ostringstream buf_;
};

inline LogLine log_error(const char* tag) { return LogLine(LogLevel::ERROR, tag); }
inline LogLine log_info(const char* tag) { return LogLine(LogLevel::INFO, tag); }
inline LogLine log_debug(const char* tag) { return LogLine(LogLevel::DEBUG, tag); }

// strerror(errno) wrapper in the spirit of perror().
std::string errno_text(int err);

}  // namespace gamemode

#endif
