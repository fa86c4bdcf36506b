#include "command_runner.hpp"

#include "log.hpp"

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>

extern char** environ;

namespace gamemode {

bool check_exit_status(int status, const char* action) {
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) return true;
        log_error("exec") << action << " failed with exit code " << code;
        return false;
    }
    if (WIFSIGNALED(status)) {
        log_error("exec") << action << " terminated by signal " << WTERMSIG(status);
        return false;
    }
    log_error("exec") << action << " failed with status " << status;
    return false;
}

bool SystemCommandRunner::run(const std::vector<std::string>& argv, const char* action) {
    if (argv.empty()) {
        log_error("exec") << action << ": empty command";
        return false;
    }

    // posix_spawnp wants writable char*; keep our own NUL-terminated copies.
    std::vector<std::vector<char>> storage;
    storage.reserve(argv.size());
    for (const auto& a : argv) {
        storage.emplace_back(a.begin(), a.end());
        storage.back().push_back('\0');
    }
    std::vector<char*> args;
    args.reserve(storage.size() + 1);
    for (auto& buf : storage) args.push_back(buf.data());
    args.push_back(nullptr);

    std::string joined;
    for (const auto& a : argv) {
        if (!joined.empty()) joined += ' ';
        joined += a;
    }
    log_debug("exec") << action << ": " << joined;

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), environ);
    if (rc != 0) {
        log_error("exec") << action << ": cannot spawn " << argv[0] << ": " << errno_text(rc);
        return false;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        log_error("exec") << action << ": waitpid: " << errno_text(errno);
        return false;
    }
    return check_exit_status(status, action);
}

}  // namespace gamemode
