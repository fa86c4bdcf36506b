#ifndef GAMEMODE_COMMAND_RUNNER_HPP
#define GAMEMODE_COMMAND_RUNNER_HPP

#include <string>
#include <vector>

namespace gamemode {

// Runs an external command to completion. Implementations return true only
// for a clean exit with status 0; everything else is logged under `action`.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual bool run(const std::vector<std::string>& argv, const char* action) = 0;
};

class SystemCommandRunner : public CommandRunner {
public:
    bool run(const std::vector<std::string>& argv, const char* action) override;
};

// Turns a waitpid() status into a log line; true if exited with 0.
bool check_exit_status(int status, const char* action);

}  // namespace gamemode

#endif
