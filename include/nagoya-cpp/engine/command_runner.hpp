#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace nagoya_cpp {

constexpr int CHILD_EXIT_CODE = 127;
constexpr std::chrono::milliseconds POLL_INTERVAL{100};

struct CommandResult {
    int exit_code = -1;
    std::string output;
    std::string error;
    bool timed_out = false;

    bool succeeded() const
    {
        return !timed_out && exit_code == 0;
    }
};

/**
 * @brief Runs an external command and captures its stdout and stderr
 *
 * The child is killed with SIGKILL once the deadline passes; the result is
 * then flagged timed_out. Failure to launch the program throws BuildError
 * with SYSTEM_ERROR.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::vector<std::string>& args,
                              std::optional<std::chrono::seconds> timeout = std::nullopt,
                              bool echo_output = false);
};

std::string formatCommandLine(const std::vector<std::string>& args);

} // namespace nagoya_cpp
