#pragma once

#include <string>
#include <vector>

struct ExecResult {
    int exit_code;
    std::string output; // stdout and stderr, interleaved
};

// Runs args[0] (an absolute path) with the remaining arguments and waits for it.
// exit_code is -1 when the child was killed by a signal.
ExecResult exec_command(const std::vector<std::string>& args);

// Executes hook commands for the reconciler; swapped out in tests.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Returns the captured output; throws HookExecutionError on failure.
    virtual std::string run(const std::vector<std::string>& args) = 0;
};

class ProcessRunner : public CommandRunner {
public:
    std::string run(const std::vector<std::string>& args) override;
};
