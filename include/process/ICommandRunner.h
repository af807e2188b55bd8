#pragma once

#include <string>
#include <vector>

namespace ViewPane::Process {

// What to run: either an argv token list or a single shell command string
struct CommandSpec {
    std::vector<std::string> argv;   // used when shellCommand is empty
    std::string shellCommand;        // run via /bin/sh -c

    bool IsShellCommand() const { return !shellCommand.empty(); }
    bool IsEmpty() const { return argv.empty() && shellCommand.empty(); }

    // Human readable form for the status line and logs
    std::string ToString() const;
};

struct CommandResult {
    int exitStatus = 0;      // exit code, or 128 + signal number
    std::string output;      // stdout and stderr, interleaved
};

/**
 * @brief Abstract interface for running the watched command
 *
 * Implementations block until the process exits. Enables testing the
 * controller with canned output instead of real processes.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    virtual CommandResult Run(const CommandSpec& command) = 0;
};

} // namespace ViewPane::Process
