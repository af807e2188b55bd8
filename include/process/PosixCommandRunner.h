#pragma once

#include "process/ICommandRunner.h"

namespace ViewPane::Process {

/**
 * @brief Runs commands with fork/exec, capturing stdout+stderr through one pipe
 *
 * A command that cannot be executed reports exit status 127 with the exec
 * error in its output, like a shell would. Failure to create the pipe or
 * the child process throws std::system_error.
 */
class PosixCommandRunner : public ICommandRunner {
public:
    static constexpr int kExecFailedStatus = 127;
    static constexpr const char* kShellPath = "/bin/sh";

    PosixCommandRunner() = default;

    CommandResult Run(const CommandSpec& command) override;
};

} // namespace ViewPane::Process
