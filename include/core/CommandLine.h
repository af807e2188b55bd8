#pragma once

#include "process/ICommandRunner.h"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ViewPane::Core {

class CommandLineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CommandLineOptions {
    Process::CommandSpec command;
    std::optional<double> intervalSeconds;
    bool showStatus = false;
    bool errexit = false;                    // non-zero command exit is fatal
    std::optional<std::string> configPath;
    std::optional<std::string> logFile;
    std::optional<std::string> logLevel;
    bool help = false;
    bool version = false;
};

/**
 * @brief Parse arguments (without the program name)
 *
 * Options come first; the first non-option token and everything after it
 * is the watched command. "--" also ends option parsing.
 * @throws CommandLineError on malformed or conflicting arguments.
 */
CommandLineOptions ParseCommandLine(const std::vector<std::string>& args);

std::string UsageText(const std::string& programName);

} // namespace ViewPane::Core
