#include "core/CommandLine.h"
#include "core/Config.h"
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cmath>
#include <cstdlib>

namespace ViewPane::Core {

namespace {
double ParseInterval(const std::string& text) {
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || errno != 0 || !std::isfinite(value)) {
        throw CommandLineError("invalid interval: '" + text + "'");
    }
    if (value < Config::kMinIntervalSeconds || value > Config::kMaxIntervalSeconds) {
        throw CommandLineError("interval must be between " + std::to_string(Config::kMinIntervalSeconds) +
                               " and " + std::to_string(Config::kMaxIntervalSeconds) + " seconds");
    }
    return value;
}

bool TakesValue(const std::string& name) {
    return name == "-d" || name == "--delay" || name == "-n" || name == "--interval" ||
           name == "-c" || name == "--command" || name == "--config" ||
           name == "--log-file" || name == "--log-level";
}

// Splits "--name=value" into name and value
bool SplitLongOption(const std::string& arg, std::string& name, std::string& value) {
    auto eq = arg.find('=');
    if (eq == std::string::npos) {
        name = arg;
        return false;
    }
    name = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}
} // anonymous namespace

CommandLineOptions ParseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;
    std::optional<std::string> shellCommand;

    size_t i = 0;

    // Fetch the value for an option, either inline or from the next argument
    auto takeValue = [&](const std::string& option, bool hasInline, const std::string& inlineValue) {
        if (hasInline) {
            return inlineValue;
        }
        if (i + 1 >= args.size()) {
            throw CommandLineError("option " + option + " requires a value");
        }
        return args[++i];
    };

    auto applyOption = [&](const std::string& name, bool hasInline, const std::string& inlineValue) {
        if (hasInline && !TakesValue(name)) {
            throw CommandLineError("option " + name + " does not take a value");
        }

        if (name == "-h" || name == "--help") {
            options.help = true;
        } else if (name == "-V" || name == "--version") {
            options.version = true;
        } else if (name == "-s" || name == "--status") {
            options.showStatus = true;
        } else if (name == "-e" || name == "--errexit") {
            options.errexit = true;
        } else if (name == "-d" || name == "--delay" || name == "-n" || name == "--interval") {
            options.intervalSeconds = ParseInterval(takeValue(name, hasInline, inlineValue));
        } else if (name == "-c" || name == "--command") {
            if (shellCommand) {
                throw CommandLineError("option " + name + " given more than once");
            }
            shellCommand = takeValue(name, hasInline, inlineValue);
            if (shellCommand->empty()) {
                throw CommandLineError("empty command string");
            }
        } else if (name == "--config") {
            options.configPath = takeValue(name, hasInline, inlineValue);
        } else if (name == "--log-file") {
            options.logFile = takeValue(name, hasInline, inlineValue);
        } else if (name == "--log-level") {
            std::string level = takeValue(name, hasInline, inlineValue);
            if (!Config::IsValidLogLevel(level)) {
                throw CommandLineError("unknown log level: " + level);
            }
            options.logLevel = level;
        } else {
            throw CommandLineError("unknown option: " + name);
        }
    };

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.size() < 2 || arg[0] != '-') {
            break;   // start of the command
        }

        if (arg.rfind("--", 0) == 0) {
            std::string name;
            std::string inlineValue;
            bool hasInline = SplitLongOption(arg, name, inlineValue);
            applyOption(name, hasInline, inlineValue);
            continue;
        }

        // Short options cluster (-se); one taking a value ends the cluster,
        // with the value attached (-sd0.5) or in the next argument
        for (size_t pos = 1; pos < arg.size(); ++pos) {
            std::string name{'-', arg[pos]};
            if (TakesValue(name)) {
                bool hasInline = pos + 1 < arg.size();
                applyOption(name, hasInline, hasInline ? arg.substr(pos + 1) : std::string());
                break;
            }
            applyOption(name, false, std::string());
        }
    }

    std::vector<std::string> tokens(args.begin() + static_cast<std::ptrdiff_t>(std::min(i, args.size())), args.end());

    if (options.help || options.version) {
        return options;
    }

    if (shellCommand && !tokens.empty()) {
        throw CommandLineError("a command string (-c) and command arguments are mutually exclusive");
    }
    if (shellCommand) {
        options.command.shellCommand = *shellCommand;
    } else if (!tokens.empty()) {
        options.command.argv = std::move(tokens);
    } else {
        throw CommandLineError("no command given");
    }

    return options;
}

std::string UsageText(const std::string& programName) {
    return "Usage: " + programName + " [options] [--] command [args...]\n"
           "       " + programName + " [options] -c \"command string\"\n"
           "\n"
           "Re-run a command periodically and show its colored output in a\n"
           "scrollable view.\n"
           "\n"
           "Options:\n"
           "  -d, --delay SECONDS   how frequently to run the command (alias -n, --interval)\n"
           "  -c, --command STRING  run STRING through /bin/sh -c\n"
           "  -s, --status          show a status line with the exit status\n"
           "  -e, --errexit         stop when the command exits with a non-zero status\n"
           "      --config PATH     configuration file (default: " + Config::GetDefaultConfigPath() + ")\n"
           "      --log-file PATH   write a log to PATH\n"
           "      --log-level LEVEL trace, debug, info, warn, error or off\n"
           "  -h, --help            show this help\n"
           "  -V, --version         show the version\n"
           "\n"
           "Keys: arrows/hjkl scroll, PgUp/PgDn/space/b page, u/d half page,\n"
           "      g/G top/bottom, 0/$ line start/end, r refresh, q quit\n";
}

} // namespace ViewPane::Core
