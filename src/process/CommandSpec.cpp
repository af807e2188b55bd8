#include "process/ICommandRunner.h"

namespace ViewPane::Process {

namespace {
bool NeedsQuoting(const std::string& arg) {
    if (arg.empty()) return true;
    for (char ch : arg) {
        if (ch == ' ' || ch == '\t' || ch == '"' || ch == '\'' || ch == '\\' ||
            ch == '$' || ch == '`' || ch == '|' || ch == '&' || ch == ';' ||
            ch == '<' || ch == '>' || ch == '*' || ch == '?') {
            return true;
        }
    }
    return false;
}

std::string QuoteArgument(const std::string& arg) {
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('"');
    for (char ch : arg) {
        if (ch == '\\' || ch == '"' || ch == '$' || ch == '`') {
            quoted.push_back('\\');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}
} // anonymous namespace

std::string CommandSpec::ToString() const {
    if (IsShellCommand()) {
        return shellCommand;
    }

    std::string result;
    for (const auto& arg : argv) {
        if (!result.empty()) {
            result += ' ';
        }
        result += NeedsQuoting(arg) ? QuoteArgument(arg) : arg;
    }
    return result;
}

} // namespace ViewPane::Process
