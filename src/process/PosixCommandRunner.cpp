#include "process/PosixCommandRunner.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace ViewPane::Process {

namespace {
// Closes a file descriptor on scope exit
class FdGuard {
public:
    explicit FdGuard(int fd = -1) : m_fd(fd) {}
    ~FdGuard() { Close(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int Get() const { return m_fd; }
    void Close() {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

private:
    int m_fd;
};

void WriteAll(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return;
        }
        data += written;
        size -= static_cast<size_t>(written);
    }
}

// Runs in the forked child; only async-signal-safe calls from here on
[[noreturn]] void ExecChild(int outputFd, char* const* argv) {
    int nullFd = ::open("/dev/null", O_RDONLY);
    if (nullFd >= 0) {
        ::dup2(nullFd, STDIN_FILENO);
        ::close(nullFd);
    }
    ::dup2(outputFd, STDOUT_FILENO);
    ::dup2(outputFd, STDERR_FILENO);
    if (outputFd != STDOUT_FILENO && outputFd != STDERR_FILENO) {
        ::close(outputFd);
    }

    ::execvp(argv[0], argv);

    int error = errno;
    const char* prefix = "viewpane: cannot execute ";
    WriteAll(STDERR_FILENO, prefix, std::strlen(prefix));
    WriteAll(STDERR_FILENO, argv[0], std::strlen(argv[0]));
    WriteAll(STDERR_FILENO, ": ", 2);
    const char* message = std::strerror(error);
    WriteAll(STDERR_FILENO, message, std::strlen(message));
    WriteAll(STDERR_FILENO, "\n", 1);
    ::_exit(PosixCommandRunner::kExecFailedStatus);
}
} // anonymous namespace

CommandResult PosixCommandRunner::Run(const CommandSpec& command) {
    if (command.IsEmpty()) {
        throw std::invalid_argument("no command to run");
    }

    // Build argv before forking; the child must not allocate
    std::vector<std::string> args;
    if (command.IsShellCommand()) {
        args = {kShellPath, "-c", command.shellCommand};
    } else {
        args = command.argv;
    }
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "failed to create output pipe");
    }
    FdGuard readEnd(fds[0]);
    FdGuard writeEnd(fds[1]);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "failed to fork");
    }
    if (pid == 0) {
        ExecChild(writeEnd.Get(), argv.data());
    }

    // Parent keeps only the read end so EOF arrives when the child exits
    writeEnd.Close();

    CommandResult result;
    char buffer[4096];
    for (;;) {
        ssize_t count = ::read(readEnd.Get(), buffer, sizeof(buffer));
        if (count > 0) {
            result.output.append(buffer, static_cast<size_t>(count));
        } else if (count == 0) {
            break;
        } else if (errno != EINTR) {
            spdlog::error("Failed to read command output: {}", std::strerror(errno));
            break;
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "failed to wait for command");
        }
    }

    if (WIFEXITED(status)) {
        result.exitStatus = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitStatus = 128 + WTERMSIG(status);
    }

    spdlog::debug("Command '{}' exited with {} ({} bytes)",
                  command.ToString(), result.exitStatus, result.output.size());
    return result;
}

} // namespace ViewPane::Process
