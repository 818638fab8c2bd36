#include "CommandRunner.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ProxyVm {
namespace Libvirt {

namespace {

struct FdCloser {
    int fd = -1;

    ~FdCloser() { reset(); }

    void reset()
    {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

struct PipePair {
    FdCloser read;
    FdCloser write;

    bool open()
    {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        read.fd = fds[0];
        write.fd = fds[1];
        return true;
    }
};

bool startsWithPath(const std::filesystem::path& path, const std::filesystem::path& prefix)
{
    auto pathIt = path.begin();
    for (auto prefixIt = prefix.begin(); prefixIt != prefix.end(); ++prefixIt, ++pathIt) {
        if (prefixIt->empty()) {
            continue;
        }
        if (pathIt == path.end() || *pathIt != *prefixIt) {
            return false;
        }
    }
    return true;
}

// Reads both pipes until each reaches EOF.
void drainPipes(int stdoutFd, int stderrFd, std::string& stdoutText, std::string& stderrText)
{
    pollfd fds[2];
    fds[0] = { stdoutFd, POLLIN, 0 };
    fds[1] = { stderrFd, POLLIN, 0 };
    std::string* sinks[2] = { &stdoutText, &stderrText };
    int open = 2;
    char buffer[4096];

    while (open > 0) {
        const int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            }
            else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open;
            }
        }
    }
}

int waitForExit(pid_t pid)
{
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

std::string CommandLine::toString() const
{
    std::string text = program;
    for (const auto& arg : args) {
        text += ' ';
        if (arg.find(' ') != std::string::npos) {
            text += "'" + arg + "'";
        }
        else {
            text += arg;
        }
    }
    return text;
}

const char* toString(InvocationStrategy strategy)
{
    switch (strategy) {
        case InvocationStrategy::Direct:
            return "direct";
        case InvocationStrategy::Elevated:
            return "elevated";
    }
    return "unknown";
}

const std::vector<std::filesystem::path>& defaultProtectedPrefixes()
{
    static const std::vector<std::filesystem::path> prefixes = { "/var/lib", "/usr", "/etc" };
    return prefixes;
}

bool isProtectedPath(
    const std::filesystem::path& path, const std::vector<std::filesystem::path>& protectedPrefixes)
{
    const auto normalized = path.lexically_normal();
    if (!normalized.is_absolute()) {
        return false;
    }
    return std::any_of(
        protectedPrefixes.begin(), protectedPrefixes.end(), [&](const auto& prefix) {
            return startsWithPath(normalized, prefix.lexically_normal());
        });
}

InvocationStrategy strategyForPath(
    const std::filesystem::path& path, const std::vector<std::filesystem::path>& protectedPrefixes)
{
    return isProtectedPath(path, protectedPrefixes) ? InvocationStrategy::Elevated
                                                    : InvocationStrategy::Direct;
}

CommandLine applyStrategy(
    const CommandLine& command, InvocationStrategy strategy, const std::string& elevationWrapper)
{
    if (strategy == InvocationStrategy::Direct) {
        return command;
    }

    CommandLine elevated;
    elevated.program = elevationWrapper;
    elevated.args.reserve(command.args.size() + 1);
    elevated.args.push_back(command.program);
    elevated.args.insert(elevated.args.end(), command.args.begin(), command.args.end());
    return elevated;
}

Result<CommandOutput, VmError> runSubprocess(const CommandLine& command)
{
    const std::string rendered = command.toString();
    LOG_DEBUG(Command, "exec: {}", rendered);

    PipePair stdoutPipe;
    PipePair stderrPipe;
    PipePair execStatusPipe;
    if (!stdoutPipe.open() || !stderrPipe.open() || !execStatusPipe.open()) {
        return Result<CommandOutput, VmError>::error(VmError::toolFailed(
            "Failed to create pipes for " + command.program, rendered, std::strerror(errno)));
    }

    std::vector<std::string> argStorage;
    argStorage.reserve(command.args.size() + 1);
    argStorage.push_back(command.program);
    argStorage.insert(argStorage.end(), command.args.begin(), command.args.end());

    std::vector<char*> argv;
    for (auto& arg : argStorage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Result<CommandOutput, VmError>::error(VmError::toolFailed(
            "Failed to fork for " + command.program, rendered, std::strerror(errno)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        const int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(stdoutPipe.write.fd, STDOUT_FILENO);
        ::dup2(stderrPipe.write.fd, STDERR_FILENO);

        ::execvp(argv[0], argv.data());

        const int execErrno = errno;
        ssize_t ignored = ::write(execStatusPipe.write.fd, &execErrno, sizeof(execErrno));
        (void)ignored;
        ::_exit(127);
    }

    stdoutPipe.write.reset();
    stderrPipe.write.reset();
    execStatusPipe.write.reset();

    int execErrno = 0;
    ssize_t statusBytes;
    do {
        statusBytes = ::read(execStatusPipe.read.fd, &execErrno, sizeof(execErrno));
    } while (statusBytes < 0 && errno == EINTR);

    if (statusBytes == static_cast<ssize_t>(sizeof(execErrno))) {
        waitForExit(pid);
        if (execErrno == ENOENT) {
            LOG_WARN(Command, "Tool not found: {}", command.program);
            return Result<CommandOutput, VmError>::error(
                VmError::toolNotFound(command.program, rendered));
        }
        return Result<CommandOutput, VmError>::error(VmError::toolFailed(
            "Failed to execute " + command.program, rendered, std::strerror(execErrno)));
    }

    CommandOutput output;
    drainPipes(stdoutPipe.read.fd, stderrPipe.read.fd, output.stdoutText, output.stderrText);
    output.exitCode = waitForExit(pid);

    LOG_TRACE(Command, "exit {}: {}", output.exitCode, rendered);
    return Result<CommandOutput, VmError>::okay(output);
}

} // namespace Libvirt
} // namespace ProxyVm
