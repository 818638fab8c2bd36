#pragma once

#include "core/Result.h"
#include "core/VmError.h"
#include <filesystem>
#include <string>
#include <vector>

namespace ProxyVm {
namespace Libvirt {

struct CommandLine {
    std::string program;
    std::vector<std::string> args;

    // Space-joined rendering for logs and error messages.
    std::string toString() const;
};

struct CommandOutput {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;

    bool success() const { return exitCode == 0; }
};

/**
 * @brief How a command reaches the host.
 *
 * Elevated prefixes the elevation wrapper (pkexec by default); the command's
 * own arguments are identical in both cases.
 */
enum class InvocationStrategy {
    Direct,
    Elevated,
};

const char* toString(InvocationStrategy strategy);

const std::vector<std::filesystem::path>& defaultProtectedPrefixes();

bool isProtectedPath(
    const std::filesystem::path& path,
    const std::vector<std::filesystem::path>& protectedPrefixes = defaultProtectedPrefixes());

InvocationStrategy strategyForPath(
    const std::filesystem::path& path,
    const std::vector<std::filesystem::path>& protectedPrefixes = defaultProtectedPrefixes());

CommandLine applyStrategy(
    const CommandLine& command, InvocationStrategy strategy, const std::string& elevationWrapper);

/**
 * @brief Runs a program with fork/execvp, capturing stdout and stderr separately.
 *
 * Only spawn failures are errors: a program that cannot be found yields
 * ToolNotFound, any other fork/exec failure yields ToolInvocationFailed. A
 * program that runs and exits non-zero is an okay result carrying its exit code.
 */
Result<CommandOutput, VmError> runSubprocess(const CommandLine& command);

} // namespace Libvirt
} // namespace ProxyVm
