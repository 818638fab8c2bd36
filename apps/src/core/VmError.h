#pragma once

#include <string>

namespace ProxyVm {

enum class ErrorKind {
    PreconditionFailed,
    ToolInvocationFailed,
    ToolNotFound,
    AlreadyExists,
    NotFound,
    Io,
    Cancelled,
};

const char* toString(ErrorKind kind);

/**
 * @brief Error reported by adapter and orchestrator operations.
 *
 * Tool errors keep the command line that was attempted and the stderr it
 * produced so callers can show both verbatim.
 */
struct VmError {
    ErrorKind kind = ErrorKind::PreconditionFailed;
    std::string message;
    std::string command;
    std::string stderrText;

    VmError() = default;
    explicit VmError(std::string message);
    VmError(ErrorKind kind, std::string message);

    static VmError precondition(const std::string& message);
    static VmError alreadyExists(const std::string& message);
    static VmError notFound(const std::string& message);
    static VmError io(const std::string& message);
    static VmError cancelled(const std::string& message);
    static VmError toolFailed(
        const std::string& context, const std::string& command, const std::string& stderrText);
    static VmError toolNotFound(const std::string& tool, const std::string& command);

    // Install hint for ToolNotFound, empty for every other kind.
    std::string remediation() const;

    // Message plus captured stderr, suitable for a single log line.
    std::string describe() const;
};

} // namespace ProxyVm
