#include "VmError.h"
#include <utility>

namespace ProxyVm {

namespace {

constexpr const char* kToolRemediation = "sudo apt install libvirt-clients virtinst qemu-utils";

std::string trimTrailingNewlines(std::string text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // namespace

const char* toString(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::PreconditionFailed:
            return "PreconditionFailed";
        case ErrorKind::ToolInvocationFailed:
            return "ToolInvocationFailed";
        case ErrorKind::ToolNotFound:
            return "ToolNotFound";
        case ErrorKind::AlreadyExists:
            return "AlreadyExists";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::Io:
            return "Io";
        case ErrorKind::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

VmError::VmError(std::string message) : message(std::move(message))
{}

VmError::VmError(ErrorKind kind, std::string message) : kind(kind), message(std::move(message))
{}

VmError VmError::precondition(const std::string& message)
{
    return VmError(ErrorKind::PreconditionFailed, message);
}

VmError VmError::alreadyExists(const std::string& message)
{
    return VmError(ErrorKind::AlreadyExists, message);
}

VmError VmError::notFound(const std::string& message)
{
    return VmError(ErrorKind::NotFound, message);
}

VmError VmError::io(const std::string& message)
{
    return VmError(ErrorKind::Io, message);
}

VmError VmError::cancelled(const std::string& message)
{
    return VmError(ErrorKind::Cancelled, message);
}

VmError VmError::toolFailed(
    const std::string& context, const std::string& command, const std::string& stderrText)
{
    VmError error(ErrorKind::ToolInvocationFailed, context);
    error.command = command;
    error.stderrText = trimTrailingNewlines(stderrText);
    return error;
}

VmError VmError::toolNotFound(const std::string& tool, const std::string& command)
{
    VmError error(ErrorKind::ToolNotFound, "Required tool not found: " + tool);
    error.command = command;
    return error;
}

std::string VmError::remediation() const
{
    if (kind == ErrorKind::ToolNotFound) {
        return kToolRemediation;
    }
    return "";
}

std::string VmError::describe() const
{
    std::string text = message;
    if (!stderrText.empty()) {
        text += ": " + stderrText;
    }
    if (!command.empty() && kind == ErrorKind::ToolInvocationFailed) {
        text += " (command: " + command + ")";
    }
    return text;
}

} // namespace ProxyVm
