#include "VirshParser.h"
#include "Naming.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace ProxyVm {
namespace Libvirt {
namespace VirshParser {

namespace {

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

bool parseYesNo(const std::string& value)
{
    const std::string lower = toLower(value);
    return lower == "yes" || lower == "true" || lower == "enable";
}

} // namespace

std::vector<std::pair<std::string, std::string>> parseKeyValueLines(const std::string& text)
{
    std::vector<std::pair<std::string, std::string>> pairs;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        const size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        pairs.emplace_back(toLower(trim(line.substr(0, colon))), trim(line.substr(colon + 1)));
    }
    return pairs;
}

VmState parseVmState(const std::string& value)
{
    const std::string lower = toLower(trim(value));
    if (lower == "running") {
        return VmState::Running;
    }
    if (lower == "paused") {
        return VmState::Paused;
    }
    if (lower == "shut off" || lower == "shutoff") {
        return VmState::ShutOff;
    }
    return VmState::Unknown;
}

VmInfo parseDomInfo(const std::string& name, const std::string& output)
{
    VmInfo info;
    info.name = name;

    for (const auto& [key, value] : parseKeyValueLines(output)) {
        if (key == "state") {
            info.state = parseVmState(value);
        }
    }

    const VmIdentity identity = Naming::parseVmName(name);
    info.kind = identity.kind;
    info.role = identity.role;
    return info;
}

NetworkInfo parseNetInfo(const std::string& name, const std::string& output)
{
    NetworkInfo info;
    info.name = name;

    for (const auto& [key, value] : parseKeyValueLines(output)) {
        if (key == "active") {
            const std::string lower = toLower(value);
            if (lower == "yes") {
                info.state = NetworkState::Active;
            }
            else if (lower == "no") {
                info.state = NetworkState::Inactive;
            }
        }
        else if (key == "autostart") {
            info.autostart = parseYesNo(value);
        }
    }
    return info;
}

std::vector<std::string> parseNameList(const std::string& output)
{
    std::vector<std::string> names;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        const std::string name = trim(line);
        if (!name.empty()) {
            names.push_back(name);
        }
    }
    return names;
}

std::optional<std::string> parseDiskSource(const std::string& domainXml)
{
    static const std::string kSingle = "<source file='";
    static const std::string kDouble = "<source file=\"";

    size_t pos = domainXml.find(kSingle);
    char quote = '\'';
    size_t prefixLength = kSingle.size();

    const size_t doublePos = domainXml.find(kDouble);
    if (doublePos != std::string::npos && (pos == std::string::npos || doublePos < pos)) {
        pos = doublePos;
        quote = '"';
        prefixLength = kDouble.size();
    }
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    const size_t start = pos + prefixLength;
    const size_t end = domainXml.find(quote, start);
    if (end == std::string::npos || end == start) {
        return std::nullopt;
    }
    return domainXml.substr(start, end - start);
}

std::optional<std::string> parseBackingFile(const std::string& output)
{
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        const std::string trimmed = trim(line);
        const std::string lower = toLower(trimmed);
        if (lower.rfind("backing file:", 0) != 0) {
            continue;
        }

        // "backing file: /path/base.qcow2 (actual path: ...)"
        std::istringstream rest(trim(trimmed.substr(std::string("backing file:").size())));
        std::string path;
        rest >> path;
        if (!path.empty()) {
            return path;
        }
    }
    return std::nullopt;
}

} // namespace VirshParser
} // namespace Libvirt
} // namespace ProxyVm
