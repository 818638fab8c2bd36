#pragma once

#include "LibvirtTypes.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ProxyVm {
namespace Libvirt {

/**
 * Parsers for the human-oriented text printed by virsh and qemu-img.
 *
 * Every parser reads only the keys it knows and falls back to Unknown (or an
 * empty result) on anything it cannot make sense of, so new tool versions
 * that add or reword lines do not break status queries.
 */
namespace VirshParser {

// "Key: value" lines; keys lowercased and trimmed, lines without ':' skipped.
std::vector<std::pair<std::string, std::string>> parseKeyValueLines(const std::string& text);

VmState parseVmState(const std::string& value);

// Fills state from `virsh dominfo` output; kind and role come from the name.
VmInfo parseDomInfo(const std::string& name, const std::string& output);

// Fills state and autostart from `virsh net-info` output.
NetworkInfo parseNetInfo(const std::string& name, const std::string& output);

// One name per line from `virsh list --all --name`, blanks dropped.
std::vector<std::string> parseNameList(const std::string& output);

// First <source file='...'/> (either quote style) in `virsh dumpxml` output.
std::optional<std::string> parseDiskSource(const std::string& domainXml);

// First token after "backing file:" in `qemu-img info` output.
std::optional<std::string> parseBackingFile(const std::string& output);

} // namespace VirshParser
} // namespace Libvirt
} // namespace ProxyVm
