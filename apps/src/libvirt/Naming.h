#pragma once

#include "LibvirtTypes.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace ProxyVm {
namespace Libvirt {

/**
 * Resource naming conventions. Other tools on the host key off these
 * names, so they must stay bit-exact:
 *
 *   gateway VM        {role}-gw
 *   role network      {role}-inet
 *   app VM            {role}-app-{n}           (n is 1-based)
 *   disposable VM     disp-{role}-{YYYYmmdd-HHMMSS}
 *   gateway overlay   {role}-gw.qcow2
 *   app overlay       {role}-app-{n}-overlay.qcow2
 */
namespace Naming {

std::string gatewayVmName(const std::string& role);
std::string roleNetworkName(const std::string& role);
std::string appVmName(const std::string& role, uint32_t number);
std::string disposableVmName(const std::string& role, const std::string& timestamp);

std::string gatewayOverlayFileName(const std::string& role);
std::string appOverlayFileName(const std::string& role, uint32_t number);

std::filesystem::path gatewayOverlayPath(
    const std::filesystem::path& imagesDir, const std::string& role);
std::filesystem::path appOverlayPath(
    const std::filesystem::path& imagesDir, const std::string& role, uint32_t number);

// {cfgRoot}/{role}/disposable
std::filesystem::path disposableDir(
    const std::filesystem::path& cfgRoot, const std::string& role);
std::filesystem::path disposableOverlayPath(
    const std::filesystem::path& cfgRoot, const std::string& role, const std::string& timestamp);

// Local time formatted as YYYYmmdd-HHMMSS.
std::string timestamp(std::chrono::system_clock::time_point when);

/**
 * @brief Infer kind and role from a domain name.
 *
 * The only place the naming convention is decoded; everything that needs
 * to map a VM back to its role goes through here.
 */
VmIdentity parseVmName(const std::string& name);

} // namespace Naming
} // namespace Libvirt
} // namespace ProxyVm
