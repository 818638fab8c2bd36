#pragma once

#include "core/Result.h"
#include "core/VmError.h"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ProxyVm {
namespace Provisioning {

enum class GatewayMode {
    ProxyChain,
    WireGuard,
    OpenVpn,
};

enum class ChainStrategy {
    Strict,
    Dynamic,
    Random,
};

enum class ProxyType {
    Socks5,
    Http,
};

// Values as written to proxy.conf (PROXY_CHAIN, strict_chain, SOCKS5, ...).
const char* toConfString(GatewayMode mode);
const char* toConfString(ChainStrategy strategy);
const char* toConfString(ProxyType type);

std::optional<GatewayMode> parseGatewayMode(const std::string& text);
std::optional<ChainStrategy> parseChainStrategy(const std::string& text);
std::optional<ProxyType> parseProxyType(const std::string& text);

// Human-facing names used in role metadata and the CLI ("ProxyChain", ...).
const char* toString(GatewayMode mode);
std::optional<GatewayMode> gatewayModeFromString(const std::string& text);

struct ProxyHop {
    ProxyType type = ProxyType::Socks5;
    std::string host;
    uint16_t port = 0;
    std::string username;
    std::string password;
    std::string label;

    bool operator==(const ProxyHop& other) const = default;
};

// Parses socks5://[user:pass@]host:port or http://... shorthand.
Result<ProxyHop, VmError> parseProxyUrl(const std::string& url);

struct WireGuardSettings {
    // Path as seen inside the gateway, e.g. /proxy/wg0.conf.
    std::string configPath;
    std::string interfaceName = "wg0";
    bool routeAllTraffic = true;

    bool operator==(const WireGuardSettings& other) const = default;
};

struct OpenVpnSettings {
    std::string configPath;
    std::string authFile;
    bool routeAllTraffic = true;

    bool operator==(const OpenVpnSettings& other) const = default;
};

/**
 * @brief Egress configuration of a role's gateway VM, stored as proxy.conf.
 */
struct GatewayConfig {
    static constexpr size_t kMaxHops = 8;
    static constexpr const char* kConfFileName = "proxy.conf";
    static constexpr const char* kApplyScriptName = "apply-proxy.sh";
    static constexpr const char* kGuestMountPoint = "/proxy";

    std::string role;
    GatewayMode mode = GatewayMode::ProxyChain;
    ChainStrategy chainStrategy = ChainStrategy::Strict;
    std::vector<ProxyHop> hops;
    std::optional<WireGuardSettings> wireGuard;
    std::optional<OpenVpnSettings> openVpn;

    Result<std::monostate, VmError> validate() const;

    std::string renderConf() const;
    static Result<GatewayConfig, VmError> parseConf(const std::string& text);

    // Guest-side path of a file copied into the role directory.
    static std::string guestPath(const std::filesystem::path& hostFile);
};

std::string renderApplyScript(const std::string& role);

/**
 * @brief Writes proxy.conf and apply-proxy.sh into `roleDir`.
 * @return Paths of the files written, in write order.
 */
Result<std::vector<std::filesystem::path>, VmError> writeGatewayConfigFiles(
    const GatewayConfig& config, const std::filesystem::path& roleDir);

Result<GatewayConfig, VmError> readGatewayConfig(const std::filesystem::path& roleDir);

/**
 * @brief Copies host-side VPN files named in `config` into `roleDir`.
 *
 * Paths that name an existing host file are copied and rewritten to their
 * guest path under /proxy; anything else is left as given. A failed copy of
 * the OpenVPN auth file is only logged.
 * @return Paths of the files copied.
 */
Result<std::vector<std::filesystem::path>, VmError> stageCredentialFiles(
    GatewayConfig& config, const std::filesystem::path& roleDir);

} // namespace Provisioning
} // namespace ProxyVm
