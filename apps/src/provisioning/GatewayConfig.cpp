#include "GatewayConfig.h"
#include "core/LoggingChannels.h"
#include <charconv>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

namespace ProxyVm {
namespace Provisioning {

namespace {

constexpr const char* kRoleHeader = "# Proxy config for role: ";

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::optional<uint16_t> parsePort(const std::string& text)
{
    unsigned value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

const char* boolString(bool value)
{
    return value ? "true" : "false";
}

bool parseBool(const std::string& text, bool fallback)
{
    if (text == "true" || text == "1" || text == "yes") return true;
    if (text == "false" || text == "0" || text == "no") return false;
    return fallback;
}

std::string hopKey(size_t index, const char* field)
{
    return "PROXY_" + std::to_string(index) + "_" + field;
}

bool isHostFile(const std::string& path)
{
    std::error_code ec;
    return !path.empty() && std::filesystem::is_regular_file(path, ec);
}

Result<std::filesystem::path, VmError> copyIntoRoleDir(
    const std::filesystem::path& source, const std::filesystem::path& roleDir)
{
    const auto dest = roleDir / source.filename();
    std::error_code ec;
    std::filesystem::copy_file(
        source, dest, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<std::filesystem::path, VmError>::error(VmError::io(
            "Cannot copy " + source.string() + " to " + dest.string() + ": " + ec.message()));
    }
    LOG_INFO(Provision, "Copied {} to {}", source.string(), dest.string());
    return Result<std::filesystem::path, VmError>::okay(dest);
}

} // namespace

const char* toConfString(GatewayMode mode)
{
    switch (mode) {
        case GatewayMode::ProxyChain:
            return "PROXY_CHAIN";
        case GatewayMode::WireGuard:
            return "WIREGUARD";
        case GatewayMode::OpenVpn:
            return "OPENVPN";
    }
    return "PROXY_CHAIN";
}

const char* toConfString(ChainStrategy strategy)
{
    switch (strategy) {
        case ChainStrategy::Strict:
            return "strict_chain";
        case ChainStrategy::Dynamic:
            return "dynamic_chain";
        case ChainStrategy::Random:
            return "random_chain";
    }
    return "strict_chain";
}

const char* toConfString(ProxyType type)
{
    switch (type) {
        case ProxyType::Socks5:
            return "SOCKS5";
        case ProxyType::Http:
            return "HTTP";
    }
    return "SOCKS5";
}

std::optional<GatewayMode> parseGatewayMode(const std::string& text)
{
    if (text == "PROXY_CHAIN") return GatewayMode::ProxyChain;
    if (text == "WIREGUARD") return GatewayMode::WireGuard;
    if (text == "OPENVPN") return GatewayMode::OpenVpn;
    return std::nullopt;
}

std::optional<ChainStrategy> parseChainStrategy(const std::string& text)
{
    if (text == "strict_chain" || text == "strict") return ChainStrategy::Strict;
    if (text == "dynamic_chain" || text == "dynamic") return ChainStrategy::Dynamic;
    if (text == "random_chain" || text == "random") return ChainStrategy::Random;
    return std::nullopt;
}

std::optional<ProxyType> parseProxyType(const std::string& text)
{
    if (text == "SOCKS5" || text == "socks5") return ProxyType::Socks5;
    if (text == "HTTP" || text == "http") return ProxyType::Http;
    return std::nullopt;
}

const char* toString(GatewayMode mode)
{
    switch (mode) {
        case GatewayMode::ProxyChain:
            return "ProxyChain";
        case GatewayMode::WireGuard:
            return "WireGuard";
        case GatewayMode::OpenVpn:
            return "OpenVpn";
    }
    return "ProxyChain";
}

std::optional<GatewayMode> gatewayModeFromString(const std::string& text)
{
    if (text == "ProxyChain" || text == "proxy-chain" || text == "proxychain") {
        return GatewayMode::ProxyChain;
    }
    if (text == "WireGuard" || text == "wireguard") return GatewayMode::WireGuard;
    if (text == "OpenVpn" || text == "openvpn") return GatewayMode::OpenVpn;
    return parseGatewayMode(text);
}

Result<ProxyHop, VmError> parseProxyUrl(const std::string& url)
{
    const size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return Result<ProxyHop, VmError>::error(
            VmError::precondition("Proxy URL needs a scheme (socks5:// or http://): " + url));
    }

    ProxyHop hop;
    const auto type = parseProxyType(url.substr(0, schemeEnd));
    if (!type.has_value()) {
        return Result<ProxyHop, VmError>::error(
            VmError::precondition("Unsupported proxy scheme in " + url));
    }
    hop.type = type.value();

    std::string rest = url.substr(schemeEnd + 3);
    if (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }

    const size_t at = rest.rfind('@');
    if (at != std::string::npos) {
        const std::string credentials = rest.substr(0, at);
        rest = rest.substr(at + 1);
        const size_t colon = credentials.find(':');
        hop.username = credentials.substr(0, colon);
        if (colon != std::string::npos) {
            hop.password = credentials.substr(colon + 1);
        }
    }

    const size_t portSep = rest.rfind(':');
    if (portSep == std::string::npos) {
        return Result<ProxyHop, VmError>::error(
            VmError::precondition("Proxy URL needs a port: " + url));
    }
    hop.host = rest.substr(0, portSep);
    const auto port = parsePort(rest.substr(portSep + 1));
    if (hop.host.empty() || !port.has_value()) {
        return Result<ProxyHop, VmError>::error(
            VmError::precondition("Invalid host or port in proxy URL: " + url));
    }
    hop.port = port.value();
    return Result<ProxyHop, VmError>::okay(hop);
}

Result<std::monostate, VmError> GatewayConfig::validate() const
{
    switch (mode) {
        case GatewayMode::ProxyChain:
            if (hops.empty() || hops.size() > kMaxHops) {
                return Result<std::monostate, VmError>::error(VmError::precondition(
                    "Proxy chain needs between 1 and " + std::to_string(kMaxHops) + " hops"));
            }
            for (size_t i = 0; i < hops.size(); ++i) {
                if (trim(hops[i].host).empty()) {
                    return Result<std::monostate, VmError>::error(VmError::precondition(
                        "Proxy hop " + std::to_string(i + 1) + " has no host"));
                }
                if (hops[i].port == 0) {
                    return Result<std::monostate, VmError>::error(VmError::precondition(
                        "Proxy hop " + std::to_string(i + 1) + " has no port"));
                }
            }
            break;
        case GatewayMode::WireGuard:
            if (!wireGuard.has_value() || wireGuard->configPath.empty()) {
                return Result<std::monostate, VmError>::error(
                    VmError::precondition("WireGuard mode needs a config file"));
            }
            break;
        case GatewayMode::OpenVpn:
            if (!openVpn.has_value() || openVpn->configPath.empty()) {
                return Result<std::monostate, VmError>::error(
                    VmError::precondition("OpenVPN mode needs a config file"));
            }
            break;
    }
    return Result<std::monostate, VmError>::okay(std::monostate{});
}

std::string GatewayConfig::renderConf() const
{
    std::ostringstream out;
    out << kRoleHeader << role << "\n";
    out << "GATEWAY_MODE=" << toConfString(mode) << "\n";
    out << "CHAIN_STRATEGY=" << toConfString(chainStrategy) << "\n";

    const bool chain = mode == GatewayMode::ProxyChain && !hops.empty();
    out << "PROXY_COUNT=" << (chain ? hops.size() : 0) << "\n\n";

    if (chain) {
        out << "# Proxy chain configuration\n";
        for (size_t i = 0; i < hops.size(); ++i) {
            const ProxyHop& hop = hops[i];
            const size_t index = i + 1;
            out << hopKey(index, "TYPE") << "=" << toConfString(hop.type) << "\n";
            out << hopKey(index, "HOST") << "=" << hop.host << "\n";
            out << hopKey(index, "PORT") << "=" << hop.port << "\n";
            out << hopKey(index, "USER") << "=" << hop.username << "\n";
            out << hopKey(index, "PASS") << "=" << hop.password << "\n";
            out << hopKey(index, "LABEL") << "=" << hop.label << "\n";
        }
        out << "\n";
    }

    // Single-proxy fields read by older gateway images.
    out << "# First proxy (for compatibility)\n";
    const ProxyHop* first = chain ? &hops.front() : nullptr;
    const bool firstSocks = first && first->type == ProxyType::Socks5;
    const bool firstHttp = first && first->type == ProxyType::Http;
    out << "ACTIVE_PROTOCOL=" << (first ? toConfString(first->type) : "") << "\n";
    out << "SOCKS5_HOST=" << (firstSocks ? first->host : "") << "\n";
    out << "SOCKS5_PORT=" << (firstSocks ? std::to_string(first->port) : "") << "\n";
    out << "SOCKS5_USER=" << (firstSocks ? first->username : "") << "\n";
    out << "SOCKS5_PASS=" << (firstSocks ? first->password : "") << "\n";
    out << "HTTP_HOST=" << (firstHttp ? first->host : "") << "\n";
    out << "HTTP_PORT=" << (firstHttp ? std::to_string(first->port) : "") << "\n";
    out << "HTTP_USER=" << (firstHttp ? first->username : "") << "\n";
    out << "HTTP_PASS=" << (firstHttp ? first->password : "") << "\n\n";

    out << "# VPN / other modes\n";
    if (wireGuard.has_value()) {
        out << "WG_CONFIG_PATH=" << wireGuard->configPath << "\n";
        out << "WG_INTERFACE_NAME=" << wireGuard->interfaceName << "\n";
        out << "WG_ROUTE_ALL_TRAFFIC=" << boolString(wireGuard->routeAllTraffic) << "\n";
    }
    else {
        out << "WG_CONFIG_PATH=\nWG_INTERFACE_NAME=\nWG_ROUTE_ALL_TRAFFIC=\n";
    }
    if (openVpn.has_value()) {
        out << "OPENVPN_CONFIG_PATH=" << openVpn->configPath << "\n";
        out << "OPENVPN_AUTH_FILE=" << openVpn->authFile << "\n";
        out << "OPENVPN_ROUTE_ALL_TRAFFIC=" << boolString(openVpn->routeAllTraffic) << "\n";
    }
    else {
        out << "OPENVPN_CONFIG_PATH=\nOPENVPN_AUTH_FILE=\nOPENVPN_ROUTE_ALL_TRAFFIC=\n";
    }

    return out.str();
}

Result<GatewayConfig, VmError> GatewayConfig::parseConf(const std::string& text)
{
    GatewayConfig config;
    std::map<std::string, std::string> values;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        const std::string trimmed = trim(line);
        if (trimmed.rfind(kRoleHeader, 0) == 0) {
            config.role = trim(trimmed.substr(std::string(kRoleHeader).size()));
            continue;
        }
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        const size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        values[trim(trimmed.substr(0, eq))] = trimmed.substr(eq + 1);
    }

    auto lookup = [&values](const std::string& key) -> std::string {
        auto it = values.find(key);
        return it == values.end() ? std::string() : it->second;
    };

    const auto mode = parseGatewayMode(lookup("GATEWAY_MODE"));
    if (!mode.has_value()) {
        return Result<GatewayConfig, VmError>::error(VmError::precondition(
            "Unknown GATEWAY_MODE '" + lookup("GATEWAY_MODE") + "' in proxy config"));
    }
    config.mode = mode.value();
    config.chainStrategy =
        parseChainStrategy(lookup("CHAIN_STRATEGY")).value_or(ChainStrategy::Strict);

    size_t count = 0;
    const std::string countText = lookup("PROXY_COUNT");
    if (!countText.empty()) {
        const auto [ptr, ec] =
            std::from_chars(countText.data(), countText.data() + countText.size(), count);
        if (ec != std::errc() || count > kMaxHops) {
            return Result<GatewayConfig, VmError>::error(
                VmError::precondition("Invalid PROXY_COUNT '" + countText + "'"));
        }
    }

    for (size_t index = 1; index <= count; ++index) {
        ProxyHop hop;
        const auto type = parseProxyType(lookup(hopKey(index, "TYPE")));
        const auto port = parsePort(lookup(hopKey(index, "PORT")));
        if (!type.has_value() || !port.has_value()) {
            return Result<GatewayConfig, VmError>::error(VmError::precondition(
                "Proxy hop " + std::to_string(index) + " has an invalid type or port"));
        }
        hop.type = type.value();
        hop.port = port.value();
        hop.host = lookup(hopKey(index, "HOST"));
        hop.username = lookup(hopKey(index, "USER"));
        hop.password = lookup(hopKey(index, "PASS"));
        hop.label = lookup(hopKey(index, "LABEL"));
        config.hops.push_back(hop);
    }

    const std::string wgPath = lookup("WG_CONFIG_PATH");
    if (!wgPath.empty()) {
        WireGuardSettings wg;
        wg.configPath = wgPath;
        const std::string interfaceName = lookup("WG_INTERFACE_NAME");
        if (!interfaceName.empty()) {
            wg.interfaceName = interfaceName;
        }
        wg.routeAllTraffic = parseBool(lookup("WG_ROUTE_ALL_TRAFFIC"), true);
        config.wireGuard = wg;
    }

    const std::string ovpnPath = lookup("OPENVPN_CONFIG_PATH");
    if (!ovpnPath.empty()) {
        OpenVpnSettings ovpn;
        ovpn.configPath = ovpnPath;
        ovpn.authFile = lookup("OPENVPN_AUTH_FILE");
        ovpn.routeAllTraffic = parseBool(lookup("OPENVPN_ROUTE_ALL_TRAFFIC"), true);
        config.openVpn = ovpn;
    }

    return Result<GatewayConfig, VmError>::okay(config);
}

std::string GatewayConfig::guestPath(const std::filesystem::path& hostFile)
{
    return std::string(kGuestMountPoint) + "/" + hostFile.filename().string();
}

std::string renderApplyScript(const std::string& role)
{
    std::ostringstream out;
    out << R"SH(#!/usr/bin/env bash
# Regenerates /etc/proxychains.conf inside the gateway from /proxy/proxy.conf.
set -euo pipefail

ROLE=")SH" << role
        << R"SH("
CONF="/proxy/proxy.conf"
OUT="/etc/proxychains.conf"

log() { echo "[apply-proxy][${ROLE}] $*"; }

if [[ ! -f "$CONF" ]]; then
  log "$CONF not found, nothing to do."
  exit 0
fi

# shellcheck disable=SC1090
. "$CONF"

case "${GATEWAY_MODE:-}" in
  PROXY_CHAIN)
    COUNT="${PROXY_COUNT:-0}"
    if ! [[ "$COUNT" =~ ^[0-9]+$ ]] || [[ "$COUNT" -lt 1 ]]; then
      log "PROXY_COUNT is invalid ('$COUNT')."
      exit 0
    fi

    TMP="$(mktemp)"
    {
      echo "# Generated by apply-proxy.sh for role ${ROLE}"
      echo "${CHAIN_STRATEGY:-strict_chain}"
      echo "proxy_dns"
      echo "tcp_read_time_out 15000"
      echo "tcp_connect_time_out 8000"
      echo
      echo "[ProxyList]"
    } > "$TMP"

    written=0
    for ((i = 1; i <= COUNT; i++)); do
      type_var="PROXY_${i}_TYPE"; host_var="PROXY_${i}_HOST"; port_var="PROXY_${i}_PORT"
      user_var="PROXY_${i}_USER"; pass_var="PROXY_${i}_PASS"
      T="${!type_var:-}"; H="${!host_var:-}"; P="${!port_var:-}"
      U="${!user_var:-}"; PW="${!pass_var:-}"

      if [[ -z "$T" || -z "$H" || -z "$P" ]]; then
        log "Hop $i is incomplete, skipping."
        continue
      fi

      kind="$(echo "$T" | tr '[:upper:]' '[:lower:]')"
      if [[ "$kind" != "socks5" && "$kind" != "http" ]]; then
        log "Hop $i has unsupported type '$T', skipping."
        continue
      fi

      if [[ -n "$U" || -n "$PW" ]]; then
        echo "$kind $H $P $U $PW" >> "$TMP"
      else
        echo "$kind $H $P" >> "$TMP"
      fi
      written=$((written + 1))
    done

    if [[ "$written" -eq 0 ]]; then
      log "No usable hops, leaving $OUT untouched."
      rm -f "$TMP"
      exit 0
    fi

    mv "$TMP" "$OUT"
    log "proxychains.conf updated with $written hop(s)."
    ;;
  WIREGUARD)
    log "WireGuard mode uses ${WG_CONFIG_PATH:-<unset>} on ${WG_INTERFACE_NAME:-wg0}."
    ;;
  OPENVPN)
    log "OpenVPN mode uses ${OPENVPN_CONFIG_PATH:-<unset>}."
    ;;
  *)
    log "Unknown GATEWAY_MODE '${GATEWAY_MODE:-}'."
    ;;
esac

exit 0
)SH";
    return out.str();
}

Result<std::vector<std::filesystem::path>, VmError> writeGatewayConfigFiles(
    const GatewayConfig& config, const std::filesystem::path& roleDir)
{
    namespace fs = std::filesystem;
    using ResultType = Result<std::vector<fs::path>, VmError>;

    std::error_code ec;
    fs::create_directories(roleDir, ec);
    if (ec) {
        return ResultType::error(
            VmError::io("Cannot create role directory " + roleDir.string() + ": " + ec.message()));
    }

    std::vector<fs::path> written;

    const fs::path confPath = roleDir / GatewayConfig::kConfFileName;
    {
        std::ofstream out(confPath, std::ios::trunc);
        out << config.renderConf();
        if (!out.good()) {
            return ResultType::error(VmError::io("Cannot write " + confPath.string()));
        }
    }
    written.push_back(confPath);

    const fs::path scriptPath = roleDir / GatewayConfig::kApplyScriptName;
    {
        std::ofstream out(scriptPath, std::ios::trunc);
        out << renderApplyScript(config.role);
        if (!out.good()) {
            return ResultType::error(VmError::io("Cannot write " + scriptPath.string()));
        }
    }
    written.push_back(scriptPath);

    fs::permissions(
        scriptPath,
        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec
            | fs::perms::others_read | fs::perms::others_exec,
        fs::perm_options::replace,
        ec);
    if (ec) {
        return ResultType::error(VmError::io(
            "Cannot make " + scriptPath.string() + " executable: " + ec.message()));
    }

    LOG_INFO(Config, "Wrote gateway config for role {} ({})", config.role, toString(config.mode));
    return ResultType::okay(written);
}

Result<GatewayConfig, VmError> readGatewayConfig(const std::filesystem::path& roleDir)
{
    const auto path = roleDir / GatewayConfig::kConfFileName;
    std::ifstream in(path);
    if (!in.is_open()) {
        return Result<GatewayConfig, VmError>::error(
            VmError::notFound("No gateway config at " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return GatewayConfig::parseConf(buffer.str());
}

Result<std::vector<std::filesystem::path>, VmError> stageCredentialFiles(
    GatewayConfig& config, const std::filesystem::path& roleDir)
{
    using ResultType = Result<std::vector<std::filesystem::path>, VmError>;
    std::vector<std::filesystem::path> copied;

    std::error_code ec;
    std::filesystem::create_directories(roleDir, ec);
    if (ec) {
        return ResultType::error(
            VmError::io("Cannot create role directory " + roleDir.string() + ": " + ec.message()));
    }

    if (config.mode == GatewayMode::WireGuard && config.wireGuard.has_value()
        && isHostFile(config.wireGuard->configPath)) {
        auto result = copyIntoRoleDir(config.wireGuard->configPath, roleDir);
        if (result.isError()) {
            return ResultType::error(result.errorValue());
        }
        copied.push_back(result.value());
        config.wireGuard->configPath = GatewayConfig::guestPath(result.value());
    }

    if (config.mode == GatewayMode::OpenVpn && config.openVpn.has_value()) {
        if (isHostFile(config.openVpn->configPath)) {
            auto result = copyIntoRoleDir(config.openVpn->configPath, roleDir);
            if (result.isError()) {
                return ResultType::error(result.errorValue());
            }
            copied.push_back(result.value());
            config.openVpn->configPath = GatewayConfig::guestPath(result.value());
        }
        if (isHostFile(config.openVpn->authFile)) {
            auto result = copyIntoRoleDir(config.openVpn->authFile, roleDir);
            if (result.isError()) {
                LOG_WARN(Provision, "Auth file not copied: {}", result.errorValue().message);
            }
            else {
                copied.push_back(result.value());
                config.openVpn->authFile = GatewayConfig::guestPath(result.value());
            }
        }
    }

    return ResultType::okay(copied);
}

} // namespace Provisioning
} // namespace ProxyVm
