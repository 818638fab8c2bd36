#include "CliParams.h"
#include <charconv>
#include <limits>
#include <optional>

namespace ProxyVm {
namespace Cli {

namespace {

// A missing key gives the fallback. Anything but an integer in [min, max] is an error.
Result<int64_t, VmError> boundedInteger(
    const nlohmann::json& params, const char* key, int64_t fallback, int64_t min, int64_t max)
{
    using ResultType = Result<int64_t, VmError>;
    if (!params.contains(key)) {
        return ResultType::okay(fallback);
    }

    const auto& value = params[key];
    const auto outOfRange = [&] {
        return ResultType::error(VmError::precondition(
            "'" + std::string(key) + "' must be an integer from " + std::to_string(min) + " to "
            + std::to_string(max) + ", got " + value.dump()));
    };
    if (!value.is_number_integer()) {
        return outOfRange();
    }
    if (value.is_number_unsigned()) {
        const auto number = value.get<uint64_t>();
        if (number > static_cast<uint64_t>(max)) {
            return outOfRange();
        }
        return ResultType::okay(static_cast<int64_t>(number));
    }
    const auto number = value.get<int64_t>();
    if (number < min || number > max) {
        return outOfRange();
    }
    return ResultType::okay(number);
}

Result<Provisioning::ProxyHop, VmError> parseHop(const nlohmann::json& hop)
{
    if (hop.is_string()) {
        return Provisioning::parseProxyUrl(hop.get<std::string>());
    }

    Provisioning::ProxyHop parsed;
    const auto type = Provisioning::parseProxyType(hop.value("type", std::string("SOCKS5")));
    if (!type.has_value()) {
        return Result<Provisioning::ProxyHop, VmError>::error(
            VmError::precondition("Unknown proxy type '" + hop.value("type", std::string()) + "'"));
    }
    parsed.type = *type;
    parsed.host = hop.value("host", std::string());
    // Left at 0 when absent so validation reports the missing port.
    auto port = boundedInteger(hop, "port", 0, 1, 65535);
    if (port.isError()) {
        return Result<Provisioning::ProxyHop, VmError>::error(port.errorValue());
    }
    parsed.port = static_cast<uint16_t>(port.value());
    parsed.username = hop.value("username", std::string());
    parsed.password = hop.value("password", std::string());
    parsed.label = hop.value("label", std::string());
    return Result<Provisioning::ProxyHop, VmError>::okay(parsed);
}

} // namespace

Result<nlohmann::json, VmError> parseParams(const std::string& text)
{
    if (text.empty()) {
        return Result<nlohmann::json, VmError>::okay(nlohmann::json::object());
    }
    try {
        nlohmann::json params = nlohmann::json::parse(text);
        if (!params.is_object()) {
            return Result<nlohmann::json, VmError>::error(
                VmError::precondition("Params must be a JSON object"));
        }
        return Result<nlohmann::json, VmError>::okay(params);
    }
    catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, VmError>::error(
            VmError::precondition(std::string("Invalid params JSON: ") + e.what()));
    }
}

Result<std::string, VmError> requiredString(const nlohmann::json& params, const std::string& key)
{
    auto value = optionalString(params, key);
    if (value.isError()) {
        return Result<std::string, VmError>::error(value.errorValue());
    }
    if (!value.value().has_value() || value.value()->empty()) {
        return Result<std::string, VmError>::error(
            VmError::precondition("Params need a '" + key + "'"));
    }
    return Result<std::string, VmError>::okay(*value.value());
}

Result<std::optional<std::string>, VmError> optionalString(
    const nlohmann::json& params, const std::string& key)
{
    using ResultType = Result<std::optional<std::string>, VmError>;
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return ResultType::okay(std::nullopt);
    }
    if (!it->is_string()) {
        return ResultType::error(VmError::precondition(
            "'" + key + "' must be a string, got " + std::string(it->type_name())));
    }
    return ResultType::okay(it->get<std::string>());
}

Result<Provisioning::GatewayConfig, VmError> parseGatewayParams(
    const nlohmann::json& params, const std::vector<std::string>& extraHops)
{
    using namespace Provisioning;
    using ResultType = Result<GatewayConfig, VmError>;

    GatewayConfig config;
    try {
        const std::string modeText = params.value("mode", std::string("ProxyChain"));
        const auto mode = gatewayModeFromString(modeText);
        if (!mode.has_value()) {
            return ResultType::error(
                VmError::precondition("Unknown gateway mode '" + modeText + "'"));
        }
        config.mode = *mode;

        if (params.contains("chain_strategy")) {
            const auto strategy = parseChainStrategy(params["chain_strategy"].get<std::string>());
            if (!strategy.has_value()) {
                return ResultType::error(VmError::precondition("Unknown chain strategy"));
            }
            config.chainStrategy = *strategy;
        }

        for (const auto& hop : params.value("hops", nlohmann::json::array())) {
            auto parsed = parseHop(hop);
            if (parsed.isError()) {
                return ResultType::error(parsed.errorValue());
            }
            config.hops.push_back(parsed.value());
        }

        const bool routeAll = params.value("route_all_traffic", true);
        if (config.mode == GatewayMode::WireGuard) {
            WireGuardSettings wg;
            wg.configPath = params.value("wireguard_config", std::string());
            wg.interfaceName = params.value("interface_name", std::string("wg0"));
            wg.routeAllTraffic = routeAll;
            config.wireGuard = wg;
        }
        if (config.mode == GatewayMode::OpenVpn) {
            OpenVpnSettings ovpn;
            ovpn.configPath = params.value("openvpn_config", std::string());
            ovpn.authFile = params.value("openvpn_auth", std::string());
            ovpn.routeAllTraffic = routeAll;
            config.openVpn = ovpn;
        }
    }
    catch (const nlohmann::json::exception& e) {
        return ResultType::error(
            VmError::precondition(std::string("Invalid gateway params: ") + e.what()));
    }

    for (const auto& url : extraHops) {
        auto parsed = parseProxyUrl(url);
        if (parsed.isError()) {
            return ResultType::error(parsed.errorValue());
        }
        config.hops.push_back(parsed.value());
    }
    return ResultType::okay(config);
}

Result<Provisioning::RoleRequest, VmError> parseRoleRequest(
    const nlohmann::json& params, const std::vector<std::string>& extraHops)
{
    using ResultType = Result<Provisioning::RoleRequest, VmError>;

    auto gateway = parseGatewayParams(params, extraHops);
    if (gateway.isError()) {
        return ResultType::error(gateway.errorValue());
    }

    Provisioning::RoleRequest request;
    try {
        request.roleName = params.value("name", std::string());
        request.gwTemplateId = params.value("gw_template", std::string());
        request.createAppVm = params.value("create_app_vm", false);
    }
    catch (const nlohmann::json::exception& e) {
        return ResultType::error(
            VmError::precondition(std::string("Invalid role params: ") + e.what()));
    }
    auto appTemplate = optionalString(params, "app_template");
    if (appTemplate.isError()) {
        return ResultType::error(appTemplate.errorValue());
    }
    request.appTemplateId = appTemplate.value();
    auto dispTemplate = optionalString(params, "disp_template");
    if (dispTemplate.isError()) {
        return ResultType::error(dispTemplate.errorValue());
    }
    request.dispTemplateId = dispTemplate.value();
    if (request.roleName.empty()) {
        return ResultType::error(VmError::precondition("Role params need a 'name'"));
    }
    if (request.gwTemplateId.empty()) {
        return ResultType::error(VmError::precondition("Role params need a 'gw_template'"));
    }
    request.gateway = gateway.value();
    return ResultType::okay(request);
}

Result<Provisioning::Template, VmError> parseTemplateParams(const nlohmann::json& params)
{
    using ResultType = Result<Provisioning::Template, VmError>;

    Provisioning::Template tmpl;
    try {
        tmpl.path = params.value("path", std::string());
        tmpl.id = params.value("id", std::string());
        tmpl.label = params.value("label", std::string());
        tmpl.osVariant = params.value("os_variant", std::string());
        auto ram = boundedInteger(
            params, "default_ram_mb", 1024, 1, std::numeric_limits<uint32_t>::max());
        if (ram.isError()) {
            return ResultType::error(ram.errorValue());
        }
        tmpl.defaultRamMb = static_cast<uint32_t>(ram.value());
        tmpl.notes = params.value("notes", std::string());
        const std::string kind = params.value("role_kind", std::string("Generic"));
        const auto roleKind = Provisioning::roleKindFromString(kind);
        if (!roleKind.has_value()) {
            return ResultType::error(VmError::precondition("Unknown role kind '" + kind + "'"));
        }
        tmpl.roleKind = *roleKind;
    }
    catch (const nlohmann::json::exception& e) {
        return ResultType::error(
            VmError::precondition(std::string("Invalid template params: ") + e.what()));
    }
    if (tmpl.path.empty()) {
        return ResultType::error(VmError::precondition("Template params need a 'path'"));
    }
    return ResultType::okay(tmpl);
}

Result<std::pair<std::string, uint16_t>, VmError> parseEndpoint(const std::string& text)
{
    using ResultType = Result<std::pair<std::string, uint16_t>, VmError>;

    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        return ResultType::error(VmError::precondition("Expected host:port, got '" + text + "'"));
    }
    const std::string portText = text.substr(colon + 1);
    unsigned port = 0;
    const char* end = portText.data() + portText.size();
    const auto [ptr, ec] = std::from_chars(portText.data(), end, port);
    if (ec != std::errc() || ptr != portText.data() + portText.size() || port == 0
        || port > 65535) {
        return ResultType::error(VmError::precondition("Invalid port '" + portText + "'"));
    }
    return ResultType::okay({ text.substr(0, colon), static_cast<uint16_t>(port) });
}

nlohmann::json toJson(const Libvirt::VmInfo& vm)
{
    nlohmann::json j{
        { "name", vm.name },
        { "state", Libvirt::toString(vm.state) },
        { "kind", Libvirt::toString(vm.kind) },
    };
    j["role"] = vm.role.has_value() ? nlohmann::json(*vm.role) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json toJson(const VmError& error)
{
    nlohmann::json j{
        { "kind", toString(error.kind) },
        { "message", error.message },
    };
    if (!error.command.empty()) {
        j["command"] = error.command;
    }
    if (!error.stderrText.empty()) {
        j["stderr"] = error.stderrText;
    }
    if (!error.remediation().empty()) {
        j["remediation"] = error.remediation();
    }
    return j;
}

} // namespace Cli
} // namespace ProxyVm
