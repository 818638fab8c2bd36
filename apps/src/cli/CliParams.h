#pragma once

#include "core/Result.h"
#include "core/VmError.h"
#include "libvirt/LibvirtTypes.h"
#include "provisioning/GatewayConfig.h"
#include "provisioning/RoleProvisioner.h"
#include "provisioning/Template.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ProxyVm {
namespace Cli {

// Empty text is an empty object.
Result<nlohmann::json, VmError> parseParams(const std::string& text);

// A non-empty string under key.
Result<std::string, VmError> requiredString(const nlohmann::json& params, const std::string& key);

// Absent or null gives nullopt; any other non-string value is an error.
Result<std::optional<std::string>, VmError> optionalString(
    const nlohmann::json& params, const std::string& key);

/**
 * @brief Gateway settings from a params object.
 *
 * Keys: mode, chain_strategy, hops (URL strings or objects with type, host,
 * port, username, password, label), wireguard_config, interface_name,
 * openvpn_config, openvpn_auth, route_all_traffic. Hop URLs given with
 * --hop are appended after the params hops.
 */
Result<Provisioning::GatewayConfig, VmError> parseGatewayParams(
    const nlohmann::json& params, const std::vector<std::string>& extraHops = {});

// Keys: name, gw_template, app_template, disp_template, create_app_vm, plus
// the gateway keys above.
Result<Provisioning::RoleRequest, VmError> parseRoleRequest(
    const nlohmann::json& params, const std::vector<std::string>& extraHops = {});

// Keys: path (required), label, os_variant, role_kind, default_ram_mb, notes, id.
Result<Provisioning::Template, VmError> parseTemplateParams(const nlohmann::json& params);

// host:port
Result<std::pair<std::string, uint16_t>, VmError> parseEndpoint(const std::string& text);

nlohmann::json toJson(const Libvirt::VmInfo& vm);
nlohmann::json toJson(const VmError& error);

} // namespace Cli
} // namespace ProxyVm
