#pragma once

#include "Result.h"
#include "VmError.h"
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace ProxyVm {

/**
 * @brief Host-wide settings shared by every role.
 *
 * Loaded from proxy-vm.json through ConfigLoader. Missing keys keep the
 * defaults below so a partial file is valid.
 */
struct GlobalConfig {
    static constexpr const char* kFileName = "proxy-vm.json";
    static constexpr uint32_t kMinGatewayRamMb = 128;
    static constexpr uint32_t kMinAppRamMb = 256;

    // Root directory holding one subdirectory per role.
    std::filesystem::path cfgRoot;
    std::filesystem::path imagesDir = "/var/lib/libvirt/images";
    // Shared ingress network, provisioned by the operator.
    std::string lanNet = "lan-net";
    uint32_t gatewayRamMb = 1024;
    uint32_t appRamMb = 2048;
    uint32_t disposableRamMb = 2048;
    std::string gatewayOsVariant = "debian12";
    std::string appOsVariant = "fedora40";
    std::string elevationWrapper = "pkexec";

    GlobalConfig();

    Result<std::monostate, VmError> validate() const;

    std::filesystem::path templatesFile() const { return cfgRoot / "templates.json"; }

    // Falls back to defaults when no config file is found; a file that exists
    // but cannot be parsed is an error.
    static Result<GlobalConfig, VmError> load();
    Result<std::filesystem::path, VmError> save() const;
};

std::filesystem::path defaultCfgRoot();

void to_json(nlohmann::json& j, const GlobalConfig& config);
void from_json(const nlohmann::json& j, GlobalConfig& config);

} // namespace ProxyVm
