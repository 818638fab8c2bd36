#include "GlobalConfig.h"
#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>

namespace ProxyVm {

std::filesystem::path defaultCfgRoot()
{
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / "VMS" / "VM-Proxy-configs";
    }
    return std::filesystem::path("/var/lib/proxy-vm/roles");
}

GlobalConfig::GlobalConfig() : cfgRoot(defaultCfgRoot())
{}

Result<std::monostate, VmError> GlobalConfig::validate() const
{
    if (lanNet.empty()) {
        return Result<std::monostate, VmError>::error(
            VmError::precondition("LAN network name must not be empty"));
    }
    if (gatewayRamMb < kMinGatewayRamMb) {
        return Result<std::monostate, VmError>::error(VmError::precondition(
            "Gateway RAM must be at least " + std::to_string(kMinGatewayRamMb) + " MB"));
    }
    if (appRamMb < kMinAppRamMb) {
        return Result<std::monostate, VmError>::error(VmError::precondition(
            "App RAM must be at least " + std::to_string(kMinAppRamMb) + " MB"));
    }
    if (disposableRamMb < kMinAppRamMb) {
        return Result<std::monostate, VmError>::error(VmError::precondition(
            "Disposable RAM must be at least " + std::to_string(kMinAppRamMb) + " MB"));
    }
    if (cfgRoot.empty()) {
        return Result<std::monostate, VmError>::error(
            VmError::precondition("Config root directory must not be empty"));
    }
    if (imagesDir.empty()) {
        return Result<std::monostate, VmError>::error(
            VmError::precondition("Images directory must not be empty"));
    }
    return Result<std::monostate, VmError>::okay(std::monostate{});
}

Result<GlobalConfig, VmError> GlobalConfig::load()
{
    auto result = ConfigLoader::load<GlobalConfig>(kFileName);
    if (result.isError() && result.errorValue().kind == ErrorKind::NotFound) {
        LOG_INFO(Config, "No {} found, using defaults", kFileName);
        return Result<GlobalConfig, VmError>::okay(GlobalConfig{});
    }
    return result;
}

Result<std::filesystem::path, VmError> GlobalConfig::save() const
{
    return ConfigLoader::save(kFileName, nlohmann::json(*this));
}

void to_json(nlohmann::json& j, const GlobalConfig& config)
{
    j = nlohmann::json{
        { "cfg_root", config.cfgRoot.string() },
        { "images_dir", config.imagesDir.string() },
        { "lan_net", config.lanNet },
        { "gateway_ram_mb", config.gatewayRamMb },
        { "app_ram_mb", config.appRamMb },
        { "disposable_ram_mb", config.disposableRamMb },
        { "gateway_os_variant", config.gatewayOsVariant },
        { "app_os_variant", config.appOsVariant },
        { "elevation_wrapper", config.elevationWrapper },
    };
}

void from_json(const nlohmann::json& j, GlobalConfig& config)
{
    const GlobalConfig defaults;
    config.cfgRoot = j.value("cfg_root", defaults.cfgRoot.string());
    config.imagesDir = j.value("images_dir", defaults.imagesDir.string());
    config.lanNet = j.value("lan_net", defaults.lanNet);
    config.gatewayRamMb = j.value("gateway_ram_mb", defaults.gatewayRamMb);
    config.appRamMb = j.value("app_ram_mb", defaults.appRamMb);
    config.disposableRamMb = j.value("disposable_ram_mb", defaults.disposableRamMb);
    config.gatewayOsVariant = j.value("gateway_os_variant", defaults.gatewayOsVariant);
    config.appOsVariant = j.value("app_os_variant", defaults.appOsVariant);
    config.elevationWrapper = j.value("elevation_wrapper", defaults.elevationWrapper);
}

} // namespace ProxyVm
