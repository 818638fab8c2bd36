#pragma once

#include "GatewayConfig.h"
#include "RoleMeta.h"
#include "core/Result.h"
#include "core/VmError.h"
#include "libvirt/LibvirtTypes.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ProxyVm {

struct GlobalConfig;

namespace Libvirt {
class LibvirtAdapter;
}

namespace Provisioning {

class TemplateRegistry;

struct RoleSummary {
    std::string name;
    std::optional<RoleMeta> meta;
    std::vector<Libvirt::VmInfo> vms;
};

/**
 * @brief Operations on roles that already exist.
 *
 * Creation lives in RoleProvisioner; everything after that (adding VMs,
 * editing the gateway, teardown) goes through here.
 */
class RoleManager {
public:
    struct Dependencies {
        std::function<void(std::chrono::milliseconds)> sleep;
        std::function<std::chrono::system_clock::time_point()> now;
    };

    static constexpr uint32_t kMaxGuessedAppOverlays = 20;
    static constexpr std::chrono::milliseconds kRestartPause{ 500 };

    RoleManager(
        const GlobalConfig& config,
        const TemplateRegistry& templates,
        Libvirt::LibvirtAdapter& adapter);
    RoleManager(
        const GlobalConfig& config,
        const TemplateRegistry& templates,
        Libvirt::LibvirtAdapter& adapter,
        Dependencies dependencies);

    /**
     * @brief Tear down every resource derived from `role`.
     *
     * Each step is attempted regardless of earlier failures, so a role that
     * was partly removed by hand still gets cleaned up. Only an invalid
     * role name is reported as an error.
     * @return Number of cleanup steps that reported an error.
     */
    Result<size_t, VmError> deleteRole(const std::string& role);

    // Uses `templateId` when given, otherwise the role's app template.
    // @return Name of the new app VM.
    Result<std::string, VmError> addAppVm(
        const std::string& role, const std::optional<std::string>& templateId = std::nullopt);

    // @return Name of the transient VM.
    Result<std::string, VmError> launchDisposableVm(const std::string& role);

    Result<std::monostate, VmError> updateGatewayConfig(
        const std::string& role, GatewayConfig gateway, bool restartGateway);

    Result<std::monostate, VmError> startVm(const std::string& name);
    Result<std::monostate, VmError> stopVm(const std::string& name);

    // Known roles with their VMs, plus roles that only exist as VM names.
    Result<std::vector<RoleSummary>, VmError> listRoles();

private:
    Result<RoleMeta, VmError> loadMeta(const std::string& role) const;

    const GlobalConfig& config_;
    const TemplateRegistry& templates_;
    Libvirt::LibvirtAdapter& adapter_;
    Dependencies dependencies_;
};

} // namespace Provisioning
} // namespace ProxyVm
