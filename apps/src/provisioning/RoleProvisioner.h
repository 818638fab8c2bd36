#pragma once

#include "GatewayConfig.h"
#include "ProvisioningLedger.h"
#include "core/Result.h"
#include "core/VmError.h"
#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace ProxyVm {

struct GlobalConfig;

namespace Libvirt {
class LibvirtAdapter;
}

namespace Provisioning {

class TemplateRegistry;

enum class ProvisioningStep {
    Validating,
    NetworkReady,
    ConfigWritten,
    DiskReady,
    VmCreated,
    MetadataSaved,
    AppVmCreated,
    Done,
    Failed,
    RollingBack,
    Cancelled,
};

const char* toString(ProvisioningStep step);

struct RoleRequest {
    std::string roleName;
    // VPN paths may name host files; they are copied into the role directory.
    GatewayConfig gateway;
    std::string gwTemplateId;
    std::optional<std::string> appTemplateId;
    std::optional<std::string> dispTemplateId;
    bool createAppVm = false;
};

struct RoleOutcome {
    std::string role;
    std::filesystem::path roleDir;
    std::string gatewayVm;
    bool networkCreated = false;
    bool metadataSaved = false;
    std::optional<std::string> appVm;
};

/**
 * @brief Runs the create-role workflow with compensating rollback.
 *
 * Steps run in a fixed order. Every resource the run creates is recorded in
 * a ledger; a fatal failure, or a cancel request seen between steps, undoes
 * exactly those resources newest first. Metadata and the optional app VM
 * are best-effort and never roll back the gateway.
 */
class RoleProvisioner {
public:
    using ProgressCallback = std::function<void(ProvisioningStep, const std::string&)>;

    RoleProvisioner(
        const GlobalConfig& config,
        const TemplateRegistry& templates,
        Libvirt::LibvirtAdapter& adapter);

    void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

    Result<RoleOutcome, VmError> createRole(const RoleRequest& request);

    // Honoured at the next step boundary; an in-flight tool call finishes first.
    void requestCancel() { cancelRequested_ = true; }

    /**
     * @brief Undo whatever the last run left in the ledger.
     *
     * A no-op after a successful run or one that already rolled back.
     */
    void cancel();

    ProvisioningStep lastStep() const { return lastStep_; }

private:
    friend struct RoleProvisionerTestAccessor;

    void report(ProvisioningStep step, const std::string& message);
    VmError fail(VmError error);
    std::optional<VmError> checkCancelled(const std::string& role);
    std::optional<std::string> createFirstAppVm(
        const std::string& role, const std::string& appTemplateId);

    const GlobalConfig& config_;
    const TemplateRegistry& templates_;
    Libvirt::LibvirtAdapter& adapter_;
    ProvisioningLedger ledger_;
    ProgressCallback progress_;
    std::atomic<bool> cancelRequested_{ false };
    ProvisioningStep lastStep_ = ProvisioningStep::Validating;
};

} // namespace Provisioning
} // namespace ProxyVm
