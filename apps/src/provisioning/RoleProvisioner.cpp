#include "RoleProvisioner.h"
#include "RoleManager.h"
#include "RoleMeta.h"
#include "TemplateRegistry.h"
#include "core/GlobalConfig.h"
#include "core/LoggingChannels.h"
#include "libvirt/LibvirtAdapter.h"
#include "libvirt/Naming.h"
#include <algorithm>
#include <system_error>

namespace ProxyVm {
namespace Provisioning {

const char* toString(ProvisioningStep step)
{
    switch (step) {
        case ProvisioningStep::Validating:
            return "Validating";
        case ProvisioningStep::NetworkReady:
            return "NetworkReady";
        case ProvisioningStep::ConfigWritten:
            return "ConfigWritten";
        case ProvisioningStep::DiskReady:
            return "DiskReady";
        case ProvisioningStep::VmCreated:
            return "VmCreated";
        case ProvisioningStep::MetadataSaved:
            return "MetadataSaved";
        case ProvisioningStep::AppVmCreated:
            return "AppVmCreated";
        case ProvisioningStep::Done:
            return "Done";
        case ProvisioningStep::Failed:
            return "Failed";
        case ProvisioningStep::RollingBack:
            return "RollingBack";
        case ProvisioningStep::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

RoleProvisioner::RoleProvisioner(
    const GlobalConfig& config, const TemplateRegistry& templates, Libvirt::LibvirtAdapter& adapter)
    : config_(config), templates_(templates), adapter_(adapter)
{}

Result<RoleOutcome, VmError> RoleProvisioner::createRole(const RoleRequest& request)
{
    using ResultType = Result<RoleOutcome, VmError>;
    namespace Naming = Libvirt::Naming;

    ledger_.clear();
    cancelRequested_ = false;

    // Step 1: configuration, role name, gateway settings.
    report(ProvisioningStep::Validating, "Validating configuration");
    auto configValid = config_.validate();
    if (configValid.isError()) {
        return ResultType::error(fail(configValid.errorValue()));
    }

    auto normalized = normalizeRoleName(request.roleName);
    if (normalized.isError()) {
        return ResultType::error(fail(normalized.errorValue()));
    }
    const std::string role = normalized.value();

    if (roleExists(config_.cfgRoot, role)) {
        return ResultType::error(
            fail(VmError::alreadyExists("Role '" + role + "' already exists")));
    }

    GatewayConfig gateway = request.gateway;
    gateway.role = role;
    auto gatewayValid = gateway.validate();
    if (gatewayValid.isError()) {
        return ResultType::error(fail(gatewayValid.errorValue()));
    }

    // Step 2: gateway template.
    report(ProvisioningStep::Validating, "Checking gateway template");
    const auto tmpl = templates_.get(request.gwTemplateId);
    if (!tmpl.has_value()) {
        return ResultType::error(fail(VmError::precondition(
            "Gateway template '" + request.gwTemplateId + "' is not registered")));
    }
    auto templateValid = tmpl->validate();
    if (templateValid.isError()) {
        return ResultType::error(fail(templateValid.errorValue()));
    }

    // Step 3: shared ingress network, never created here.
    report(ProvisioningStep::Validating, "Checking LAN network '" + config_.lanNet + "'");
    auto lanReady = adapter_.ensureLanNetExists(config_.lanNet);
    if (lanReady.isError()) {
        return ResultType::error(fail(lanReady.errorValue()));
    }
    if (auto cancelled = checkCancelled(role)) {
        return ResultType::error(fail(*cancelled));
    }

    RoleOutcome outcome;
    outcome.role = role;
    outcome.roleDir = config_.cfgRoot / role;
    outcome.gatewayVm = Naming::gatewayVmName(role);
    const std::string roleNet = Naming::roleNetworkName(role);

    // Step 4: role network.
    auto network = adapter_.ensureRoleNetwork(role);
    if (network.isError()) {
        return ResultType::error(fail(network.errorValue()));
    }
    outcome.networkCreated = network.value();
    if (outcome.networkCreated) {
        ledger_.recordNetwork(roleNet);
        report(ProvisioningStep::NetworkReady, "Created network '" + roleNet + "'");
    }
    else {
        report(ProvisioningStep::NetworkReady, "Network '" + roleNet + "' already exists");
    }
    if (auto cancelled = checkCancelled(role)) {
        return ResultType::error(fail(*cancelled));
    }

    // Step 5: role directory and gateway configuration.
    std::error_code ec;
    const bool dirExisted = std::filesystem::exists(outcome.roleDir, ec);
    std::filesystem::create_directories(outcome.roleDir, ec);
    if (ec) {
        return ResultType::error(fail(VmError::io(
            "Cannot create role directory " + outcome.roleDir.string() + ": " + ec.message())));
    }
    if (!dirExisted) {
        ledger_.recordRoleDirectory(outcome.roleDir);
    }

    auto staged = stageCredentialFiles(gateway, outcome.roleDir);
    if (staged.isError()) {
        return ResultType::error(fail(staged.errorValue()));
    }
    for (const auto& file : staged.value()) {
        ledger_.recordWrittenFile(file);
    }

    auto written = writeGatewayConfigFiles(gateway, outcome.roleDir);
    if (written.isError()) {
        return ResultType::error(fail(written.errorValue()));
    }
    for (const auto& file : written.value()) {
        ledger_.recordWrittenFile(file);
    }
    report(ProvisioningStep::ConfigWritten, "Wrote gateway configuration");
    if (auto cancelled = checkCancelled(role)) {
        return ResultType::error(fail(*cancelled));
    }

    // Step 6: overlay disk. An existing overlay is already a fatal precondition.
    const auto overlay = Naming::gatewayOverlayPath(config_.imagesDir, role);
    auto disk = adapter_.createOverlayDisk(tmpl->path, overlay);
    if (disk.isError()) {
        return ResultType::error(fail(disk.errorValue()));
    }
    ledger_.recordOverlayDisk(overlay);
    report(ProvisioningStep::DiskReady, "Created overlay " + overlay.string());
    if (auto cancelled = checkCancelled(role)) {
        return ResultType::error(fail(*cancelled));
    }

    // Step 7: gateway VM.
    Libvirt::GatewayVmSpec spec{
        .name = outcome.gatewayVm,
        .overlayPath = overlay,
        .lanNetwork = config_.lanNet,
        .roleNetwork = roleNet,
        .roleDir = outcome.roleDir,
        .osVariant = tmpl->osVariant.empty() ? config_.gatewayOsVariant : tmpl->osVariant,
        .ramMb = std::max(tmpl->defaultRamMb, config_.gatewayRamMb),
    };
    auto vm = adapter_.createGatewayVm(spec);
    if (vm.isError()) {
        return ResultType::error(fail(vm.errorValue()));
    }
    ledger_.recordVm(outcome.gatewayVm);
    report(ProvisioningStep::VmCreated, "Created gateway VM '" + outcome.gatewayVm + "'");

    // The gateway is usable from here on; nothing below rolls it back.
    ledger_.clear();

    // Step 8: metadata.
    RoleMeta meta;
    meta.roleName = role;
    meta.gwTemplateId = request.gwTemplateId;
    meta.appTemplateId = request.appTemplateId;
    meta.dispTemplateId = request.dispTemplateId;
    meta.gatewayMode = gateway.mode;
    auto saved = meta.save(outcome.roleDir);
    if (saved.isError()) {
        LOG_WARN(Provision, "Role metadata not saved: {}", saved.errorValue().describe());
    }
    outcome.metadataSaved = saved.isValue();
    report(ProvisioningStep::MetadataSaved, "Saved role metadata");

    // Step 9: optional first app VM.
    if (request.createAppVm) {
        if (request.appTemplateId.has_value()) {
            outcome.appVm = createFirstAppVm(role, *request.appTemplateId);
            if (outcome.appVm.has_value()) {
                report(ProvisioningStep::AppVmCreated, "Created app VM '" + *outcome.appVm + "'");
            }
        }
        else {
            LOG_WARN(Provision, "No app template selected, skipping app VM for {}", role);
        }
    }

    report(ProvisioningStep::Done, "Role '" + role + "' created");
    LOG_INFO(Provision, "Created role '{}' with gateway VM '{}'", role, outcome.gatewayVm);
    return ResultType::okay(outcome);
}

void RoleProvisioner::cancel()
{
    if (ledger_.empty()) {
        return;
    }
    report(ProvisioningStep::RollingBack, "Rolling back");
    ledger_.compensate(adapter_);
    report(ProvisioningStep::Cancelled, "Rolled back");
}

void RoleProvisioner::report(ProvisioningStep step, const std::string& message)
{
    lastStep_ = step;
    LOG_DEBUG(Provision, "[{}] {}", toString(step), message);
    if (progress_) {
        progress_(step, message);
    }
}

VmError RoleProvisioner::fail(VmError error)
{
    if (error.kind != ErrorKind::Cancelled) {
        LOG_ERROR(Provision, "{}", error.describe());
        report(ProvisioningStep::Failed, error.describe());
    }
    if (!ledger_.empty()) {
        cancel();
    }
    else if (error.kind == ErrorKind::Cancelled) {
        report(ProvisioningStep::Cancelled, error.message);
    }
    return error;
}

std::optional<VmError> RoleProvisioner::checkCancelled(const std::string& role)
{
    if (!cancelRequested_) {
        return std::nullopt;
    }
    LOG_WARN(Provision, "Provisioning of '{}' cancelled", role);
    return VmError::cancelled("Provisioning of role '" + role + "' was cancelled");
}

std::optional<std::string> RoleProvisioner::createFirstAppVm(
    const std::string& role, const std::string& appTemplateId)
{
    RoleManager manager(config_, templates_, adapter_);
    auto created = manager.addAppVm(role, appTemplateId);
    if (created.isError()) {
        LOG_WARN(Provision, "App VM not created: {}", created.errorValue().describe());
        return std::nullopt;
    }
    return created.value();
}

} // namespace Provisioning
} // namespace ProxyVm
