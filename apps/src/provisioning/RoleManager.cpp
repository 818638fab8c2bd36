#include "RoleManager.h"
#include "TemplateRegistry.h"
#include "core/GlobalConfig.h"
#include "core/LoggingChannels.h"
#include "libvirt/LibvirtAdapter.h"
#include "libvirt/Naming.h"
#include <algorithm>
#include <map>
#include <system_error>
#include <thread>

namespace ProxyVm {
namespace Provisioning {

namespace Naming = Libvirt::Naming;

namespace {

RoleManager::Dependencies defaultDependencies()
{
    return RoleManager::Dependencies{
        .sleep = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); },
        .now = [] { return std::chrono::system_clock::now(); },
    };
}

// Runs one teardown step, logging instead of propagating its error.
template <typename T>
bool bestEffort(const Result<T, VmError>& result, const std::string& what)
{
    if (result.isError()) {
        LOG_WARN(Vm, "{} failed: {}", what, result.errorValue().describe());
        return false;
    }
    return true;
}

Result<Template, VmError> resolveTemplate(
    const TemplateRegistry& templates,
    const std::optional<std::string>& id,
    const std::string& what)
{
    if (!id.has_value() || id->empty()) {
        return Result<Template, VmError>::error(
            VmError::precondition("No " + what + " template configured for this role"));
    }
    auto tmpl = templates.get(*id);
    if (!tmpl.has_value()) {
        return Result<Template, VmError>::error(
            VmError::precondition("Template '" + *id + "' is not registered"));
    }
    auto valid = tmpl->validate();
    if (valid.isError()) {
        return Result<Template, VmError>::error(valid.errorValue());
    }
    return Result<Template, VmError>::okay(*tmpl);
}

} // namespace

RoleManager::RoleManager(
    const GlobalConfig& config, const TemplateRegistry& templates, Libvirt::LibvirtAdapter& adapter)
    : RoleManager(config, templates, adapter, defaultDependencies())
{}

RoleManager::RoleManager(
    const GlobalConfig& config,
    const TemplateRegistry& templates,
    Libvirt::LibvirtAdapter& adapter,
    Dependencies dependencies)
    : config_(config),
      templates_(templates),
      adapter_(adapter),
      dependencies_(std::move(dependencies))
{}

Result<size_t, VmError> RoleManager::deleteRole(const std::string& roleName)
{
    auto normalized = normalizeRoleName(roleName);
    if (normalized.isError()) {
        return Result<size_t, VmError>::error(normalized.errorValue());
    }
    const std::string role = normalized.value();
    const auto roleDir = config_.cfgRoot / role;
    LOG_WARN(Vm, "Deleting role '{}' and all associated resources", role);

    size_t failures = 0;

    auto vms = adapter_.listRoleVms(role);
    if (bestEffort(vms, "Listing VMs of " + role)) {
        for (const auto& vm : vms.value()) {
            LOG_INFO(Vm, "Removing VM '{}'", vm.name);
            failures += bestEffort(adapter_.destroyVm(vm.name), "destroy " + vm.name) ? 0 : 1;
            failures += bestEffort(adapter_.undefineVm(vm.name), "undefine " + vm.name) ? 0 : 1;
        }
    }
    else {
        ++failures;
    }

    // The gateway may be missing from the listing if libvirt state is odd.
    const std::string gwName = Naming::gatewayVmName(role);
    failures += bestEffort(adapter_.destroyVm(gwName), "destroy " + gwName) ? 0 : 1;
    failures += bestEffort(adapter_.undefineVm(gwName), "undefine " + gwName) ? 0 : 1;

    const auto gwOverlay = Naming::gatewayOverlayPath(config_.imagesDir, role);
    failures += bestEffort(adapter_.deleteOverlayDisk(gwOverlay), "delete " + gwOverlay.string())
        ? 0
        : 1;
    uint32_t lastAppNumber = kMaxGuessedAppOverlays;
    auto meta = RoleMeta::load(roleDir);
    if (meta.isValue()) {
        lastAppNumber =
            std::clamp(meta.value().appVmCount, lastAppNumber, RoleMeta::kMaxAppVmCount);
    }
    else if (meta.errorValue().kind != ErrorKind::NotFound) {
        LOG_WARN(Vm, "{}; trying app overlays 1..{}", meta.errorValue().message, lastAppNumber);
    }
    for (uint32_t n = 1; n <= lastAppNumber; ++n) {
        const auto appOverlay = Naming::appOverlayPath(config_.imagesDir, role, n);
        failures +=
            bestEffort(adapter_.deleteOverlayDisk(appOverlay), "delete " + appOverlay.string())
            ? 0
            : 1;
    }

    std::error_code ec;
    std::filesystem::remove_all(Naming::disposableDir(config_.cfgRoot, role), ec);
    if (ec) {
        LOG_WARN(Vm, "Removing disposable overlays of {} failed: {}", role, ec.message());
        ++failures;
    }

    const std::string roleNet = Naming::roleNetworkName(role);
    failures += bestEffort(adapter_.destroyNetwork(roleNet), "remove network " + roleNet) ? 0 : 1;

    std::filesystem::remove_all(roleDir, ec);
    if (ec) {
        LOG_WARN(Vm, "Removing {} failed: {}", roleDir.string(), ec.message());
        ++failures;
    }

    LOG_INFO(Vm, "Deleted role '{}' ({} cleanup errors)", role, failures);
    return Result<size_t, VmError>::okay(failures);
}

Result<std::string, VmError> RoleManager::addAppVm(
    const std::string& roleName, const std::optional<std::string>& templateId)
{
    using ResultType = Result<std::string, VmError>;

    auto normalized = normalizeRoleName(roleName);
    if (normalized.isError()) {
        return ResultType::error(normalized.errorValue());
    }
    const std::string role = normalized.value();

    auto metaResult = loadMeta(role);
    if (metaResult.isError()) {
        return ResultType::error(metaResult.errorValue());
    }
    RoleMeta meta = metaResult.value();

    auto tmpl = resolveTemplate(templates_, templateId ? templateId : meta.appTemplateId, "app");
    if (tmpl.isError()) {
        return ResultType::error(tmpl.errorValue());
    }

    if (meta.appVmCount >= RoleMeta::kMaxAppVmCount) {
        return ResultType::error(VmError::precondition(
            "Role '" + role + "' already used all " + std::to_string(RoleMeta::kMaxAppVmCount)
            + " app VM numbers"));
    }
    const uint32_t number = meta.nextAppNumber();
    const std::string vmName = Naming::appVmName(role, number);
    const auto overlay = Naming::appOverlayPath(config_.imagesDir, role, number);

    auto disk = adapter_.createOverlayDisk(tmpl.value().path, overlay);
    if (disk.isError()) {
        return ResultType::error(disk.errorValue());
    }

    Libvirt::AppVmSpec spec{
        .name = vmName,
        .overlayPath = overlay,
        .roleNetwork = Naming::roleNetworkName(role),
        .osVariant =
            tmpl.value().osVariant.empty() ? config_.appOsVariant : tmpl.value().osVariant,
        .ramMb = std::max(tmpl.value().defaultRamMb, config_.appRamMb),
    };
    auto vm = adapter_.createAppVm(spec);
    if (vm.isError()) {
        bestEffort(adapter_.deleteOverlayDisk(overlay), "delete " + overlay.string());
        return ResultType::error(vm.errorValue());
    }

    auto saved = meta.save(config_.cfgRoot / role);
    if (saved.isError()) {
        LOG_WARN(Vm, "App counter for {} not saved: {}", role, saved.errorValue().describe());
    }

    LOG_INFO(Vm, "Created app VM {}", vmName);
    return ResultType::okay(vmName);
}

Result<std::string, VmError> RoleManager::launchDisposableVm(const std::string& roleName)
{
    using ResultType = Result<std::string, VmError>;

    auto normalized = normalizeRoleName(roleName);
    if (normalized.isError()) {
        return ResultType::error(normalized.errorValue());
    }
    const std::string role = normalized.value();

    auto metaResult = loadMeta(role);
    if (metaResult.isError()) {
        return ResultType::error(metaResult.errorValue());
    }
    const RoleMeta& meta = metaResult.value();

    auto tmpl = resolveTemplate(
        templates_, meta.dispTemplateId ? meta.dispTemplateId : meta.appTemplateId, "disposable");
    if (tmpl.isError()) {
        return ResultType::error(tmpl.errorValue());
    }

    const std::string stamp = Naming::timestamp(dependencies_.now());
    const std::string vmName = Naming::disposableVmName(role, stamp);
    const auto overlay = Naming::disposableOverlayPath(config_.cfgRoot, role, stamp);

    auto disk = adapter_.createOverlayDisk(tmpl.value().path, overlay);
    if (disk.isError()) {
        return ResultType::error(disk.errorValue());
    }

    Libvirt::DisposableVmSpec spec{
        .name = vmName,
        .overlayPath = overlay,
        .roleNetwork = Naming::roleNetworkName(role),
        .osVariant =
            tmpl.value().osVariant.empty() ? config_.appOsVariant : tmpl.value().osVariant,
        .ramMb = std::max(tmpl.value().defaultRamMb, config_.disposableRamMb),
    };
    auto vm = adapter_.createDisposableVm(spec);
    if (vm.isError()) {
        bestEffort(adapter_.deleteOverlayDisk(overlay), "delete " + overlay.string());
        return ResultType::error(vm.errorValue());
    }

    LOG_INFO(Vm, "Launched disposable VM {}", vmName);
    return ResultType::okay(vmName);
}

Result<std::monostate, VmError> RoleManager::updateGatewayConfig(
    const std::string& roleName, GatewayConfig gateway, bool restartGateway)
{
    using ResultType = Result<std::monostate, VmError>;

    auto normalized = normalizeRoleName(roleName);
    if (normalized.isError()) {
        return ResultType::error(normalized.errorValue());
    }
    const std::string role = normalized.value();
    const auto roleDir = config_.cfgRoot / role;

    auto metaResult = loadMeta(role);
    if (metaResult.isError()) {
        return ResultType::error(metaResult.errorValue());
    }
    RoleMeta meta = metaResult.value();

    gateway.role = role;
    auto valid = gateway.validate();
    if (valid.isError()) {
        return ResultType::error(valid.errorValue());
    }

    auto staged = stageCredentialFiles(gateway, roleDir);
    if (staged.isError()) {
        return ResultType::error(staged.errorValue());
    }
    auto written = writeGatewayConfigFiles(gateway, roleDir);
    if (written.isError()) {
        return ResultType::error(written.errorValue());
    }

    meta.gatewayMode = gateway.mode;
    auto saved = meta.save(roleDir);
    if (saved.isError()) {
        return ResultType::error(saved.errorValue());
    }
    LOG_INFO(Config, "Updated gateway configuration of {} ({})", role, toString(gateway.mode));

    if (!restartGateway) {
        return ResultType::okay(std::monostate{});
    }

    const std::string gwName = Naming::gatewayVmName(role);
    const auto info = adapter_.getVmInfo(gwName);
    if (info.has_value() && info->state == Libvirt::VmState::Running) {
        auto stopped = adapter_.stopVm(gwName);
        if (stopped.isError()) {
            return ResultType::error(stopped.errorValue());
        }
        dependencies_.sleep(kRestartPause);
    }
    return adapter_.startVm(gwName);
}

Result<std::monostate, VmError> RoleManager::startVm(const std::string& name)
{
    const auto info = adapter_.getVmInfo(name);
    if (!info.has_value()) {
        return Result<std::monostate, VmError>::error(
            VmError::notFound("VM '" + name + "' does not exist"));
    }
    if (info->state == Libvirt::VmState::Running) {
        LOG_INFO(Vm, "{} is already running", name);
        return Result<std::monostate, VmError>::okay(std::monostate{});
    }
    return adapter_.startVm(name);
}

Result<std::monostate, VmError> RoleManager::stopVm(const std::string& name)
{
    const auto info = adapter_.getVmInfo(name);
    if (!info.has_value()) {
        return Result<std::monostate, VmError>::error(
            VmError::notFound("VM '" + name + "' does not exist"));
    }
    if (info->state != Libvirt::VmState::Running) {
        LOG_INFO(Vm, "{} is not running", name);
        return Result<std::monostate, VmError>::okay(std::monostate{});
    }
    return adapter_.stopVm(name);
}

Result<std::vector<RoleSummary>, VmError> RoleManager::listRoles()
{
    using ResultType = Result<std::vector<RoleSummary>, VmError>;

    auto vms = adapter_.listVms();
    if (vms.isError()) {
        return ResultType::error(vms.errorValue());
    }

    std::map<std::string, RoleSummary> byName;
    for (const auto& role : discoverRoles(config_.cfgRoot)) {
        byName[role].name = role;
    }
    for (const auto& vm : vms.value()) {
        if (!vm.role.has_value()) {
            continue;
        }
        RoleSummary& summary = byName[*vm.role];
        summary.name = *vm.role;
        summary.vms.push_back(vm);
    }

    std::vector<RoleSummary> roles;
    roles.reserve(byName.size());
    for (auto& [name, summary] : byName) {
        auto meta = RoleMeta::load(config_.cfgRoot / name);
        if (meta.isValue()) {
            summary.meta = meta.value();
        }
        roles.push_back(std::move(summary));
    }
    return ResultType::okay(roles);
}

Result<RoleMeta, VmError> RoleManager::loadMeta(const std::string& role) const
{
    if (!roleExists(config_.cfgRoot, role)) {
        return Result<RoleMeta, VmError>::error(
            VmError::notFound("Role '" + role + "' does not exist"));
    }
    auto meta = RoleMeta::load(config_.cfgRoot / role);
    if (meta.isError() && meta.errorValue().kind == ErrorKind::NotFound) {
        // Roles that predate role-meta.json only have proxy.conf.
        RoleMeta fresh;
        fresh.roleName = role;
        return Result<RoleMeta, VmError>::okay(fresh);
    }
    return meta;
}

} // namespace Provisioning
} // namespace ProxyVm
