#include "ProvisioningLedger.h"
#include "core/LoggingChannels.h"
#include "libvirt/LibvirtAdapter.h"
#include <algorithm>
#include <system_error>

namespace ProxyVm {
namespace Provisioning {

const char* toString(ProvisioningLedger::EntryKind kind)
{
    switch (kind) {
        case ProvisioningLedger::EntryKind::Network:
            return "Network";
        case ProvisioningLedger::EntryKind::RoleDirectory:
            return "RoleDirectory";
        case ProvisioningLedger::EntryKind::OverlayDisk:
            return "OverlayDisk";
        case ProvisioningLedger::EntryKind::Vm:
            return "Vm";
    }
    return "Unknown";
}

void ProvisioningLedger::recordNetwork(const std::string& name)
{
    entries_.push_back(Entry{ .kind = EntryKind::Network, .name = name, .path = {} });
}

void ProvisioningLedger::recordRoleDirectory(const std::filesystem::path& dir)
{
    entries_.push_back(Entry{ .kind = EntryKind::RoleDirectory, .name = {}, .path = dir });
}

void ProvisioningLedger::recordOverlayDisk(const std::filesystem::path& path)
{
    entries_.push_back(Entry{ .kind = EntryKind::OverlayDisk, .name = {}, .path = path });
}

void ProvisioningLedger::recordVm(const std::string& name)
{
    entries_.push_back(Entry{ .kind = EntryKind::Vm, .name = name, .path = {} });
}

void ProvisioningLedger::recordWrittenFile(const std::filesystem::path& file)
{
    writtenFiles_.insert(file.lexically_normal());
}

bool ProvisioningLedger::contains(EntryKind kind) const
{
    return std::any_of(entries_.begin(), entries_.end(), [kind](const Entry& entry) {
        return entry.kind == kind;
    });
}

void ProvisioningLedger::clear()
{
    entries_.clear();
    writtenFiles_.clear();
}

size_t ProvisioningLedger::compensate(Libvirt::LibvirtAdapter& adapter)
{
    size_t failures = 0;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (!compensateEntry(adapter, *it)) {
            ++failures;
        }
    }
    if (!contains(EntryKind::RoleDirectory) && !writtenFiles_.empty()) {
        LOG_WARN(
            Rollback, "Removing {} files written into an existing directory", writtenFiles_.size());
        if (!removeWrittenFiles()) {
            ++failures;
        }
    }
    if (!entries_.empty()) {
        LOG_INFO(
            Rollback,
            "Rolled back {} resources ({} cleanup errors)",
            entries_.size(),
            failures);
    }
    clear();
    return failures;
}

bool ProvisioningLedger::compensateEntry(Libvirt::LibvirtAdapter& adapter, const Entry& entry)
{
    switch (entry.kind) {
        case EntryKind::Vm: {
            LOG_WARN(Rollback, "Removing VM '{}'", entry.name);
            bool ok = true;
            auto destroyed = adapter.destroyVm(entry.name);
            if (destroyed.isError()) {
                LOG_WARN(Rollback, "destroy {}: {}", entry.name, destroyed.errorValue().describe());
                ok = false;
            }
            auto undefined = adapter.undefineVm(entry.name);
            if (undefined.isError()) {
                LOG_WARN(
                    Rollback, "undefine {}: {}", entry.name, undefined.errorValue().describe());
                ok = false;
            }
            return ok;
        }
        case EntryKind::OverlayDisk: {
            LOG_WARN(Rollback, "Removing overlay disk '{}'", entry.path.string());
            auto deleted = adapter.deleteOverlayDisk(entry.path);
            if (deleted.isError()) {
                const std::string path = entry.path.string();
                LOG_WARN(Rollback, "delete {}: {}", path, deleted.errorValue().describe());
                return false;
            }
            return true;
        }
        case EntryKind::RoleDirectory:
            return removeRoleDirectory(entry.path);
        case EntryKind::Network: {
            LOG_WARN(Rollback, "Removing network '{}'", entry.name);
            auto destroyed = adapter.destroyNetwork(entry.name);
            if (destroyed.isError()) {
                LOG_WARN(Rollback, "net {}: {}", entry.name, destroyed.errorValue().describe());
                return false;
            }
            return true;
        }
    }
    return false;
}

bool ProvisioningLedger::removeRoleDirectory(const std::filesystem::path& dir)
{
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return true;
    }

    // Anything not written by this run means someone else is using the
    // directory; remove only our own files then.
    bool onlyOurFiles = true;
    std::filesystem::directory_iterator it(dir, ec);
    const std::filesystem::directory_iterator end;
    while (!ec && it != end) {
        if (writtenFiles_.count(it->path().lexically_normal()) == 0) {
            onlyOurFiles = false;
            break;
        }
        it.increment(ec);
    }
    if (ec) {
        LOG_WARN(Rollback, "Cannot list {}: {}", dir.string(), ec.message());
        return false;
    }

    if (onlyOurFiles) {
        LOG_WARN(Rollback, "Removing role directory '{}'", dir.string());
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            LOG_WARN(Rollback, "Cannot remove {}: {}", dir.string(), ec.message());
            return false;
        }
        return true;
    }

    LOG_WARN(Rollback, "Keeping role directory '{}', removing only files written", dir.string());
    return removeWrittenFiles();
}

bool ProvisioningLedger::removeWrittenFiles()
{
    bool ok = true;
    for (const auto& file : writtenFiles_) {
        std::error_code ec;
        std::filesystem::remove(file, ec);
        if (ec) {
            LOG_WARN(Rollback, "Cannot remove {}: {}", file.string(), ec.message());
            ok = false;
        }
    }
    return ok;
}

} // namespace Provisioning
} // namespace ProxyVm
