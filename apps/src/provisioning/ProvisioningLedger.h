#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace ProxyVm {

namespace Libvirt {
class LibvirtAdapter;
}

namespace Provisioning {

/**
 * @brief Undo log for one provisioning run.
 *
 * Only resources the current run created are recorded, so compensation
 * never touches anything that existed before the run started. Entries are
 * compensated newest first. Files written into a role directory the run did
 * not create are tracked without a directory entry and deleted last.
 */
class ProvisioningLedger {
public:
    enum class EntryKind {
        Network,
        RoleDirectory,
        OverlayDisk,
        Vm,
    };

    struct Entry {
        EntryKind kind;
        // Network or VM name; empty for path entries.
        std::string name;
        // Overlay or role directory path; empty for named entries.
        std::filesystem::path path;
    };

    void recordNetwork(const std::string& name);
    // Only for a directory this run created.
    void recordRoleDirectory(const std::filesystem::path& dir);
    void recordOverlayDisk(const std::filesystem::path& path);
    void recordVm(const std::string& name);

    // Adds a file this run wrote into the role directory.
    void recordWrittenFile(const std::filesystem::path& file);

    bool empty() const { return entries_.empty() && writtenFiles_.empty(); }
    bool contains(EntryKind kind) const;
    const std::vector<Entry>& entries() const { return entries_; }
    const std::set<std::filesystem::path>& writtenFiles() const { return writtenFiles_; }

    // Forget everything without undoing it; used once a run succeeds.
    void clear();

    /**
     * @brief Undo every entry in reverse order, then clear.
     *
     * Never fails: each compensating action's error is logged and the
     * remaining actions still run.
     * @return Number of compensating actions that reported an error.
     */
    size_t compensate(Libvirt::LibvirtAdapter& adapter);

private:
    bool compensateEntry(Libvirt::LibvirtAdapter& adapter, const Entry& entry);
    bool removeRoleDirectory(const std::filesystem::path& dir);
    bool removeWrittenFiles();

    std::vector<Entry> entries_;
    std::set<std::filesystem::path> writtenFiles_;
};

const char* toString(ProvisioningLedger::EntryKind kind);

} // namespace Provisioning
} // namespace ProxyVm
