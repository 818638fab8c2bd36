#pragma once

#include "libvirt/CommandRunner.h"
#include "libvirt/LibvirtAdapter.h"
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ProxyVm::Tests {

/**
 * In-memory stand-in for virsh, virt-install and qemu-img.
 *
 * Domains and networks live in maps; qemu-img create, mkdir, rm and cp act on
 * the real filesystem so the adapter's own existence checks see them. Output
 * and error text mimic the real tools closely enough for the parsers and the
 * adapter's idempotence checks. Commands wrapped in the elevation wrapper are
 * unwrapped and recorded as elevated.
 */
class FakeToolchain {
public:
    struct Domain {
        std::string name;
        std::string state = "shut off";
        std::filesystem::path diskPath;
        std::vector<std::string> networks;
        std::vector<std::string> args;
        bool transient = false;
    };

    struct Network {
        std::string name;
        bool active = false;
        bool autostart = false;
    };

    explicit FakeToolchain(std::string elevationWrapper = "pkexec");

    void addNetwork(const std::string& name, bool active = true);
    void addDomain(
        const std::string& name,
        const std::filesystem::path& diskPath,
        const std::string& state = "shut off");
    // Registers a qcow2 image for `qemu-img info` without touching the disk.
    void addImage(
        const std::filesystem::path& path,
        const std::optional<std::filesystem::path>& backing = std::nullopt);

    bool hasNetwork(const std::string& name) const { return networks_.count(name) > 0; }
    bool hasDomain(const std::string& name) const { return domains_.count(name) > 0; }
    const Network* network(const std::string& name) const;
    const Domain* domain(const std::string& name) const;
    std::optional<std::filesystem::path> backingOf(const std::filesystem::path& image) const;

    // Every call of `program subcommand` exits with `exitCode` and `stderrText`.
    void failCommand(
        const std::string& program,
        const std::string& subcommand,
        const std::string& stderrText,
        int exitCode = 1);
    void clearFailures() { failures_.clear(); }
    // Calls to `program` fail to spawn, as if it were not installed.
    void setMissingTool(const std::string& program) { missingTools_.insert(program); }

    const std::vector<Libvirt::CommandLine>& invocations() const { return invocations_; }
    const std::vector<Libvirt::CommandLine>& elevatedInvocations() const
    {
        return elevatedInvocations_;
    }
    size_t countInvocations(const std::string& program, const std::string& subcommand) const;
    void clearInvocations();

    Libvirt::LibvirtAdapter::CommandRunnerFn runner();
    Result<Libvirt::CommandOutput, VmError> run(const Libvirt::CommandLine& command);

private:
    struct Failure {
        std::string stderrText;
        int exitCode = 1;
    };

    Libvirt::CommandOutput runVirsh(const std::vector<std::string>& args);
    Libvirt::CommandOutput runVirtInstall(const std::vector<std::string>& args);
    Libvirt::CommandOutput runQemuImg(const std::vector<std::string>& args);
    Libvirt::CommandOutput runFileCommand(
        const std::string& program, const std::vector<std::string>& args);

    std::string elevationWrapper_;
    std::map<std::string, Domain> domains_;
    std::map<std::string, Network> networks_;
    std::map<std::filesystem::path, std::optional<std::filesystem::path>> images_;
    std::map<std::string, Failure> failures_;
    std::set<std::string> missingTools_;
    std::vector<Libvirt::CommandLine> invocations_;
    std::vector<Libvirt::CommandLine> elevatedInvocations_;
};

} // namespace ProxyVm::Tests
