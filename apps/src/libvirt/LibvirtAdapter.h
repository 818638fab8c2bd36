#pragma once

#include "CommandRunner.h"
#include "LibvirtTypes.h"
#include "core/Result.h"
#include "core/VmError.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ProxyVm {

struct GlobalConfig;

namespace Libvirt {

struct GatewayVmSpec {
    std::string name;
    std::filesystem::path overlayPath;
    std::string lanNetwork;
    std::string roleNetwork;
    // Exposed to the guest as the "proxy" 9p tag.
    std::filesystem::path roleDir;
    std::string osVariant;
    uint32_t ramMb = 1024;
    uint32_t vcpus = 1;
};

struct AppVmSpec {
    std::string name;
    std::filesystem::path overlayPath;
    std::string roleNetwork;
    std::string osVariant;
    uint32_t ramMb = 2048;
    uint32_t vcpus = 2;
    // Exposed to the guest as the "shared" 9p tag when set.
    std::optional<std::filesystem::path> sharedDir;
};

struct DisposableVmSpec {
    std::string name;
    std::filesystem::path overlayPath;
    std::string roleNetwork;
    std::string osVariant;
    uint32_t ramMb = 2048;
    uint32_t vcpus = 2;
};

/**
 * @brief Idempotent single-resource operations over virsh, virt-install and qemu-img.
 *
 * Knows nothing about roles beyond the naming conventions in Naming.h. Every
 * external call goes through run(), which applies the invocation strategy
 * (direct or elevated) chosen from the target path.
 */
class LibvirtAdapter {
public:
    struct Config {
        std::filesystem::path imagesDir = "/var/lib/libvirt/images";
        std::string elevationWrapper = "pkexec";
        std::vector<std::filesystem::path> protectedPrefixes = defaultProtectedPrefixes();
        // Where transient network XML definitions are written.
        std::filesystem::path scratchDir = std::filesystem::temp_directory_path();

        static Config fromGlobalConfig(const GlobalConfig& globalConfig);
    };

    using CommandRunnerFn = std::function<Result<CommandOutput, VmError>(const CommandLine&)>;
    using TcpConnectorFn = std::function<Result<std::monostate, VmError>(
        const std::string&, uint16_t, std::chrono::milliseconds)>;

    struct Dependencies {
        CommandRunnerFn commandRunner;
        TcpConnectorFn tcpConnector;
    };

    struct TestMode {
        Dependencies dependencies;
        Config config;
    };

    static constexpr std::chrono::milliseconds kDefaultTcpTimeout{ 5000 };

    explicit LibvirtAdapter(Config config);
    explicit LibvirtAdapter(TestMode mode);

    const Config& config() const { return config_; }

    Result<std::monostate, VmError> checkPrerequisites();
    Result<std::monostate, VmError> checkLibvirtAccess();

    // Networks.
    bool networkExists(const std::string& name);
    Result<bool, VmError> ensureRoleNetwork(const std::string& role);
    Result<std::monostate, VmError> ensureLanNetExists(const std::string& name);
    Result<std::monostate, VmError> destroyNetwork(const std::string& name);
    std::optional<NetworkInfo> getNetworkInfo(const std::string& name);

    // Disks.
    Result<std::monostate, VmError> ensureImagesDir();
    Result<std::monostate, VmError> createOverlayDisk(
        const std::filesystem::path& templatePath, const std::filesystem::path& overlayPath);
    Result<std::monostate, VmError> deleteOverlayDisk(const std::filesystem::path& path);
    std::optional<std::filesystem::path> getBackingFile(const std::filesystem::path& diskPath);
    Result<std::filesystem::path, VmError> copyTemplateToImagesDir(
        const std::filesystem::path& source);

    // VMs.
    bool vmExists(const std::string& name);
    Result<std::monostate, VmError> createGatewayVm(const GatewayVmSpec& spec);
    Result<std::monostate, VmError> createAppVm(const AppVmSpec& spec);
    Result<std::monostate, VmError> createDisposableVm(const DisposableVmSpec& spec);
    Result<std::monostate, VmError> startVm(const std::string& name);
    Result<std::monostate, VmError> stopVm(const std::string& name);
    Result<std::monostate, VmError> destroyVm(const std::string& name);
    Result<std::monostate, VmError> undefineVm(const std::string& name);
    std::optional<VmInfo> getVmInfo(const std::string& name);
    Result<std::vector<VmInfo>, VmError> listVms(const std::string& filter = "");
    Result<std::vector<VmInfo>, VmError> listRoleVms(const std::string& role);
    std::optional<std::filesystem::path> getVmDiskPath(const std::string& name);
    Result<std::vector<std::string>, VmError> getVmsUsingImage(
        const std::filesystem::path& imagePath);

    Result<std::monostate, VmError> testTcpConnection(
        const std::string& host,
        uint16_t port,
        std::chrono::milliseconds timeout = kDefaultTcpTimeout);

private:
    Result<CommandOutput, VmError> run(
        const CommandLine& command, InvocationStrategy strategy = InvocationStrategy::Direct);

    // Like run(), but a non-zero exit becomes ToolInvocationFailed with `context`.
    Result<CommandOutput, VmError> runChecked(
        const CommandLine& command,
        const std::string& context,
        InvocationStrategy strategy = InvocationStrategy::Direct);

    InvocationStrategy strategyFor(const std::filesystem::path& path) const;

    Result<std::monostate, VmError> runVirtInstall(
        const std::string& name, const std::vector<std::string>& args);

    Config config_;
    Dependencies dependencies_;
};

} // namespace Libvirt
} // namespace ProxyVm
