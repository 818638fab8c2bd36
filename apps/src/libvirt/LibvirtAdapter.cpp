#include "LibvirtAdapter.h"
#include "Naming.h"
#include "VirshParser.h"
#include "core/GlobalConfig.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace ProxyVm {
namespace Libvirt {

namespace {

constexpr const char* kVirsh = "virsh";
constexpr const char* kVirtInstall = "virt-install";
constexpr const char* kQemuImg = "qemu-img";

struct SocketCloser {
    int fd = -1;

    ~SocketCloser()
    {
        if (fd >= 0) {
            ::close(fd);
        }
    }
};

// Removes a scratch file when it goes out of scope.
struct ScratchFile {
    std::filesystem::path path;

    ~ScratchFile()
    {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    }
};

bool containsIgnoreCase(const std::string& haystack, const std::string& needle)
{
    auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a))
                == std::tolower(static_cast<unsigned char>(b));
        });
    return it != haystack.end();
}

int remainingMs(const std::chrono::steady_clock::time_point& deadline)
{
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
        return 0;
    }
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
}

bool waitWritable(int socketFd, int timeoutMs)
{
    if (timeoutMs <= 0) {
        return false;
    }
    pollfd pfd;
    pfd.fd = socketFd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    return ::poll(&pfd, 1, timeoutMs) > 0;
}

// Tries every resolved address in turn; each gets whatever is left of the deadline.
Result<std::monostate, VmError> connectWithTimeout(
    const std::string& host, uint16_t port, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string portStr = std::to_string(port);
    struct addrinfo* result = nullptr;
    const int rc = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result);
    if (rc != 0) {
        return Result<std::monostate, VmError>::error(VmError::precondition(
            "Failed to resolve host " + host + ": " + gai_strerror(rc)));
    }

    bool connected = false;
    for (struct addrinfo* addr = result; addr != nullptr && !connected; addr = addr->ai_next) {
        if (remainingMs(deadline) <= 0) {
            break;
        }

        SocketCloser socket;
        socket.fd = ::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
        if (socket.fd < 0) {
            continue;
        }

        const int flags = fcntl(socket.fd, F_GETFL, 0);
        if (flags >= 0) {
            fcntl(socket.fd, F_SETFL, flags | O_NONBLOCK);
        }

        if (::connect(socket.fd, addr->ai_addr, addr->ai_addrlen) == 0) {
            connected = true;
            break;
        }
        if (errno != EINPROGRESS) {
            continue;
        }
        if (!waitWritable(socket.fd, remainingMs(deadline))) {
            continue;
        }

        int socketError = 0;
        socklen_t socketErrorLen = sizeof(socketError);
        if (getsockopt(socket.fd, SOL_SOCKET, SO_ERROR, &socketError, &socketErrorLen) == 0
            && socketError == 0) {
            connected = true;
        }
    }

    freeaddrinfo(result);

    if (!connected) {
        return Result<std::monostate, VmError>::error(
            VmError::precondition("Failed to connect to " + host + ":" + portStr));
    }
    return Result<std::monostate, VmError>::okay(std::monostate{});
}

std::string networkXml(const std::string& name)
{
    return "<network>\n  <name>" + name + "</name>\n  <bridge stp='on' delay='0'/>\n</network>\n";
}

Result<std::monostate, VmError> okay()
{
    return Result<std::monostate, VmError>::okay(std::monostate{});
}

} // namespace

LibvirtAdapter::Config LibvirtAdapter::Config::fromGlobalConfig(const GlobalConfig& globalConfig)
{
    Config config;
    config.imagesDir = globalConfig.imagesDir;
    config.elevationWrapper = globalConfig.elevationWrapper;
    return config;
}

LibvirtAdapter::LibvirtAdapter(Config config) : config_(std::move(config))
{
    dependencies_.commandRunner = runSubprocess;
    dependencies_.tcpConnector = connectWithTimeout;
}

LibvirtAdapter::LibvirtAdapter(TestMode mode)
    : config_(std::move(mode.config)), dependencies_(std::move(mode.dependencies))
{
    if (!dependencies_.commandRunner) {
        dependencies_.commandRunner = runSubprocess;
    }
    if (!dependencies_.tcpConnector) {
        dependencies_.tcpConnector = connectWithTimeout;
    }
}

Result<CommandOutput, VmError> LibvirtAdapter::run(
    const CommandLine& command, InvocationStrategy strategy)
{
    const CommandLine effective = applyStrategy(command, strategy, config_.elevationWrapper);
    return dependencies_.commandRunner(effective);
}

Result<CommandOutput, VmError> LibvirtAdapter::runChecked(
    const CommandLine& command, const std::string& context, InvocationStrategy strategy)
{
    auto result = run(command, strategy);
    if (result.isError()) {
        return result;
    }
    if (!result.value().success()) {
        const CommandLine effective = applyStrategy(command, strategy, config_.elevationWrapper);
        return Result<CommandOutput, VmError>::error(
            VmError::toolFailed(context, effective.toString(), result.value().stderrText));
    }
    return result;
}

InvocationStrategy LibvirtAdapter::strategyFor(const std::filesystem::path& path) const
{
    return strategyForPath(path, config_.protectedPrefixes);
}

Result<std::monostate, VmError> LibvirtAdapter::checkPrerequisites()
{
    for (const char* tool : { kVirsh, kVirtInstall, kQemuImg }) {
        auto result = runChecked({ tool, { "--version" } }, std::string(tool) + " is not usable");
        if (result.isError()) {
            return Result<std::monostate, VmError>::error(result.errorValue());
        }
    }
    return okay();
}

Result<std::monostate, VmError> LibvirtAdapter::checkLibvirtAccess()
{
    auto result = runChecked(
        { kVirsh, { "list", "--all" } },
        "Cannot talk to libvirt; check that libvirtd is running and you are in the libvirt "
        "group");
    if (result.isError()) {
        return Result<std::monostate, VmError>::error(result.errorValue());
    }
    return okay();
}

bool LibvirtAdapter::networkExists(const std::string& name)
{
    auto result = run({ kVirsh, { "net-info", name } });
    return result.isValue() && result.value().success();
}

Result<bool, VmError> LibvirtAdapter::ensureRoleNetwork(const std::string& role)
{
    const std::string name = Naming::roleNetworkName(role);
    if (networkExists(name)) {
        LOG_DEBUG(Network, "Network {} already exists", name);
        return Result<bool, VmError>::okay(false);
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.scratchDir, ec);
    std::string pathTemplate = (config_.scratchDir / (name + "-XXXXXX.xml")).string();
    const int fd = ::mkstemps(pathTemplate.data(), 4);
    if (fd < 0) {
        return Result<bool, VmError>::error(
            VmError::io("Cannot create network definition file: " + std::string(strerror(errno))));
    }
    ::close(fd);

    ScratchFile xmlFile{ pathTemplate };
    {
        std::ofstream out(xmlFile.path, std::ios::trunc);
        out << networkXml(name);
        if (!out.good()) {
            return Result<bool, VmError>::error(
                VmError::io("Cannot write network definition " + xmlFile.path.string()));
        }
    }

    auto defineResult = runChecked(
        { kVirsh, { "net-define", xmlFile.path.string() } }, "Failed to define network " + name);
    if (defineResult.isError()) {
        return Result<bool, VmError>::error(defineResult.errorValue());
    }

    auto autostartResult = runChecked(
        { kVirsh, { "net-autostart", name } }, "Failed to enable autostart for network " + name);
    if (autostartResult.isError()) {
        auto undo = run({ kVirsh, { "net-undefine", name } });
        if (undo.isError() || !undo.value().success()) {
            LOG_WARN(Network, "Could not undefine {} after autostart failure", name);
        }
        return Result<bool, VmError>::error(autostartResult.errorValue());
    }

    auto startResult =
        runChecked({ kVirsh, { "net-start", name } }, "Failed to start network " + name);
    if (startResult.isError()) {
        auto destroyed = run({ kVirsh, { "net-destroy", name } });
        auto undefined = run({ kVirsh, { "net-undefine", name } });
        if (destroyed.isError() || undefined.isError() || !undefined.value().success()) {
            LOG_WARN(Network, "Could not fully remove {} after start failure", name);
        }
        return Result<bool, VmError>::error(startResult.errorValue());
    }

    LOG_INFO(Network, "Created network {}", name);
    return Result<bool, VmError>::okay(true);
}

Result<std::monostate, VmError> LibvirtAdapter::ensureLanNetExists(const std::string& name)
{
    if (!networkExists(name)) {
        return Result<std::monostate, VmError>::error(VmError::precondition(
            "LAN network '" + name + "' does not exist; create it with virsh net-define first"));
    }
    return okay();
}

Result<std::monostate, VmError> LibvirtAdapter::destroyNetwork(const std::string& name)
{
    // Inactive networks fail net-destroy; that is fine.
    auto destroyed = run({ kVirsh, { "net-destroy", name } });
    if (destroyed.isError()) {
        return Result<std::monostate, VmError>::error(destroyed.errorValue());
    }

    auto undefined = run({ kVirsh, { "net-undefine", name } });
    if (undefined.isError()) {
        return Result<std::monostate, VmError>::error(undefined.errorValue());
    }
    const CommandOutput& output = undefined.value();
    if (!output.success() && !containsIgnoreCase(output.stderrText, "not found")) {
        return Result<std::monostate, VmError>::error(VmError::toolFailed(
            "Failed to undefine network " + name, "virsh net-undefine " + name, output.stderrText));
    }

    LOG_INFO(Network, "Removed network {}", name);
    return okay();
}

std::optional<NetworkInfo> LibvirtAdapter::getNetworkInfo(const std::string& name)
{
    auto result = run({ kVirsh, { "net-info", name } });
    if (result.isError() || !result.value().success()) {
        return std::nullopt;
    }
    return VirshParser::parseNetInfo(name, result.value().stdoutText);
}

Result<std::monostate, VmError> LibvirtAdapter::ensureImagesDir()
{
    std::error_code ec;
    if (std::filesystem::is_directory(config_.imagesDir, ec)) {
        return okay();
    }

    auto result = runChecked(
        { "mkdir", { "-p", config_.imagesDir.string() } },
        "Failed to create images directory " + config_.imagesDir.string(),
        strategyFor(config_.imagesDir));
    if (result.isError()) {
        return Result<std::monostate, VmError>::error(result.errorValue());
    }
    return okay();
}

Result<std::monostate, VmError> LibvirtAdapter::createOverlayDisk(
    const std::filesystem::path& templatePath, const std::filesystem::path& overlayPath)
{
    std::error_code ec;
    if (!std::filesystem::exists(templatePath, ec)) {
        return Result<std::monostate, VmError>::error(
            VmError::precondition("Template image not found: " + templatePath.string()));
    }
    if (std::filesystem::exists(overlayPath, ec)) {
        return Result<std::monostate, VmError>::error(
            VmError::alreadyExists("Overlay disk already exists: " + overlayPath.string()));
    }

    const InvocationStrategy strategy = strategyFor(overlayPath);

    if (overlayPath.has_parent_path()) {
        auto mkdirResult = runChecked(
            { "mkdir", { "-p", overlayPath.parent_path().string() } },
            "Failed to create directory for " + overlayPath.string(),
            strategy);
        if (mkdirResult.isError()) {
            return Result<std::monostate, VmError>::error(mkdirResult.errorValue());
        }
    }

    auto createResult = runChecked(
        { kQemuImg,
          { "create",
            "-f",
            "qcow2",
            "-F",
            "qcow2",
            "-b",
            templatePath.string(),
            overlayPath.string() } },
        "Failed to create overlay disk " + overlayPath.string(),
        strategy);
    if (createResult.isError()) {
        return Result<std::monostate, VmError>::error(createResult.errorValue());
    }

    auto chmodResult = run({ "chmod", { "644", overlayPath.string() } }, strategy);
    if (chmodResult.isError() || !chmodResult.value().success()) {
        LOG_WARN(Disk, "Could not set permissions on {}", overlayPath.string());
    }

    LOG_INFO(
        Disk,
        "Created overlay {} backed by {} ({})",
        overlayPath.string(),
        templatePath.string(),
        toString(strategy));
    return okay();
}

Result<std::monostate, VmError> LibvirtAdapter::deleteOverlayDisk(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return okay();
    }

    const InvocationStrategy strategy = strategyFor(path);
    auto result = run({ "rm", { "-f", path.string() } }, strategy);
    if (result.isError()) {
        return Result<std::monostate, VmError>::error(result.errorValue());
    }
    const CommandOutput& output = result.value();
    if (!output.success() && !containsIgnoreCase(output.stderrText, "No such file")) {
        return Result<std::monostate, VmError>::error(VmError::toolFailed(
            "Failed to delete overlay disk " + path.string(),
            applyStrategy({ "rm", { "-f", path.string() } }, strategy, config_.elevationWrapper)
                .toString(),
            output.stderrText));
    }

    LOG_INFO(Disk, "Deleted overlay {}", path.string());
    return okay();
}

std::optional<std::filesystem::path> LibvirtAdapter::getBackingFile(
    const std::filesystem::path& diskPath)
{
    // -U: running VMs hold a write lock on their disks.
    auto result = run({ kQemuImg, { "info", "-U", diskPath.string() } });
    if (result.isError() || !result.value().success()) {
        return std::nullopt;
    }
    auto backing = VirshParser::parseBackingFile(result.value().stdoutText);
    if (!backing.has_value()) {
        return std::nullopt;
    }
    return std::filesystem::path(backing.value());
}

Result<std::filesystem::path, VmError> LibvirtAdapter::copyTemplateToImagesDir(
    const std::filesystem::path& source)
{
    const std::filesystem::path destination = config_.imagesDir / source.filename();

    std::error_code ec;
    if (std::filesystem::exists(destination, ec)) {
        LOG_INFO(Disk, "Template already present at {}, reusing it", destination.string());
        return Result<std::filesystem::path, VmError>::okay(destination);
    }
    if (!std::filesystem::is_regular_file(source, ec)) {
        return Result<std::filesystem::path, VmError>::error(
            VmError::precondition("Template source is not a file: " + source.string()));
    }

    auto dirResult = ensureImagesDir();
    if (dirResult.isError()) {
        return Result<std::filesystem::path, VmError>::error(dirResult.errorValue());
    }

    const InvocationStrategy strategy = strategyFor(destination);
    auto copyResult = runChecked(
        { "cp", { source.string(), destination.string() } },
        "Failed to copy template into " + config_.imagesDir.string(),
        strategy);
    if (copyResult.isError()) {
        return Result<std::filesystem::path, VmError>::error(copyResult.errorValue());
    }

    if (strategy == InvocationStrategy::Elevated) {
        auto chownResult = run({ "chown", { "libvirt-qemu:kvm", destination.string() } }, strategy);
        if (chownResult.isError() || !chownResult.value().success()) {
            auto fallback = run({ "chown", { "root:root", destination.string() } }, strategy);
            if (fallback.isError() || !fallback.value().success()) {
                LOG_WARN(Disk, "Could not set ownership on {}", destination.string());
            }
        }
    }

    auto chmodResult = run({ "chmod", { "644", destination.string() } }, strategy);
    if (chmodResult.isError() || !chmodResult.value().success()) {
        LOG_WARN(Disk, "Could not set permissions on {}", destination.string());
    }

    LOG_INFO(Disk, "Copied template {} to {}", source.string(), destination.string());
    return Result<std::filesystem::path, VmError>::okay(destination);
}

bool LibvirtAdapter::vmExists(const std::string& name)
{
    auto result = run({ kVirsh, { "dominfo", name } });
    return result.isValue() && result.value().success();
}

Result<std::monostate, VmError> LibvirtAdapter::runVirtInstall(
    const std::string& name, const std::vector<std::string>& args)
{
    if (vmExists(name)) {
        return Result<std::monostate, VmError>::error(
            VmError::alreadyExists("VM '" + name + "' already exists"));
    }

    auto result = runChecked({ kVirtInstall, args }, "Failed to create VM '" + name + "'");
    if (result.isError()) {
        return Result<std::monostate, VmError>::error(result.errorValue());
    }

    LOG_INFO(Vm, "Created VM {}", name);
    return okay();
}

Result<std::monostate, VmError> LibvirtAdapter::createGatewayVm(const GatewayVmSpec& spec)
{
    return runVirtInstall(
        spec.name,
        {
            "--name",
            spec.name,
            "--memory",
            std::to_string(spec.ramMb),
            "--vcpus",
            std::to_string(spec.vcpus),
            "--import",
            "--disk",
            "path=" + spec.overlayPath.string() + ",format=qcow2",
            "--network",
            "network=" + spec.lanNetwork + ",model=virtio",
            "--network",
            "network=" + spec.roleNetwork + ",model=virtio",
            "--filesystem",
            "source=" + spec.roleDir.string() + ",target=proxy,accessmode=mapped",
            "--os-variant",
            spec.osVariant,
            "--noautoconsole",
        });
}

Result<std::monostate, VmError> LibvirtAdapter::createAppVm(const AppVmSpec& spec)
{
    std::vector<std::string> args = {
        "--name",
        spec.name,
        "--memory",
        std::to_string(spec.ramMb),
        "--vcpus",
        std::to_string(spec.vcpus),
        "--import",
        "--disk",
        "path=" + spec.overlayPath.string() + ",format=qcow2",
        "--network",
        "network=" + spec.roleNetwork + ",model=virtio",
    };
    if (spec.sharedDir.has_value()) {
        args.push_back("--filesystem");
        args.push_back("source=" + spec.sharedDir->string() + ",target=shared,accessmode=mapped");
    }
    args.insert(args.end(), { "--os-variant", spec.osVariant, "--noautoconsole" });

    return runVirtInstall(spec.name, args);
}

Result<std::monostate, VmError> LibvirtAdapter::createDisposableVm(const DisposableVmSpec& spec)
{
    return runVirtInstall(
        spec.name,
        {
            "--name",
            spec.name,
            "--memory",
            std::to_string(spec.ramMb),
            "--vcpus",
            std::to_string(spec.vcpus),
            "--import",
            "--disk",
            "path=" + spec.overlayPath.string() + ",format=qcow2",
            "--network",
            "network=" + spec.roleNetwork + ",model=virtio",
            "--os-variant",
            spec.osVariant,
            "--noautoconsole",
            "--transient",
        });
}

Result<std::monostate, VmError> LibvirtAdapter::startVm(const std::string& name)
{
    auto result = runChecked({ kVirsh, { "start", name } }, "Failed to start VM '" + name + "'");
    if (result.isError()) {
        return Result<std::monostate, VmError>::error(result.errorValue());
    }
    LOG_INFO(Vm, "Started {}", name);
    return okay();
}

Result<std::monostate, VmError> LibvirtAdapter::stopVm(const std::string& name)
{
    auto result = run({ kVirsh, { "shutdown", name } });
    if (result.isError()) {
        return Result<std::monostate, VmError>::error(result.errorValue());
    }
    const CommandOutput& output = result.value();
    if (!output.success() && !containsIgnoreCase(output.stderrText, "not running")) {
        return Result<std::monostate, VmError>::error(VmError::toolFailed(
            "Failed to stop VM '" + name + "'", "virsh shutdown " + name, output.stderrText));
    }
    LOG_INFO(Vm, "Requested shutdown of {}", name);
    return okay();
}

Result<std::monostate, VmError> LibvirtAdapter::destroyVm(const std::string& name)
{
    auto result = run({ kVirsh, { "destroy", name } });
    if (result.isError()) {
        return Result<std::monostate, VmError>::error(result.errorValue());
    }
    const CommandOutput& output = result.value();
    if (!output.success() && !containsIgnoreCase(output.stderrText, "not running")
        && !containsIgnoreCase(output.stderrText, "failed to get domain")
        && !containsIgnoreCase(output.stderrText, "domain not found")) {
        return Result<std::monostate, VmError>::error(VmError::toolFailed(
            "Failed to destroy VM '" + name + "'", "virsh destroy " + name, output.stderrText));
    }
    LOG_DEBUG(Vm, "Destroyed {}", name);
    return okay();
}

Result<std::monostate, VmError> LibvirtAdapter::undefineVm(const std::string& name)
{
    auto destroyed = destroyVm(name);
    if (destroyed.isError()) {
        LOG_WARN(Vm, "Destroy before undefine failed: {}", destroyed.errorValue().describe());
    }

    auto result = run({ kVirsh, { "undefine", name } });
    if (result.isError()) {
        return Result<std::monostate, VmError>::error(result.errorValue());
    }
    const CommandOutput& output = result.value();
    if (!output.success() && !containsIgnoreCase(output.stderrText, "failed to get domain")
        && !containsIgnoreCase(output.stderrText, "domain not found")) {
        return Result<std::monostate, VmError>::error(VmError::toolFailed(
            "Failed to undefine VM '" + name + "'", "virsh undefine " + name, output.stderrText));
    }
    LOG_INFO(Vm, "Undefined {}", name);
    return okay();
}

std::optional<VmInfo> LibvirtAdapter::getVmInfo(const std::string& name)
{
    auto result = run({ kVirsh, { "dominfo", name } });
    if (result.isError() || !result.value().success()) {
        return std::nullopt;
    }
    return VirshParser::parseDomInfo(name, result.value().stdoutText);
}

Result<std::vector<VmInfo>, VmError> LibvirtAdapter::listVms(const std::string& filter)
{
    auto result = runChecked({ kVirsh, { "list", "--all", "--name" } }, "Failed to list VMs");
    if (result.isError()) {
        return Result<std::vector<VmInfo>, VmError>::error(result.errorValue());
    }

    std::vector<VmInfo> vms;
    for (const auto& name : VirshParser::parseNameList(result.value().stdoutText)) {
        if (!filter.empty() && name.find(filter) == std::string::npos) {
            continue;
        }
        auto info = getVmInfo(name);
        if (info.has_value()) {
            vms.push_back(info.value());
        }
        else {
            // Listed but not queryable (e.g. vanished in between); keep it with Unknown state.
            vms.push_back(VirshParser::parseDomInfo(name, ""));
        }
    }
    return Result<std::vector<VmInfo>, VmError>::okay(vms);
}

Result<std::vector<VmInfo>, VmError> LibvirtAdapter::listRoleVms(const std::string& role)
{
    auto result = listVms(role);
    if (result.isError()) {
        return result;
    }

    std::vector<VmInfo> vms;
    for (const auto& vm : result.value()) {
        if (vm.role.has_value() && vm.role.value() == role) {
            vms.push_back(vm);
        }
    }
    return Result<std::vector<VmInfo>, VmError>::okay(vms);
}

std::optional<std::filesystem::path> LibvirtAdapter::getVmDiskPath(const std::string& name)
{
    auto result = run({ kVirsh, { "dumpxml", name } });
    if (result.isError() || !result.value().success()) {
        return std::nullopt;
    }
    auto source = VirshParser::parseDiskSource(result.value().stdoutText);
    if (!source.has_value()) {
        return std::nullopt;
    }
    return std::filesystem::path(source.value());
}

Result<std::vector<std::string>, VmError> LibvirtAdapter::getVmsUsingImage(
    const std::filesystem::path& imagePath)
{
    auto vmsResult = listVms();
    if (vmsResult.isError()) {
        return Result<std::vector<std::string>, VmError>::error(vmsResult.errorValue());
    }

    const auto image = imagePath.lexically_normal();
    std::vector<std::string> users;
    for (const auto& vm : vmsResult.value()) {
        const auto disk = getVmDiskPath(vm.name);
        if (!disk.has_value()) {
            continue;
        }
        if (disk->lexically_normal() == image) {
            users.push_back(vm.name);
            continue;
        }
        const auto backing = getBackingFile(disk.value());
        if (backing.has_value() && backing->lexically_normal() == image) {
            users.push_back(vm.name);
        }
    }

    std::sort(users.begin(), users.end());
    users.erase(std::unique(users.begin(), users.end()), users.end());
    return Result<std::vector<std::string>, VmError>::okay(users);
}

Result<std::monostate, VmError> LibvirtAdapter::testTcpConnection(
    const std::string& host, uint16_t port, std::chrono::milliseconds timeout)
{
    if (host.empty() || port == 0) {
        return Result<std::monostate, VmError>::error(
            VmError::precondition("Host and port are required for a connection test"));
    }
    auto result = dependencies_.tcpConnector(host, port, timeout);
    if (result.isValue()) {
        LOG_INFO(Network, "Reached {}:{}", host, port);
    }
    return result;
}

} // namespace Libvirt
} // namespace ProxyVm
