#include "Naming.h"
#include <cctype>
#include <ctime>

namespace ProxyVm {
namespace Libvirt {
namespace Naming {

namespace {

constexpr const char* kGatewaySuffix = "-gw";
constexpr const char* kAppInfix = "-app-";
constexpr const char* kDisposablePrefix = "disp-";

// "-YYYYmmdd-HHMMSS"
constexpr size_t kTimestampSuffixLength = 16;

bool endsWith(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size()
        && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isTimestampSuffix(const std::string& text)
{
    if (text.size() != kTimestampSuffixLength || text[0] != '-' || text[9] != '-') {
        return false;
    }
    for (size_t i = 1; i < text.size(); ++i) {
        if (i == 9) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string gatewayVmName(const std::string& role)
{
    return role + kGatewaySuffix;
}

std::string roleNetworkName(const std::string& role)
{
    return role + "-inet";
}

std::string appVmName(const std::string& role, uint32_t number)
{
    return role + kAppInfix + std::to_string(number);
}

std::string disposableVmName(const std::string& role, const std::string& timestamp)
{
    return std::string(kDisposablePrefix) + role + "-" + timestamp;
}

std::string gatewayOverlayFileName(const std::string& role)
{
    return role + "-gw.qcow2";
}

std::string appOverlayFileName(const std::string& role, uint32_t number)
{
    return role + kAppInfix + std::to_string(number) + "-overlay.qcow2";
}

std::filesystem::path gatewayOverlayPath(
    const std::filesystem::path& imagesDir, const std::string& role)
{
    return imagesDir / gatewayOverlayFileName(role);
}

std::filesystem::path appOverlayPath(
    const std::filesystem::path& imagesDir, const std::string& role, uint32_t number)
{
    return imagesDir / appOverlayFileName(role, number);
}

std::filesystem::path disposableDir(const std::filesystem::path& cfgRoot, const std::string& role)
{
    return cfgRoot / role / "disposable";
}

std::filesystem::path disposableOverlayPath(
    const std::filesystem::path& cfgRoot, const std::string& role, const std::string& timestamp)
{
    return disposableDir(cfgRoot, role) / (std::string(kDisposablePrefix) + timestamp + ".qcow2");
}

std::string timestamp(std::chrono::system_clock::time_point when)
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[32];
    const size_t length = std::strftime(buffer, sizeof(buffer), "%Y%m%d-%H%M%S", &local);
    return std::string(buffer, length);
}

VmIdentity parseVmName(const std::string& name)
{
    VmIdentity identity;

    if (endsWith(name, kGatewaySuffix) && name.size() > std::string(kGatewaySuffix).size()) {
        identity.kind = VmKind::ProxyGateway;
        identity.role = name.substr(0, name.size() - std::string(kGatewaySuffix).size());
        return identity;
    }

    // Checked before the app infix: a disposable's role part may itself contain "-app-".
    if (name.rfind(kDisposablePrefix, 0) == 0) {
        identity.kind = VmKind::DisposableApp;
        const std::string rest = name.substr(std::string(kDisposablePrefix).size());
        if (rest.size() > kTimestampSuffixLength
            && isTimestampSuffix(rest.substr(rest.size() - kTimestampSuffixLength))) {
            identity.role = rest.substr(0, rest.size() - kTimestampSuffixLength);
        }
        return identity;
    }

    const size_t appPos = name.find(kAppInfix);
    if (appPos != std::string::npos) {
        identity.kind = VmKind::App;
        if (appPos > 0) {
            identity.role = name.substr(0, appPos);
        }
        return identity;
    }

    return identity;
}

} // namespace Naming
} // namespace Libvirt
} // namespace ProxyVm
