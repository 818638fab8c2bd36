#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ProxyVm {
namespace Libvirt {

enum class VmState {
    Running,
    Paused,
    ShutOff,
    Unknown,
};

enum class NetworkState {
    Active,
    Inactive,
    Unknown,
};

enum class VmKind {
    ProxyGateway,
    App,
    DisposableApp,
    Unknown,
};

const char* toString(VmState state);
const char* toString(NetworkState state);
const char* toString(VmKind kind);

// Kind and owning role as encoded in a domain name.
struct VmIdentity {
    VmKind kind = VmKind::Unknown;
    std::optional<std::string> role;
};

struct VmInfo {
    std::string name;
    VmState state = VmState::Unknown;
    VmKind kind = VmKind::Unknown;
    std::optional<std::string> role;
};

struct NetworkInfo {
    std::string name;
    NetworkState state = NetworkState::Unknown;
    bool autostart = false;
};

} // namespace Libvirt
} // namespace ProxyVm
