#include "LibvirtTypes.h"

namespace ProxyVm {
namespace Libvirt {

const char* toString(VmState state)
{
    switch (state) {
        case VmState::Running:
            return "running";
        case VmState::Paused:
            return "paused";
        case VmState::ShutOff:
            return "shut off";
        case VmState::Unknown:
            return "unknown";
    }
    return "unknown";
}

const char* toString(NetworkState state)
{
    switch (state) {
        case NetworkState::Active:
            return "active";
        case NetworkState::Inactive:
            return "inactive";
        case NetworkState::Unknown:
            return "unknown";
    }
    return "unknown";
}

const char* toString(VmKind kind)
{
    switch (kind) {
        case VmKind::ProxyGateway:
            return "gateway";
        case VmKind::App:
            return "app";
        case VmKind::DisposableApp:
            return "disposable";
        case VmKind::Unknown:
            return "unknown";
    }
    return "unknown";
}

} // namespace Libvirt
} // namespace ProxyVm
