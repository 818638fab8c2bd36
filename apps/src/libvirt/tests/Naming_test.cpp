#include "libvirt/Naming.h"
#include <chrono>
#include <ctime>
#include <gtest/gtest.h>

using namespace ProxyVm::Libvirt;

TEST(NamingTest, ResourceNamesFollowTheConvention)
{
    EXPECT_EQ(Naming::gatewayVmName("work"), "work-gw");
    EXPECT_EQ(Naming::roleNetworkName("work"), "work-inet");
    EXPECT_EQ(Naming::appVmName("work", 3), "work-app-3");
    EXPECT_EQ(Naming::disposableVmName("work", "20260101-000000"), "disp-work-20260101-000000");
    EXPECT_EQ(Naming::gatewayOverlayFileName("work"), "work-gw.qcow2");
    EXPECT_EQ(Naming::appOverlayFileName("work", 2), "work-app-2-overlay.qcow2");
    EXPECT_EQ(
        Naming::gatewayOverlayPath("/var/lib/libvirt/images", "work"),
        std::filesystem::path("/var/lib/libvirt/images/work-gw.qcow2"));
    EXPECT_EQ(
        Naming::disposableOverlayPath("/cfg", "work", "20260101-000000"),
        std::filesystem::path("/cfg/work/disposable/disp-20260101-000000.qcow2"));
}

TEST(NamingTest, TimestampIsLocalCompactDateTime)
{
    std::tm local{};
    local.tm_year = 2025 - 1900;
    local.tm_mon = 11;
    local.tm_mday = 31;
    local.tm_hour = 23;
    local.tm_min = 5;
    local.tm_sec = 9;
    local.tm_isdst = -1;
    const auto when = std::chrono::system_clock::from_time_t(std::mktime(&local));

    EXPECT_EQ(Naming::timestamp(when), "20251231-230509");
}

TEST(NamingTest, ParseVmNameRecognizesEachKind)
{
    const VmIdentity gateway = Naming::parseVmName("banking-gw");
    EXPECT_EQ(gateway.kind, VmKind::ProxyGateway);
    EXPECT_EQ(gateway.role, "banking");

    const VmIdentity app = Naming::parseVmName("banking-app-12");
    EXPECT_EQ(app.kind, VmKind::App);
    EXPECT_EQ(app.role, "banking");

    const VmIdentity disposable = Naming::parseVmName("disp-banking-20260314-092653");
    EXPECT_EQ(disposable.kind, VmKind::DisposableApp);
    EXPECT_EQ(disposable.role, "banking");

    const VmIdentity other = Naming::parseVmName("win11");
    EXPECT_EQ(other.kind, VmKind::Unknown);
    EXPECT_FALSE(other.role.has_value());
}

TEST(NamingTest, DisposablePrefixWinsOverAppInfix)
{
    const VmIdentity identity = Naming::parseVmName("disp-my-app-1-20260314-092653");
    EXPECT_EQ(identity.kind, VmKind::DisposableApp);
    EXPECT_EQ(identity.role, "my-app-1");

    // Malformed timestamp: still disposable, but the role is unknown.
    const VmIdentity malformed = Naming::parseVmName("disp-work-yesterday");
    EXPECT_EQ(malformed.kind, VmKind::DisposableApp);
    EXPECT_FALSE(malformed.role.has_value());

    EXPECT_EQ(Naming::parseVmName("-gw").kind, VmKind::Unknown);
    EXPECT_FALSE(Naming::parseVmName("-app-1").role.has_value());
}
