#include "libvirt/LibvirtAdapter.h"
#include "tests/FakeToolchain.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace ProxyVm;
using namespace ProxyVm::Libvirt;
using ProxyVm::Tests::FakeToolchain;

namespace {

struct TcpAttempt {
    std::string host;
    uint16_t port = 0;
    std::chrono::milliseconds timeout{ 0 };
};

class LibvirtAdapterTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::temp_directory_path()
            / (std::string("proxyvm_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "templates");

        config_.imagesDir = root_ / "images";
        config_.elevationWrapper = "pkexec";
        config_.scratchDir = root_ / "scratch";
        adapter_ = makeAdapter(config_);
    }

    void TearDown() override { std::filesystem::remove_all(root_); }

    std::unique_ptr<LibvirtAdapter> makeAdapter(const LibvirtAdapter::Config& config)
    {
        auto connector = [this](
                             const std::string& host,
                             uint16_t port,
                             std::chrono::milliseconds timeout) {
            tcpAttempts_.push_back(TcpAttempt{ host, port, timeout });
            if (host == "unreachable.example") {
                return Result<std::monostate, VmError>::error(
                    VmError::precondition("Failed to connect to " + host));
            }
            return Result<std::monostate, VmError>::okay(std::monostate{});
        };
        return std::make_unique<LibvirtAdapter>(LibvirtAdapter::TestMode{
            .dependencies = { .commandRunner = toolchain_.runner(), .tcpConnector = connector },
            .config = config,
        });
    }

    std::filesystem::path writeTemplate(const std::string& name)
    {
        const auto path = root_ / "templates" / name;
        std::ofstream out(path, std::ios::binary);
        out << "qcow2 base";
        return path;
    }

    std::filesystem::path root_;
    LibvirtAdapter::Config config_;
    FakeToolchain toolchain_;
    std::vector<TcpAttempt> tcpAttempts_;
    std::unique_ptr<LibvirtAdapter> adapter_;
};

} // namespace

TEST_F(LibvirtAdapterTest, EnsureRoleNetworkCreatesOnceThenReportsExisting)
{
    auto created = adapter_->ensureRoleNetwork("work");

    ASSERT_TRUE(created.isValue()) << created.errorValue().describe();
    EXPECT_TRUE(created.value());
    const auto* net = toolchain_.network("work-inet");
    ASSERT_NE(net, nullptr);
    EXPECT_TRUE(net->active);
    EXPECT_TRUE(net->autostart);

    // Verify: the definition file is a scratch file and does not outlive the call.
    EXPECT_TRUE(std::filesystem::is_empty(root_ / "scratch"));

    auto again = adapter_->ensureRoleNetwork("work");
    ASSERT_TRUE(again.isValue());
    EXPECT_FALSE(again.value());
    EXPECT_EQ(toolchain_.countInvocations("virsh", "net-define"), 1u);

    auto info = adapter_->getNetworkInfo("work-inet");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, NetworkState::Active);
}

/**
 * @brief Test that a network that fails to start is removed again.
 */
TEST_F(LibvirtAdapterTest, EnsureRoleNetworkUndefinesWhenStartFails)
{
    toolchain_.failCommand("virsh", "net-start", "error: bridge virbr3 is busy\n");

    auto result = adapter_->ensureRoleNetwork("work");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::ToolInvocationFailed);
    EXPECT_NE(result.errorValue().stderrText.find("busy"), std::string::npos);
    EXPECT_FALSE(toolchain_.hasNetwork("work-inet"));
}

TEST_F(LibvirtAdapterTest, EnsureRoleNetworkUndefinesWhenAutostartFails)
{
    toolchain_.failCommand("virsh", "net-autostart", "error: cannot create symlink\n");

    auto result = adapter_->ensureRoleNetwork("work");

    ASSERT_TRUE(result.isError());
    EXPECT_FALSE(toolchain_.hasNetwork("work-inet"));
    EXPECT_EQ(toolchain_.countInvocations("virsh", "net-start"), 0u);
}

TEST_F(LibvirtAdapterTest, LanNetworkMustAlreadyExist)
{
    auto missing = adapter_->ensureLanNetExists("lan-net");
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.errorValue().kind, ErrorKind::PreconditionFailed);

    toolchain_.addNetwork("lan-net");
    EXPECT_TRUE(adapter_->ensureLanNetExists("lan-net").isValue());
}

TEST_F(LibvirtAdapterTest, RemovalOfMissingResourcesSucceeds)
{
    EXPECT_TRUE(adapter_->destroyVm("ghost-gw").isValue());
    EXPECT_TRUE(adapter_->undefineVm("ghost-gw").isValue());
    EXPECT_TRUE(adapter_->destroyNetwork("ghost-inet").isValue());
    EXPECT_TRUE(adapter_->deleteOverlayDisk(root_ / "images" / "ghost-gw.qcow2").isValue());
}

TEST_F(LibvirtAdapterTest, UndefineStopsARunningVmFirst)
{
    toolchain_.addDomain("work-gw", root_ / "images" / "work-gw.qcow2", "running");

    auto result = adapter_->undefineVm("work-gw");

    ASSERT_TRUE(result.isValue()) << result.errorValue().describe();
    EXPECT_FALSE(toolchain_.hasDomain("work-gw"));
    EXPECT_EQ(toolchain_.countInvocations("virsh", "destroy"), 1u);
}

TEST_F(LibvirtAdapterTest, UnexpectedUndefineFailureKeepsToolOutput)
{
    toolchain_.addDomain("work-gw", root_ / "images" / "work-gw.qcow2");
    toolchain_.failCommand("virsh", "undefine", "error: access denied by policy\n");

    auto result = adapter_->undefineVm("work-gw");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::ToolInvocationFailed);
    EXPECT_EQ(result.errorValue().command, "virsh undefine work-gw");
    EXPECT_NE(result.errorValue().stderrText.find("access denied"), std::string::npos);
    EXPECT_TRUE(toolchain_.hasDomain("work-gw"));
}

TEST_F(LibvirtAdapterTest, StopIsANoOpForAStoppedVm)
{
    toolchain_.addDomain("work-app-1", root_ / "disk.qcow2");

    EXPECT_TRUE(adapter_->stopVm("work-app-1").isValue());
    EXPECT_EQ(adapter_->getVmInfo("work-app-1")->state, VmState::ShutOff);
}

TEST_F(LibvirtAdapterTest, OverlayIsBackedByTemplateAndNeverOverwritten)
{
    const auto base = writeTemplate("base.qcow2");
    const auto overlay = root_ / "images" / "work-gw.qcow2";

    auto created = adapter_->createOverlayDisk(base, overlay);

    ASSERT_TRUE(created.isValue()) << created.errorValue().describe();
    EXPECT_TRUE(std::filesystem::exists(overlay));
    EXPECT_EQ(adapter_->getBackingFile(overlay), base);
    EXPECT_TRUE(toolchain_.elevatedInvocations().empty());

    auto again = adapter_->createOverlayDisk(base, overlay);
    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.errorValue().kind, ErrorKind::AlreadyExists);

    auto missingBase =
        adapter_->createOverlayDisk(root_ / "nope.qcow2", root_ / "images" / "x.qcow2");
    ASSERT_TRUE(missingBase.isError());
    EXPECT_EQ(missingBase.errorValue().kind, ErrorKind::PreconditionFailed);
}

TEST_F(LibvirtAdapterTest, OverlayUnderProtectedPrefixIsElevated)
{
    LibvirtAdapter::Config protectedConfig = config_;
    protectedConfig.protectedPrefixes = { root_ / "images" };
    auto adapter = makeAdapter(protectedConfig);
    const auto base = writeTemplate("base.qcow2");
    const auto overlay = root_ / "images" / "work-gw.qcow2";

    ASSERT_TRUE(adapter->createOverlayDisk(base, overlay).isValue());

    const auto& elevated = toolchain_.elevatedInvocations();
    ASSERT_GE(elevated.size(), 2u);
    EXPECT_EQ(elevated[0].program, "mkdir");
    EXPECT_EQ(elevated[1].program, "qemu-img");
    EXPECT_EQ(
        elevated[1].args,
        (std::vector<std::string>{
            "create", "-f", "qcow2", "-F", "qcow2", "-b", base.string(), overlay.string() }));

    toolchain_.clearInvocations();
    ASSERT_TRUE(adapter->deleteOverlayDisk(overlay).isValue());
    ASSERT_EQ(toolchain_.elevatedInvocations().size(), 1u);
    EXPECT_EQ(toolchain_.elevatedInvocations()[0].program, "rm");
    EXPECT_FALSE(std::filesystem::exists(overlay));
}

TEST_F(LibvirtAdapterTest, PrerequisitesReportTheMissingTool)
{
    EXPECT_TRUE(adapter_->checkPrerequisites().isValue());
    EXPECT_TRUE(adapter_->checkLibvirtAccess().isValue());

    toolchain_.setMissingTool("virt-install");
    auto result = adapter_->checkPrerequisites();

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::ToolNotFound);
    EXPECT_NE(result.errorValue().message.find("virt-install"), std::string::npos);
}

TEST_F(LibvirtAdapterTest, ListRoleVmsMatchesParsedRoleNotSubstring)
{
    toolchain_.addDomain("work-gw", root_ / "a.qcow2", "running");
    toolchain_.addDomain("work-app-1", root_ / "b.qcow2");
    toolchain_.addDomain("disp-work-20260314-092653", root_ / "c.qcow2", "running");
    toolchain_.addDomain("workshop-gw", root_ / "d.qcow2");
    toolchain_.addDomain("win11", root_ / "e.qcow2");

    auto result = adapter_->listRoleVms("work");

    ASSERT_TRUE(result.isValue()) << result.errorValue().describe();
    std::vector<std::string> names;
    for (const auto& vm : result.value()) {
        names.push_back(vm.name);
    }
    EXPECT_EQ(
        names,
        (std::vector<std::string>{ "disp-work-20260314-092653", "work-app-1", "work-gw" }));
    EXPECT_EQ(result.value()[2].kind, VmKind::ProxyGateway);
    EXPECT_EQ(result.value()[2].state, VmState::Running);

    auto all = adapter_->listVms();
    ASSERT_TRUE(all.isValue());
    EXPECT_EQ(all.value().size(), 5u);
}

TEST_F(LibvirtAdapterTest, ImageUsersIncludeOverlaysBackedByIt)
{
    const auto base = root_ / "templates" / "base.qcow2";
    const auto overlay = root_ / "images" / "work-gw.qcow2";
    toolchain_.addImage(base);
    toolchain_.addImage(overlay, base);
    toolchain_.addDomain("work-gw", overlay, "running");
    toolchain_.addDomain("direct", base);
    toolchain_.addDomain("unrelated", root_ / "images" / "other.qcow2");

    auto users = adapter_->getVmsUsingImage(base);

    ASSERT_TRUE(users.isValue());
    EXPECT_EQ(users.value(), (std::vector<std::string>{ "direct", "work-gw" }));
    EXPECT_EQ(adapter_->getVmDiskPath("work-gw"), overlay);
}

TEST_F(LibvirtAdapterTest, DuplicateVmNameIsRejectedBeforeVirtInstall)
{
    toolchain_.addNetwork("work-inet");
    toolchain_.addDomain("work-app-1", root_ / "a.qcow2");

    auto result = adapter_->createAppVm(AppVmSpec{
        .name = "work-app-1",
        .overlayPath = root_ / "a.qcow2",
        .roleNetwork = "work-inet",
        .osVariant = "fedora40",
        .ramMb = 2048,
        .vcpus = 2,
        .sharedDir = std::nullopt,
    });

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::AlreadyExists);
    EXPECT_EQ(toolchain_.countInvocations("virt-install", ""), 0u);
}

TEST_F(LibvirtAdapterTest, GatewayVmGetsBothNetworksAndTheProxyShare)
{
    toolchain_.addNetwork("lan-net");
    toolchain_.addNetwork("work-inet");
    const auto overlay = root_ / "images" / "work-gw.qcow2";
    toolchain_.addImage(overlay);

    auto result = adapter_->createGatewayVm(GatewayVmSpec{
        .name = "work-gw",
        .overlayPath = overlay,
        .lanNetwork = "lan-net",
        .roleNetwork = "work-inet",
        .roleDir = root_ / "roles" / "work",
        .osVariant = "debian12",
        .ramMb = 512,
        .vcpus = 1,
    });

    ASSERT_TRUE(result.isValue()) << result.errorValue().describe();
    const auto* vm = toolchain_.domain("work-gw");
    ASSERT_NE(vm, nullptr);
    EXPECT_EQ(vm->networks, (std::vector<std::string>{ "lan-net", "work-inet" }));
    const std::string share =
        "source=" + (root_ / "roles" / "work").string() + ",target=proxy,accessmode=mapped";
    EXPECT_NE(std::find(vm->args.begin(), vm->args.end(), share), vm->args.end());
    EXPECT_FALSE(vm->transient);
}

TEST_F(LibvirtAdapterTest, TcpConnectionUsesInjectedConnector)
{
    EXPECT_TRUE(adapter_->testTcpConnection("10.0.0.5", 1080).isValue());
    ASSERT_EQ(tcpAttempts_.size(), 1u);
    EXPECT_EQ(tcpAttempts_[0].port, 1080);
    EXPECT_EQ(tcpAttempts_[0].timeout, LibvirtAdapter::kDefaultTcpTimeout);

    EXPECT_TRUE(adapter_->testTcpConnection("unreachable.example", 80).isError());

    // Verify: missing host or port never reaches the connector.
    EXPECT_TRUE(adapter_->testTcpConnection("", 80).isError());
    EXPECT_TRUE(adapter_->testTcpConnection("10.0.0.5", 0).isError());
    EXPECT_EQ(tcpAttempts_.size(), 2u);
}
