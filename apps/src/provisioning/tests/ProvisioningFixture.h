#pragma once

#include "core/GlobalConfig.h"
#include "libvirt/LibvirtAdapter.h"
#include "provisioning/GatewayConfig.h"
#include "provisioning/Template.h"
#include "provisioning/TemplateRegistry.h"
#include "tests/FakeToolchain.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace ProxyVm {
namespace Provisioning {
namespace Tests {

/**
 * @brief Scratch cfg root, images dir and a fake libvirt host for one test.
 *
 * The LAN network exists and a gateway and an app template are registered,
 * so a role can be created without further setup.
 */
class ProvisioningFixture : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::temp_directory_path()
            / (std::string("proxyvm_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "templates");

        config_.cfgRoot = root_ / "roles";
        config_.imagesDir = root_ / "images";
        config_.lanNet = "lan-net";
        config_.elevationWrapper = "pkexec";

        toolchain_.addNetwork(config_.lanNet);

        Libvirt::LibvirtAdapter::Config adapterConfig;
        adapterConfig.imagesDir = config_.imagesDir;
        adapterConfig.elevationWrapper = config_.elevationWrapper;
        adapterConfig.scratchDir = root_ / "scratch";
        adapter_ = std::make_unique<Libvirt::LibvirtAdapter>(Libvirt::LibvirtAdapter::TestMode{
            .dependencies = { .commandRunner = toolchain_.runner(), .tcpConnector = {} },
            .config = adapterConfig,
        });

        registry_ = std::make_unique<TemplateRegistry>(config_.templatesFile());
        gatewayTemplate_ = addTemplate("gw-base", "debian12", RoleKind::ProxyGateway, 512);
        appTemplate_ = addTemplate("app-base", "fedora40", RoleKind::App, 4096);
    }

    void TearDown() override { std::filesystem::remove_all(root_); }

    // Creates a small image file and registers it without copying.
    Template addTemplate(
        const std::string& id, const std::string& osVariant, RoleKind kind, uint32_t ramMb)
    {
        const auto path = root_ / "templates" / (id + ".qcow2");
        {
            std::ofstream out(path, std::ios::binary);
            out << "qcow2 base image " << id;
        }
        Template tmpl{
            .id = id,
            .label = id,
            .path = path,
            .osVariant = osVariant,
            .roleKind = kind,
            .defaultRamMb = ramMb,
            .notes = "",
        };
        EXPECT_TRUE(registry_->add(tmpl).isValue());
        return tmpl;
    }

    std::filesystem::path roleDir(const std::string& role) const { return config_.cfgRoot / role; }

    std::filesystem::path root_;
    GlobalConfig config_;
    ProxyVm::Tests::FakeToolchain toolchain_;
    std::unique_ptr<Libvirt::LibvirtAdapter> adapter_;
    std::unique_ptr<TemplateRegistry> registry_;
    Template gatewayTemplate_;
    Template appTemplate_;
};

inline GatewayConfig makeChainGateway()
{
    GatewayConfig gateway;
    gateway.mode = GatewayMode::ProxyChain;
    gateway.chainStrategy = ChainStrategy::Strict;
    gateway.hops.push_back(ProxyHop{
        .type = ProxyType::Socks5,
        .host = "10.0.0.5",
        .port = 1080,
        .username = "",
        .password = "",
        .label = "first",
    });
    return gateway;
}

} // namespace Tests
} // namespace Provisioning
} // namespace ProxyVm
