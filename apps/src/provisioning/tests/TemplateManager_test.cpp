#include "provisioning/TemplateManager.h"
#include "provisioning/TemplateRegistry.h"
#include "provisioning/tests/ProvisioningFixture.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace ProxyVm;
using namespace ProxyVm::Provisioning;
using namespace ProxyVm::Provisioning::Tests;

namespace {

class TemplateManagerTest : public ProvisioningFixture {
protected:
    std::filesystem::path writeImage(const std::filesystem::path& path)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << "qcow2 image";
        return path;
    }
};

} // namespace

TEST_F(TemplateManagerTest, RegisterCopiesOutsideImageIntoImagesDir)
{
    TemplateManager manager(*registry_, *adapter_);
    Template tmpl;
    tmpl.path = writeImage(root_ / "downloads" / "debian-12-gw.qcow2");
    tmpl.roleKind = RoleKind::ProxyGateway;

    auto result = manager.registerTemplate(tmpl);

    ASSERT_TRUE(result.isValue()) << result.errorValue().describe();
    const Template& stored = result.value();
    EXPECT_FALSE(stored.id.empty());
    EXPECT_EQ(stored.label, "debian-12-gw");
    EXPECT_EQ(stored.path, config_.imagesDir / "debian-12-gw.qcow2");
    EXPECT_TRUE(std::filesystem::exists(stored.path));
    EXPECT_EQ(toolchain_.countInvocations("cp", ""), 1u);

    // Persisted: a fresh load sees it.
    auto reloaded = TemplateRegistry::load(registry_->file());
    ASSERT_TRUE(reloaded.isValue());
    ASSERT_TRUE(reloaded.value().get(stored.id).has_value());
    EXPECT_EQ(reloaded.value().get(stored.id)->path, stored.path);
}

TEST_F(TemplateManagerTest, RegisterKeepsImageAlreadyInImagesDir)
{
    TemplateManager manager(*registry_, *adapter_);
    Template tmpl;
    tmpl.id = "in-place";
    tmpl.path = writeImage(config_.imagesDir / "in-place.qcow2");

    auto result = manager.registerTemplate(tmpl);

    ASSERT_TRUE(result.isValue()) << result.errorValue().describe();
    EXPECT_EQ(result.value().path, config_.imagesDir / "in-place.qcow2");
    EXPECT_EQ(toolchain_.countInvocations("cp", ""), 0u);
}

TEST_F(TemplateManagerTest, RegisterRejectsMissingImageAndDuplicateId)
{
    TemplateManager manager(*registry_, *adapter_);

    Template missing;
    missing.path = root_ / "nowhere.qcow2";
    auto missingResult = manager.registerTemplate(missing);
    ASSERT_TRUE(missingResult.isError());
    EXPECT_EQ(missingResult.errorValue().kind, ErrorKind::PreconditionFailed);

    Template duplicate = gatewayTemplate_;
    auto duplicateResult = manager.registerTemplate(duplicate);
    ASSERT_TRUE(duplicateResult.isError());
    EXPECT_EQ(duplicateResult.errorValue().kind, ErrorKind::AlreadyExists);
}

TEST_F(TemplateManagerTest, CopyIntoProtectedImagesDirIsElevated)
{
    Libvirt::LibvirtAdapter::Config adapterConfig = adapter_->config();
    adapterConfig.protectedPrefixes = { config_.imagesDir };
    Libvirt::LibvirtAdapter elevatedAdapter(Libvirt::LibvirtAdapter::TestMode{
        .dependencies = { .commandRunner = toolchain_.runner(), .tcpConnector = {} },
        .config = adapterConfig,
    });
    TemplateManager manager(*registry_, elevatedAdapter);
    Template tmpl;
    tmpl.path = writeImage(root_ / "downloads" / "alpine.qcow2");

    auto result = manager.registerTemplate(tmpl);

    ASSERT_TRUE(result.isValue()) << result.errorValue().describe();
    bool copyElevated = false;
    bool chownElevated = false;
    for (const auto& command : toolchain_.elevatedInvocations()) {
        copyElevated = copyElevated || command.program == "cp";
        chownElevated = chownElevated || command.program == "chown";
    }
    EXPECT_TRUE(copyElevated);
    EXPECT_TRUE(chownElevated);
}

TEST_F(TemplateManagerTest, RemoveIsRefusedWhileAVmUsesTheImage)
{
    const auto overlay = config_.imagesDir / "work-gw.qcow2";
    toolchain_.addImage(overlay, gatewayTemplate_.path);
    toolchain_.addDomain("work-gw", overlay, "running");
    TemplateManager manager(*registry_, *adapter_);

    auto result = manager.removeTemplate(gatewayTemplate_.id, true);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::PreconditionFailed);
    EXPECT_NE(result.errorValue().message.find("work-gw"), std::string::npos);
    EXPECT_TRUE(registry_->get(gatewayTemplate_.id).has_value());
    EXPECT_TRUE(std::filesystem::exists(gatewayTemplate_.path));
}

TEST_F(TemplateManagerTest, RemoveUnusedTemplateOptionallyDeletesImage)
{
    TemplateManager manager(*registry_, *adapter_);

    auto kept = manager.removeTemplate(appTemplate_.id, false);
    ASSERT_TRUE(kept.isValue()) << kept.errorValue().describe();
    EXPECT_TRUE(std::filesystem::exists(appTemplate_.path));
    EXPECT_FALSE(registry_->get(appTemplate_.id).has_value());

    auto deleted = manager.removeTemplate(gatewayTemplate_.id, true);
    ASSERT_TRUE(deleted.isValue()) << deleted.errorValue().describe();
    EXPECT_FALSE(std::filesystem::exists(gatewayTemplate_.path));

    auto missing = manager.removeTemplate("gone", false);
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.errorValue().kind, ErrorKind::NotFound);
}
