#include "provisioning/RoleMeta.h"
#include "provisioning/Template.h"
#include "provisioning/TemplateRegistry.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

using namespace ProxyVm;
using namespace ProxyVm::Provisioning;

class RoleMetaTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::temp_directory_path()
            / (std::string("proxyvm_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    void TearDown() override { std::filesystem::remove_all(root_); }

    void writeFile(const std::filesystem::path& path, const std::string& content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }

    std::filesystem::path root_;
};

TEST(RoleNameTest, NormalizesCaseAndWhitespace)
{
    auto result = normalizeRoleName("  Work_VPN-2 \n");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value(), "work_vpn-2");
}

TEST(RoleNameTest, RejectsBadCharactersAndLengths)
{
    EXPECT_TRUE(normalizeRoleName("").isError());
    EXPECT_TRUE(normalizeRoleName("   ").isError());
    EXPECT_TRUE(normalizeRoleName("has space").isError());
    EXPECT_TRUE(normalizeRoleName("dot.name").isError());
    EXPECT_TRUE(normalizeRoleName("../up").isError());
    EXPECT_TRUE(normalizeRoleName(std::string(33, 'a')).isError());
    EXPECT_TRUE(normalizeRoleName(std::string(32, 'a')).isValue());
}

TEST_F(RoleMetaTest, SaveAndLoadKeepEveryField)
{
    RoleMeta meta;
    meta.roleName = "banking";
    meta.gwTemplateId = "gw-1";
    meta.appTemplateId = "app-1";
    meta.gwRamMb = 768;
    meta.gatewayMode = GatewayMode::OpenVpn;
    meta.nextAppNumber();
    meta.nextAppNumber();

    auto saved = meta.save(root_ / "banking");
    ASSERT_TRUE(saved.isValue());
    EXPECT_EQ(saved.value(), root_ / "banking" / "role-meta.json");

    auto loaded = RoleMeta::load(root_ / "banking");
    ASSERT_TRUE(loaded.isValue());
    const RoleMeta& back = loaded.value();
    EXPECT_EQ(back.roleName, "banking");
    EXPECT_EQ(back.gwTemplateId, "gw-1");
    EXPECT_EQ(back.appTemplateId, "app-1");
    EXPECT_FALSE(back.dispTemplateId.has_value());
    EXPECT_EQ(back.gwRamMb, 768u);
    EXPECT_EQ(back.gatewayMode, GatewayMode::OpenVpn);
    EXPECT_EQ(back.appVmCount, 2u);
}

TEST_F(RoleMetaTest, JsonWritesNullForUnsetFields)
{
    RoleMeta meta;
    meta.roleName = "dev";

    const nlohmann::json j = meta;
    EXPECT_EQ(j.at("role_name"), "dev");
    EXPECT_TRUE(j.at("gw_template_id").is_null());
    EXPECT_TRUE(j.at("lan_net").is_null());
    EXPECT_EQ(j.at("gateway_mode"), "ProxyChain");
    EXPECT_EQ(j.at("version"), RoleMeta::kCurrentVersion);
}

TEST_F(RoleMetaTest, LoadReportsMissingAndMalformedFilesDifferently)
{
    auto missing = RoleMeta::load(root_ / "nothing");
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.errorValue().kind, ErrorKind::NotFound);

    writeFile(root_ / "broken" / "role-meta.json", "{ not json");
    auto broken = RoleMeta::load(root_ / "broken");
    ASSERT_TRUE(broken.isError());
    EXPECT_EQ(broken.errorValue().kind, ErrorKind::PreconditionFailed);
}

TEST_F(RoleMetaTest, LoadRejectsOutOfRangeAppCounter)
{
    writeFile(
        root_ / "negative" / "role-meta.json", R"({"role_name": "negative", "app_vm_count": -1})");
    auto negative = RoleMeta::load(root_ / "negative");
    ASSERT_TRUE(negative.isError());
    EXPECT_EQ(negative.errorValue().kind, ErrorKind::PreconditionFailed);

    writeFile(
        root_ / "huge" / "role-meta.json", R"({"role_name": "huge", "app_vm_count": 4294967295})");
    auto huge = RoleMeta::load(root_ / "huge");
    ASSERT_TRUE(huge.isError());
    EXPECT_EQ(huge.errorValue().kind, ErrorKind::PreconditionFailed);

    writeFile(root_ / "max" / "role-meta.json", R"({"role_name": "max", "app_vm_count": 9999})");
    auto max = RoleMeta::load(root_ / "max");
    ASSERT_TRUE(max.isValue());
    EXPECT_EQ(max.value().appVmCount, RoleMeta::kMaxAppVmCount);
}

TEST_F(RoleMetaTest, DiscoverRolesFindsMetaOrProxyConf)
{
    writeFile(root_ / "zeta" / "role-meta.json", R"({"role_name": "zeta"})");
    writeFile(root_ / "alpha" / "proxy.conf", "GATEWAY_MODE=PROXY_CHAIN\n");
    std::filesystem::create_directories(root_ / "empty");
    writeFile(root_ / "stray.txt", "not a role");

    EXPECT_EQ(discoverRoles(root_), (std::vector<std::string>{ "alpha", "zeta" }));
    EXPECT_TRUE(roleExists(root_, "alpha"));
    EXPECT_FALSE(roleExists(root_, "empty"));
    EXPECT_TRUE(discoverRoles(root_ / "missing").empty());
}

TEST_F(RoleMetaTest, TemplateRegistryRoundTripsThroughItsFile)
{
    const auto file = root_ / "templates.json";
    writeFile(root_ / "base.qcow2", "img");

    TemplateRegistry registry(file);
    ASSERT_TRUE(registry
                    .add(Template{
                        .id = "t1",
                        .label = "Debian gateway",
                        .path = root_ / "base.qcow2",
                        .osVariant = "debian12",
                        .roleKind = RoleKind::ProxyGateway,
                        .defaultRamMb = 512,
                        .notes = "hardened",
                    })
                    .isValue());
    ASSERT_TRUE(registry
                    .add(Template{
                        .id = "t2",
                        .label = "Anything",
                        .path = root_ / "base.qcow2",
                        .osVariant = "",
                        .roleKind = RoleKind::Generic,
                        .defaultRamMb = 1024,
                        .notes = "",
                    })
                    .isValue());
    EXPECT_TRUE(registry.add(registry.all().front()).isError());
    ASSERT_TRUE(registry.save().isValue());

    auto loaded = TemplateRegistry::load(file);
    ASSERT_TRUE(loaded.isValue());
    ASSERT_EQ(loaded.value().all().size(), 2u);
    const auto t1 = loaded.value().get("t1");
    ASSERT_TRUE(t1.has_value());
    EXPECT_EQ(t1->roleKind, RoleKind::ProxyGateway);
    EXPECT_EQ(t1->notes, "hardened");

    // Generic templates are offered for every kind.
    EXPECT_EQ(loaded.value().gatewayTemplates().size(), 2u);
    EXPECT_EQ(loaded.value().appTemplates().size(), 1u);
}

TEST_F(RoleMetaTest, MissingRegistryFileIsEmpty)
{
    auto loaded = TemplateRegistry::load(root_ / "none.json");
    ASSERT_TRUE(loaded.isValue());
    EXPECT_TRUE(loaded.value().all().empty());

    writeFile(root_ / "bad.json", "[1, 2");
    EXPECT_TRUE(TemplateRegistry::load(root_ / "bad.json").isError());
}

TEST(TemplateTest, GeneratedIdsAreVersionFourUuids)
{
    const std::string id = generateTemplateId();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[14], '4');
    EXPECT_NE(id, generateTemplateId());
}
