#include "cli/CliParams.h"
#include <gtest/gtest.h>

using namespace ProxyVm;
using namespace ProxyVm::Cli;
using namespace ProxyVm::Provisioning;

TEST(CliParamsTest, EmptyParamsAreAnEmptyObject)
{
    auto params = parseParams("");
    ASSERT_TRUE(params.isValue());
    EXPECT_TRUE(params.value().is_object());
    EXPECT_TRUE(params.value().empty());
}

TEST(CliParamsTest, NonObjectOrBrokenJsonIsRejected)
{
    EXPECT_TRUE(parseParams("[1, 2]").isError());
    EXPECT_TRUE(parseParams("{\"name\": ").isError());
    EXPECT_TRUE(parseParams("\"work\"").isError());
}

TEST(CliParamsTest, RoleRequestReadsEveryKey)
{
    auto params = parseParams(R"({
        "name": "Work",
        "gw_template": "gw-1",
        "app_template": "app-1",
        "create_app_vm": true,
        "chain_strategy": "random",
        "hops": [
            "socks5://u:p@10.0.0.1:1080",
            {"type": "HTTP", "host": "proxy.example.net", "port": 3128, "label": "office"}
        ]
    })");
    ASSERT_TRUE(params.isValue());

    auto request = parseRoleRequest(params.value(), { "http://10.0.0.9:8080" });

    ASSERT_TRUE(request.isValue()) << request.errorValue().message;
    const RoleRequest& r = request.value();
    EXPECT_EQ(r.roleName, "Work");
    EXPECT_EQ(r.gwTemplateId, "gw-1");
    EXPECT_EQ(r.appTemplateId, "app-1");
    EXPECT_FALSE(r.dispTemplateId.has_value());
    EXPECT_TRUE(r.createAppVm);
    EXPECT_EQ(r.gateway.mode, GatewayMode::ProxyChain);
    EXPECT_EQ(r.gateway.chainStrategy, ChainStrategy::Random);
    ASSERT_EQ(r.gateway.hops.size(), 3u);
    EXPECT_EQ(r.gateway.hops[0].username, "u");
    EXPECT_EQ(r.gateway.hops[1].type, ProxyType::Http);
    EXPECT_EQ(r.gateway.hops[1].label, "office");
    EXPECT_EQ(r.gateway.hops[2].host, "10.0.0.9");
}

TEST(CliParamsTest, WrongTypedStringParamsAreErrorsNotExceptions)
{
    const auto params = nlohmann::json::parse(R"({"name": 5, "template": ["gw"], "filter": null})");

    auto name = requiredString(params, "name");
    ASSERT_TRUE(name.isError());
    EXPECT_EQ(name.errorValue().kind, ErrorKind::PreconditionFailed);
    EXPECT_NE(name.errorValue().message.find("'name' must be a string"), std::string::npos);

    EXPECT_TRUE(optionalString(params, "template").isError());

    auto filter = optionalString(params, "filter");
    ASSERT_TRUE(filter.isValue());
    EXPECT_FALSE(filter.value().has_value());

    EXPECT_TRUE(requiredString(params, "id").isError());
    EXPECT_TRUE(requiredString(nlohmann::json{ { "id", "" } }, "id").isError());
    auto id = requiredString(nlohmann::json{ { "id", "tmpl-1" } }, "id");
    ASSERT_TRUE(id.isValue());
    EXPECT_EQ(id.value(), "tmpl-1");

    EXPECT_TRUE(parseRoleRequest(nlohmann::json{
                                     { "name", "work" },
                                     { "gw_template", "g" },
                                     { "app_template", 7 },
                                 })
                    .isError());
}

TEST(CliParamsTest, RoleRequestNeedsNameAndGatewayTemplate)
{
    EXPECT_TRUE(parseRoleRequest(nlohmann::json{ { "gw_template", "g" } }).isError());
    EXPECT_TRUE(parseRoleRequest(nlohmann::json{ { "name", "work" } }).isError());
    EXPECT_TRUE(
        parseRoleRequest(nlohmann::json{ { "name", "work" }, { "gw_template", "g" } }).isValue());
}

TEST(CliParamsTest, VpnModesFillTheirSettings)
{
    auto wg = parseGatewayParams(nlohmann::json{
        { "mode", "wireguard" },
        { "wireguard_config", "/home/me/wg.conf" },
        { "route_all_traffic", false },
    });
    ASSERT_TRUE(wg.isValue());
    ASSERT_TRUE(wg.value().wireGuard.has_value());
    EXPECT_EQ(wg.value().wireGuard->configPath, "/home/me/wg.conf");
    EXPECT_EQ(wg.value().wireGuard->interfaceName, "wg0");
    EXPECT_FALSE(wg.value().wireGuard->routeAllTraffic);
    EXPECT_FALSE(wg.value().openVpn.has_value());

    auto ovpn = parseGatewayParams(nlohmann::json{
        { "mode", "OPENVPN" },
        { "openvpn_config", "client.ovpn" },
        { "openvpn_auth", "auth.txt" },
    });
    ASSERT_TRUE(ovpn.isValue());
    EXPECT_EQ(ovpn.value().mode, GatewayMode::OpenVpn);
    EXPECT_EQ(ovpn.value().openVpn->authFile, "auth.txt");

    EXPECT_TRUE(parseGatewayParams(nlohmann::json{ { "mode", "tor" } }).isError());
    const nlohmann::json badHops{ { "hops", nlohmann::json::array({ "no-scheme:1" }) } };
    EXPECT_TRUE(parseGatewayParams(badHops).isError());
    EXPECT_TRUE(parseGatewayParams(nlohmann::json::object(), { "socks5://host" }).isError());
}

TEST(CliParamsTest, HopPortsOutsideTheValidRangeAreRejected)
{
    const auto withPort = [](const nlohmann::json& port) {
        return parseGatewayParams(nlohmann::json{
            { "hops", nlohmann::json::array({ { { "host", "10.0.0.5" }, { "port", port } } }) },
        });
    };

    auto tooLarge = withPort(70000);
    ASSERT_TRUE(tooLarge.isError());
    EXPECT_EQ(tooLarge.errorValue().kind, ErrorKind::PreconditionFailed);
    EXPECT_NE(tooLarge.errorValue().message.find("70000"), std::string::npos);

    EXPECT_TRUE(withPort(-1).isError());
    EXPECT_TRUE(withPort(0).isError());
    EXPECT_TRUE(withPort(1080.5).isError());
    EXPECT_TRUE(withPort("1080").isError());

    auto highest = withPort(65535);
    ASSERT_TRUE(highest.isValue()) << highest.errorValue().message;
    EXPECT_EQ(highest.value().hops[0].port, 65535);
}

TEST(CliParamsTest, NegativeTemplateRamIsRejected)
{
    auto negative =
        parseTemplateParams(nlohmann::json{ { "path", "/a.qcow2" }, { "default_ram_mb", -512 } });
    ASSERT_TRUE(negative.isError());
    EXPECT_EQ(negative.errorValue().kind, ErrorKind::PreconditionFailed);

    auto fallback = parseTemplateParams(nlohmann::json{ { "path", "/a.qcow2" } });
    ASSERT_TRUE(fallback.isValue());
    EXPECT_EQ(fallback.value().defaultRamMb, 1024u);
}

TEST(CliParamsTest, TemplateParamsNeedAPath)
{
    auto tmpl = parseTemplateParams(nlohmann::json{
        { "path", "/isos/debian.qcow2" },
        { "label", "Debian" },
        { "role_kind", "gateway" },
        { "default_ram_mb", 768 },
    });
    ASSERT_TRUE(tmpl.isValue());
    EXPECT_EQ(tmpl.value().path, "/isos/debian.qcow2");
    EXPECT_EQ(tmpl.value().roleKind, RoleKind::ProxyGateway);
    EXPECT_EQ(tmpl.value().defaultRamMb, 768u);
    EXPECT_TRUE(tmpl.value().id.empty());

    EXPECT_TRUE(parseTemplateParams(nlohmann::json{ { "label", "x" } }).isError());
    EXPECT_TRUE(
        parseTemplateParams(nlohmann::json{ { "path", "/a" }, { "role_kind", "tank" } }).isError());
}

TEST(CliParamsTest, EndpointSplitsOnLastColon)
{
    auto endpoint = parseEndpoint("gw.local:1080");
    ASSERT_TRUE(endpoint.isValue());
    EXPECT_EQ(endpoint.value().first, "gw.local");
    EXPECT_EQ(endpoint.value().second, 1080);

    EXPECT_TRUE(parseEndpoint("gw.local").isError());
    EXPECT_TRUE(parseEndpoint(":80").isError());
    EXPECT_TRUE(parseEndpoint("gw.local:").isError());
    EXPECT_TRUE(parseEndpoint("gw.local:http").isError());
    EXPECT_TRUE(parseEndpoint("gw.local:65536").isError());
}

TEST(CliParamsTest, ErrorJsonCarriesToolDetails)
{
    const auto failed = toJson(VmError::toolFailed("Failed to start", "virsh start a", "boom\n"));
    EXPECT_EQ(failed.at("kind"), "ToolInvocationFailed");
    EXPECT_EQ(failed.at("command"), "virsh start a");
    EXPECT_EQ(failed.at("stderr"), "boom");
    EXPECT_FALSE(failed.contains("remediation"));

    const auto missing = toJson(VmError::toolNotFound("qemu-img", "qemu-img --version"));
    EXPECT_TRUE(missing.contains("remediation"));

    Libvirt::VmInfo vm;
    vm.name = "scratch";
    vm.state = Libvirt::VmState::ShutOff;
    const auto vmJson = toJson(vm);
    EXPECT_EQ(vmJson.at("state"), "shut off");
    EXPECT_TRUE(vmJson.at("role").is_null());
}
