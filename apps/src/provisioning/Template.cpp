#include "Template.h"
#include <array>
#include <cstdio>
#include <fstream>
#include <random>
#include <system_error>

namespace ProxyVm {
namespace Provisioning {

namespace {

std::mt19937_64& getRandomEngine()
{
    thread_local std::mt19937_64 engine{ std::random_device{}() };
    return engine;
}

} // namespace

const char* toString(RoleKind kind)
{
    switch (kind) {
        case RoleKind::ProxyGateway:
            return "ProxyGateway";
        case RoleKind::App:
            return "App";
        case RoleKind::DisposableApp:
            return "DisposableApp";
        case RoleKind::Generic:
            return "Generic";
    }
    return "Generic";
}

std::optional<RoleKind> roleKindFromString(const std::string& text)
{
    if (text == "ProxyGateway" || text == "gateway") return RoleKind::ProxyGateway;
    if (text == "App" || text == "app") return RoleKind::App;
    if (text == "DisposableApp" || text == "disposable") return RoleKind::DisposableApp;
    if (text == "Generic" || text == "generic") return RoleKind::Generic;
    return std::nullopt;
}

Result<std::monostate, VmError> Template::validate() const
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<std::monostate, VmError>::error(
            VmError::precondition("Template image not found: " + path.string()));
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Result<std::monostate, VmError>::error(
            VmError::precondition("Template image is not a regular file: " + path.string()));
    }
    std::ifstream probe(path, std::ios::binary);
    if (!probe.is_open()) {
        return Result<std::monostate, VmError>::error(
            VmError::precondition("Template image is not readable: " + path.string()));
    }
    return Result<std::monostate, VmError>::okay(std::monostate{});
}

std::string generateTemplateId()
{
    std::uniform_int_distribution<uint64_t> dist;
    auto& engine = getRandomEngine();
    const uint64_t high = dist(engine);
    const uint64_t low = dist(engine);

    std::array<uint8_t, 16> bytes{};
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>((high >> (56 - i * 8)) & 0xFF);
        bytes[i + 8] = static_cast<uint8_t>((low >> (56 - i * 8)) & 0xFF);
    }

    // Version 4 (random) and RFC 4122 variant.
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    char text[37];
    std::snprintf(
        text,
        sizeof(text),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0],
        bytes[1],
        bytes[2],
        bytes[3],
        bytes[4],
        bytes[5],
        bytes[6],
        bytes[7],
        bytes[8],
        bytes[9],
        bytes[10],
        bytes[11],
        bytes[12],
        bytes[13],
        bytes[14],
        bytes[15]);
    return std::string(text);
}

void to_json(nlohmann::json& j, const Template& tmpl)
{
    j = nlohmann::json{
        { "id", tmpl.id },
        { "label", tmpl.label },
        { "path", tmpl.path.string() },
        { "os_variant", tmpl.osVariant },
        { "role_kind", toString(tmpl.roleKind) },
        { "default_ram_mb", tmpl.defaultRamMb },
        { "notes", tmpl.notes },
    };
}

void from_json(const nlohmann::json& j, Template& tmpl)
{
    tmpl.id = j.at("id").get<std::string>();
    tmpl.label = j.value("label", std::string());
    tmpl.path = j.at("path").get<std::string>();
    tmpl.osVariant = j.value("os_variant", std::string());
    tmpl.roleKind =
        roleKindFromString(j.value("role_kind", std::string("Generic")))
            .value_or(RoleKind::Generic);
    tmpl.defaultRamMb = j.value("default_ram_mb", 1024u);
    tmpl.notes = j.value("notes", std::string());
}

} // namespace Provisioning
} // namespace ProxyVm
