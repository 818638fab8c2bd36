#include "RoleMeta.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace ProxyVm {
namespace Provisioning {

namespace {

constexpr size_t kMaxRoleNameLength = 32;

bool isRoleNameChar(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

template <typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value)
{
    if (value.has_value()) {
        j[key] = value.value();
    }
    else {
        j[key] = nullptr;
    }
}

template <typename T>
std::optional<T> getOptional(const nlohmann::json& j, const char* key)
{
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

} // namespace

uint32_t RoleMeta::nextAppNumber()
{
    return ++appVmCount;
}

Result<RoleMeta, VmError> RoleMeta::load(const std::filesystem::path& roleDir)
{
    const auto path = roleDir / kFileName;
    std::ifstream in(path);
    if (!in.is_open()) {
        return Result<RoleMeta, VmError>::error(
            VmError::notFound("No role metadata at " + path.string()));
    }

    try {
        const auto j = nlohmann::json::parse(in);
        const auto count = j.value("app_vm_count", int64_t{ 0 });
        if (count < 0 || count > kMaxAppVmCount) {
            return Result<RoleMeta, VmError>::error(VmError::precondition(
                "Invalid role metadata " + path.string() + ": app_vm_count "
                + std::to_string(count) + " is outside 0.." + std::to_string(kMaxAppVmCount)));
        }
        return Result<RoleMeta, VmError>::okay(j.get<RoleMeta>());
    }
    catch (const nlohmann::json::exception& e) {
        return Result<RoleMeta, VmError>::error(
            VmError::precondition("Invalid role metadata " + path.string() + ": " + e.what()));
    }
}

Result<std::filesystem::path, VmError> RoleMeta::save(const std::filesystem::path& roleDir) const
{
    std::error_code ec;
    std::filesystem::create_directories(roleDir, ec);
    if (ec) {
        return Result<std::filesystem::path, VmError>::error(
            VmError::io("Cannot create " + roleDir.string() + ": " + ec.message()));
    }

    const auto path = roleDir / kFileName;
    std::ofstream out(path, std::ios::trunc);
    out << nlohmann::json(*this).dump(2) << std::endl;
    if (!out.good()) {
        return Result<std::filesystem::path, VmError>::error(
            VmError::io("Cannot write role metadata " + path.string()));
    }
    LOG_DEBUG(Config, "Saved metadata for role {}", roleName);
    return Result<std::filesystem::path, VmError>::okay(path);
}

void to_json(nlohmann::json& j, const RoleMeta& meta)
{
    j = nlohmann::json{
        { "version", meta.version },
        { "role_name", meta.roleName },
        { "gateway_mode", toString(meta.gatewayMode) },
        { "app_vm_count", meta.appVmCount },
    };
    putOptional(j, "gw_template_id", meta.gwTemplateId);
    putOptional(j, "app_template_id", meta.appTemplateId);
    putOptional(j, "disp_template_id", meta.dispTemplateId);
    putOptional(j, "lan_net", meta.lanNet);
    putOptional(j, "gw_ram_mb", meta.gwRamMb);
    putOptional(j, "app_ram_mb", meta.appRamMb);
    putOptional(j, "gw_vcpus", meta.gwVcpus);
}

void from_json(const nlohmann::json& j, RoleMeta& meta)
{
    meta.version = j.value("version", RoleMeta::kCurrentVersion);
    meta.roleName = j.at("role_name").get<std::string>();
    meta.gatewayMode = gatewayModeFromString(j.value("gateway_mode", std::string("ProxyChain")))
                           .value_or(GatewayMode::ProxyChain);
    meta.appVmCount = j.value("app_vm_count", 0u);
    meta.gwTemplateId = getOptional<std::string>(j, "gw_template_id");
    meta.appTemplateId = getOptional<std::string>(j, "app_template_id");
    meta.dispTemplateId = getOptional<std::string>(j, "disp_template_id");
    meta.lanNet = getOptional<std::string>(j, "lan_net");
    meta.gwRamMb = getOptional<uint32_t>(j, "gw_ram_mb");
    meta.appRamMb = getOptional<uint32_t>(j, "app_ram_mb");
    meta.gwVcpus = getOptional<uint32_t>(j, "gw_vcpus");
}

Result<std::string, VmError> normalizeRoleName(const std::string& name)
{
    std::string normalized;
    const auto first = name.find_first_not_of(" \t\r\n");
    if (first != std::string::npos) {
        const auto last = name.find_last_not_of(" \t\r\n");
        normalized = name.substr(first, last - first + 1);
    }
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (normalized.empty() || normalized.size() > kMaxRoleNameLength) {
        return Result<std::string, VmError>::error(VmError::precondition(
            "Role name must be 1 to " + std::to_string(kMaxRoleNameLength) + " characters"));
    }
    if (!std::all_of(normalized.begin(), normalized.end(), isRoleNameChar)) {
        return Result<std::string, VmError>::error(VmError::precondition(
            "Role name '" + name + "' may only contain a-z, 0-9, '_' and '-'"));
    }
    return Result<std::string, VmError>::okay(normalized);
}

bool roleExists(const std::filesystem::path& cfgRoot, const std::string& role)
{
    std::error_code ec;
    const auto dir = cfgRoot / role;
    return std::filesystem::exists(dir / RoleMeta::kFileName, ec)
        || std::filesystem::exists(dir / GatewayConfig::kConfFileName, ec);
}

std::vector<std::string> discoverRoles(const std::filesystem::path& cfgRoot)
{
    std::vector<std::string> roles;
    std::error_code ec;
    std::filesystem::directory_iterator it(cfgRoot, ec);
    if (ec) {
        return roles;
    }
    for (const auto& entry : it) {
        std::error_code entryEc;
        if (!entry.is_directory(entryEc)) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (roleExists(cfgRoot, name)) {
            roles.push_back(name);
        }
    }
    std::sort(roles.begin(), roles.end());
    return roles;
}

} // namespace Provisioning
} // namespace ProxyVm
