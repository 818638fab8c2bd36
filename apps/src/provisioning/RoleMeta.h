#pragma once

#include "GatewayConfig.h"
#include "core/Result.h"
#include "core/VmError.h"
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ProxyVm {
namespace Provisioning {

/**
 * @brief Per-role record kept in {cfgRoot}/{role}/role-meta.json.
 */
struct RoleMeta {
    static constexpr uint32_t kCurrentVersion = 1;
    static constexpr const char* kFileName = "role-meta.json";
    static constexpr uint32_t kMaxAppVmCount = 9999;

    uint32_t version = kCurrentVersion;
    std::string roleName;
    std::optional<std::string> gwTemplateId;
    std::optional<std::string> appTemplateId;
    std::optional<std::string> dispTemplateId;
    std::optional<std::string> lanNet;
    std::optional<uint32_t> gwRamMb;
    std::optional<uint32_t> appRamMb;
    std::optional<uint32_t> gwVcpus;
    GatewayMode gatewayMode = GatewayMode::ProxyChain;
    // Highest app ordinal handed out so far; never decreases.
    uint32_t appVmCount = 0;

    // Increments the counter and returns the new ordinal. Callers check
    // appVmCount against kMaxAppVmCount first.
    uint32_t nextAppNumber();

    static Result<RoleMeta, VmError> load(const std::filesystem::path& roleDir);
    Result<std::filesystem::path, VmError> save(const std::filesystem::path& roleDir) const;
};

void to_json(nlohmann::json& j, const RoleMeta& meta);
void from_json(const nlohmann::json& j, RoleMeta& meta);

/**
 * @brief Trims and lowercases, then checks ^[a-z0-9_-]{1,32}$.
 * @return The normalized name.
 */
Result<std::string, VmError> normalizeRoleName(const std::string& name);

// A role exists when its directory holds role-meta.json or proxy.conf.
bool roleExists(const std::filesystem::path& cfgRoot, const std::string& role);

// Sorted names of every existing role under cfgRoot.
std::vector<std::string> discoverRoles(const std::filesystem::path& cfgRoot);

} // namespace Provisioning
} // namespace ProxyVm
