#pragma once

#include "core/Result.h"
#include "core/VmError.h"
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace ProxyVm {
namespace Provisioning {

enum class RoleKind {
    ProxyGateway,
    App,
    DisposableApp,
    Generic,
};

const char* toString(RoleKind kind);
std::optional<RoleKind> roleKindFromString(const std::string& text);

/**
 * @brief A registered base disk image.
 *
 * The template points at the image but does not own it; removing a
 * template leaves the file in place unless deletion is asked for.
 */
struct Template {
    std::string id;
    std::string label;
    std::filesystem::path path;
    std::string osVariant;
    RoleKind roleKind = RoleKind::Generic;
    uint32_t defaultRamMb = 1024;
    std::string notes;

    // The image exists, is a regular file, and can be opened for reading.
    Result<std::monostate, VmError> validate() const;
};

// Random version 4 UUID string.
std::string generateTemplateId();

void to_json(nlohmann::json& j, const Template& tmpl);
void from_json(const nlohmann::json& j, Template& tmpl);

} // namespace Provisioning
} // namespace ProxyVm
