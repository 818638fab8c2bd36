#pragma once

#include "Template.h"
#include "core/Result.h"
#include "core/VmError.h"
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ProxyVm {
namespace Provisioning {

/**
 * @brief Persistent list of registered templates, stored as JSON.
 *
 * Mutations only touch memory; call save() to persist.
 */
class TemplateRegistry {
public:
    explicit TemplateRegistry(std::filesystem::path file);

    // A missing file is an empty registry.
    static Result<TemplateRegistry, VmError> load(const std::filesystem::path& file);
    Result<std::monostate, VmError> save() const;

    Result<std::monostate, VmError> add(const Template& tmpl);
    Result<std::monostate, VmError> update(const Template& tmpl);
    std::optional<Template> remove(const std::string& id);

    std::optional<Template> get(const std::string& id) const;
    const std::vector<Template>& all() const { return templates_; }

    // Templates of `kind`, plus Generic ones.
    std::vector<Template> byRoleKind(RoleKind kind) const;
    std::vector<Template> gatewayTemplates() const { return byRoleKind(RoleKind::ProxyGateway); }
    std::vector<Template> appTemplates() const { return byRoleKind(RoleKind::App); }

    const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
    std::vector<Template> templates_;
};

} // namespace Provisioning
} // namespace ProxyVm
