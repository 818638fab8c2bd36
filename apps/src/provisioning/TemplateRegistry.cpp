#include "TemplateRegistry.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace ProxyVm {
namespace Provisioning {

TemplateRegistry::TemplateRegistry(std::filesystem::path file) : file_(std::move(file))
{}

Result<TemplateRegistry, VmError> TemplateRegistry::load(const std::filesystem::path& file)
{
    TemplateRegistry registry(file);

    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        LOG_DEBUG(Template, "No template registry at {}, starting empty", file.string());
        return Result<TemplateRegistry, VmError>::okay(registry);
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        return Result<TemplateRegistry, VmError>::error(
            VmError::io("Cannot open template registry " + file.string()));
    }

    try {
        const nlohmann::json json = nlohmann::json::parse(in);
        registry.templates_ = json.value("templates", nlohmann::json::array())
                                  .get<std::vector<Template>>();
    }
    catch (const nlohmann::json::exception& e) {
        return Result<TemplateRegistry, VmError>::error(VmError::precondition(
            "Invalid template registry " + file.string() + ": " + e.what()));
    }

    LOG_DEBUG(Template, "Loaded {} templates from {}", registry.templates_.size(), file.string());
    return Result<TemplateRegistry, VmError>::okay(registry);
}

Result<std::monostate, VmError> TemplateRegistry::save() const
{
    std::error_code ec;
    if (file_.has_parent_path()) {
        std::filesystem::create_directories(file_.parent_path(), ec);
        if (ec) {
            return Result<std::monostate, VmError>::error(VmError::io(
                "Cannot create " + file_.parent_path().string() + ": " + ec.message()));
        }
    }

    std::ofstream out(file_, std::ios::trunc);
    out << nlohmann::json{ { "templates", templates_ } }.dump(2) << std::endl;
    if (!out.good()) {
        return Result<std::monostate, VmError>::error(
            VmError::io("Cannot write template registry " + file_.string()));
    }
    return Result<std::monostate, VmError>::okay(std::monostate{});
}

Result<std::monostate, VmError> TemplateRegistry::add(const Template& tmpl)
{
    if (get(tmpl.id).has_value()) {
        return Result<std::monostate, VmError>::error(
            VmError::alreadyExists("Template '" + tmpl.id + "' is already registered"));
    }
    templates_.push_back(tmpl);
    LOG_INFO(Template, "Registered template {} ({})", tmpl.label, tmpl.id);
    return Result<std::monostate, VmError>::okay(std::monostate{});
}

Result<std::monostate, VmError> TemplateRegistry::update(const Template& tmpl)
{
    auto it = std::find_if(templates_.begin(), templates_.end(), [&](const Template& existing) {
        return existing.id == tmpl.id;
    });
    if (it == templates_.end()) {
        return Result<std::monostate, VmError>::error(
            VmError::notFound("Template '" + tmpl.id + "' is not registered"));
    }
    *it = tmpl;
    return Result<std::monostate, VmError>::okay(std::monostate{});
}

std::optional<Template> TemplateRegistry::remove(const std::string& id)
{
    auto it = std::find_if(templates_.begin(), templates_.end(), [&](const Template& existing) {
        return existing.id == id;
    });
    if (it == templates_.end()) {
        return std::nullopt;
    }
    Template removed = *it;
    templates_.erase(it);
    return removed;
}

std::optional<Template> TemplateRegistry::get(const std::string& id) const
{
    for (const auto& tmpl : templates_) {
        if (tmpl.id == id) {
            return tmpl;
        }
    }
    return std::nullopt;
}

std::vector<Template> TemplateRegistry::byRoleKind(RoleKind kind) const
{
    std::vector<Template> matches;
    std::copy_if(
        templates_.begin(),
        templates_.end(),
        std::back_inserter(matches),
        [kind](const Template& tmpl) {
            return tmpl.roleKind == kind || tmpl.roleKind == RoleKind::Generic;
        });
    return matches;
}

} // namespace Provisioning
} // namespace ProxyVm
