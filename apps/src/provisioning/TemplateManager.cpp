#include "TemplateManager.h"
#include "TemplateRegistry.h"
#include "core/LoggingChannels.h"
#include "libvirt/LibvirtAdapter.h"
#include <algorithm>
#include <iterator>

namespace ProxyVm {
namespace Provisioning {

namespace {

bool isUnder(const std::filesystem::path& path, const std::filesystem::path& dir)
{
    const auto normalizedPath = path.lexically_normal();
    const auto normalizedDir = dir.lexically_normal();
    auto mismatch = std::mismatch(
        normalizedDir.begin(), normalizedDir.end(), normalizedPath.begin(), normalizedPath.end());
    // A trailing separator leaves an empty last element on the directory.
    return mismatch.first == normalizedDir.end()
        || (std::next(mismatch.first) == normalizedDir.end() && mismatch.first->empty());
}

} // namespace

TemplateManager::TemplateManager(TemplateRegistry& registry, Libvirt::LibvirtAdapter& adapter)
    : registry_(registry), adapter_(adapter)
{}

Result<Template, VmError> TemplateManager::registerTemplate(Template tmpl)
{
    using ResultType = Result<Template, VmError>;

    if (tmpl.id.empty()) {
        tmpl.id = generateTemplateId();
    }
    if (tmpl.label.empty()) {
        tmpl.label = tmpl.path.stem().string();
    }

    auto valid = tmpl.validate();
    if (valid.isError()) {
        return ResultType::error(valid.errorValue());
    }
    if (registry_.get(tmpl.id).has_value()) {
        return ResultType::error(
            VmError::alreadyExists("Template '" + tmpl.id + "' is already registered"));
    }

    const auto& imagesDir = adapter_.config().imagesDir;
    if (!isUnder(tmpl.path, imagesDir)) {
        LOG_INFO(
            Template, "{} is outside {}, copying it in", tmpl.path.string(), imagesDir.string());
        auto copied = adapter_.copyTemplateToImagesDir(tmpl.path);
        if (copied.isError()) {
            return ResultType::error(copied.errorValue());
        }
        tmpl.path = copied.value();
    }

    auto added = registry_.add(tmpl);
    if (added.isError()) {
        return ResultType::error(added.errorValue());
    }
    auto saved = registry_.save();
    if (saved.isError()) {
        registry_.remove(tmpl.id);
        return ResultType::error(saved.errorValue());
    }
    return ResultType::okay(tmpl);
}

Result<Template, VmError> TemplateManager::removeTemplate(const std::string& id, bool deleteImage)
{
    using ResultType = Result<Template, VmError>;

    const auto tmpl = registry_.get(id);
    if (!tmpl.has_value()) {
        return ResultType::error(VmError::notFound("Template '" + id + "' is not registered"));
    }

    auto users = adapter_.getVmsUsingImage(tmpl->path);
    if (users.isError()) {
        return ResultType::error(users.errorValue());
    }
    if (!users.value().empty()) {
        std::string names;
        for (const auto& name : users.value()) {
            names += names.empty() ? name : ", " + name;
        }
        return ResultType::error(VmError::precondition(
            "Template '" + tmpl->label + "' is still used by: " + names));
    }

    if (deleteImage) {
        auto deleted = adapter_.deleteOverlayDisk(tmpl->path);
        if (deleted.isError()) {
            return ResultType::error(deleted.errorValue());
        }
    }

    registry_.remove(id);
    auto saved = registry_.save();
    if (saved.isError()) {
        return ResultType::error(saved.errorValue());
    }
    LOG_INFO(Template, "Removed template {} ({})", tmpl->label, id);
    return ResultType::okay(*tmpl);
}

} // namespace Provisioning
} // namespace ProxyVm
