#pragma once

#include "Template.h"
#include "core/Result.h"
#include "core/VmError.h"
#include <string>
#include <variant>

namespace ProxyVm {

namespace Libvirt {
class LibvirtAdapter;
}

namespace Provisioning {

class TemplateRegistry;

/**
 * @brief Registers and removes templates, keeping images and registry in step.
 */
class TemplateManager {
public:
    TemplateManager(TemplateRegistry& registry, Libvirt::LibvirtAdapter& adapter);

    /**
     * @brief Validate, copy into the images directory if needed, and persist.
     *
     * An empty id is replaced by a generated one.
     * @return The template as stored, with its final path.
     */
    Result<Template, VmError> registerTemplate(Template tmpl);

    // Refused while any VM still uses the image directly or as a backing file.
    Result<Template, VmError> removeTemplate(const std::string& id, bool deleteImage);

private:
    TemplateRegistry& registry_;
    Libvirt::LibvirtAdapter& adapter_;
};

} // namespace Provisioning
} // namespace ProxyVm
