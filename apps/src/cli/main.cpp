#include "CliParams.h"
#include "core/ConfigLoader.h"
#include "core/GlobalConfig.h"
#include "core/LoggingChannels.h"
#include "libvirt/LibvirtAdapter.h"
#include "provisioning/RoleManager.h"
#include "provisioning/RoleProvisioner.h"
#include "provisioning/TemplateManager.h"
#include "provisioning/TemplateRegistry.h"
#include <args.hxx>
#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

using namespace ProxyVm;

namespace {

struct CliCommandInfo {
    std::string target;
    std::string command;
    std::string description;
};

const std::vector<CliCommandInfo> CLI_COMMANDS = {
    { "check", "", "Verify the virsh, virt-install and qemu-img tools and libvirt access" },
    { "probe", "host:port", "Test a TCP connection, e.g. to a proxy hop" },
    { "role", "list", "List roles with their VMs" },
    { "role", "create", "Provision a role: {\"name\", \"gw_template\", \"mode\", \"hops\", ...}" },
    { "role", "delete", "Remove a role and everything derived from it: {\"name\"}" },
    { "role", "add-app", "Add an app VM: {\"name\", \"template\"?}" },
    { "role", "disposable", "Launch a transient VM: {\"name\"}" },
    { "role", "set-gateway", "Rewrite gateway config: {\"name\", \"mode\", ...}; --restart" },
    { "template", "list", "List registered templates" },
    { "template", "add", "Register an image: {\"path\", \"label\", \"role_kind\", ...}" },
    { "template", "remove", "Unregister: {\"id\"}; --delete-image also deletes the file" },
    { "vm", "list", "List VMs, optionally filtered: {\"filter\"}" },
    { "vm", "info", "Show one VM: {\"name\"}" },
    { "vm", "start", "Start a VM: {\"name\"}" },
    { "vm", "stop", "Shut down a VM: {\"name\"}" },
};

std::string getCommandListHelp()
{
    std::string help = "Commands:\n";
    for (const auto& info : CLI_COMMANDS) {
        std::string usage = info.target + (info.command.empty() ? "" : " " + info.command);
        help += "  " + usage + std::string(usage.size() < 22 ? 22 - usage.size() : 1, ' ')
            + info.description + "\n";
    }
    return help;
}

std::string getExamplesHelp()
{
    return "Examples:\n"
           "  proxy-vm check\n"
           "  proxy-vm template add '{\"path\": \"/srv/debian12.qcow2\", \"role_kind\": "
           "\"gateway\"}'\n"
           "  proxy-vm role create '{\"name\": \"work\", \"gw_template\": \"<id>\"}' "
           "--hop socks5://10.0.0.5:1080\n"
           "  proxy-vm vm start '{\"name\": \"work-gw\"}'\n";
}

int printError(const VmError& error)
{
    std::cerr << "Error: " << error.describe() << std::endl;
    const std::string remediation = error.remediation();
    if (!remediation.empty()) {
        std::cerr << "Install the missing tools with: " << remediation << std::endl;
    }
    std::cout << nlohmann::json{ { "error", Cli::toJson(error) } }.dump(2) << std::endl;
    return 1;
}

int printOkay(const nlohmann::json& result)
{
    std::cout << result.dump(2) << std::endl;
    return 0;
}

template <typename T>
int printResult(const Result<T, VmError>& result, const nlohmann::json& okay)
{
    if (result.isError()) {
        return printError(result.errorValue());
    }
    return printOkay(okay);
}

struct CliOptions {
    std::vector<std::string> hops;
    bool restart = false;
    bool deleteImage = false;
};

int runRoleCommand(
    const GlobalConfig& config,
    Provisioning::TemplateRegistry& registry,
    Libvirt::LibvirtAdapter& adapter,
    const std::string& command,
    const nlohmann::json& params,
    const CliOptions& options)
{
    Provisioning::RoleManager manager(config, registry, adapter);

    if (command == "list") {
        auto roles = manager.listRoles();
        if (roles.isError()) {
            return printError(roles.errorValue());
        }
        nlohmann::json out = nlohmann::json::array();
        for (const auto& role : roles.value()) {
            nlohmann::json entry{ { "name", role.name }, { "vms", nlohmann::json::array() } };
            if (role.meta.has_value()) {
                entry["gateway_mode"] = Provisioning::toString(role.meta->gatewayMode);
                entry["app_vm_count"] = role.meta->appVmCount;
            }
            for (const auto& vm : role.vms) {
                entry["vms"].push_back(Cli::toJson(vm));
            }
            out.push_back(entry);
        }
        return printOkay(out);
    }

    if (command == "create") {
        auto request = Cli::parseRoleRequest(params, options.hops);
        if (request.isError()) {
            return printError(request.errorValue());
        }
        Provisioning::RoleProvisioner provisioner(config, registry, adapter);
        provisioner.setProgressCallback(
            [](Provisioning::ProvisioningStep step, const std::string& message) {
                std::cerr << "[" << Provisioning::toString(step) << "] " << message << std::endl;
            });
        auto outcome = provisioner.createRole(request.value());
        if (outcome.isError()) {
            return printError(outcome.errorValue());
        }
        const auto& value = outcome.value();
        nlohmann::json out{
            { "role", value.role },
            { "role_dir", value.roleDir.string() },
            { "gateway_vm", value.gatewayVm },
            { "network_created", value.networkCreated },
            { "metadata_saved", value.metadataSaved },
        };
        out["app_vm"] =
            value.appVm.has_value() ? nlohmann::json(*value.appVm) : nlohmann::json(nullptr);
        return printOkay(out);
    }

    auto name = Cli::requiredString(params, "name");
    if (name.isError()) {
        return printError(name.errorValue());
    }

    if (command == "delete") {
        auto deleted = manager.deleteRole(name.value());
        if (deleted.isError()) {
            return printError(deleted.errorValue());
        }
        return printOkay({ { "deleted", name.value() }, { "cleanup_errors", deleted.value() } });
    }
    if (command == "add-app") {
        auto templateId = Cli::optionalString(params, "template");
        if (templateId.isError()) {
            return printError(templateId.errorValue());
        }
        auto vm = manager.addAppVm(name.value(), templateId.value());
        if (vm.isError()) {
            return printError(vm.errorValue());
        }
        return printOkay({ { "vm", vm.value() } });
    }
    if (command == "disposable") {
        auto vm = manager.launchDisposableVm(name.value());
        if (vm.isError()) {
            return printError(vm.errorValue());
        }
        return printOkay({ { "vm", vm.value() } });
    }
    if (command == "set-gateway") {
        auto gateway = Cli::parseGatewayParams(params, options.hops);
        if (gateway.isError()) {
            return printError(gateway.errorValue());
        }
        auto updated = manager.updateGatewayConfig(name.value(), gateway.value(), options.restart);
        const nlohmann::json summary{ { "updated", name.value() },
                                      { "restarted", options.restart } };
        return printResult(updated, summary);
    }

    std::cerr << "Error: unknown role command '" << command << "'\n\n" << getCommandListHelp();
    return 1;
}

int runTemplateCommand(
    Provisioning::TemplateRegistry& registry,
    Libvirt::LibvirtAdapter& adapter,
    const std::string& command,
    const nlohmann::json& params,
    const CliOptions& options)
{
    if (command == "list") {
        return printOkay(nlohmann::json(registry.all()));
    }

    Provisioning::TemplateManager manager(registry, adapter);
    if (command == "add") {
        auto tmpl = Cli::parseTemplateParams(params);
        if (tmpl.isError()) {
            return printError(tmpl.errorValue());
        }
        auto registered = manager.registerTemplate(tmpl.value());
        if (registered.isError()) {
            return printError(registered.errorValue());
        }
        return printOkay(nlohmann::json(registered.value()));
    }
    if (command == "remove") {
        auto id = Cli::requiredString(params, "id");
        if (id.isError()) {
            return printError(id.errorValue());
        }
        auto removed = manager.removeTemplate(id.value(), options.deleteImage);
        if (removed.isError()) {
            return printError(removed.errorValue());
        }
        return printOkay({ { "removed", id.value() }, { "image_deleted", options.deleteImage } });
    }

    std::cerr << "Error: unknown template command '" << command << "'\n\n"
              << getCommandListHelp();
    return 1;
}

int runVmCommand(
    const GlobalConfig& config,
    Provisioning::TemplateRegistry& registry,
    Libvirt::LibvirtAdapter& adapter,
    const std::string& command,
    const nlohmann::json& params)
{
    if (command == "list") {
        auto filter = Cli::optionalString(params, "filter");
        if (filter.isError()) {
            return printError(filter.errorValue());
        }
        auto vms = adapter.listVms(filter.value().value_or(""));
        if (vms.isError()) {
            return printError(vms.errorValue());
        }
        nlohmann::json out = nlohmann::json::array();
        for (const auto& vm : vms.value()) {
            out.push_back(Cli::toJson(vm));
        }
        return printOkay(out);
    }

    auto name = Cli::requiredString(params, "name");
    if (name.isError()) {
        return printError(name.errorValue());
    }

    if (command == "info") {
        const auto info = adapter.getVmInfo(name.value());
        if (!info.has_value()) {
            return printError(VmError::notFound("VM '" + name.value() + "' does not exist"));
        }
        nlohmann::json out = Cli::toJson(*info);
        if (const auto disk = adapter.getVmDiskPath(name.value())) {
            out["disk"] = disk->string();
            if (const auto backing = adapter.getBackingFile(*disk)) {
                out["backing_file"] = backing->string();
            }
        }
        return printOkay(out);
    }

    Provisioning::RoleManager manager(config, registry, adapter);
    if (command == "start") {
        return printResult(manager.startVm(name.value()), { { "started", name.value() } });
    }
    if (command == "stop") {
        return printResult(manager.stopVm(name.value()), { { "stopping", name.value() } });
    }

    std::cerr << "Error: unknown vm command '" << command << "'\n\n" << getCommandListHelp();
    return 1;
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "proxy-vm: manage gateway, app and disposable VM roles on libvirt.",
        getCommandListHelp() + "\n" + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for proxy-vm.json", { "config-dir" });
    args::ValueFlag<std::string> cfgRootOverride(
        parser, "cfg-root", "Override the role configuration root", { "cfg-root" });
    args::ValueFlag<std::string> imagesDirOverride(
        parser, "images-dir", "Override the libvirt images directory", { "images-dir" });
    args::ValueFlagList<std::string> hops(
        parser, "url", "Proxy hop URL, repeatable (socks5://[user:pass@]host:port)", { "hop" });
    args::Flag restart(
        parser, "restart", "role set-gateway: restart the gateway VM", { "restart" });
    args::Flag deleteImage(
        parser, "delete-image", "template remove: also delete the image file", { "delete-image" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "spec",
        "Per-channel log levels, e.g. 'command:debug,vm:warn'",
        { "log-channels" });

    args::Positional<std::string> target(
        parser, "target", "Target: 'check', 'probe', 'role', 'template' or 'vm'");
    args::Positional<std::string> command(parser, "command", "Command for the target");
    args::Positional<std::string> params(
        parser, "params", "Optional JSON object with command parameters");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    // Logs go to stderr so stdout stays clean JSON.
    LoggingChannels::initializeFromConfig("logging-config.json", "cli", true);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    }
    if (logConfig) {
        LoggingChannels::configureFromString(args::get(logConfig));
    }

    if (!target) {
        std::cerr << "Error: target is required\n\n" << parser;
        return 1;
    }
    const std::string targetName = args::get(target);
    const std::string commandName = command ? args::get(command) : "";

    auto configResult = GlobalConfig::load();
    if (configResult.isError()) {
        return printError(configResult.errorValue());
    }
    GlobalConfig config = configResult.value();
    if (cfgRootOverride) {
        config.cfgRoot = args::get(cfgRootOverride);
    }
    if (imagesDirOverride) {
        config.imagesDir = args::get(imagesDirOverride);
    }

    Libvirt::LibvirtAdapter adapter(Libvirt::LibvirtAdapter::Config::fromGlobalConfig(config));

    if (targetName == "check") {
        auto tools = adapter.checkPrerequisites();
        if (tools.isError()) {
            return printError(tools.errorValue());
        }
        auto access = adapter.checkLibvirtAccess();
        if (access.isError()) {
            return printError(access.errorValue());
        }
        const bool lanNetPresent = adapter.networkExists(config.lanNet);
        return printOkay(
            { { "tools", "ok" },
              { "libvirt", "ok" },
              { "lan_net", config.lanNet },
              { "lan_net_present", lanNetPresent } });
    }

    if (targetName == "probe") {
        auto endpoint = Cli::parseEndpoint(commandName);
        if (endpoint.isError()) {
            return printError(endpoint.errorValue());
        }
        const auto& [host, port] = endpoint.value();
        return printResult(
            adapter.testTcpConnection(host, port),
            { { "host", host }, { "port", port }, { "reachable", true } });
    }

    if (commandName.empty()) {
        std::cerr << "Error: command is required for '" << targetName << "'\n\n"
                  << getCommandListHelp();
        return 1;
    }

    auto paramsResult = Cli::parseParams(params ? args::get(params) : "");
    if (paramsResult.isError()) {
        return printError(paramsResult.errorValue());
    }

    auto registryResult = Provisioning::TemplateRegistry::load(config.templatesFile());
    if (registryResult.isError()) {
        return printError(registryResult.errorValue());
    }
    Provisioning::TemplateRegistry registry = registryResult.value();

    CliOptions options;
    options.hops = args::get(hops);
    options.restart = args::get(restart);
    options.deleteImage = args::get(deleteImage);

    if (targetName == "role") {
        return runRoleCommand(
            config, registry, adapter, commandName, paramsResult.value(), options);
    }
    if (targetName == "template") {
        return runTemplateCommand(registry, adapter, commandName, paramsResult.value(), options);
    }
    if (targetName == "vm") {
        return runVmCommand(config, registry, adapter, commandName, paramsResult.value());
    }

    std::cerr << "Error: unknown target '" << targetName << "'\n\n" << getCommandListHelp();
    return 1;
}
