#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace ProxyVm {

namespace {

std::optional<std::filesystem::path> envPath(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}

std::optional<std::filesystem::path> userConfigDir()
{
    if (auto xdg = envPath("XDG_CONFIG_HOME")) {
        return *xdg / ConfigLoader::kAppDirName;
    }
    if (auto home = envPath("HOME")) {
        return *home / ".config" / ConfigLoader::kAppDirName;
    }
    return std::nullopt;
}

} // namespace

std::optional<std::filesystem::path> ConfigLoader::overrideDir_;

void ConfigLoader::setConfigDir(const std::filesystem::path& dir)
{
    overrideDir_ = dir;
}

void ConfigLoader::clearConfigDir()
{
    overrideDir_.reset();
}

std::vector<std::filesystem::path> ConfigLoader::searchPaths()
{
    std::vector<std::filesystem::path> paths;
    if (overrideDir_.has_value()) {
        paths.push_back(*overrideDir_);
    }
    if (auto env = envPath(kEnvConfigDir)) {
        paths.push_back(*env);
    }

    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / "config");
    }

    if (auto user = userConfigDir()) {
        paths.push_back(*user);
    }
    paths.push_back(std::filesystem::path("/etc") / kAppDirName);
    return paths;
}

std::filesystem::path ConfigLoader::writableConfigDir()
{
    if (overrideDir_.has_value()) {
        return *overrideDir_;
    }
    if (auto env = envPath(kEnvConfigDir)) {
        return *env;
    }
    if (auto user = userConfigDir()) {
        return *user;
    }
    return std::filesystem::path("/etc") / kAppDirName;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    for (const auto& dir : searchPaths()) {
        std::error_code ec;
        for (const auto& candidate : { dir / (filename + ".local"), dir / filename }) {
            if (std::filesystem::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

Result<nlohmann::json, VmError> ConfigLoader::readJsonFile(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size == 0) {
        LOG_WARN(Config, "Config file {} is empty or unreadable", path.string());
        return Result<nlohmann::json, VmError>::error(
            VmError::precondition("Config file is empty or unreadable: " + path.string()));
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return Result<nlohmann::json, VmError>::error(
            VmError::io("Cannot open config file " + path.string()));
    }

    try {
        return Result<nlohmann::json, VmError>::okay(nlohmann::json::parse(in));
    }
    catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR(Config, "Malformed JSON in {}: {}", path.string(), e.what());
        return Result<nlohmann::json, VmError>::error(
            VmError::precondition("Malformed JSON in " + path.string() + ": " + e.what()));
    }
}

Result<nlohmann::json, VmError> ConfigLoader::loadJson(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path.has_value()) {
        LOG_DEBUG(Config, "No {} in any config directory", filename);
        return Result<nlohmann::json, VmError>::error(
            VmError::notFound("Config file not found: " + filename));
    }

    LOG_INFO(Config, "Reading {}", path->string());
    return readJsonFile(*path);
}

Result<std::filesystem::path, VmError> ConfigLoader::save(
    const std::string& filename, const nlohmann::json& json)
{
    const auto dir = writableConfigDir();
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Result<std::filesystem::path, VmError>::error(VmError::io(
            "Cannot create config directory " + dir.string() + ": " + ec.message()));
    }

    // Written beside the target, then renamed over it.
    const auto path = dir / filename;
    const auto staging = dir / (filename + ".tmp");
    {
        std::ofstream out(staging, std::ios::trunc);
        out << json.dump(2) << '\n';
        if (!out.good()) {
            return Result<std::filesystem::path, VmError>::error(
                VmError::io("Cannot write config file " + staging.string()));
        }
    }
    std::filesystem::rename(staging, path, ec);
    if (ec) {
        std::filesystem::remove(staging, ec);
        return Result<std::filesystem::path, VmError>::error(
            VmError::io("Cannot replace config file " + path.string()));
    }

    LOG_INFO(Config, "Wrote {}", path.string());
    return Result<std::filesystem::path, VmError>::okay(path);
}

} // namespace ProxyVm
