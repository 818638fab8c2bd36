#pragma once

#include "Result.h"
#include "VmError.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ProxyVm {

/**
 * @brief Finds, reads and writes the JSON files proxy-vm is configured by.
 *
 * Directories are searched in order, first match wins:
 *   1. the override set with setConfigDir() (the CLI's --config-dir)
 *   2. $PROXYVM_CONFIG_DIR
 *   3. ./config
 *   4. $XDG_CONFIG_HOME/proxy-vm, or ~/.config/proxy-vm
 *   5. /etc/proxy-vm
 *
 * In each directory "<name>.local" shadows "<name>" entirely; the two are
 * never merged. An empty or broken file is an error, not a reason to keep
 * searching.
 */
class ConfigLoader {
public:
    static constexpr const char* kEnvConfigDir = "PROXYVM_CONFIG_DIR";
    static constexpr const char* kAppDirName = "proxy-vm";

    static void setConfigDir(const std::filesystem::path& dir);
    static void clearConfigDir();

    static std::vector<std::filesystem::path> searchPaths();
    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);

    // NotFound when no candidate exists, PreconditionFailed when it cannot be parsed.
    static Result<nlohmann::json, VmError> loadJson(const std::string& filename);

    template <typename T>
    static Result<T, VmError> load(const std::string& filename);

    // Into the override directory when set, otherwise the per-user directory.
    static Result<std::filesystem::path, VmError> save(
        const std::string& filename, const nlohmann::json& json);

    static std::filesystem::path writableConfigDir();

private:
    static Result<nlohmann::json, VmError> readJsonFile(const std::filesystem::path& path);

    static std::optional<std::filesystem::path> overrideDir_;
};

template <typename T>
Result<T, VmError> ConfigLoader::load(const std::string& filename)
{
    auto json = loadJson(filename);
    if (json.isError()) {
        return Result<T, VmError>::error(json.errorValue());
    }

    try {
        T value;
        from_json(json.value(), value);
        return Result<T, VmError>::okay(value);
    }
    catch (const nlohmann::json::exception& e) {
        return Result<T, VmError>::error(
            VmError::precondition("Invalid value in " + filename + ": " + e.what()));
    }
}

} // namespace ProxyVm
