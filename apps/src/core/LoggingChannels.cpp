#include "LoggingChannels.h"
#include "ConfigLoader.h"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace ProxyVm {

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

namespace {

constexpr const char* kBasePattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
constexpr const char* kDefaultLogFile = "proxy-vm.log";

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

// Inject "[component] " after the timestamp block of a pattern.
std::string patternForComponent(const std::string& pattern, const std::string& componentName)
{
    if (componentName == "default") {
        return pattern;
    }
    const size_t pos = pattern.find("] ");
    if (pos == std::string::npos) {
        return "[" + componentName + "] " + pattern;
    }
    return pattern.substr(0, pos + 2) + "[" + componentName + "] " + pattern.substr(pos + 2);
}

std::string withoutChannelName(std::string pattern)
{
    const std::string channelToken = "[%n] ";
    const size_t pos = pattern.find(channelToken);
    if (pos != std::string::npos) {
        pattern.erase(pos, channelToken.size());
    }
    return pattern;
}

spdlog::sink_ptr makeConsoleSink(bool consoleToStderr)
{
    if (consoleToStderr) {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
}

} // namespace

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto consoleSink = makeConsoleSink(consoleToStderr);
    consoleSink->set_level(consoleLevel);

    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kDefaultLogFile, true);
    fileSink->set_level(fileLevel);

    sharedSinks_ = { consoleSink, fileSink };

    const std::string pattern = patternForComponent(kBasePattern, componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(defaultConfig()["channels"]);
    installDefaultLogger(
        consoleLevel, fileLevel, componentName, kDefaultLogFile, consoleToStderr);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized");
}

bool LoggingChannels::initializeFromConfig(
    const std::string& fileName, const std::string& componentName, bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    auto config = loadConfigFile(fileName);
    const bool fromFile = !config.is_null();
    if (!fromFile) {
        config = defaultConfig();
    }

    applyConfig(config, componentName, consoleToStderr);

    initialized_ = true;
    return fromFile;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Unit tests log before anyone has called initialize().
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);
        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
    return spdlog::level::info;
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    if (spdlog::get(name)) {
        spdlog::drop(name);
    }
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

void LoggingChannels::createChannelLoggers(const nlohmann::json& channelLevels)
{
    const LogChannel channels[] = {
        LogChannel::Command,   LogChannel::Config,   LogChannel::Disk,     LogChannel::Network,
        LogChannel::Provision, LogChannel::Rollback, LogChannel::Template, LogChannel::Vm,
    };

    for (const auto channel : channels) {
        const std::string name = toString(channel);
        auto level = spdlog::level::info;
        if (channelLevels.is_object() && channelLevels.contains(name)
            && channelLevels[name].is_string()) {
            level = parseLevelString(channelLevels[name].get<std::string>());
        }
        createLogger(name, sharedSinks_, level);
    }
}

void LoggingChannels::installDefaultLogger(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    const std::string& filePath,
    bool consoleToStderr)
{
    // Separate sinks so the default logger's pattern omits the channel name.
    auto consoleSink = makeConsoleSink(consoleToStderr);
    consoleSink->set_level(consoleLevel);
    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, false);
    fileSink->set_level(fileLevel);

    const std::string pattern =
        withoutChannelName(patternForComponent(kBasePattern, componentName));
    consoleSink->set_pattern(pattern);
    fileSink->set_pattern(pattern);

    std::vector<spdlog::sink_ptr> sinks = { consoleSink, fileSink };
    const std::string loggerName = componentName.empty() ? "default" : componentName;
    auto logger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(logger);
}

nlohmann::json LoggingChannels::defaultConfig()
{
#ifdef PROXYVM_PRODUCTION_BUILD
    const std::string fileLevel = "info";
#else
    const std::string fileLevel = "debug";
#endif
    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", fileLevel },
            { "pattern", kBasePattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", fileLevel },
                { "path", kDefaultLogFile },
                { "truncate", false },
                { "max_size_mb", 10 },
                { "max_files", 3 } } } } },
        { "channels",
          { { "command", "info" },
            { "config", "info" },
            { "disk", "info" },
            { "network", "info" },
            { "provision", "info" },
            { "rollback", "info" },
            { "template", "info" },
            { "vm", "info" } } },
    };
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& fileName)
{
    // ConfigLoader's own load path logs, so only its lookup is used here.
    const auto path = ConfigLoader::findConfigFile(fileName);
    if (!path.has_value()) {
        return nullptr;
    }

    std::ifstream configFile(*path);
    if (!configFile.is_open()) {
        spdlog::error("Cannot open logging config {}, using built-in defaults", path->string());
        return nullptr;
    }
    try {
        return nlohmann::json::parse(configFile);
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse logging config {}: {}", path->string(), e.what());
        return nullptr;
    }
}

void LoggingChannels::applyConfig(
    const nlohmann::json& config, const std::string& componentName, bool consoleToStderr)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string pattern = kBasePattern;
    int flushIntervalMs = 1000;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            consoleLevel = parseLevelString(defaults.value("console_level", "info"));
            fileLevel = parseLevelString(defaults.value("file_level", "debug"));
            pattern = defaults.value("pattern", std::string(kBasePattern));
            flushIntervalMs = defaults.value("flush_interval_ms", 1000);
        }
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::warn("Error reading logging defaults: {}, using built-in defaults", e.what());
    }
    pattern = patternForComponent(pattern, componentName);

    std::vector<spdlog::sink_ptr> sinks;
    std::string filePath = kDefaultLogFile;

    try {
        const nlohmann::json sinksConfig = config.value("sinks", nlohmann::json::object());

        const nlohmann::json consoleCfg = sinksConfig.value("console", nlohmann::json::object());
        if (consoleCfg.value("enabled", true)) {
            auto consoleSink = makeConsoleSink(consoleToStderr);
            consoleSink->set_level(parseLevelString(consoleCfg.value("level", "info")));
            sinks.push_back(consoleSink);
        }

        const nlohmann::json fileCfg = sinksConfig.value("file", nlohmann::json::object());
        if (fileCfg.value("enabled", true)) {
            filePath = fileCfg.value("path", std::string(kDefaultLogFile));
            const auto level = parseLevelString(fileCfg.value("level", "debug"));

            spdlog::sink_ptr fileSink;
            if (fileCfg.contains("max_size_mb")) {
                const size_t maxSizeMb = fileCfg.value("max_size_mb", 10);
                const size_t maxFiles = fileCfg.value("max_files", 3);
                fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    filePath, maxSizeMb * 1024 * 1024, maxFiles);
            }
            else {
                fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    filePath, fileCfg.value("truncate", false));
            }
            fileSink->set_level(level);
            sinks.push_back(fileSink);
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error creating log sinks: {}, falling back to console", e.what());
        sinks.clear();
        sinks.push_back(makeConsoleSink(consoleToStderr));
    }

    for (auto& sink : sinks) {
        sink->set_pattern(pattern);
    }
    sharedSinks_ = sinks;

    createChannelLoggers(config.value("channels", nlohmann::json::object()));
    installDefaultLogger(consoleLevel, fileLevel, componentName, filePath, consoleToStderr);

    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
}

} // namespace ProxyVm
