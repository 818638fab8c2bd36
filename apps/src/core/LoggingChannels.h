#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace ProxyVm {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel {
    Command,
    Config,
    Disk,
    Network,
    Provision,
    Rollback,
    Template,
    Vm,
};

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Command:
            return "command";
        case LogChannel::Config:
            return "config";
        case LogChannel::Disk:
            return "disk";
        case LogChannel::Network:
            return "network";
        case LogChannel::Provision:
            return "provision";
        case LogChannel::Rollback:
            return "rollback";
        case LogChannel::Template:
            return "template";
        case LogChannel::Vm:
            return "vm";
    }
    return "";
}

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Each subsystem logs through its own named logger; all loggers share the
 * same console and file sinks so output stays interleaved in order.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for the pattern (e.g., "cli")
     * @param consoleToStderr Send console output to stderr so stdout stays clean
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Initialize the logging system from a JSON config file.
     * The file is located through the ConfigLoader search path, .local first.
     * @return true if a config file was applied, false if built-in defaults were used
     */
    static bool initializeFromConfig(
        const std::string& fileName = "logging-config.json",
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "command:trace,vm:debug" - Set command to trace, vm to debug
     *   "*:off,rollback:debug" - Disable all except rollback
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    static bool isInitialized() { return initialized_; }

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static void createChannelLoggers(const nlohmann::json& channelLevels);

    static void installDefaultLogger(
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        const std::string& componentName,
        const std::string& filePath,
        bool consoleToStderr);

    static nlohmann::json defaultConfig();
    static nlohmann::json loadConfigFile(const std::string& fileName);
    static void applyConfig(
        const nlohmann::json& config, const std::string& componentName, bool consoleToStderr);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(\
        ::ProxyVm::LoggingChannels::get(::ProxyVm::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(\
        ::ProxyVm::LoggingChannels::get(::ProxyVm::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(\
        ::ProxyVm::LoggingChannels::get(::ProxyVm::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(\
        ::ProxyVm::LoggingChannels::get(::ProxyVm::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(\
        ::ProxyVm::LoggingChannels::get(::ProxyVm::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace ProxyVm
